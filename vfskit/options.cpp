#include "options.h"
#include "dir_fs.h"
#include "map_fs.h"
#include <fstream>
#include <sstream>
#include <json/json.h>

namespace vfskit {

static int invalid(std::string& err, const std::string& msg) {
    err = msg;
    return -EINVAL;
}

int parse_options(const std::string& json, Options& out, std::string& err) {
    Json::CharReaderBuilder b;
    Json::Value root;
    std::istringstream s(json);
    std::string errs;
    if (!Json::parseFromStream(b, s, &root, &errs)) return invalid(err, errs);
    if (!root.isObject()) return invalid(err, "options must be a JSON object");

    Options opts;
    const Json::Value& backend = root["backend"];
    if (!backend.isNull()) {
        if (!backend.isString()) return invalid(err, "\"backend\" must be a string");
        std::string name = backend.asString();
        if (name == "dir") opts.backend = BackendKind::Dir;
        else if (name == "memory") opts.backend = BackendKind::Memory;
        else return invalid(err, "unknown backend: " + name);
    }

    const Json::Value& r = root["root"];
    if (!r.isNull()) {
        if (!r.isString()) return invalid(err, "\"root\" must be a string");
        opts.root = r.asString();
    }

    const Json::Value& clean = root["auto_clean"];
    if (!clean.isNull()) {
        if (!clean.isBool()) return invalid(err, "\"auto_clean\" must be a boolean");
        opts.auto_clean = clean.asBool();
    }

    const Json::Value& policy = root["mkfile_policy"];
    if (!policy.isNull()) {
        if (!policy.isString()) return invalid(err, "\"mkfile_policy\" must be a string");
        std::string name = policy.asString();
        if (name == "overwrite") opts.mkfile_policy = MkfilePolicy::Overwrite;
        else if (name == "reject") opts.mkfile_policy = MkfilePolicy::Reject;
        else return invalid(err, "unknown mkfile_policy: " + name);
    }

    if (opts.backend == BackendKind::Dir && opts.root.empty())
        return invalid(err, "the dir backend needs a \"root\"");

    out = opts;
    return 0;
}

int load_options(const std::string& file, Options& out, std::string& err) {
    std::ifstream ifs(file);
    if (!ifs) {
        err = "cannot open " + file;
        return -ENOENT;
    }
    std::stringstream buf;
    buf << ifs.rdbuf();
    return parse_options(buf.str(), out, err);
}

int open_backend(const Options& opts, std::unique_ptr<FsBackend>& out) {
    if (opts.backend == BackendKind::Memory) {
        auto fs = std::make_unique<MapFS>();
        if (!opts.root.empty()) {
            int rc = fs->set_root(opts.root);
            if (rc < 0) return rc;
        }
        fs->set_mkfile_policy(opts.mkfile_policy);
        out = std::move(fs);
        return 0;
    }

    std::unique_ptr<DirFS> fs;
    int rc = DirFS::open(opts.root, fs);
    if (rc < 0) return rc;
    fs->set_auto_clean(opts.auto_clean);
    fs->set_mkfile_policy(opts.mkfile_policy);
    out = std::move(fs);
    return 0;
}

}
