#include "fs_backend.h"
#include <iostream>

namespace vfskit {

static bool has_nul(const std::string& path) {
    return path.find('\0') != std::string::npos;
}

std::string FsBackend::resolve(const std::string& path) const {
    return resolve_path(cwd_, path);
}

int FsBackend::cd(const std::string& path) {
    if (has_nul(path)) return kInvalidPath;
    std::string target = resolve(path);
    const Entry* e = entries_.find(target);
    if (!e) return kNotFound;
    if (!e->is_dir()) return kNotADirectory;
    cwd_ = target;
    return 0;
}

bool FsBackend::exists(const std::string& path) const {
    if (has_nul(path)) return false;
    return entries_.contains(resolve(path));
}

int FsBackend::is_dir(const std::string& path, bool& out) const {
    const Entry* e = has_nul(path) ? nullptr : entries_.find(resolve(path));
    if (!e) return kNotFound;
    out = e->is_dir();
    return 0;
}

int FsBackend::is_file(const std::string& path, bool& out) const {
    const Entry* e = has_nul(path) ? nullptr : entries_.find(resolve(path));
    if (!e) return kNotFound;
    out = e->is_file();
    return 0;
}

int FsBackend::ls(const std::string& path, std::vector<std::string>& out) const {
    std::string inner = resolve(path);
    if (has_nul(path) || !entries_.contains(inner)) return kNotFound;
    out = entries_.children(inner);
    return 0;
}

int FsBackend::tree(const std::string& path, std::vector<std::string>& out) const {
    std::string inner = resolve(path);
    if (has_nul(path) || !entries_.contains(inner)) return kNotFound;
    out = entries_.descendants(inner);
    return 0;
}

int FsBackend::mkdir(const std::string& path) {
    if (path.empty() || has_nul(path)) return kInvalidPath;
    std::string inner = resolve(path);
    if (entries_.contains(inner)) return kAlreadyExists;

    std::string base = entries_.nearest_existing(inner);
    if (!entries_.find(base)->is_dir()) return kNotADirectory;

    // Walk back down from the closest tracked ancestor.
    std::string built = base;
    for (const auto& part : split_path(inner.substr(base.size()))) {
        built = join_path(built, part);
        int rc = create_dir(built);
        if (rc < 0) return rc;
        entries_.insert(built, Entry::directory());
    }
    return 0;
}

int FsBackend::mkfile(const std::string& path, const std::optional<std::string>& content) {
    if (path.empty() || has_nul(path)) return kInvalidPath;
    std::string inner = resolve(path);

    if (const Entry* e = entries_.find(inner)) {
        if (e->is_dir()) return kIsADirectory;
        if (mkfile_policy_ == MkfilePolicy::Reject) return kAlreadyExists;
    }

    std::string parent = parent_path(inner);
    const Entry* p = entries_.find(parent);
    if (!p) {
        int rc = mkdir(parent);
        if (rc < 0) return rc;
    } else if (!p->is_dir()) {
        return kNotADirectory;
    }

    Entry entry{EntryType::File, std::monostate{}};
    int rc = create_file(inner, content.value_or(std::string()), entry);
    if (rc < 0) return rc;
    entries_.insert(inner, std::move(entry));
    return 0;
}

int FsBackend::content_entry(const std::string& path, std::string& inner) const {
    if (has_nul(path)) return kNotFound;
    inner = resolve(path);
    const Entry* e = entries_.find(inner);
    if (!e) return kNotFound;
    if (e->is_dir()) return kIsADirectory;
    return 0;
}

int FsBackend::read(const std::string& path, std::string& out) const {
    std::string inner;
    int rc = content_entry(path, inner);
    if (rc < 0) return rc;
    return load(inner, *entries_.find(inner), out);
}

int FsBackend::write(const std::string& path, const std::string& content) {
    std::string inner;
    int rc = content_entry(path, inner);
    if (rc < 0) return rc;
    return store(inner, *entries_.find(inner), content, false);
}

int FsBackend::append(const std::string& path, const std::string& content) {
    std::string inner;
    int rc = content_entry(path, inner);
    if (rc < 0) return rc;
    return store(inner, *entries_.find(inner), content, true);
}

int FsBackend::write_at(const std::string& path, size_t offset, const std::string& content) {
    std::string inner;
    int rc = content_entry(path, inner);
    if (rc < 0) return rc;
    Entry& entry = *entries_.find(inner);

    size_t cur = 0;
    rc = length(inner, entry, cur);
    if (rc < 0) return rc;
    if (offset == cur) return store(inner, entry, content, true);

    std::string data;
    rc = load(inner, entry, data);
    if (rc < 0) return rc;
    size_t end = offset + content.size();
    if (end > data.size()) data.resize(end);
    data.replace(offset, content.size(), content);
    return store(inner, entry, data, false);
}

int FsBackend::size(const std::string& path, size_t& out) const {
    std::string inner;
    int rc = content_entry(path, inner);
    if (rc < 0) return rc;
    return length(inner, *entries_.find(inner), out);
}

int FsBackend::rm(const std::string& path) {
    if (path.empty() || has_nul(path)) return kInvalidPath;
    std::string inner = resolve(path);
    if (is_root(inner)) return kInvalidPath;

    const Entry* e = entries_.find(inner);
    if (!e) return kNotFound;

    int rc = remove(inner, *e, true);
    if (rc < 0) return rc;
    entries_.erase_subtree(inner);

    // cwd may have been inside the removed subtree.
    cwd_ = entries_.nearest_existing(cwd_);
    return 0;
}

bool FsBackend::cleanup() {
    bool ok = true;
    for (const auto& inner : entries_.removal_order()) {
        const Entry* e = entries_.find(inner);
        if (!e) continue;
        if (entries_.has_descendants(inner)) {
            // A child failed above; the directory has to stay.
            ok = false;
            continue;
        }
        int rc = remove(inner, *e, false);
        if (rc < 0) {
            std::cerr << "vfskit: unable to remove " << inner << ": " << error_message(rc) << std::endl;
            ok = false;
            continue;
        }
        entries_.erase_subtree(inner);
    }
    cwd_ = entries_.nearest_existing(cwd_);
    return ok;
}

}
