#include "dir_fs.h"
#include "posix_storage.h"
#include <iostream>

namespace vfskit {

DirFS::DirFS(Key, std::string root, std::shared_ptr<Storage> storage, std::vector<std::string> created)
    : storage_(std::move(storage)), created_root_parents_(std::move(created)) {
    root_ = std::move(root);
}

DirFS::~DirFS() {
    dispose();
}

static int host_error(int rc, const std::string& host) {
    if (rc >= 0 || error_kind(rc) == ErrorKind::IOError) return rc;
    std::cerr << "vfskit: " << host << ": " << error_message(rc) << std::endl;
    return -EIO;
}

// Best effort: takes back directories made for a root that never opened.
static void remove_created(Storage& storage, std::vector<std::string>& created) {
    for (auto it = created.rbegin(); it != created.rend(); ++it) {
        int rc = storage.remove_dir(*it);
        if (rc < 0)
            std::cerr << "vfskit: failed to remove " << *it << ": " << error_message(rc) << std::endl;
    }
    created.clear();
}

int DirFS::open(const std::string& root, std::unique_ptr<DirFS>& out) {
    return open(root, std::make_shared<PosixStorage>(), out);
}

int DirFS::open(const std::string& root, std::shared_ptr<Storage> storage, std::unique_ptr<DirFS>& out) {
    if (root.empty() || !is_absolute(root)) return kInvalidPath;
    if (root.find('\0') != std::string::npos) return kInvalidPath;
    std::string host = normalize_path(root);

    HostKind kind;
    int rc = storage->stat(host, kind);
    if (rc < 0) return rc;
    if (kind == HostKind::File) return kNotADirectory;

    std::vector<std::string> created;
    if (kind == HostKind::Missing) {
        rc = mkdir_all(*storage, host, created);
        if (rc < 0) return rc;
    }

    if (!storage->probe_writable(host)) {
        remove_created(*storage, created);
        return -EACCES;
    }

    out = std::make_unique<DirFS>(Key(), host, std::move(storage), std::move(created));
    return 0;
}

// Creates `host` and the missing directories above it. On failure the ones
// made so far are removed again.
int DirFS::mkdir_all(Storage& storage, const std::string& host, std::vector<std::string>& created) {
    std::string existing = host;
    HostKind kind = HostKind::Missing;
    while (true) {
        int rc = storage.stat(existing, kind);
        if (rc < 0) return rc;
        if (kind != HostKind::Missing || is_root(existing)) break;
        existing = parent_path(existing);
    }
    if (kind == HostKind::File) return kNotADirectory;

    std::string built = existing;
    for (const auto& part : split_path(host.substr(is_root(existing) ? 0 : existing.size()))) {
        built = join_path(built, part);
        int rc = storage.make_dir(built);
        if (rc < 0) {
            remove_created(storage, created);
            return rc;
        }
        created.push_back(built);
    }
    return 0;
}

std::string DirFS::to_host(const std::string& path) const {
    std::string inner = resolve(path);
    if (is_root(inner)) return root_;
    if (is_root(root_)) return inner;
    return root_ + inner;
}

int DirFS::add(const std::string& path) {
    if (path.find('\0') != std::string::npos) return kInvalidPath;
    std::string inner = resolve(path);
    std::string host = to_host(inner);

    HostKind kind;
    int rc = storage_->stat(host, kind);
    if (rc < 0) return host_error(rc, host);
    if (kind == HostKind::Missing) return kNotFound;

    if (!is_root(inner)) {
        const Entry* parent = entries_.find(parent_path(inner));
        if (!parent) return kNotFound;
        if (!parent->is_dir()) return kNotADirectory;
    } else if (kind != HostKind::Directory) {
        return kNotADirectory;
    }
    return add_recursive(inner, host, kind);
}

int DirFS::add_recursive(const std::string& inner, const std::string& host, HostKind kind) {
    if (kind != HostKind::Directory) {
        entries_.insert(inner, Entry::host_file());
        return 0;
    }
    entries_.insert(inner, Entry::directory());

    std::vector<std::string> names;
    int rc = storage_->list_dir(host, names);
    if (rc < 0) return host_error(rc, host);
    for (const auto& name : names) {
        std::string child = join_path(host, name);
        HostKind child_kind;
        rc = storage_->stat(child, child_kind);
        if (rc < 0) return host_error(rc, child);
        if (child_kind == HostKind::Missing) continue;
        rc = add_recursive(join_path(inner, name), child, child_kind);
        if (rc < 0) return rc;
    }
    return 0;
}

int DirFS::forget(const std::string& path) {
    if (path.find('\0') != std::string::npos) return kInvalidPath;
    std::string inner = resolve(path);
    if (is_root(inner)) return kInvalidPath;
    if (!entries_.contains(inner)) return kNotFound;
    entries_.erase_subtree(inner);
    cwd_ = entries_.nearest_existing(cwd_);
    return 0;
}

void DirFS::dispose() {
    if (disposed_) return;
    disposed_ = true;
    if (!auto_clean_) return;

    if (cleanup()) entries_.reset();

    for (auto it = created_root_parents_.rbegin(); it != created_root_parents_.rend(); ++it) {
        int rc = storage_->remove_dir(*it);
        if (rc < 0 && rc != -ENOENT)
            std::cerr << "vfskit: failed to remove " << *it << ": " << error_message(rc) << std::endl;
    }
    created_root_parents_.clear();
}

int DirFS::create_dir(const std::string& inner) {
    std::string host = to_host(inner);
    return host_error(storage_->make_dir(host), host);
}

int DirFS::create_file(const std::string& inner, const std::string& data, Entry& entry) {
    std::string host = to_host(inner);
    int rc = storage_->create_file(host, data);
    if (rc < 0) return host_error(rc, host);
    entry = Entry::host_file();
    return 0;
}

int DirFS::load(const std::string& inner, const Entry&, std::string& out) const {
    std::string host = to_host(inner);
    return host_error(storage_->read_file(host, out), host);
}

int DirFS::length(const std::string& inner, const Entry&, size_t& out) const {
    std::string host = to_host(inner);
    return host_error(storage_->file_size(host, out), host);
}

int DirFS::store(const std::string& inner, Entry&, const std::string& data, bool append) {
    std::string host = to_host(inner);
    int rc = append ? storage_->append_file(host, data) : storage_->replace_file(host, data);
    return host_error(rc, host);
}

int DirFS::remove(const std::string& inner, const Entry&, bool recursive) {
    std::string host = to_host(inner);
    HostKind kind;
    int rc = storage_->stat(host, kind);
    if (rc < 0) return host_error(rc, host);
    // Gone already: the entries follow whatever happened on the host.
    if (kind == HostKind::Missing) return 0;

    if (kind != HostKind::Directory) rc = storage_->remove_file(host);
    else if (recursive) rc = storage_->remove_tree(host);
    else rc = storage_->remove_dir(host);
    return rc == -ENOENT ? 0 : host_error(rc, host);
}

}
