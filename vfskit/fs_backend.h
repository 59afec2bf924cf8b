#ifndef VFSKIT_FS_BACKEND_H
#define VFSKIT_FS_BACKEND_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "entry_store.h"
#include "errors.h"

namespace vfskit {

// What mkfile does with a path that is already a tracked file.
enum class MkfilePolicy { Overwrite, Reject };

// Common API of every virtual filesystem. Paths given to it are inner paths,
// absolute or relative to cwd(); only root() speaks about the host.
//
// Not thread-safe: guard a shared instance with a mutex.
class FsBackend {
public:
    virtual ~FsBackend() = default;

    FsBackend(const FsBackend&) = delete;
    FsBackend& operator=(const FsBackend&) = delete;

    const std::string& root() const { return root_; }
    const std::string& cwd() const { return cwd_; }

    std::string resolve(const std::string& path) const;

    int cd(const std::string& path);
    bool exists(const std::string& path) const;
    int is_dir(const std::string& path, bool& out) const;
    int is_file(const std::string& path, bool& out) const;

    // Immediate children of a directory; a file lists as itself.
    int ls(const std::string& path, std::vector<std::string>& out) const;
    // Everything below a directory, parents before children.
    int tree(const std::string& path, std::vector<std::string>& out) const;

    // Creates the directory and any missing parents; the target itself must
    // not exist yet.
    int mkdir(const std::string& path);
    // Creates a file, creating missing parents. See MkfilePolicy for paths
    // that already hold a file.
    int mkfile(const std::string& path, const std::optional<std::string>& content = std::nullopt);

    int read(const std::string& path, std::string& out) const;
    int write(const std::string& path, const std::string& content);
    int append(const std::string& path, const std::string& content);
    // Writes `content` at byte `offset`, zero-filling any gap. Writing at the
    // current end is an append; anything else rewrites the whole file.
    int write_at(const std::string& path, size_t offset, const std::string& content);
    int size(const std::string& path, size_t& out) const;

    int rm(const std::string& path);

    // Removes every tracked entry but the root, deepest first. Entries that
    // cannot be removed stay tracked; returns false if any remained.
    bool cleanup();

    void set_mkfile_policy(MkfilePolicy policy) { mkfile_policy_ = policy; }
    MkfilePolicy mkfile_policy() const { return mkfile_policy_; }

    const EntryStore& entries() const { return entries_; }

protected:
    FsBackend() = default;

    // Backend hooks. `inner` is always canonical.
    virtual int create_dir(const std::string& inner) = 0;
    virtual int create_file(const std::string& inner, const std::string& data, Entry& entry) = 0;
    virtual int load(const std::string& inner, const Entry& entry, std::string& out) const = 0;
    virtual int length(const std::string& inner, const Entry& entry, size_t& out) const = 0;
    virtual int store(const std::string& inner, Entry& entry, const std::string& data, bool append) = 0;
    // `recursive` is set by rm; cleanup removes one entry at a time.
    virtual int remove(const std::string& inner, const Entry& entry, bool recursive) = 0;

    // Looks up `path` for a content operation.
    int content_entry(const std::string& path, std::string& inner) const;

    std::string root_ = "/";
    std::string cwd_ = "/";
    EntryStore entries_;
    MkfilePolicy mkfile_policy_ = MkfilePolicy::Overwrite;
};

}

#endif
