#ifndef VFSKIT_DIR_FS_H
#define VFSKIT_DIR_FS_H

#include <memory>
#include <string>
#include <vector>

#include "fs_backend.h"
#include "storage.h"

namespace vfskit {

// Virtual filesystem mirrored onto a host directory. Every effect stays
// below root(); file bytes live on the host and the entries only record
// what exists.
//
// With auto-clean on (the default) dispose(), or the destructor, removes
// every tracked artifact and then the host directories that were created to
// make root() exist. Directories that existed before are left alone.
// Symbolic links are leaves: rm() removes the link, read() returns its target.
//
// A host failure whose errno would read as an entry-level error (ENOENT,
// EEXIST, ...) is logged and reported as -EIO: those codes only ever
// describe the tracked entries.
class DirFS : public FsBackend {
    struct Key {
        explicit Key() = default;
    };

public:
    // Only reachable through open().
    DirFS(Key, std::string root, std::shared_ptr<Storage> storage, std::vector<std::string> created);

    // `root` is an absolute host path; missing components are created.
    static int open(const std::string& root, std::unique_ptr<DirFS>& out);
    static int open(const std::string& root, std::shared_ptr<Storage> storage, std::unique_ptr<DirFS>& out);

    ~DirFS() override;

    void set_auto_clean(bool clean) { auto_clean_ = clean; }
    bool auto_clean() const { return auto_clean_; }

    // Host directories created by open(), outermost first.
    const std::vector<std::string>& created_root_parents() const { return created_root_parents_; }

    std::string to_host(const std::string& path) const;

    // Starts tracking an artifact that already exists on the host, with its
    // whole subtree. Its parent must be tracked.
    int add(const std::string& path);

    // Stops tracking `path` and everything below it; the host is untouched.
    int forget(const std::string& path);

    // Runs auto-clean teardown once; later calls do nothing.
    void dispose();

protected:
    int create_dir(const std::string& inner) override;
    int create_file(const std::string& inner, const std::string& data, Entry& entry) override;
    int load(const std::string& inner, const Entry& entry, std::string& out) const override;
    int length(const std::string& inner, const Entry& entry, size_t& out) const override;
    int store(const std::string& inner, Entry& entry, const std::string& data, bool append) override;
    int remove(const std::string& inner, const Entry& entry, bool recursive) override;

private:
    static int mkdir_all(Storage& storage, const std::string& host, std::vector<std::string>& created);
    int add_recursive(const std::string& inner, const std::string& host, HostKind kind);

    std::shared_ptr<Storage> storage_;
    std::vector<std::string> created_root_parents_;
    bool auto_clean_ = true;
    bool disposed_ = false;
};

}

#endif
