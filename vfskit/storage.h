#ifndef VFSKIT_STORAGE_H
#define VFSKIT_STORAGE_H

#include <cstddef>
#include <string>
#include <vector>

namespace vfskit {

enum class HostKind { Missing, File, Directory, Link };

// Host filesystem access used by DirFS. Paths are absolute host paths and
// every call returns 0 or a negated errno. Nothing here follows a symbolic
// link at the final component.
class Storage {
public:
    virtual ~Storage() = default;

    // A missing path is not an error: `kind` becomes Missing.
    virtual int stat(const std::string& path, HostKind& kind) = 0;

    virtual int make_dir(const std::string& path) = 0;
    // Fails on non-empty directories.
    virtual int remove_dir(const std::string& path) = 0;
    virtual int remove_file(const std::string& path) = 0;
    virtual int remove_tree(const std::string& path) = 0;
    virtual int list_dir(const std::string& path, std::vector<std::string>& names) = 0;

    // Byte length; for a link, the length of its target text.
    virtual int file_size(const std::string& path, size_t& size) = 0;
    // Creates or truncates, then writes `data`.
    virtual int create_file(const std::string& path, const std::string& data) = 0;
    // A link yields the text of its target.
    virtual int read_file(const std::string& path, std::string& data) = 0;
    // Swaps in the new content in one step.
    virtual int replace_file(const std::string& path, const std::string& data) = 0;
    virtual int append_file(const std::string& path, const std::string& data) = 0;

    // Write-then-delete of a sentinel inside `dir`.
    virtual bool probe_writable(const std::string& dir) = 0;
};

}

#endif
