#ifndef VFSKIT_OPTIONS_H
#define VFSKIT_OPTIONS_H

#include <memory>
#include <string>

#include "fs_backend.h"

namespace vfskit {

enum class BackendKind { Dir, Memory };

// How to open a VFS. JSON form:
//   { "backend": "dir", "root": "/tmp/vfs", "auto_clean": true,
//     "mkfile_policy": "overwrite" }
struct Options {
    BackendKind backend = BackendKind::Dir;
    std::string root;
    bool auto_clean = true;
    MkfilePolicy mkfile_policy = MkfilePolicy::Overwrite;
};

// Malformed input gives -EINVAL with the reason in `err`; load_options
// gives -ENOENT when the file cannot be opened.
int parse_options(const std::string& json, Options& out, std::string& err);
int load_options(const std::string& file, Options& out, std::string& err);

int open_backend(const Options& opts, std::unique_ptr<FsBackend>& out);

}

#endif
