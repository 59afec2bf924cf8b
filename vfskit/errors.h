#ifndef VFSKIT_ERRORS_H
#define VFSKIT_ERRORS_H

#include <cerrno>
#include <string>

namespace vfskit {

// Every operation returns 0 or a negated errno, the same convention FUSE
// callbacks use, so codes pass straight through the mount front end.
enum class ErrorKind { None, InvalidPath, NotFound, AlreadyExists, IsADirectory, NotADirectory, IOError };

constexpr int kInvalidPath = -EINVAL;
constexpr int kNotFound = -ENOENT;
constexpr int kAlreadyExists = -EEXIST;
constexpr int kIsADirectory = -EISDIR;
constexpr int kNotADirectory = -ENOTDIR;

ErrorKind error_kind(int rc);
std::string error_message(int rc);

// errno captured right after a failed libc call.
inline int last_error() { return errno ? -errno : -EIO; }

}

#endif
