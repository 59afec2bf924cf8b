#include "errors.h"
#include <cstring>

namespace vfskit {

ErrorKind error_kind(int rc) {
    switch (rc) {
    case 0:              return ErrorKind::None;
    case kInvalidPath:   return ErrorKind::InvalidPath;
    case kNotFound:      return ErrorKind::NotFound;
    case kAlreadyExists: return ErrorKind::AlreadyExists;
    case kIsADirectory:  return ErrorKind::IsADirectory;
    case kNotADirectory: return ErrorKind::NotADirectory;
    default:             return ErrorKind::IOError;
    }
}

std::string error_message(int rc) {
    if (rc == 0) return "success";
    return strerror(rc < 0 ? -rc : rc);
}

}
