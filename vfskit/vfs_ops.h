#ifndef VFSKIT_VFS_OPS_H
#define VFSKIT_VFS_OPS_H

#define FUSE_USE_VERSION 31
#include <fuse.h>

#include "fs_backend.h"

namespace vfskit {

// Backend served by vfs_oper; set before fuse_main.
extern FsBackend* mounted_fs;
extern const struct fuse_operations vfs_oper;

}

#endif
