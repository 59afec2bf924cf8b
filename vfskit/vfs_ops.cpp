#include "vfs_ops.h"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>

namespace vfskit {

FsBackend* mounted_fs = nullptr;

static int vfs_getattr(const char* path, struct stat* stbuf, struct fuse_file_info*) {
    memset(stbuf, 0, sizeof(struct stat));
    bool dir = false;
    int rc = mounted_fs->is_dir(path, dir);
    if (rc < 0) return rc;
    if (dir) {
        stbuf->st_mode = S_IFDIR | 0755;
        stbuf->st_nlink = 2;
    } else {
        size_t size = 0;
        rc = mounted_fs->size(path, size);
        if (rc < 0) return rc;
        stbuf->st_mode = S_IFREG | 0644;
        stbuf->st_nlink = 1;
        stbuf->st_size = static_cast<off_t>(size);
    }
    stbuf->st_uid = getuid();
    stbuf->st_gid = getgid();
    return 0;
}

static int vfs_mknod(const char* path, mode_t mode, dev_t) {
    if (!S_ISREG(mode)) return -EPERM;
    if (mounted_fs->exists(path)) return -EEXIST;
    return mounted_fs->mkfile(path);
}

static int vfs_mkdir(const char* path, mode_t) {
    return mounted_fs->mkdir(path);
}

static int vfs_unlink(const char* path) {
    bool dir = false;
    int rc = mounted_fs->is_dir(path, dir);
    if (rc < 0) return rc;
    if (dir) return -EISDIR;
    return mounted_fs->rm(path);
}

static int vfs_rmdir(const char* path) {
    bool dir = false;
    int rc = mounted_fs->is_dir(path, dir);
    if (rc < 0) return rc;
    if (!dir) return -ENOTDIR;
    std::vector<std::string> children;
    rc = mounted_fs->ls(path, children);
    if (rc < 0) return rc;
    if (!children.empty()) return -ENOTEMPTY;
    return mounted_fs->rm(path);
}

static int vfs_truncate(const char* path, off_t size, struct fuse_file_info*) {
    std::string data;
    int rc = mounted_fs->read(path, data);
    if (rc < 0) return rc;
    data.resize(static_cast<size_t>(size));
    return mounted_fs->write(path, data);
}

static int vfs_open(const char* path, struct fuse_file_info* fi) {
    bool file = false;
    int rc = mounted_fs->is_file(path, file);
    if (rc < 0) return rc;
    if (!file) return -EISDIR;
    if (fi->flags & O_TRUNC) return mounted_fs->write(path, std::string());
    return 0;
}

static int vfs_read(const char* path, char* buf, size_t size, off_t offset, struct fuse_file_info*) {
    std::string data;
    int rc = mounted_fs->read(path, data);
    if (rc < 0) return rc;
    if (static_cast<size_t>(offset) >= data.size()) return 0;
    size_t to_read = std::min(size, data.size() - static_cast<size_t>(offset));
    memcpy(buf, data.data() + offset, to_read);
    return static_cast<int>(to_read);
}

static int vfs_write(const char* path, const char* buf, size_t size, off_t offset, struct fuse_file_info* fi) {
    std::string chunk(buf, size);
    int rc = (fi->flags & O_APPEND) ? mounted_fs->append(path, chunk)
                                    : mounted_fs->write_at(path, static_cast<size_t>(offset), chunk);
    if (rc < 0) return rc;
    return static_cast<int>(size);
}

static int vfs_readdir(const char* path, void* buf, fuse_fill_dir_t filler, off_t, struct fuse_file_info*,
                       enum fuse_readdir_flags) {
    bool dir = false;
    int rc = mounted_fs->is_dir(path, dir);
    if (rc < 0) return rc;
    if (!dir) return -ENOTDIR;
    std::vector<std::string> children;
    rc = mounted_fs->ls(path, children);
    if (rc < 0) return rc;
    filler(buf, ".", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    filler(buf, "..", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    for (const auto& child : children) {
        filler(buf, base_name(child).c_str(), nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    }
    return 0;
}

static int vfs_create(const char* path, mode_t mode, struct fuse_file_info*) {
    return vfs_mknod(path, S_IFREG | (mode & 07777), 0);
}

// Times are not modelled; accepted so that touch(1) works.
static int vfs_utimens(const char* path, const struct timespec[2], struct fuse_file_info*) {
    return mounted_fs->exists(path) ? 0 : -ENOENT;
}

static struct fuse_operations make_ops() {
    struct fuse_operations ops;
    memset(&ops, 0, sizeof(ops));
    ops.getattr  = vfs_getattr;
    ops.mknod    = vfs_mknod;
    ops.mkdir    = vfs_mkdir;
    ops.unlink   = vfs_unlink;
    ops.rmdir    = vfs_rmdir;
    ops.truncate = vfs_truncate;
    ops.open     = vfs_open;
    ops.read     = vfs_read;
    ops.write    = vfs_write;
    ops.readdir  = vfs_readdir;
    ops.create   = vfs_create;
    ops.utimens  = vfs_utimens;
    return ops;
}

const struct fuse_operations vfs_oper = make_ops();

}
