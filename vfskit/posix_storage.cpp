#include "posix_storage.h"
#include "errors.h"
#include "path.h"
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstring>

#define ACCESS_SENTINEL ".access"
// Fixed length so a target name of NAME_MAX bytes still gets a sibling.
#define REPLACE_TEMPLATE ".vfskit.XXXXXX"

namespace vfskit {

static int write_all(int fd, const std::string& data) {
    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::write(fd, data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        done += static_cast<size_t>(n);
    }
    return 0;
}

static int write_fd(int fd, const std::string& data) {
    int rc = write_all(fd, data);
    if (::close(fd) < 0 && rc == 0) rc = last_error();
    return rc;
}

int PosixStorage::stat(const std::string& path, HostKind& kind) {
    struct stat st;
    if (::lstat(path.c_str(), &st) < 0) {
        if (errno == ENOENT) {
            kind = HostKind::Missing;
            return 0;
        }
        return last_error();
    }
    if (S_ISDIR(st.st_mode)) kind = HostKind::Directory;
    else if (S_ISLNK(st.st_mode)) kind = HostKind::Link;
    else kind = HostKind::File;
    return 0;
}

int PosixStorage::make_dir(const std::string& path) {
    return ::mkdir(path.c_str(), 0755) < 0 ? last_error() : 0;
}

int PosixStorage::remove_dir(const std::string& path) {
    return ::rmdir(path.c_str()) < 0 ? last_error() : 0;
}

int PosixStorage::remove_file(const std::string& path) {
    return ::unlink(path.c_str()) < 0 ? last_error() : 0;
}

static int remove_one(const char* path, const struct stat*, int type, struct FTW*) {
    int res = (type == FTW_DP) ? ::rmdir(path) : ::unlink(path);
    return res < 0 ? errno : 0;
}

int PosixStorage::remove_tree(const std::string& path) {
    HostKind kind;
    int rc = stat(path, kind);
    if (rc < 0) return rc;
    if (kind != HostKind::Directory) return remove_file(path);
    // Depth-first, without crossing links or mount points.
    int res = ::nftw(path.c_str(), remove_one, 16, FTW_DEPTH | FTW_PHYS | FTW_MOUNT);
    if (res < 0) return last_error();
    return res > 0 ? -res : 0;
}

int PosixStorage::list_dir(const std::string& path, std::vector<std::string>& names) {
    DIR* dir = ::opendir(path.c_str());
    if (!dir) return last_error();
    names.clear();
    while (struct dirent* de = ::readdir(dir)) {
        if (strcmp(de->d_name, ".") == 0 || strcmp(de->d_name, "..") == 0) continue;
        names.push_back(de->d_name);
    }
    ::closedir(dir);
    return 0;
}

int PosixStorage::file_size(const std::string& path, size_t& size) {
    struct stat st;
    if (::lstat(path.c_str(), &st) < 0) return last_error();
    if (S_ISDIR(st.st_mode)) return -EISDIR;
    size = static_cast<size_t>(st.st_size);
    return 0;
}

int PosixStorage::create_file(const std::string& path, const std::string& data) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644);
    if (fd < 0) return last_error();
    return write_fd(fd, data);
}

int PosixStorage::read_file(const std::string& path, std::string& data) {
    struct stat st;
    if (::lstat(path.c_str(), &st) < 0) return last_error();
    if (S_ISDIR(st.st_mode)) return -EISDIR;
    if (S_ISLNK(st.st_mode)) {
        std::string target(static_cast<size_t>(st.st_size) + 1, '\0');
        ssize_t n = ::readlink(path.c_str(), &target[0], target.size());
        if (n < 0) return last_error();
        target.resize(static_cast<size_t>(n));
        data = std::move(target);
        return 0;
    }
    int fd = ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) return last_error();
    std::string out;
    char buf[8192];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            int rc = last_error();
            ::close(fd);
            return rc;
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    data = std::move(out);
    return 0;
}

int PosixStorage::replace_file(const std::string& path, const std::string& data) {
    struct stat st;
    if (::lstat(path.c_str(), &st) < 0) return last_error();
    if (S_ISDIR(st.st_mode)) return -EISDIR;

    std::string tmp = join_path(parent_path(path), REPLACE_TEMPLATE);
    int fd = ::mkstemp(&tmp[0]);
    if (fd < 0) return last_error();
    int rc = 0;
    if (!S_ISLNK(st.st_mode) && ::fchmod(fd, st.st_mode & 07777) < 0) rc = last_error();
    if (rc == 0) rc = write_all(fd, data);
    if (rc == 0 && ::fsync(fd) < 0) rc = last_error();
    if (::close(fd) < 0 && rc == 0) rc = last_error();
    if (rc == 0 && ::rename(tmp.c_str(), path.c_str()) < 0) rc = last_error();
    if (rc < 0) ::unlink(tmp.c_str());
    return rc;
}

int PosixStorage::append_file(const std::string& path, const std::string& data) {
    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) return last_error();
    return write_fd(fd, data);
}

bool PosixStorage::probe_writable(const std::string& dir) {
    std::string sentinel = join_path(dir, ACCESS_SENTINEL);
    if (create_file(sentinel, "check") < 0) return false;
    return remove_file(sentinel) == 0;
}

}
