#ifndef VFSKIT_POSIX_STORAGE_H
#define VFSKIT_POSIX_STORAGE_H

#include "storage.h"

namespace vfskit {

class PosixStorage : public Storage {
public:
    int stat(const std::string& path, HostKind& kind) override;
    int make_dir(const std::string& path) override;
    int remove_dir(const std::string& path) override;
    int remove_file(const std::string& path) override;
    int remove_tree(const std::string& path) override;
    int list_dir(const std::string& path, std::vector<std::string>& names) override;
    int file_size(const std::string& path, size_t& size) override;
    int create_file(const std::string& path, const std::string& data) override;
    int read_file(const std::string& path, std::string& data) override;
    int replace_file(const std::string& path, const std::string& data) override;
    int append_file(const std::string& path, const std::string& data) override;
    bool probe_writable(const std::string& dir) override;
};

}

#endif
