#ifndef VFSKIT_MAP_FS_H
#define VFSKIT_MAP_FS_H

#include "fs_backend.h"

namespace vfskit {

// Virtual filesystem held entirely in memory; file bytes live in the entries.
class MapFS : public FsBackend {
public:
    MapFS() = default;

    // The root is advisory here; it must be absolute.
    int set_root(const std::string& path);

protected:
    int create_dir(const std::string& inner) override;
    int create_file(const std::string& inner, const std::string& data, Entry& entry) override;
    int load(const std::string& inner, const Entry& entry, std::string& out) const override;
    int length(const std::string& inner, const Entry& entry, size_t& out) const override;
    int store(const std::string& inner, Entry& entry, const std::string& data, bool append) override;
    int remove(const std::string& inner, const Entry& entry, bool recursive) override;
};

}

#endif
