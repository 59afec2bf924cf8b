#include "map_fs.h"

namespace vfskit {

int MapFS::set_root(const std::string& path) {
    if (!is_absolute(path)) return kInvalidPath;
    root_ = normalize_path(path);
    return 0;
}

int MapFS::create_dir(const std::string&) {
    return 0;
}

int MapFS::create_file(const std::string&, const std::string& data, Entry& entry) {
    entry = Entry::memory_file(data);
    return 0;
}

int MapFS::load(const std::string&, const Entry& entry, std::string& out) const {
    const std::string* data = std::get_if<std::string>(&entry.content);
    out = data ? *data : std::string();
    return 0;
}

int MapFS::length(const std::string&, const Entry& entry, size_t& out) const {
    const std::string* data = std::get_if<std::string>(&entry.content);
    out = data ? data->size() : 0;
    return 0;
}

int MapFS::store(const std::string&, Entry& entry, const std::string& data, bool append) {
    std::string* cur = std::get_if<std::string>(&entry.content);
    if (append && cur) {
        cur->append(data);
        return 0;
    }
    entry.content = data;
    return 0;
}

int MapFS::remove(const std::string&, const Entry&, bool) {
    return 0;
}

}
