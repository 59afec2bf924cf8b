#ifndef VFSKIT_ENTRY_H
#define VFSKIT_ENTRY_H

#include <string>
#include <variant>

namespace vfskit {

enum class EntryType { File, Directory };

// Marks a file whose bytes live in the mirrored host file.
struct HostBacked {};

// Directories carry no content; memory files carry their bytes.
using Content = std::variant<std::monostate, HostBacked, std::string>;

struct Entry {
    EntryType type;
    Content content;

    bool is_file() const { return type == EntryType::File; }
    bool is_dir() const { return type == EntryType::Directory; }

    static Entry directory() { return Entry{EntryType::Directory, std::monostate{}}; }
    static Entry host_file() { return Entry{EntryType::File, HostBacked{}}; }
    static Entry memory_file(std::string data) { return Entry{EntryType::File, std::move(data)}; }
};

}

#endif
