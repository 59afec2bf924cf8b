#ifndef VFSKIT_PATH_H
#define VFSKIT_PATH_H

#include <string>
#include <vector>

namespace vfskit {

// Inner paths are absolute, '/'-separated, with no '.', '..', empty or
// trailing components; "/" is the root.

std::vector<std::string> split_path(const std::string& path);

// Canonical form of `path` taken relative to the root. Never fails; '..'
// above the root stays at the root.
std::string normalize_path(const std::string& path);

// Resolves `path` against `cwd`: "" and "." give `cwd`, absolute paths ignore it.
std::string resolve_path(const std::string& cwd, const std::string& path);

std::string join_path(const std::string& base, const std::string& name);
std::string parent_path(const std::string& inner);
std::string base_name(const std::string& inner);

bool is_root(const std::string& inner);
bool is_absolute(const std::string& path);

// True when `inner` equals `base` or lies below it.
bool is_within(const std::string& inner, const std::string& base);

// Number of components; the root has none.
size_t path_depth(const std::string& inner);

// Orders paths component by component: "/a" < "/a/b" < "/a-b".
struct PathLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

}

#endif
