#include "path.h"

namespace vfskit {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> elems;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        if (pos == std::string::npos) pos = path.size();
        if (pos > start) elems.push_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return elems;
}

std::string normalize_path(const std::string& path) {
    std::vector<std::string> parts;
    for (auto& p : split_path(path)) {
        if (p == ".") continue;
        if (p == "..") {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        parts.push_back(std::move(p));
    }
    if (parts.empty()) return "/";
    std::string out;
    for (const auto& p : parts) {
        out += '/';
        out += p;
    }
    return out;
}

std::string resolve_path(const std::string& cwd, const std::string& path) {
    if (path.empty() || path == ".") return normalize_path(cwd);
    if (is_absolute(path)) return normalize_path(path);
    return normalize_path(cwd + "/" + path);
}

std::string join_path(const std::string& base, const std::string& name) {
    if (base.empty() || base.back() == '/') return base + name;
    return base + "/" + name;
}

std::string parent_path(const std::string& inner) {
    size_t pos = inner.rfind('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return inner.substr(0, pos);
}

std::string base_name(const std::string& inner) {
    size_t pos = inner.rfind('/');
    return pos == std::string::npos ? inner : inner.substr(pos + 1);
}

bool is_root(const std::string& inner) {
    return inner == "/";
}

bool is_absolute(const std::string& path) {
    return !path.empty() && path[0] == '/';
}

bool is_within(const std::string& inner, const std::string& base) {
    if (is_root(base)) return is_absolute(inner);
    if (inner.compare(0, base.size(), base) != 0) return false;
    return inner.size() == base.size() || inner[base.size()] == '/';
}

size_t path_depth(const std::string& inner) {
    return split_path(inner).size();
}

static unsigned rank(char c) {
    // The separator sorts below every byte a name can hold.
    return c == '/' ? 0u : static_cast<unsigned char>(c);
}

bool PathLess::operator()(const std::string& a, const std::string& b) const {
    size_t n = a.size() < b.size() ? a.size() : b.size();
    for (size_t i = 0; i < n; i++) {
        unsigned ra = rank(a[i]), rb = rank(b[i]);
        if (ra != rb) return ra < rb;
    }
    return a.size() < b.size();
}

}
