#include <catch2/catch.hpp>
#include "map_fs.h"

using namespace vfskit;
using Paths = std::vector<std::string>;

// Every non-root key has a tracked directory as its parent.
static bool parents_tracked(const FsBackend& fs) {
    for (const auto& kv : fs.entries()) {
        if (is_root(kv.first)) continue;
        const Entry* parent = fs.entries().find(parent_path(kv.first));
        if (!parent || !parent->is_dir()) return false;
    }
    return true;
}

TEST_CASE("MapFS starts at the root", "[map_fs]") {
    MapFS fs;
    CHECK(fs.root() == "/");
    CHECK(fs.cwd() == "/");
    CHECK(fs.exists("/"));
    CHECK(fs.exists(""));
    bool dir = false;
    REQUIRE(fs.is_dir("/", dir) == 0);
    CHECK(dir);
}

TEST_CASE("MapFS set_root needs an absolute path", "[map_fs]") {
    MapFS fs;
    CHECK(fs.set_root("relative/path") == kInvalidPath);
    CHECK(fs.set_root("") == kInvalidPath);
    REQUIRE(fs.set_root("/srv/./data/") == 0);
    CHECK(fs.root() == "/srv/data");
}

TEST_CASE("MapFS mkdir creates every missing level", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkdir("/a/b/c") == 0);

    CHECK(fs.entries().size() == 4);
    for (const char* p : {"/a", "/a/b", "/a/b/c"}) {
        bool dir = false;
        REQUIRE(fs.is_dir(p, dir) == 0);
        CHECK(dir);
    }

    SECTION("the exact target must not exist") {
        CHECK(fs.mkdir("/a/b/c") == kAlreadyExists);
        CHECK(fs.mkdir("/a") == kAlreadyExists);
        CHECK(fs.mkdir("/") == kAlreadyExists);
    }
    SECTION("empty input is rejected") {
        CHECK(fs.mkdir("") == kInvalidPath);
    }
    SECTION("relative paths land under cwd") {
        REQUIRE(fs.cd("/a/b") == 0);
        REQUIRE(fs.mkdir("d/e") == 0);
        CHECK(fs.exists("/a/b/d/e"));
    }
    SECTION("a file cannot hold directories") {
        REQUIRE(fs.mkfile("/a/f.txt") == 0);
        CHECK(fs.mkdir("/a/f.txt/sub") == kNotADirectory);
        CHECK_FALSE(fs.exists("/a/f.txt/sub"));
    }
}

TEST_CASE("MapFS mkfile creates parents and keeps content", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkfile("/docs/note.txt", std::string("Hello")) == 0);

    CHECK(fs.exists("/docs"));
    bool dir = false;
    REQUIRE(fs.is_dir("/docs", dir) == 0);
    CHECK(dir);

    std::string data;
    REQUIRE(fs.read("/docs/note.txt", data) == 0);
    CHECK(data == "Hello");

    SECTION("no content reads back empty") {
        REQUIRE(fs.mkfile("/docs/empty.txt") == 0);
        REQUIRE(fs.read("/docs/empty.txt", data) == 0);
        CHECK(data.empty());
    }
    SECTION("a directory path is not a file") {
        CHECK(fs.mkfile("/docs") == kIsADirectory);
        CHECK(fs.mkfile("/") == kIsADirectory);
        CHECK(fs.mkfile("") == kInvalidPath);
    }
    SECTION("overwrite policy replaces the file") {
        REQUIRE(fs.mkfile("/docs/note.txt", std::string("Bye")) == 0);
        REQUIRE(fs.read("/docs/note.txt", data) == 0);
        CHECK(data == "Bye");
    }
    SECTION("reject policy keeps the file") {
        fs.set_mkfile_policy(MkfilePolicy::Reject);
        CHECK(fs.mkfile("/docs/note.txt", std::string("Bye")) == kAlreadyExists);
        REQUIRE(fs.read("/docs/note.txt", data) == 0);
        CHECK(data == "Hello");
    }
    SECTION("a NUL byte in the name is rejected") {
        CHECK(fs.mkfile(std::string("/bad\0name.txt", 13)) == kInvalidPath);
    }
}

TEST_CASE("MapFS read, write and append", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkfile("/f.txt", std::string("abc")) == 0);
    REQUIRE(fs.mkdir("/dir") == 0);
    std::string data;

    REQUIRE(fs.write("/f.txt", "xyz") == 0);
    REQUIRE(fs.read("/f.txt", data) == 0);
    CHECK(data == "xyz");

    REQUIRE(fs.append("/f.txt", "123") == 0);
    REQUIRE(fs.read("/f.txt", data) == 0);
    CHECK(data == "xyz123");

    CHECK(fs.read("/missing", data) == kNotFound);
    CHECK(fs.write("/missing", "x") == kNotFound);
    CHECK(fs.append("/missing", "x") == kNotFound);
    CHECK_FALSE(fs.exists("/missing"));

    CHECK(fs.read("/dir", data) == kIsADirectory);
    CHECK(fs.write("/dir", "x") == kIsADirectory);
    CHECK(fs.append("/dir", "x") == kIsADirectory);

    SECTION("append to a file made without content") {
        REQUIRE(fs.mkfile("/new.txt") == 0);
        REQUIRE(fs.append("/new.txt", "tail") == 0);
        REQUIRE(fs.read("/new.txt", data) == 0);
        CHECK(data == "tail");
    }
}

TEST_CASE("MapFS write_at and size", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkfile("/log.txt", std::string("ab")) == 0);
    size_t size = 0;
    REQUIRE(fs.size("/log.txt", size) == 0);
    CHECK(size == 2);

    REQUIRE(fs.write_at("/log.txt", 2, "cd") == 0);
    REQUIRE(fs.write_at("/log.txt", 0, "A") == 0);
    REQUIRE(fs.write_at("/log.txt", 6, "z") == 0);
    std::string data;
    REQUIRE(fs.read("/log.txt", data) == 0);
    CHECK(data == std::string("Abcd\0\0z", 7));
    REQUIRE(fs.size("/log.txt", size) == 0);
    CHECK(size == 7);

    REQUIRE(fs.mkfile("/empty.txt") == 0);
    REQUIRE(fs.size("/empty.txt", size) == 0);
    CHECK(size == 0);
    REQUIRE(fs.mkdir("/d") == 0);
    CHECK(fs.size("/d", size) == kIsADirectory);
    CHECK(fs.write_at("/d", 0, "x") == kIsADirectory);
}

TEST_CASE("MapFS is_dir and is_file need an existing path", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkfile("/a/f.txt") == 0);
    bool flag = true;

    CHECK(fs.is_dir("/nope", flag) == kNotFound);
    CHECK(fs.is_file("/nope", flag) == kNotFound);

    REQUIRE(fs.is_file("/a/f.txt", flag) == 0);
    CHECK(flag);
    REQUIRE(fs.is_dir("/a/f.txt", flag) == 0);
    CHECK_FALSE(flag);
    REQUIRE(fs.is_file("/a", flag) == 0);
    CHECK_FALSE(flag);
}

TEST_CASE("MapFS cd", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkdir("/a/b") == 0);
    REQUIRE(fs.mkfile("/a/f.txt") == 0);

    REQUIRE(fs.cd("a") == 0);
    CHECK(fs.cwd() == "/a");
    REQUIRE(fs.cd("b") == 0);
    CHECK(fs.cwd() == "/a/b");
    REQUIRE(fs.cd("..") == 0);
    CHECK(fs.cwd() == "/a");
    REQUIRE(fs.cd("../../../..") == 0);
    CHECK(fs.cwd() == "/");

    CHECK(fs.cd("/missing") == kNotFound);
    CHECK(fs.cwd() == "/");
    CHECK(fs.cd("/a/f.txt") == kNotADirectory);
    CHECK(fs.cwd() == "/");
}

TEST_CASE("MapFS ls and tree", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkfile("/project/main.rs", std::string("fn main() {}")) == 0);
    REQUIRE(fs.mkfile("/project/src/lib.rs") == 0);
    Paths out;

    REQUIRE(fs.ls("/project", out) == 0);
    CHECK(out == Paths{"/project/main.rs", "/project/src"});

    REQUIRE(fs.tree("/project", out) == 0);
    CHECK(out == Paths{"/project/main.rs", "/project/src", "/project/src/lib.rs"});

    SECTION("empty directories list nothing") {
        REQUIRE(fs.mkdir("/empty") == 0);
        REQUIRE(fs.ls("/empty", out) == 0);
        CHECK(out.empty());
        REQUIRE(fs.tree("/empty", out) == 0);
        CHECK(out.empty());
    }
    SECTION("a file lists as itself") {
        REQUIRE(fs.ls("/project/main.rs", out) == 0);
        CHECK(out == Paths{"/project/main.rs"});
        REQUIRE(fs.tree("/project/main.rs", out) == 0);
        CHECK(out == Paths{"/project/main.rs"});
    }
    SECTION("relative to cwd") {
        REQUIRE(fs.cd("/project") == 0);
        REQUIRE(fs.ls("", out) == 0);
        CHECK(out == Paths{"/project/main.rs", "/project/src"});
        REQUIRE(fs.ls("src", out) == 0);
        CHECK(out == Paths{"/project/src/lib.rs"});
    }
    SECTION("the same state lists the same way") {
        Paths again;
        REQUIRE(fs.tree("/", out) == 0);
        REQUIRE(fs.tree("/", again) == 0);
        CHECK(out == again);
        CHECK(out.front() == "/project");
    }
    SECTION("missing targets fail") {
        CHECK(fs.ls("/missing", out) == kNotFound);
        CHECK(fs.tree("/missing", out) == kNotFound);
    }
}

TEST_CASE("MapFS rm removes whole subtrees", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkdir("/a/b/c") == 0);
    REQUIRE(fs.mkfile("/a/file.txt") == 0);
    REQUIRE(fs.mkfile("/ab.txt") == 0);

    REQUIRE(fs.rm("/a") == 0);
    CHECK_FALSE(fs.exists("/a"));
    CHECK_FALSE(fs.exists("/a/b"));
    CHECK_FALSE(fs.exists("/a/b/c"));
    CHECK_FALSE(fs.exists("/a/file.txt"));
    CHECK(fs.exists("/ab.txt"));

    CHECK(fs.rm("/a") == kNotFound);
    CHECK(fs.rm("") == kInvalidPath);
}

TEST_CASE("MapFS never removes the root", "[map_fs]") {
    MapFS fs;
    CHECK(fs.rm("/") == kInvalidPath);
    REQUIRE(fs.mkdir("/x/y") == 0);
    CHECK(fs.rm("/") == kInvalidPath);
    CHECK(fs.rm("/x/..") == kInvalidPath);
    REQUIRE(fs.cd("/x") == 0);
    CHECK(fs.rm("..") == kInvalidPath);
    CHECK(fs.exists("/x/y"));
}

TEST_CASE("MapFS rm of the working directory moves cwd up", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkdir("/a/b") == 0);
    REQUIRE(fs.cd("/a/b") == 0);
    REQUIRE(fs.rm("/a") == 0);
    CHECK(fs.cwd() == "/");
}

TEST_CASE("MapFS cleanup keeps only the root", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkdir("/a/b") == 0);
    REQUIRE(fs.mkfile("/a/b/f.txt", std::string("x")) == 0);
    REQUIRE(fs.mkfile("/g.txt") == 0);
    REQUIRE(fs.cd("/a/b") == 0);

    CHECK(fs.cleanup());
    CHECK(fs.entries().size() == 1);
    CHECK(fs.exists("/"));
    CHECK(fs.cwd() == "/");
    CHECK(fs.cleanup());
}

TEST_CASE("MapFS keeps parents tracked through mixed operations", "[map_fs]") {
    MapFS fs;
    REQUIRE(fs.mkdir("/a/b/c") == 0);
    REQUIRE(fs.mkfile("/a/b/c/d/e.txt") == 0);
    REQUIRE(fs.cd("/a/b") == 0);
    REQUIRE(fs.mkfile("../x/y.txt", std::string("y")) == 0);
    CHECK(parents_tracked(fs));

    REQUIRE(fs.rm("c/d") == 0);
    CHECK(parents_tracked(fs));
    REQUIRE(fs.mkdir("/a-b/q") == 0);
    REQUIRE(fs.rm("/a") == 0);
    CHECK(parents_tracked(fs));
    CHECK(fs.exists("/a-b/q"));

    REQUIRE(fs.mkfile("/z/z/z") == 0);
    CHECK(fs.cleanup());
    CHECK(parents_tracked(fs));
}
