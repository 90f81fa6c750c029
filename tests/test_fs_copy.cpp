#include <catch2/catch_test_macros.hpp>
#include "gotfiles/fs_copy.hpp"
#include "test_support.hpp"

using namespace gotfiles;
using gotfiles::test::read_file;
using gotfiles::test::TempDir;
using gotfiles::test::write_file;
namespace fs = std::filesystem;

TEST_CASE("copy_file duplicates bytes and creates parents", "[fs_copy]")
{
    TempDir dir;
    std::string payload("line one\n\0binary\xff tail", 22);
    write_file(dir / "src.txt", payload);

    auto r = fsutil::copy_file(dir / "src.txt", dir / "a" / "b" / "dst.txt");
    REQUIRE(r.has_value());
    REQUIRE(read_file(dir / "a" / "b" / "dst.txt") == payload);
    REQUIRE(read_file(dir / "src.txt") == payload);
}

TEST_CASE("copy_file overwrites and handles empty files", "[fs_copy]")
{
    TempDir dir;
    write_file(dir / "empty", "");
    write_file(dir / "dst", "old contents that are longer");

    REQUIRE(fsutil::copy_file(dir / "empty", dir / "dst").has_value());
    REQUIRE(fs::file_size(dir / "dst") == 0);
}

TEST_CASE("copy_file does not carry over source permissions", "[fs_copy]")
{
    TempDir dir;
    write_file(dir / "script.sh", "#!/bin/sh\n");
    fs::permissions(dir / "script.sh", fs::perms::owner_all);

    REQUIRE(fsutil::copy_file(dir / "script.sh", dir / "copy.sh").has_value());
    auto perms = fs::status(dir / "copy.sh").permissions();
    REQUIRE((perms & fs::perms::owner_exec) == fs::perms::none);
}

TEST_CASE("copy_file fails on missing sources and directories", "[fs_copy]")
{
    TempDir dir;
    auto missing = fsutil::copy_file(dir / "absent", dir / "dst");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::IOError);

    fs::create_directory(dir / "folder");
    auto folder = fsutil::copy_file(dir / "folder", dir / "dst");
    REQUIRE_FALSE(folder.has_value());
    REQUIRE(folder.error().code == ErrorCode::IOError);
}

TEST_CASE("copy_path copies a single file", "[fs_copy]")
{
    TempDir dir;
    write_file(dir / ".gitconfig", "[user]\n\tname = me\n");

    REQUIRE(fsutil::copy_path(dir / ".gitconfig", dir / "repo" / ".gitconfig").has_value());
    REQUIRE(read_file(dir / "repo" / ".gitconfig") == "[user]\n\tname = me\n");
}

TEST_CASE("copy_path copies a directory tree", "[fs_copy]")
{
    TempDir dir;
    const fs::path src = dir / "nvim";
    write_file(src / "init.lua", "require('plugins')\n");
    write_file(src / "lua" / "plugins.lua", "return {}\n");
    write_file(src / "lua" / "deep" / "more" / "x.lua", "x");
    fs::create_directories(src / "empty");

    const fs::path dst = dir / "repo" / "nvim";
    REQUIRE(fsutil::copy_path(src, dst).has_value());

    REQUIRE(read_file(dst / "init.lua") == "require('plugins')\n");
    REQUIRE(read_file(dst / "lua" / "plugins.lua") == "return {}\n");
    REQUIRE(read_file(dst / "lua" / "deep" / "more" / "x.lua") == "x");
    REQUIRE(fs::is_directory(dst / "empty"));
}

TEST_CASE("copy_path gives new directories the source mode", "[fs_copy]")
{
    TempDir dir;
    const fs::path src = dir / "private";
    write_file(src / "sub" / "key", "secret");
    fs::permissions(src, fs::perms::owner_all);
    fs::permissions(src / "sub", fs::perms::owner_all);

    const fs::path dst = dir / "repo" / "private";
    REQUIRE(fsutil::copy_path(src, dst).has_value());
    REQUIRE(fs::status(dst).permissions() == fs::perms::owner_all);
    REQUIRE(fs::status(dst / "sub").permissions() == fs::perms::owner_all);
}

TEST_CASE("copy_path copies symlinks inside a tree by content", "[fs_copy]")
{
    TempDir dir;
    write_file(dir / "real.conf", "real");
    write_file(dir / "src" / "plain", "plain");
    fs::create_symlink(dir / "real.conf", dir / "src" / "link.conf");

    REQUIRE(fsutil::copy_path(dir / "src", dir / "dst").has_value());
    REQUIRE_FALSE(fs::is_symlink(dir / "dst" / "link.conf"));
    REQUIRE(read_file(dir / "dst" / "link.conf") == "real");
}

TEST_CASE("copy_path reports a dangling link inside a tree", "[fs_copy]")
{
    TempDir dir;
    write_file(dir / "src" / "a", "a");
    fs::create_symlink(dir / "gone", dir / "src" / "b");

    auto r = fsutil::copy_path(dir / "src", dir / "dst");
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == ErrorCode::IOError);
}

TEST_CASE("create_directories_like leaves existing directories alone", "[fs_copy]")
{
    TempDir dir;
    fs::create_directories(dir / "template");
    fs::permissions(dir / "template", fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read | fs::perms::group_exec);
    fs::create_directories(dir / "existing");
    const auto before = fs::status(dir / "existing").permissions();

    REQUIRE(fsutil::create_directories_like(dir / "existing" / "new" / "leaf", dir / "template").has_value());
    REQUIRE(fs::is_directory(dir / "existing" / "new" / "leaf"));
    REQUIRE(fs::status(dir / "existing").permissions() == before);
}
