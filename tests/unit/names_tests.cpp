#include <doctest/doctest.h>
#include <lzc/names.hpp>
#include <lzc/types.hpp>

#include <string>

using namespace lzc;

TEST_CASE("filesystem names") {
    CHECK(is_valid_fs_name("pool"));
    CHECK(is_valid_fs_name("pool/fs"));
    CHECK(is_valid_fs_name("pool/fs/child-1_a.b:c d"));

    CHECK_FALSE(is_valid_fs_name(""));
    CHECK_FALSE(is_valid_fs_name("pool//fs"));
    CHECK_FALSE(is_valid_fs_name("pool/"));
    CHECK_FALSE(is_valid_fs_name("/pool"));
    CHECK_FALSE(is_valid_fs_name("pool/fs@snap"));
    CHECK_FALSE(is_valid_fs_name("pool/f$s"));
}

TEST_CASE("snapshot names") {
    CHECK(is_valid_snap_name("pool@snap"));
    CHECK(is_valid_snap_name("pool/fs@snap"));

    CHECK_FALSE(is_valid_snap_name("pool/fs"));
    CHECK_FALSE(is_valid_snap_name("pool/fs@"));
    CHECK_FALSE(is_valid_snap_name("@snap"));
    CHECK_FALSE(is_valid_snap_name("pool/fs@a@b"));
    CHECK_FALSE(is_valid_snap_name("pool/fs@a/b"));
}

TEST_CASE("bookmark names") {
    CHECK(is_valid_bmark_name("pool/fs#mark"));
    CHECK_FALSE(is_valid_bmark_name("pool/fs@snap"));
    CHECK_FALSE(is_valid_bmark_name("pool/fs#"));
    CHECK_FALSE(is_valid_bmark_name("pool/fs#a#b"));
}

TEST_CASE("name length is checked separately from syntax") {
    std::string limit(MAXNAMELEN, 'a');
    std::string over(MAXNAMELEN + 1, 'a');

    CHECK(is_valid_fs_name(over));
    CHECK_FALSE(is_name_too_long(limit));
    CHECK(is_name_too_long(over));
}

TEST_CASE("name type classification") {
    CHECK(name_type("pool/fs") == NameType::Filesystem);
    CHECK(name_type("pool/fs@snap") == NameType::Snapshot);
    CHECK(name_type("pool/fs#mark") == NameType::Bookmark);
    CHECK(name_type("pool//fs") == NameType::Invalid);
    CHECK(std::string(name_type_to_string(NameType::Snapshot)) == "snapshot");
}

TEST_CASE("pool and filesystem decomposition") {
    CHECK(pool_name("pool/fs@snap") == "pool");
    CHECK(pool_name("pool@snap") == "pool");
    CHECK(pool_name("pool#mark") == "pool");
    CHECK(pool_name("pool") == "pool");

    CHECK(fs_name("pool/fs@snap") == "pool/fs");
    CHECK(fs_name("pool/fs#mark") == "pool/fs");
    CHECK(fs_name("pool/fs") == "pool/fs");
}

TEST_CASE("same pool") {
    CHECK(same_pool({}));
    CHECK(same_pool({"pool/a@s1", "pool/b@s1"}));
    CHECK_FALSE(same_pool({"pool/a@s1", "other/b@s1"}));
}
