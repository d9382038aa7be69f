#include <doctest/doctest.h>
#include <lzc/classify.hpp>
#include <lzc/names.hpp>

#include <cerrno>
#include <string>

using namespace lzc;

namespace {

// Unwraps a non-batch result
ClassifiedFailure single(const std::optional<ClassifiedFailure>& f) {
    REQUIRE(f.has_value());
    return *f;
}

// Unwraps the only item of a batch result
ClassifiedFailure only_item(const std::optional<ClassifiedFailure>& f) {
    REQUIRE(f.has_value());
    REQUIRE(f->is_batch());
    REQUIRE(f->errors.size() == 1);
    return f->errors.front();
}

const std::string kLong = "pool/" + std::string(300, 'a');

} // namespace

TEST_CASE("status zero is not a failure") {
    CHECK_FALSE(classify_create(0, "pool/fs").has_value());
    CHECK_FALSE(classify_snapshot(0, {}, {"pool/fs@s"}).has_value());
    CHECK_FALSE(classify_receive(0, "pool/fs@s", std::nullopt).has_value());
    CHECK_NOTHROW(throw_if_failed(std::nullopt));
}

TEST_CASE("create") {
    CHECK(single(classify_create(EINVAL, "pool//fs")).kind == FailureKind::name_invalid);
    CHECK(single(classify_create(EINVAL, kLong)).kind == FailureKind::name_too_long);
    CHECK(single(classify_create(EINVAL, "pool/fs")).kind == FailureKind::property_invalid);
    CHECK(single(classify_create(EEXIST, "pool/fs")).kind == FailureKind::filesystem_exists);
    CHECK(single(classify_create(ENOENT, "pool/fs")).kind == FailureKind::parent_not_found);

    auto generic = single(classify_create(EIO, "pool/fs"));
    CHECK(generic.kind == FailureKind::generic);
    CHECK(generic.status == EIO);
    CHECK(generic.message == "Failed to create filesystem");
    CHECK(generic.name == std::string("pool/fs"));
}

TEST_CASE("syntax outranks length") {
    std::string long_invalid = "pool//" + std::string(300, 'a');
    auto f = single(classify_create(EINVAL, long_invalid));
    CHECK(f.kind == FailureKind::name_invalid);
    CHECK(f.name == long_invalid);

    auto g = single(classify_create(EINVAL, kLong));
    CHECK(g.kind == FailureKind::name_too_long);
    CHECK(g.status == EINVAL);
}

TEST_CASE("clone") {
    CHECK(single(classify_clone(EINVAL, "pool//c", "pool/fs@s")).kind == FailureKind::name_invalid);

    auto bad_origin = single(classify_clone(EINVAL, "pool/c", "pool/fs"));
    CHECK(bad_origin.kind == FailureKind::name_invalid);
    CHECK(bad_origin.name == std::string("pool/fs"));

    CHECK(single(classify_clone(EINVAL, kLong, "pool/fs@s")).kind == FailureKind::name_too_long);

    auto pools = single(classify_clone(EINVAL, "other/c", "pool/fs@s"));
    CHECK(pools.kind == FailureKind::pools_differ);
    CHECK(pools.name == std::string("other/c"));

    CHECK(single(classify_clone(EINVAL, "pool/c", "pool/fs@s")).kind == FailureKind::property_invalid);
    CHECK(single(classify_clone(EEXIST, "pool/c", "pool/fs@s")).kind == FailureKind::filesystem_exists);
    CHECK(single(classify_clone(ENOENT, "pool/c", "pool/fs@s")).kind == FailureKind::dataset_not_found);
    CHECK(single(classify_clone(EIO, "pool/c", "pool/fs@s")).message == "Failed to create clone");
}

TEST_CASE("rollback") {
    CHECK(single(classify_rollback(EINVAL, "pool/fs@s")).kind == FailureKind::name_invalid);
    CHECK(single(classify_rollback(EINVAL, kLong)).kind == FailureKind::name_too_long);
    CHECK(single(classify_rollback(EINVAL, "pool/fs")).kind == FailureKind::snapshot_not_found);
    CHECK(single(classify_rollback(ENOENT, "pool//fs")).kind == FailureKind::name_invalid);
    CHECK(single(classify_rollback(ENOENT, "pool/fs")).kind == FailureKind::filesystem_not_found);
    CHECK(single(classify_rollback(EBUSY, "pool/fs")).message == "Failed to rollback");
}

TEST_CASE("snapshot with no item errors maps against the single target") {
    auto f = classify_snapshot(EEXIST, {}, {"pool/fs@s"});
    REQUIRE(f.has_value());
    CHECK(f->kind == FailureKind::snapshot_failure);
    CHECK(f->suppressed == 0);

    auto item = only_item(f);
    CHECK(item.kind == FailureKind::snapshot_exists);
    CHECK(item.name == std::string("pool/fs@s"));
}

TEST_CASE("snapshot with several targets and no item errors carries no name") {
    auto item = only_item(classify_snapshot(ENOENT, {}, {"pool/a@s", "pool/b@s"}));
    CHECK(item.kind == FailureKind::filesystem_not_found);
    CHECK_FALSE(item.name.has_value());
}

TEST_CASE("snapshot item errors keep the suppressed count") {
    ItemErrors errors;
    errors.items.emplace_back("pool/a@s1", EEXIST);
    errors.suppressed = 4;

    auto f = classify_snapshot(EEXIST, errors, {"pool/a@s1", "pool/b@s1"});
    REQUIRE(f.has_value());
    CHECK(f->kind == FailureKind::snapshot_failure);
    CHECK(f->suppressed == 4);
    REQUIRE(f->errors.size() == 1);
    CHECK(f->errors[0].kind == FailureKind::snapshot_exists);
    CHECK(f->errors[0].name == std::string("pool/a@s1"));
}

TEST_CASE("snapshot cross-device errors") {
    auto dup = only_item(classify_snapshot(EXDEV, {}, {"pool/a@s", "pool/a@s"}));
    CHECK(dup.kind == FailureKind::duplicate_snapshots);

    auto pools = only_item(classify_snapshot(EXDEV, {}, {"pool/a@s", "other/b@s"}));
    CHECK(pools.kind == FailureKind::pools_differ);
}

TEST_CASE("snapshot invalid argument") {
    CHECK(only_item(classify_snapshot(EINVAL, {}, {"pool/a@s", "pool/b"})).kind ==
          FailureKind::name_invalid);
    CHECK(only_item(classify_snapshot(EINVAL, {}, {kLong + "@s"})).kind ==
          FailureKind::name_too_long);
    CHECK(only_item(classify_snapshot(EINVAL, {}, {"pool/a@s"})).kind ==
          FailureKind::property_invalid);
    CHECK(only_item(classify_snapshot(EIO, {}, {"pool/a@s"})).message ==
          "Failed to create snapshot");
}

TEST_CASE("destroy_snaps") {
    ItemErrors errors;
    errors.items = {{"pool/a@s", EEXIST}, {"pool/b@s", ENOENT}, {"pool/c@s", EBUSY},
                    {"pool/d@s", EIO}};
    auto f = classify_destroy_snaps(EEXIST, errors, {});
    REQUIRE(f.has_value());
    CHECK(f->kind == FailureKind::snapshot_destruction_failure);
    REQUIRE(f->errors.size() == 4);
    CHECK(f->errors[0].kind == FailureKind::snapshot_is_cloned);
    CHECK(f->errors[1].kind == FailureKind::pool_not_found);
    CHECK(f->errors[2].kind == FailureKind::snapshot_is_held);
    CHECK(f->errors[3].kind == FailureKind::generic);
    CHECK(f->errors[3].message == "Failed to destroy snapshot");
}

TEST_CASE("bookmark item layer") {
    NamePairs bookmarks = {{"pool/fs#b1", "pool/fs@s1"}, {"pool/fs#b2", "pool/fs@s2"}};

    auto ok_names = [&](const std::string& name, int status) {
        ItemErrors errors;
        errors.items.emplace_back(name, status);
        return only_item(classify_bookmark(status, errors, bookmarks));
    };

    NamePairs bad_bmark = {{"pool/fs@b1", "pool/fs@s1"}};
    ItemErrors e1;
    e1.items.emplace_back("pool/fs@b1", EINVAL);
    CHECK(only_item(classify_bookmark(EINVAL, e1, bad_bmark)).kind == FailureKind::name_invalid);

    NamePairs bad_snap = {{"pool/fs#b1", "pool/fs"}};
    ItemErrors e2;
    e2.items.emplace_back("pool/fs#b1", EINVAL);
    auto snap = only_item(classify_bookmark(EINVAL, e2, bad_snap));
    CHECK(snap.kind == FailureKind::name_invalid);
    CHECK(snap.name == std::string("pool/fs"));

    NamePairs mismatch = {{"pool/fs#b1", "pool/other@s1"}};
    ItemErrors e3;
    e3.items.emplace_back("pool/fs#b1", EINVAL);
    CHECK(only_item(classify_bookmark(EINVAL, e3, mismatch)).kind == FailureKind::bookmark_mismatch);

    NamePairs pools = {{"pool/fs#b1", "pool/fs@s1"}, {"other/fs#b2", "other/fs@s2"}};
    ItemErrors e4;
    e4.items.emplace_back("pool/fs#b1", EINVAL);
    CHECK(only_item(classify_bookmark(EINVAL, e4, pools)).kind == FailureKind::pools_differ);

    CHECK(ok_names("pool/fs#b1", EEXIST).kind == FailureKind::bookmark_exists);
    CHECK(ok_names("pool/fs#b1", ENOENT).kind == FailureKind::snapshot_not_found);
    CHECK(ok_names("pool/fs#b1", ENOTSUP).kind == FailureKind::bookmark_not_supported);
    CHECK(ok_names("pool/fs#b1", EIO).message == "Failed to create bookmark");
}

TEST_CASE("bookmark list-level invalid argument reports the first invalid target") {
    NamePairs bookmarks = {{"pool/fs#b1", "pool/fs@s1"}, {"pool/fs@b2", "pool/fs@s2"},
                           {"pool/fs b3", "pool/fs@s3"}};
    auto item = only_item(classify_bookmark(EINVAL, {}, bookmarks));
    CHECK(item.kind == FailureKind::name_invalid);
    CHECK(item.name == std::string("pool/fs@b2"));
}

TEST_CASE("get_bookmarks") {
    CHECK(single(classify_get_bookmarks(ENOENT, "pool/fs")).kind == FailureKind::filesystem_not_found);
    CHECK(single(classify_get_bookmarks(EIO, "pool/fs")).message == "Failed to list bookmarks");
}

TEST_CASE("destroy_bookmarks") {
    ItemErrors errors;
    errors.items = {{"pool/fs#b", EINVAL}, {"pool/fs#c", EIO}};
    auto f = classify_destroy_bookmarks(EINVAL, errors, {"pool/fs#b", "pool/fs#c"});
    REQUIRE(f.has_value());
    CHECK(f->kind == FailureKind::bookmark_destruction_failure);
    REQUIRE(f->errors.size() == 2);
    CHECK(f->errors[0].kind == FailureKind::name_invalid);
    CHECK(f->errors[1].message == "Failed to destroy bookmark");
}

TEST_CASE("snaprange_space") {
    CHECK(single(classify_snaprange_space(EINVAL, "pool/fs", "pool/fs@b")).name ==
          std::string("pool/fs"));
    CHECK(single(classify_snaprange_space(EINVAL, "pool/fs@a", "pool/fs")).name ==
          std::string("pool/fs"));
    CHECK(single(classify_snaprange_space(EINVAL, kLong + "@a", "pool/fs@b")).kind ==
          FailureKind::name_too_long);

    auto pools = single(classify_snaprange_space(EINVAL, "pool/fs@a", "other/fs@b"));
    CHECK(pools.kind == FailureKind::pools_differ);
    CHECK(pools.name == std::string("other/fs@b"));

    CHECK(single(classify_snaprange_space(EINVAL, "pool/fs@a", "pool/fs@b")).kind ==
          FailureKind::snapshot_mismatch);
    CHECK(single(classify_snaprange_space(ENOENT, "pool/fs@a", "pool/fs@b")).kind ==
          FailureKind::snapshot_not_found);
}

TEST_CASE("hold") {
    NamePairs holds = {{"pool/fs@s", "tag"}};

    auto fd = classify_hold(EBADF, {}, holds);
    REQUIRE(fd.has_value());
    CHECK(fd->kind == FailureKind::bad_hold_cleanup_fd);
    CHECK_FALSE(fd->is_batch());

    auto item = [&](int status) {
        ItemErrors errors;
        errors.items.emplace_back("pool/fs@s", status);
        return only_item(classify_hold(status, errors, holds));
    };

    CHECK(item(EXDEV).kind == FailureKind::pools_differ);

    auto missing = item(ENOENT);
    CHECK(missing.kind == FailureKind::filesystem_not_found);
    CHECK(missing.name == std::string("pool/fs"));

    CHECK(item(EEXIST).kind == FailureKind::hold_exists);

    auto big = item(E2BIG);
    CHECK(big.kind == FailureKind::name_too_long);
    CHECK(big.name == std::string("tag"));

    auto unsupported = item(ENOTSUP);
    CHECK(unsupported.kind == FailureKind::feature_not_supported);
    CHECK(unsupported.name == std::string("pool"));

    CHECK(item(EIO).message == "Failed to hold snapshot");
}

TEST_CASE("hold item layer on invalid argument") {
    auto classify_one = [](const NamePairs& holds, const std::string& name) {
        ItemErrors errors;
        errors.items.emplace_back(name, EINVAL);
        return only_item(classify_hold(EINVAL, errors, holds));
    };

    CHECK(classify_one({{"pool/fs", "tag"}}, "pool/fs").kind == FailureKind::name_invalid);
    CHECK(classify_one({{kLong + "@s", "tag"}}, kLong + "@s").kind == FailureKind::name_too_long);

    std::string long_tag(300, 't');
    auto tag = classify_one({{"pool/fs@s", long_tag}}, "pool/fs@s");
    CHECK(tag.kind == FailureKind::name_too_long);
    CHECK(tag.name == long_tag);

    auto pools = classify_one({{"pool/fs@s", "t"}, {"other/fs@s", "t"}}, "pool/fs@s");
    CHECK(pools.kind == FailureKind::pools_differ);
}

TEST_CASE("hold list-level invalid argument") {
    NamePairs holds = {{"pool/fs@s", "t"}, {"pool/fs", "t"}};
    auto item = only_item(classify_hold(EINVAL, {}, holds));
    CHECK(item.kind == FailureKind::name_invalid);
    CHECK(item.name == std::string("pool/fs"));
}

TEST_CASE("hold without a name falls back to nameless kinds") {
    NamePairs holds = {{"pool/a@s", "t"}, {"pool/b@s", "t"}};
    auto item = only_item(classify_hold(ENOENT, {}, holds));
    CHECK(item.kind == FailureKind::filesystem_not_found);
    CHECK_FALSE(item.name.has_value());
}

TEST_CASE("release") {
    HoldReleases holds = {{"pool/fs@s", {"short", std::string(300, 't')}}};

    auto item = [&](int status) {
        ItemErrors errors;
        errors.items.emplace_back("pool/fs@s", status);
        return only_item(classify_release(status, errors, holds));
    };

    CHECK(item(EXDEV).kind == FailureKind::pools_differ);
    CHECK(item(ENOENT).kind == FailureKind::hold_not_found);

    auto big = item(E2BIG);
    CHECK(big.kind == FailureKind::name_too_long);
    CHECK(big.name == std::string(300, 't'));

    auto unsupported = item(ENOTSUP);
    CHECK(unsupported.kind == FailureKind::feature_not_supported);
    CHECK(unsupported.name == std::string("pool"));

    CHECK(item(EIO).message == "Failed to release snapshot hold");
}

TEST_CASE("release list-level invalid argument") {
    HoldReleases holds = {{"pool/fs@s", {"t"}}, {"pool/fs", {"t"}}};
    auto item = only_item(classify_release(EINVAL, {}, holds));
    CHECK(item.kind == FailureKind::name_invalid);
    CHECK(item.name == std::string("pool/fs"));
}

TEST_CASE("get_holds") {
    CHECK(single(classify_get_holds(EINVAL, "pool/fs")).kind == FailureKind::name_invalid);
    CHECK(single(classify_get_holds(EINVAL, kLong + "@s")).kind == FailureKind::name_too_long);
    CHECK(single(classify_get_holds(ENOENT, "pool/fs@s")).kind == FailureKind::snapshot_not_found);

    auto unsupported = single(classify_get_holds(ENOTSUP, "pool/fs@s"));
    CHECK(unsupported.kind == FailureKind::feature_not_supported);
    CHECK(unsupported.name == std::string("pool"));

    CHECK(single(classify_get_holds(EINVAL, "pool/fs@s")).message == "Failed to get holds on snapshot");
}

TEST_CASE("send") {
    auto pools = single(classify_send(EXDEV, "pool/fs@b", std::string("other/fs@a")));
    CHECK(pools.kind == FailureKind::pools_differ);
    CHECK(pools.name == std::string("pool/fs@b"));

    CHECK(single(classify_send(EXDEV, "pool/fs@b", std::string("pool/fs@a"))).kind ==
          FailureKind::snapshot_mismatch);

    CHECK(single(classify_send(EINVAL, "pool/fs@b", std::string("pool/fs"))).name ==
          std::string("pool/fs"));
    CHECK(single(classify_send(EINVAL, "pool/fs@b", std::string("pool/fs#mark"))).kind !=
          FailureKind::name_invalid);
    CHECK(single(classify_send(EINVAL, "pool//fs", std::nullopt)).kind == FailureKind::name_invalid);
    CHECK(single(classify_send(EINVAL, "pool/fs", std::nullopt)).kind == FailureKind::generic);
    CHECK(single(classify_send(EINVAL, "pool/fs@b", std::string(kLong + "@a"))).kind ==
          FailureKind::name_too_long);
    CHECK(single(classify_send(EINVAL, "pool/fs@b", std::string("other/fs@a"))).kind ==
          FailureKind::pools_differ);

    CHECK(single(classify_send(ENOENT, "pool/fs@b", std::string("pool/fs"))).kind ==
          FailureKind::name_invalid);
    CHECK(single(classify_send(ENOENT, "pool/fs@b", std::nullopt)).kind ==
          FailureKind::snapshot_not_found);

    auto too_long = single(classify_send(ENAMETOOLONG, "pool/fs@b", std::nullopt));
    CHECK(too_long.kind == FailureKind::name_too_long);
    CHECK(too_long.name == std::string("pool/fs@b"));

    auto other = single(classify_send(EPIPE, "pool/fs@b", std::nullopt));
    CHECK(other.kind == FailureKind::generic);
    CHECK(other.status == EPIPE);
}

TEST_CASE("send_space") {
    CHECK(single(classify_send_space(EXDEV, "pool/fs@b", std::string("other/fs@a"))).kind ==
          FailureKind::pools_differ);
    CHECK(single(classify_send_space(EINVAL, "pool/fs@b", std::string("pool/fs#mark"))).kind ==
          FailureKind::name_invalid);
    CHECK(single(classify_send_space(EINVAL, "pool/fs", std::nullopt)).kind ==
          FailureKind::name_invalid);
    CHECK(single(classify_send_space(ENOENT, "pool/fs@b", std::string("pool/fs"))).kind ==
          FailureKind::name_invalid);
    CHECK(single(classify_send_space(ENOENT, "pool/fs@b", std::nullopt)).kind ==
          FailureKind::snapshot_not_found);
    CHECK(single(classify_send_space(EIO, "pool/fs@b", std::nullopt)).message ==
          "Failed to estimate backup stream size");
}

TEST_CASE("receive") {
    const std::string snap = "pool/fs@s";
    CHECK(single(classify_receive(EINVAL, "pool/fs", std::nullopt)).kind == FailureKind::name_invalid);
    CHECK(single(classify_receive(EINVAL, kLong + "@s", std::nullopt)).kind == FailureKind::name_too_long);
    CHECK(single(classify_receive(EINVAL, snap, std::string("pool/o"))).kind == FailureKind::name_invalid);
    CHECK(single(classify_receive(EINVAL, snap, std::nullopt)).kind == FailureKind::bad_stream);
    CHECK(single(classify_receive(ENOENT, "pool/fs", std::nullopt)).kind == FailureKind::name_invalid);
    CHECK(single(classify_receive(ENOENT, snap, std::nullopt)).kind == FailureKind::dataset_not_found);
    CHECK(single(classify_receive(EEXIST, snap, std::nullopt)).kind == FailureKind::dataset_exists);
    CHECK(single(classify_receive(ENOTSUP, snap, std::nullopt)).kind ==
          FailureKind::stream_feature_not_supported);

    auto mismatch = single(classify_receive(ENODEV, snap, std::nullopt));
    CHECK(mismatch.kind == FailureKind::stream_mismatch);
    CHECK(mismatch.name == std::string("pool/fs"));

    CHECK(single(classify_receive(ETXTBSY, snap, std::nullopt)).kind == FailureKind::destination_modified);
    CHECK(single(classify_receive(EBUSY, snap, std::nullopt)).kind == FailureKind::dataset_busy);
    CHECK(single(classify_receive(ENOSPC, snap, std::nullopt)).kind == FailureKind::no_space);
    CHECK(single(classify_receive(EDQUOT, snap, std::nullopt)).kind == FailureKind::quota_exceeded);
    CHECK(single(classify_receive(ENAMETOOLONG, snap, std::nullopt)).kind == FailureKind::name_too_long);

    auto ro = single(classify_receive(EROFS, snap, std::nullopt));
    CHECK(ro.kind == FailureKind::read_only_pool);
    CHECK(ro.name == std::string("pool"));

    CHECK(single(classify_receive(EAGAIN, snap, std::nullopt)).kind == FailureKind::suspended_pool);
    CHECK(single(classify_receive(EPIPE, snap, std::nullopt)).kind == FailureKind::generic);
}

TEST_CASE("item errors from a decoded error map") {
    PropertyMap errlist{{"pool/a@s1", std::int32_t{EEXIST}},
                        {"N_MORE_ERRORS", std::int32_t{4}},
                        {"pool/b@s1", std::int32_t{ENOENT}}};
    ItemErrors errors = item_errors_from_properties(errlist);

    CHECK(errors.suppressed == 4);
    REQUIRE(errors.items.size() == 2);
    CHECK(errors.items[0].first == "pool/a@s1");
    CHECK(errors.items[0].second == EEXIST);
    CHECK(errors.items[1].first == "pool/b@s1");

    ItemErrors none = item_errors_from_properties(PropertyMap{{"pool/a@s", std::int32_t{EIO}}});
    CHECK(none.suppressed == 0);
}

TEST_CASE("a suppressed count without items is kept") {
    ItemErrors errors =
        item_errors_from_properties(PropertyMap{{"N_MORE_ERRORS", std::int32_t{5}}});
    CHECK(errors.items.empty());
    CHECK(errors.suppressed == 5);
    CHECK_FALSE(errors.empty());

    auto f = classify_snapshot(EEXIST, errors, {"pool/a@s", "pool/b@s"});
    REQUIRE(f.has_value());
    CHECK(f->kind == FailureKind::snapshot_failure);
    CHECK(f->errors.empty());
    CHECK(f->suppressed == 5);
}

TEST_CASE("throw_if_failed raises the classified failure") {
    try {
        throw_if_failed(classify_create(EEXIST, "pool/fs"));
        FAIL("expected OperationError");
    } catch (const OperationError& e) {
        CHECK(e.kind() == FailureKind::filesystem_exists);
        CHECK(e.status() == EEXIST);
        CHECK(e.failure().name == std::string("pool/fs"));
        CHECK(std::string(e.what()).find("pool/fs") != std::string::npos);
    }
}

TEST_CASE("dispatch by operation") {
    ClassifyRequest request;
    request.operation = Operation::hold;
    request.status = EEXIST;
    request.names = {"pool/fs@s"};
    request.values = {"tag"};
    auto f = classify(request);
    REQUIRE(f.has_value());
    CHECK(f->kind == FailureKind::hold_failure);
    CHECK(f->errors.at(0).kind == FailureKind::hold_exists);

    ClassifyRequest release;
    release.operation = Operation::release;
    release.status = E2BIG;
    release.names = {"pool/fs@s", "pool/fs@s"};
    release.values = {"a", std::string(300, 'b')};
    auto r = classify(release);
    REQUIRE(r.has_value());
    CHECK(r->errors.at(0).name == std::string(300, 'b'));

    ClassifyRequest clone;
    clone.operation = Operation::clone;
    clone.status = EINVAL;
    clone.names = {"pool/c"};
    CHECK_THROWS_AS(classify(clone), std::invalid_argument);

    ClassifyRequest empty;
    empty.operation = Operation::create;
    empty.status = EINVAL;
    CHECK_THROWS_AS(classify(empty), std::invalid_argument);
}
