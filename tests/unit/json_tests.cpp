#include <doctest/doctest.h>
#include <lzc/property_json.hpp>

#include <cerrno>

using namespace lzc;

// ============================================================================
// Property Map Parsing
// ============================================================================

TEST_CASE("untagged JSON values map to their natural property form") {
    auto result = parse_property_map(R"({
        "zed": null,
        "readonly": true,
        "mountpoint": "/mnt/data",
        "quota": 1073741824,
        "offset": -5,
        "user": {"com.example:owner": "ops"},
        "tags": ["a", "b"]
    })");
    REQUIRE(result.ok);
    const PropertyMap& props = result.value;

    REQUIRE(props.size() == 7);
    CHECK(props.at("zed").holds<Absent>());
    CHECK(props.at("readonly").get<bool>());
    CHECK(props.at("mountpoint").get<std::string>() == "/mnt/data");
    CHECK(props.at("quota").get<std::uint64_t>() == 1073741824u);
    CHECK(props.at("offset").get<std::int64_t>() == -5);
    CHECK(props.at("user").get<PropertyMap>().at("com.example:owner").get<std::string>() == "ops");
    CHECK(props.at("tags").get<PropertyArray>().size() == 2);
}

TEST_CASE("parsing keeps document key order") {
    auto result = parse_property_map(R"({"zeta": 1, "alpha": 2, "mid": 3})");
    REQUIRE(result.ok);

    std::vector<std::string> keys;
    for (const auto& entry : result.value) {
        keys.push_back(entry.first);
    }
    CHECK(keys == std::vector<std::string>{"zeta", "alpha", "mid"});
}

TEST_CASE("tagged values select an explicit width") {
    auto result = parse_property_map(R"({
        "a": {"$type": "uint32", "value": 7},
        "b": {"$type": "int8", "value": -3},
        "c": {"$type": "byte", "value": 255},
        "d": {"$type": "int64", "value": 12},
        "e": {"$type": "uint16_array", "value": [1, 2, 3]}
    })");
    REQUIRE(result.ok);
    const PropertyMap& props = result.value;

    CHECK(props.at("a").get<std::uint32_t>() == 7u);
    CHECK(props.at("b").get<std::int8_t>() == -3);
    CHECK(props.at("c").get<std::byte>() == std::byte{0xff});
    CHECK(props.at("d").get<std::int64_t>() == 12);

    const auto& arr = props.at("e").get<PropertyArray>();
    REQUIRE(arr.size() == 3);
    CHECK(arr[2].get<std::uint16_t>() == 3u);
}

TEST_CASE("malformed property documents are rejected") {
    SUBCASE("not an object") {
        auto result = parse_property_map("[1, 2]");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "JSON must be an object");
    }
    SUBCASE("syntax error") {
        auto result = parse_property_map("{\"a\": ");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("JSON parse error") == 0);
    }
    SUBCASE("floating point") {
        auto result = parse_property_map(R"({"ratio": 1.5})");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("ratio") != std::string::npos);
    }
    SUBCASE("out of range tagged value") {
        auto result = parse_property_map(R"({"small": {"$type": "uint8", "value": 256}})");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("small") != std::string::npos);
    }
    SUBCASE("negative value for unsigned tag") {
        auto result = parse_property_map(R"({"n": {"$type": "uint32", "value": -1}})");
        CHECK_FALSE(result.ok);
    }
    SUBCASE("unknown tag") {
        auto result = parse_property_map(R"({"n": {"$type": "float", "value": 1}})");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("unknown $type") != std::string::npos);
    }
    SUBCASE("tag that can not be tagged") {
        auto result = parse_property_map(R"({"n": {"$type": "string", "value": "x"}})");
        CHECK_FALSE(result.ok);
    }
    SUBCASE("error path names the nested key") {
        auto result = parse_property_map(R"({"outer": {"inner": [1, 2.5]}})");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("outer.inner[1]") != std::string::npos);
    }
}

TEST_CASE("property_map_from_json keeps the parsed document's key order") {
    auto j = nlohmann::ordered_json::parse(R"({"sync": "always", "compression": "lz4"})");
    auto result = property_map_from_json(j);
    REQUIRE(result.ok);
    REQUIRE(result.value.size() == 2);
    CHECK(result.value.begin()->first == "sync");
    CHECK(result.value.at("compression").get<std::string>() == "lz4");

    auto bad = property_map_from_json(nlohmann::ordered_json::array());
    CHECK_FALSE(bad.ok);
}

// ============================================================================
// Property Map Output
// ============================================================================

TEST_CASE("output tags every width without a natural JSON form") {
    PropertyMap props{{"flag", Absent{}},
                      {"on", true},
                      {"count", std::uint64_t{9}},
                      {"neg", std::int64_t{-1}},
                      {"pos", std::int64_t{1}},
                      {"narrow", std::uint32_t{4}},
                      {"b", std::byte{0x10}}};
    auto j = property_map_to_json(props);

    CHECK(j["flag"].is_null());
    CHECK(j["on"] == true);
    CHECK(j["count"] == 9);
    CHECK(j["neg"] == -1);
    CHECK(j["pos"]["$type"] == "int64");
    CHECK(j["narrow"]["$type"] == "uint32");
    CHECK(j["narrow"]["value"] == 4);
    CHECK(j["b"]["$type"] == "byte");
    CHECK(j["b"]["value"] == 16);
}

TEST_CASE("output re-parses to an equal map") {
    PropertyMap nested{{"x", std::int16_t{-2}}};
    PropertyMap props{{"nested", nested},
                      {"list", PropertyArray{std::uint32_t{1}, std::uint32_t{2}}},
                      {"name", "pool/fs"},
                      {"pos", std::int64_t{3}}};

    auto result = parse_property_map(property_map_to_json(props).dump());
    REQUIRE(result.ok);
    CHECK(result.value == props);
}

// ============================================================================
// Item Errors
// ============================================================================

TEST_CASE("item errors accept numbers and errno names") {
    auto result = parse_item_errors(R"({"pool/a@s": "EEXIST", "pool/b@s": 2, "N_MORE_ERRORS": 4})");
    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    CHECK(result.value.suppressed == 4);
    REQUIRE(result.value.items.size() == 2);
    CHECK(result.value.items[0].second == EEXIST);
    CHECK(result.value.items[1].first == "pool/b@s");
    CHECK(result.value.items[1].second == 2);
}

TEST_CASE("item errors with unknown statuses produce warnings") {
    auto result = parse_item_errors(R"({"pool/a@s": "EWHAT", "pool/b@s": true})");
    REQUIRE(result.ok);
    CHECK(result.value.items.empty());
    REQUIRE(result.warnings.size() == 2);
    CHECK(result.warnings[0] == "invalid_status:pool/a@s");
    CHECK(result.warnings[1] == "invalid_status:pool/b@s");

    CHECK_FALSE(parse_item_errors("[]").ok);
    CHECK_FALSE(parse_item_errors("{").ok);
}

TEST_CASE("item errors outside int range are not truncated") {
    auto result = parse_item_errors(
        R"({"pool/a@s": 4294967313, "pool/b@s": -4294967296, "pool/c@s": 17})");
    REQUIRE(result.ok);
    REQUIRE(result.value.items.size() == 1);
    CHECK(result.value.items[0].first == "pool/c@s");
    CHECK(result.value.items[0].second == 17);
    REQUIRE(result.warnings.size() == 2);
    CHECK(result.warnings[0] == "invalid_status:pool/a@s");
    CHECK(result.warnings[1] == "invalid_status:pool/b@s");
}

TEST_CASE("an error map with only a suppressed count is not empty") {
    auto result = parse_item_errors(R"({"N_MORE_ERRORS": 5})");
    REQUIRE(result.ok);
    CHECK(result.value.items.empty());
    CHECK(result.value.suppressed == 5);
    CHECK(result.value.has_more);
    CHECK_FALSE(result.value.empty());
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("failure JSON carries kind, errno and name") {
    auto j = failure_to_json(make_failure(FailureKind::snapshot_exists, EEXIST, "pool/fs@s"));
    CHECK(j["kind"] == "snapshot_exists");
    CHECK(j["status"] == EEXIST);
    CHECK(j["errno"] == "EEXIST");
    CHECK(j["name"] == "pool/fs@s");
    CHECK_FALSE(j.contains("errors"));

    auto nameless = failure_to_json(make_failure(FailureKind::bad_stream, EINVAL));
    CHECK(nameless["name"].is_null());
}

TEST_CASE("batch failure JSON nests item failures") {
    auto batch = make_batch_failure(
        FailureKind::snapshot_failure, EEXIST,
        {make_failure(FailureKind::snapshot_exists, EEXIST, "pool/a@s")}, 3);
    auto j = failure_to_json(batch);

    CHECK(j["kind"] == "snapshot_failure");
    CHECK(j["suppressed"] == 3);
    REQUIRE(j["errors"].size() == 1);
    CHECK(j["errors"][0]["name"] == "pool/a@s");
}
