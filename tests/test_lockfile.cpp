#include <catch2/catch.hpp>
#include <softpack/lockfile.hpp>

using namespace softpack;

TEST_CASE("interpreters come from the first matching specs", "[lockfile]") {
    auto r = parse_interpreters(R"({
        "_meta": {"file-type": "spack-lockfile", "lockfile-version": 5},
        "roots": [{"hash": "aaa", "spec": "py-numpy"}],
        "concrete_specs": {
            "zzz": {"name": "python", "version": "3.12.1"},
            "aaa": {"name": "py-numpy", "version": "1.26.4"},
            "bbb": {"name": "python", "version": "3.11.0"},
            "ccc": {"name": "r", "version": "4.4.0"}
        }
    })");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().python == std::string("3.12.1"));
    REQUIRE(r.value().r == std::string("4.4.0"));
}

TEST_CASE("lock without interpreters yields none", "[lockfile]") {
    auto r = parse_interpreters(R"({"concrete_specs": {"a": {"name": "zlib", "version": "1.3"}}})");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().python);
    REQUIRE_FALSE(r.value().r);

    auto bare = parse_interpreters("{}");
    REQUIRE(bare.is_ok());
    REQUIRE_FALSE(bare.value().python);
}

TEST_CASE("malformed spec entries are skipped", "[lockfile]") {
    auto r = parse_interpreters(R"({"concrete_specs": {
        "a": "not an object",
        "b": {"name": "python"},
        "c": {"name": "python", "version": 3},
        "d": {"name": "python", "version": "3.10.2"}
    }})");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().python == std::string("3.10.2"));
}

TEST_CASE("invalid JSON is a parse error", "[lockfile]") {
    auto r = parse_interpreters("{\"concrete_specs\": ");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SoftpackError::Parse);
}
