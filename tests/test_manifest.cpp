#include <catch2/catch.hpp>
#include <softpack/manifest.hpp>

using namespace softpack;

// ===== Package =====

TEST_CASE("parse package with and without version", "[manifest]") {
    auto plain = Package::parse("zlib");
    REQUIRE(plain.is_ok());
    REQUIRE(plain.value().name == "zlib");
    REQUIRE_FALSE(plain.value().version);

    auto pinned = Package::parse("py-numpy@1.26.4");
    REQUIRE(pinned.is_ok());
    REQUIRE(pinned.value().name == "py-numpy");
    REQUIRE(pinned.value().version == std::string("1.26.4"));
    REQUIRE(pinned.value().to_string() == "py-numpy@1.26.4");
}

TEST_CASE("package version splits on the first @", "[manifest]") {
    auto r = Package::parse("tool@1.0@extra");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().name == "tool");
    REQUIRE(r.value().version == std::string("1.0@extra"));
}

TEST_CASE("package with an empty version has none", "[manifest]") {
    auto r = Package::parse("zlib@");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().version);
    REQUIRE(r.value().to_string() == "zlib");
}

TEST_CASE("package without a name is rejected", "[manifest]") {
    REQUIRE(Package::parse("").is_err(SoftpackError::Manifest));
    REQUIRE(Package::parse("@1.0").is_err(SoftpackError::Manifest));
}

TEST_CASE("a leading star marks a requested recipe", "[manifest]") {
    auto r = Package::parse("*a_recipe@1.2");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_requested());
    REQUIRE(r.value().name == "*a_recipe");
    REQUIRE(r.value().version == std::string("1.2"));
    REQUIRE_FALSE(Package::parse("zlib@1.3").value().is_requested());
}

// ===== EnvManifest =====

TEST_CASE("parse softpack.yml", "[manifest]") {
    auto r = EnvManifest::parse(R"(
description: |
  Tools for variant calling
  with pinned versions
packages:
  - bcftools@1.19
  - htslib
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().description == "Tools for variant calling\nwith pinned versions\n");
    REQUIRE(r.value().packages.size() == 2);
    REQUIRE(r.value().packages[0] == (Package{"bcftools", std::string("1.19")}));
    REQUIRE(r.value().packages[1] == (Package{"htslib", std::nullopt}));
}

TEST_CASE("manifest emit parses back to the same value", "[manifest]") {
    EnvManifest m{"multi\nline: with colon\n", {Package{"r", std::string("4.3")},
                                                Package{"r-ggplot2", std::nullopt}}};
    auto back = EnvManifest::parse(m.emit());
    REQUIRE(back.is_ok());
    REQUIRE(back.value().description == m.description);
    REQUIRE(back.value().packages == m.packages);

    EnvManifest single{"one: line", {Package{"zlib", std::nullopt}}};
    auto back2 = EnvManifest::parse(single.emit());
    REQUIRE(back2.value().description == "one: line");
}

TEST_CASE("manifest emit is stable", "[manifest]") {
    EnvManifest m{"desc", {Package{"zlib", std::string("1.3")}}};
    REQUIRE(m.emit() == "description: desc\npackages:\n  - zlib@1.3\n");
    REQUIRE(m.emit() == EnvManifest::parse(m.emit()).value().emit());
}

TEST_CASE("manifest errors", "[manifest]") {
    REQUIRE(EnvManifest::parse("[not, a, map]").is_err(SoftpackError::Manifest));
    REQUIRE(EnvManifest::parse("packages: zlib\n").is_err(SoftpackError::Manifest));
    REQUIRE(EnvManifest::parse("packages:\n  - \"@1\"\n").is_err(SoftpackError::Manifest));
    REQUIRE(EnvManifest::parse("description: [unclosed\n").is_err(SoftpackError::Parse));
}

TEST_CASE("requested packages survive emit", "[manifest]") {
    EnvManifest m{"desc", {Package{"*a_recipe", std::string("1.2")},
                           Package{"zlib", std::nullopt}}};
    auto back = EnvManifest::parse(m.emit());
    REQUIRE(back.is_ok());
    REQUIRE(back.value().packages == m.packages);
    REQUIRE(back.value().packages[0].is_requested());
}

// ===== EnvMetadata =====

TEST_CASE("empty metadata has defaults", "[manifest]") {
    for (const char* text : {"", "{}", "~"}) {
        auto r = EnvMetadata::parse(text);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().tags.empty());
        REQUIRE_FALSE(r.value().force_hidden);
        REQUIRE_FALSE(r.value().failure_reason);
        REQUIRE_FALSE(r.value().username);
    }
    REQUIRE(EnvMetadata{}.emit() == "{}\n");
}

TEST_CASE("metadata tags are sorted and deduplicated", "[manifest]") {
    auto r = EnvMetadata::parse("tags: [zeta, alpha, zeta]\nforce_hidden: true\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tags == std::vector<std::string>{"alpha", "zeta"});
    REQUIRE(r.value().force_hidden);

    auto meta = r.value();
    REQUIRE(meta.add_tag("mid"));
    REQUIRE_FALSE(meta.add_tag("alpha"));
    REQUIRE(meta.tags == std::vector<std::string>{"alpha", "mid", "zeta"});
}

TEST_CASE("metadata keeps every field through emit", "[manifest]") {
    EnvMetadata meta;
    meta.add_tag("prod");
    meta.force_hidden = true;
    meta.failure_reason = "concretization";
    meta.username = "ann";

    auto back = EnvMetadata::parse(meta.emit());
    REQUIRE(back.is_ok());
    REQUIRE(back.value().tags == meta.tags);
    REQUIRE(back.value().force_hidden);
    REQUIRE(back.value().failure_reason == std::string("concretization"));
    REQUIRE(back.value().username == std::string("ann"));
}

TEST_CASE("metadata errors", "[manifest]") {
    REQUIRE(EnvMetadata::parse("- a list\n").is_err(SoftpackError::Manifest));
    REQUIRE(EnvMetadata::parse("tags: notalist\n").is_err(SoftpackError::Manifest));
    REQUIRE(EnvMetadata::parse("force_hidden: maybe\n").is_err(SoftpackError::Manifest));
}

// ===== SuffixLedger =====

TEST_CASE("ledger tracks the highest suffix per name", "[manifest]") {
    auto r = SuffixLedger::parse("myenv: 3\nother: 1\n");
    REQUIRE(r.is_ok());
    auto ledger = r.value();
    REQUIRE(ledger.last("myenv") == 3);
    REQUIRE(ledger.last("unknown") == 0);

    ledger.record("myenv", 2);
    REQUIRE(ledger.last("myenv") == 3);
    ledger.record("myenv", 4);
    ledger.record("fresh", 1);

    auto back = SuffixLedger::parse(ledger.emit());
    REQUIRE(back.is_ok());
    REQUIRE(back.value().issued == ledger.issued);
}

TEST_CASE("ledger errors", "[manifest]") {
    REQUIRE(SuffixLedger::parse("").value().issued.empty());
    REQUIRE(SuffixLedger::parse("- 1\n").is_err(SoftpackError::Manifest));
    REQUIRE(SuffixLedger::parse("myenv: three\n").is_err(SoftpackError::Manifest));
}

// ===== RecipeRequest =====

TEST_CASE("parse a recipe request", "[manifest]") {
    auto r = RecipeRequest::parse(R"(
name: a_recipe
version: "1.2"
description: does things
url: https://example.org/a_recipe
username: ann
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().name == "a_recipe");
    REQUIRE(r.value().version == "1.2");
    REQUIRE(r.value().description == "does things");
    REQUIRE(r.value().url == "https://example.org/a_recipe");
    REQUIRE(r.value().username == "ann");
    REQUIRE(r.value().file_name() == "a_recipe@1.2");
    REQUIRE(r.value().placeholder() == (Package{"*a_recipe", std::string("1.2")}));
}

TEST_CASE("recipe request optional fields default to empty", "[manifest]") {
    auto r = RecipeRequest::parse("name: tool\nversion: 2.0\nurl: ~\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().version == "2.0");
    REQUIRE(r.value().url.empty());
    REQUIRE(r.value().description.empty());
    REQUIRE(r.value().username.empty());
}

TEST_CASE("recipe request keeps numeric-looking versions through emit", "[manifest]") {
    RecipeRequest req{"tool", "1.10", "multi\nline", "", "bob"};
    auto back = RecipeRequest::parse(req.emit());
    REQUIRE(back.is_ok());
    REQUIRE(back.value().version == "1.10");
    REQUIRE(back.value().description == "multi\nline");
    REQUIRE(back.value().username == "bob");
}

TEST_CASE("recipe request errors", "[manifest]") {
    REQUIRE(RecipeRequest::parse("[a, b]").is_err(SoftpackError::Manifest));
    REQUIRE(RecipeRequest::parse("name: tool\n").is_err(SoftpackError::Manifest));
    REQUIRE(RecipeRequest::parse("version: 1\n").is_err(SoftpackError::Manifest));
    REQUIRE(RecipeRequest::parse("name: [x]\nversion: 1\n").is_err(SoftpackError::Manifest));
}
