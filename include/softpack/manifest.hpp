#pragma once

#include <softpack/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace softpack {

// Fixed file names inside an environment folder
constexpr const char* kManifestFile = "softpack.yml";
constexpr const char* kMetadataFile = "meta.yml";
constexpr const char* kBuiltBySoftpackFile = ".built_by_softpack";
constexpr const char* kGeneratedFromModuleFile = ".generated_from_module";
constexpr const char* kBuilderOutFile = "builder.out";
constexpr const char* kModuleFile = "module";
constexpr const char* kLockFile = "spack.lock";
constexpr const char* kReadmeFile = "README.md";

// Per-owner-folder record of the highest suffix issued per name
constexpr const char* kSuffixLedgerFile = ".versions.yml";

// Leading marker of a package that names a requested recipe
constexpr char kRequestedMarker = '*';

// One requested package: "name" or "name@version"
struct Package {
    std::string name;
    std::optional<std::string> version;

    // Splits on the first '@'. An empty name is a Manifest error.
    static Result<Package> parse(const std::string& spec);

    std::string to_string() const;

    // "*name": waits on a recipe request rather than an existing recipe
    bool is_requested() const { return !name.empty() && name[0] == kRequestedMarker; }

    bool operator==(const Package& o) const {
        return name == o.name && version == o.version;
    }
};

// softpack.yml
struct EnvManifest {
    std::string description;
    std::vector<Package> packages;

    static Result<EnvManifest> parse(const std::string& yaml);
    std::string emit() const;
};

// meta.yml. An empty document is valid and yields the defaults.
struct EnvMetadata {
    std::vector<std::string> tags;          // sorted, unique
    bool force_hidden = false;
    std::optional<std::string> failure_reason;
    std::optional<std::string> username;    // owed a build notification

    static Result<EnvMetadata> parse(const std::string& yaml);
    std::string emit() const;

    // Insert keeping order; false when the tag was already present
    bool add_tag(const std::string& tag);
};

// .versions.yml: name -> last suffix issued
struct SuffixLedger {
    std::map<std::string, int> issued;

    static Result<SuffixLedger> parse(const std::string& yaml);
    std::string emit() const;

    int last(const std::string& name) const;
    void record(const std::string& name, int suffix);
};

// One file per request under requested-recipes/, named "<name>@<version>"
struct RecipeRequest {
    std::string name;
    std::string version;
    std::string description;
    std::string url;
    std::string username;

    static Result<RecipeRequest> parse(const std::string& yaml);
    std::string emit() const;

    std::string file_name() const { return name + "@" + version; }

    // The package an environment lists while it waits on this request
    Package placeholder() const {
        return Package{std::string(1, kRequestedMarker) + name, version};
    }
};

} // namespace softpack
