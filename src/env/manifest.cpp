#include <softpack/manifest.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <utility>

namespace softpack {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<YAML::Node> load_document(const std::string& yaml, const char* what) {
    try {
        return Result<YAML::Node>::ok(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        return SoftpackError{SoftpackError::Parse,
            std::string("invalid ") + what + ": " + e.what()};
    }
}

static std::string emit_document(YAML::Emitter& out) {
    std::string text = out.c_str();
    if (text.empty() || text.back() != '\n') text += '\n';
    return text;
}

// ---------------------------------------------------------------------------
// Package
// ---------------------------------------------------------------------------

Result<Package> Package::parse(const std::string& spec) {
    Package pkg;
    auto at = spec.find('@');
    pkg.name = spec.substr(0, at);
    if (at != std::string::npos && at + 1 < spec.size()) {
        pkg.version = spec.substr(at + 1);
    }

    if (pkg.name.empty()) {
        return SoftpackError{SoftpackError::Manifest,
            "package '" + spec + "' has no name"};
    }
    return Result<Package>::ok(std::move(pkg));
}

std::string Package::to_string() const {
    return version ? name + "@" + *version : name;
}

// ---------------------------------------------------------------------------
// EnvManifest
// ---------------------------------------------------------------------------

Result<EnvManifest> EnvManifest::parse(const std::string& yaml) {
    auto doc = load_document(yaml, kManifestFile);
    if (doc.is_err()) return std::move(doc).error();
    const YAML::Node& root = doc.value();

    if (!root.IsMap()) {
        return SoftpackError{SoftpackError::Manifest,
            std::string(kManifestFile) + " must be a mapping"};
    }

    EnvManifest manifest;
    try {
        if (root["description"]) {
            manifest.description = root["description"].as<std::string>();
        }

        const YAML::Node& pkgs = root["packages"];
        if (pkgs && !pkgs.IsNull()) {
            if (!pkgs.IsSequence()) {
                return SoftpackError{SoftpackError::Manifest,
                    "'packages' must be a list"};
            }
            for (const auto& item : pkgs) {
                auto pkg = Package::parse(item.as<std::string>());
                if (pkg.is_err()) return std::move(pkg).error();
                manifest.packages.push_back(std::move(pkg).value());
            }
        }
    } catch (const YAML::Exception& e) {
        return SoftpackError{SoftpackError::Manifest,
            std::string("invalid ") + kManifestFile + ": " + e.what()};
    }

    return Result<EnvManifest>::ok(std::move(manifest));
}

std::string EnvManifest::emit() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "description";
    if (description.find('\n') != std::string::npos) {
        out << YAML::Value << YAML::Literal << description;
    } else {
        out << YAML::Value << description;
    }
    out << YAML::Key << "packages" << YAML::Value << YAML::BeginSeq;
    for (const auto& pkg : packages) {
        // A leading '*' would read back as an alias
        if (pkg.is_requested()) out << YAML::DoubleQuoted;
        out << pkg.to_string();
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return emit_document(out);
}

// ---------------------------------------------------------------------------
// EnvMetadata
// ---------------------------------------------------------------------------

Result<EnvMetadata> EnvMetadata::parse(const std::string& yaml) {
    EnvMetadata meta;

    auto doc = load_document(yaml, kMetadataFile);
    if (doc.is_err()) return std::move(doc).error();
    const YAML::Node& root = doc.value();

    if (!root || root.IsNull()) return Result<EnvMetadata>::ok(std::move(meta));
    if (!root.IsMap()) {
        return SoftpackError{SoftpackError::Manifest,
            std::string(kMetadataFile) + " must be a mapping"};
    }

    try {
        const YAML::Node& tags = root["tags"];
        if (tags && !tags.IsNull()) {
            if (!tags.IsSequence()) {
                return SoftpackError{SoftpackError::Manifest, "'tags' must be a list"};
            }
            for (const auto& t : tags) meta.add_tag(t.as<std::string>());
        }
        if (root["force_hidden"]) {
            meta.force_hidden = root["force_hidden"].as<bool>();
        }
        if (root["failure_reason"] && !root["failure_reason"].IsNull()) {
            meta.failure_reason = root["failure_reason"].as<std::string>();
        }
        if (root["username"] && !root["username"].IsNull()) {
            meta.username = root["username"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return SoftpackError{SoftpackError::Manifest,
            std::string("invalid ") + kMetadataFile + ": " + e.what()};
    }

    return Result<EnvMetadata>::ok(std::move(meta));
}

std::string EnvMetadata::emit() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    if (!tags.empty()) {
        out << YAML::Key << "tags" << YAML::Value << YAML::BeginSeq;
        for (const auto& t : tags) out << t;
        out << YAML::EndSeq;
    }
    if (force_hidden) {
        out << YAML::Key << "force_hidden" << YAML::Value << true;
    }
    if (failure_reason) {
        out << YAML::Key << "failure_reason" << YAML::Value << *failure_reason;
    }
    if (username) {
        out << YAML::Key << "username" << YAML::Value << *username;
    }
    out << YAML::EndMap;
    return emit_document(out);
}

bool EnvMetadata::add_tag(const std::string& tag) {
    auto it = std::lower_bound(tags.begin(), tags.end(), tag);
    if (it != tags.end() && *it == tag) return false;
    tags.insert(it, tag);
    return true;
}

// ---------------------------------------------------------------------------
// SuffixLedger
// ---------------------------------------------------------------------------

Result<SuffixLedger> SuffixLedger::parse(const std::string& yaml) {
    SuffixLedger ledger;

    auto doc = load_document(yaml, kSuffixLedgerFile);
    if (doc.is_err()) return std::move(doc).error();
    const YAML::Node& root = doc.value();

    if (!root || root.IsNull()) return Result<SuffixLedger>::ok(std::move(ledger));
    if (!root.IsMap()) {
        return SoftpackError{SoftpackError::Manifest,
            std::string(kSuffixLedgerFile) + " must be a mapping"};
    }

    try {
        for (const auto& kv : root) {
            ledger.issued[kv.first.as<std::string>()] = kv.second.as<int>();
        }
    } catch (const YAML::Exception& e) {
        return SoftpackError{SoftpackError::Manifest,
            std::string("invalid ") + kSuffixLedgerFile + ": " + e.what()};
    }

    return Result<SuffixLedger>::ok(std::move(ledger));
}

std::string SuffixLedger::emit() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& kv : issued) {
        out << YAML::Key << kv.first << YAML::Value << kv.second;
    }
    out << YAML::EndMap;
    return emit_document(out);
}

int SuffixLedger::last(const std::string& name) const {
    auto it = issued.find(name);
    return it == issued.end() ? 0 : it->second;
}

void SuffixLedger::record(const std::string& name, int suffix) {
    int& slot = issued[name];
    slot = std::max(slot, suffix);
}

// ---------------------------------------------------------------------------
// RecipeRequest
// ---------------------------------------------------------------------------

Result<RecipeRequest> RecipeRequest::parse(const std::string& yaml) {
    auto doc = load_document(yaml, "recipe request");
    if (doc.is_err()) return std::move(doc).error();
    const YAML::Node& root = doc.value();

    if (!root.IsMap()) {
        return SoftpackError{SoftpackError::Manifest, "recipe request must be a mapping"};
    }

    RecipeRequest req;
    try {
        for (auto field : {std::make_pair("name", &req.name),
                           std::make_pair("version", &req.version)}) {
            if (!root[field.first] || root[field.first].IsNull()) {
                return SoftpackError{SoftpackError::Manifest,
                    std::string("recipe request has no '") + field.first + "'"};
            }
            *field.second = root[field.first].as<std::string>();
        }
        for (auto field : {std::make_pair("description", &req.description),
                           std::make_pair("url", &req.url),
                           std::make_pair("username", &req.username)}) {
            if (root[field.first] && !root[field.first].IsNull()) {
                *field.second = root[field.first].as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        return SoftpackError{SoftpackError::Manifest,
            std::string("invalid recipe request: ") + e.what()};
    }

    return Result<RecipeRequest>::ok(std::move(req));
}

std::string RecipeRequest::emit() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << YAML::DoubleQuoted << name;
    out << YAML::Key << "version" << YAML::Value << YAML::DoubleQuoted << version;
    out << YAML::Key << "description" << YAML::Value << description;
    out << YAML::Key << "url" << YAML::Value << url;
    out << YAML::Key << "username" << YAML::Value << username;
    out << YAML::EndMap;
    return emit_document(out);
}

} // namespace softpack
