#pragma once

#include <softpack/result.hpp>
#include <optional>
#include <string>

namespace softpack {

// Environment folder name: [A-Za-z0-9][A-Za-z0-9_.-]*
// A trailing "-<N>" is the collision suffix assigned at creation.
struct EnvName {
    static Result<EnvName> parse(const std::string& raw);

    const std::string& raw() const { return raw_; }

    // Name without the "-<N>" suffix (the whole name if there is none)
    const std::string& base() const { return base_; }
    std::optional<int> suffix() const { return suffix_; }

    // "<base>-<n>"
    static std::string with_suffix(const std::string& base, int n);

private:
    std::string raw_;
    std::string base_;
    std::optional<int> suffix_;
};

// Owner path: exactly "users/<segment>" or "groups/<segment>"
struct OwnerPath {
    enum Kind { User, Group };

    static Result<OwnerPath> parse(const std::string& raw);

    Kind kind() const { return kind_; }
    const std::string& owner() const { return owner_; }
    std::string str() const;

private:
    Kind kind_ = User;
    std::string owner_;
};

// Tags must be non-empty after trimming, carry no surrounding whitespace,
// no runs of whitespace and no path separators or "..".
Status validate_tag(const std::string& tag);

// Requested recipe name and version, each [A-Za-z0-9][A-Za-z0-9_.-]*
Status validate_recipe(const std::string& name, const std::string& version);

} // namespace softpack
