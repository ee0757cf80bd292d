#include <softpack/name.hpp>
#include <cctype>

namespace softpack {

static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '_' || c == '.' || c == '-';
}

static Status check_segment(const std::string& raw, const char* what) {
    if (raw.empty()) {
        return SoftpackError{SoftpackError::InvalidArg,
            std::string("empty ") + what};
    }

    if (!std::isalnum(static_cast<unsigned char>(raw[0]))) {
        return SoftpackError{SoftpackError::InvalidArg,
            std::string("invalid ") + what + " '" + raw + "'",
            std::string(what) + "s must start with a letter or digit"};
    }

    for (size_t i = 1; i < raw.size(); ++i) {
        if (!is_name_char(raw[i])) {
            return SoftpackError{SoftpackError::InvalidArg,
                "invalid character '" + std::string(1, raw[i]) +
                "' in " + what + " '" + raw + "'",
                "allowed: [A-Za-z0-9_.-]"};
        }
    }
    return ok_status();
}

Result<EnvName> EnvName::parse(const std::string& raw) {
    SOFTPACK_TRY(check_segment(raw, "environment name"));

    EnvName name;
    name.raw_ = raw;
    name.base_ = raw;

    auto dash = raw.rfind('-');
    if (dash != std::string::npos && dash > 0 && dash + 1 < raw.size()) {
        std::string digits = raw.substr(dash + 1);
        bool all_digits = digits.size() <= 9;
        for (char c : digits) {
            if (!std::isdigit(static_cast<unsigned char>(c))) all_digits = false;
        }
        if (all_digits) {
            name.base_ = raw.substr(0, dash);
            name.suffix_ = std::stoi(digits);
        }
    }

    return Result<EnvName>::ok(std::move(name));
}

std::string EnvName::with_suffix(const std::string& base, int n) {
    return base + "-" + std::to_string(n);
}

Result<OwnerPath> OwnerPath::parse(const std::string& raw) {
    auto slash = raw.find('/');
    if (slash == std::string::npos) {
        return SoftpackError{SoftpackError::InvalidArg,
            "invalid path '" + raw + "'",
            "expected users/<name> or groups/<name>"};
    }

    OwnerPath p;
    std::string root = raw.substr(0, slash);
    if (root == "users") {
        p.kind_ = User;
    } else if (root == "groups") {
        p.kind_ = Group;
    } else {
        return SoftpackError{SoftpackError::InvalidArg,
            "invalid path '" + raw + "'",
            "expected users/<name> or groups/<name>"};
    }

    p.owner_ = raw.substr(slash + 1);
    if (p.owner_.find('/') != std::string::npos) {
        return SoftpackError{SoftpackError::InvalidArg,
            "invalid path '" + raw + "'",
            "the owner must be a single path segment"};
    }
    SOFTPACK_TRY(check_segment(p.owner_, "owner"));

    return Result<OwnerPath>::ok(std::move(p));
}

std::string OwnerPath::str() const {
    return std::string(kind_ == User ? "users/" : "groups/") + owner_;
}

Status validate_tag(const std::string& tag) {
    auto first = tag.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return SoftpackError{SoftpackError::InvalidArg, "tag must not be empty"};
    }

    auto last = tag.find_last_not_of(" \t\r\n");
    if (first != 0 || last != tag.size() - 1) {
        return SoftpackError{SoftpackError::InvalidArg,
            "tag '" + tag + "' has leading or trailing whitespace"};
    }

    for (size_t i = 1; i < tag.size(); ++i) {
        if (std::isspace(static_cast<unsigned char>(tag[i])) &&
            std::isspace(static_cast<unsigned char>(tag[i - 1]))) {
            return SoftpackError{SoftpackError::InvalidArg,
                "tag '" + tag + "' contains a run of whitespace"};
        }
    }

    if (tag.find('/') != std::string::npos ||
        tag.find('\\') != std::string::npos ||
        tag.find("..") != std::string::npos) {
        return SoftpackError{SoftpackError::InvalidArg,
            "tag '" + tag + "' contains a path sequence",
            "'/', '\\' and '..' are not allowed"};
    }

    return ok_status();
}

Status validate_recipe(const std::string& name, const std::string& version) {
    SOFTPACK_TRY(check_segment(name, "recipe name"));
    SOFTPACK_TRY(check_segment(version, "recipe version"));
    return ok_status();
}

} // namespace softpack
