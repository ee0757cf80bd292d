#include <softpack/template.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace softpack {

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Build a hint listing available variable names
static std::string available_vars_hint(const TemplateVars& vars) {
    if (vars.empty()) return "no variables defined";
    std::vector<std::string> keys;
    keys.reserve(vars.size());
    for (const auto& kv : vars) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());

    std::string hint = "available variables: ";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) hint += ", ";
        hint += keys[i];
    }
    return hint;
}

// Shared scanner; `strict` decides whether problems abort or pass through
static Result<std::string> expand(const std::string& tmpl, const TemplateVars& vars,
                                  bool strict) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;

    while (i < tmpl.size()) {
        char c = tmpl[i];
        if (c != '$') {
            out += c;
            ++i;
            continue;
        }

        if (i + 1 < tmpl.size() && tmpl[i + 1] == '$') {
            out += '$';
            i += 2;
            continue;
        }

        size_t name_start;
        size_t name_end;
        size_t next;
        if (i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
            name_start = i + 2;
            size_t close = tmpl.find('}', name_start);
            if (close == std::string::npos) {
                if (strict) {
                    return SoftpackError{SoftpackError::Parse,
                        "unclosed '${' in template at position " + std::to_string(i)};
                }
                out += tmpl.substr(i);
                break;
            }
            name_end = close;
            next = close + 1;
        } else {
            name_start = i + 1;
            name_end = name_start;
            while (name_end < tmpl.size() && is_ident_char(tmpl[name_end])) ++name_end;
            next = name_end;
        }

        std::string name = tmpl.substr(name_start, name_end - name_start);
        bool valid = !name.empty() && is_ident_start(name[0]) &&
                     std::all_of(name.begin(), name.end(), is_ident_char);
        if (!valid) {
            if (strict) {
                return SoftpackError{SoftpackError::Parse,
                    "invalid placeholder in template at position " + std::to_string(i)};
            }
            out += '$';
            ++i;
            continue;
        }

        auto it = vars.find(name);
        if (it == vars.end()) {
            if (strict) {
                return SoftpackError{SoftpackError::Parse,
                    "undefined template variable '" + name + "'",
                    available_vars_hint(vars)};
            }
            out += tmpl.substr(i, next - i);
        } else {
            out += it->second;
        }
        i = next;
    }

    return Result<std::string>::ok(std::move(out));
}

Result<std::string> substitute(const std::string& tmpl, const TemplateVars& vars) {
    return expand(tmpl, vars, true);
}

std::string safe_substitute(const std::string& tmpl, const TemplateVars& vars) {
    auto r = expand(tmpl, vars, false);
    return r.is_ok() ? std::move(r).value() : tmpl;
}

} // namespace softpack
