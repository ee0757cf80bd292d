#include <softpack/module_translator.hpp>
#include <softpack/template.hpp>

#include <sstream>
#include <vector>

namespace softpack {

static const char* kReadmeTemplate =
    "# Usage\n"
    "\n"
    "To use this environment, run:\n"
    "\n"
    "```\n"
    "module load $module_path\n"
    "```\n";

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static std::string ltrim(const std::string& s) {
    size_t i = s.find_first_not_of(" \t");
    return i == std::string::npos ? "" : s.substr(i);
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::string strip_quotes(std::string s) {
    if (!s.empty() && s.front() == '"') s.erase(0, 1);
    if (!s.empty() && s.back() == '"') s.pop_back();
    return s;
}

static std::string first_word(const std::string& s) {
    std::istringstream in(s);
    std::string word;
    in >> word;
    return word;
}

// Backslash escapes; unknown ones are kept as written
static std::string unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out += s[i];
            continue;
        }
        char c = s[++i];
        switch (c) {
            case 'n':  out += '\n'; break;
            case 't':  out += '\t'; break;
            case '\\': out += '\\'; break;
            case '"':  out += '"'; break;
            case '\'': out += '\''; break;
            default:
                out += '\\';
                out += c;
                break;
        }
    }
    return out;
}

static std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

static std::vector<std::string> split_packages(const std::string& s) {
    std::vector<std::string> out;
    std::string current;
    for (char c : s) {
        if (c == ',' || c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            if (!current.empty()) out.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) out.push_back(std::move(current));
    return out;
}

std::string to_softpack_yml(const std::string& declared_name,
                            const std::string& module_text) {
    bool in_help = false;
    std::string name = declared_name;
    std::string version;
    std::string description;
    std::vector<std::string> packages;

    std::istringstream in(module_text);
    std::string raw;
    while (std::getline(in, raw)) {
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();
        std::string line = ltrim(raw);

        if (in_help) {
            if (line == "}") {
                in_help = false;
            } else if (starts_with(line, "puts stderr ")) {
                std::string text = ltrim(line.substr(11));
                text = strip_quotes(replace_all(unescape(text), "\\$", "$"));
                description += "  " + text + "\n";
            }
            continue;
        }

        if (starts_with(line, "proc ModulesHelp")) {
            in_help = true;
            continue;
        }
        if (!starts_with(line, "module-whatis ")) continue;

        std::string what = ltrim(strip_quotes(unescape(ltrim(line.substr(13)))));

        if (starts_with(what, "Name:")) {
            std::string nv = what.substr(5);
            if (trim(nv).empty()) continue;

            auto colon = nv.find(':');
            std::string n = first_word(nv.substr(0, colon));
            if (!n.empty()) name = n;
            if (colon != std::string::npos) {
                std::string v = first_word(nv.substr(colon + 1));
                if (!v.empty()) version = v;
            }
        } else if (starts_with(what, "Version:")) {
            std::string v = first_word(what.substr(8));
            if (!v.empty()) version = v;
        } else if (starts_with(what, "Packages:")) {
            packages = split_packages(what.substr(9));
        }
    }

    if (!version.empty()) name += "@" + version;
    packages.insert(packages.begin(), name);

    std::string out = "description: |\n" + description + "packages:\n";
    for (const auto& p : packages) out += "  - " + p + "\n";
    return out;
}

Result<std::string> generate_readme(const std::string& module_path) {
    return substitute(kReadmeTemplate, {{"module_path", module_path}});
}

} // namespace softpack
