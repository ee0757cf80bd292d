#include <softpack/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace softpack {

std::string BuilderConfig::base_url() const {
    return "http://" + host + ":" + std::to_string(port);
}

// Copy a value into `out` only if the key is present with the right type
template<typename T, typename U>
static void assign_if(const toml::table& tbl, const char* key, U& out) {
    if (auto v = tbl[key].value<T>()) {
        out = static_cast<U>(*v);
    }
}

static Status check_positive(const char* key, int value) {
    if (value <= 0) {
        return SoftpackError{SoftpackError::Config,
            std::string("config value '") + key + "' must be positive"};
    }
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str, const Config& base) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SoftpackError{SoftpackError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg = base;

    if (auto art = doc["artifacts"].as_table()) {
        assign_if<std::string>(*art, "path", cfg.artifacts.path);
        assign_if<std::string>(*art, "url", cfg.artifacts.url);
        assign_if<std::string>(*art, "branch", cfg.artifacts.branch);
        assign_if<std::string>(*art, "author", cfg.artifacts.author);
        assign_if<std::string>(*art, "email", cfg.artifacts.email);
        assign_if<int64_t>(*art, "timeout", cfg.artifacts.timeout);
        assign_if<int64_t>(*art, "tree_cache", cfg.artifacts.tree_cache);
        SOFTPACK_TRY(check_positive("artifacts.timeout", cfg.artifacts.timeout));
        SOFTPACK_TRY(check_positive("artifacts.tree_cache", cfg.artifacts.tree_cache));
        if (cfg.artifacts.branch.empty()) {
            return SoftpackError{SoftpackError::Config,
                "config value 'artifacts.branch' must not be empty"};
        }
    }

    if (auto b = doc["builder"].as_table()) {
        assign_if<std::string>(*b, "host", cfg.builder.host);
        assign_if<int64_t>(*b, "port", cfg.builder.port);
        assign_if<int64_t>(*b, "timeout", cfg.builder.timeout);
        SOFTPACK_TRY(check_positive("builder.port", cfg.builder.port));
        SOFTPACK_TRY(check_positive("builder.timeout", cfg.builder.timeout));
    }

    if (auto s = doc["spack"].as_table()) {
        assign_if<std::string>(*s, "bin", cfg.spack.bin);
        assign_if<std::string>(*s, "repo", cfg.spack.repo);
        assign_if<std::string>(*s, "cache", cfg.spack.cache);
        assign_if<int64_t>(*s, "refresh", cfg.spack.refresh);
        assign_if<int64_t>(*s, "timeout", cfg.spack.timeout);
        SOFTPACK_TRY(check_positive("spack.timeout", cfg.spack.timeout));
        if (cfg.spack.refresh < 0) {
            return SoftpackError{SoftpackError::Config,
                "config value 'spack.refresh' must not be negative"};
        }
    }

    if (auto g = doc["groups"].as_table()) {
        assign_if<std::string>(*g, "pattern", cfg.groups.pattern);
    }

    if (auto l = doc["log"].as_table()) {
        if (auto v = (*l)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path, const Config& base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SoftpackError{SoftpackError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str(), base);
    if (r.is_err()) {
        r.error().file = path;
    }
    return r;
}

Result<Config> Config::parse(const std::string& toml_str) {
    return parse(toml_str, Config{});
}

Result<Config> Config::load(const std::string& path) {
    return load(path, Config{});
}

Result<Config> Config::layered(const std::vector<std::string>& paths) {
    Config cfg;
    for (const auto& p : paths) {
        if (p.empty() || !std::filesystem::exists(p)) continue;
        auto next = Config::load(p, cfg);
        if (next.is_err()) return std::move(next).error();
        cfg = std::move(next).value();
    }
    cfg.expand_paths();
    return Result<Config>::ok(std::move(cfg));
}

void Config::expand_paths() {
    artifacts.path = expand_home(artifacts.path);
    spack.cache = expand_home(spack.cache);
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::string system_config_path() {
    return "/etc/softpack/config.toml";
}

std::string user_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.softpack/config.toml";
}

} // namespace softpack
