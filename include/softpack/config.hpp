#pragma once

#include <softpack/result.hpp>
#include <softpack/log.hpp>
#include <string>
#include <vector>

namespace softpack {

// [artifacts] section: the git repository holding all environment state
struct ArtifactsConfig {
    std::string path = "~/.softpack/artifacts";   // local bare clone
    std::string url;                              // remote to clone/push
    std::string branch = "main";
    std::string author = "softpack";
    std::string email = "softpack@localhost";
    int timeout = 60;                             // seconds per git command
    int tree_cache = 4096;                        // tree listings kept in memory
};

// [builder] section
struct BuilderConfig {
    std::string host = "127.0.0.1";
    int port = 7080;
    int timeout = 10;

    std::string base_url() const;
};

// [spack] section
struct SpackConfig {
    std::string bin = "spack";
    std::string repo;                             // optional custom package repo
    std::string cache = "~/.softpack/spack";
    int refresh = 3600;                           // seconds, 0 disables
    int timeout = 600;
};

// [groups] section
struct GroupsConfig {
    std::string pattern = ".*";
};

// Layered configuration: defaults < system < user.
// Each layer only overrides the keys it actually sets.
struct Config {
    ArtifactsConfig artifacts;
    BuilderConfig builder;
    SpackConfig spack;
    GroupsConfig groups;
    log::Level log_level = log::Info;

    // Parse a TOML document on top of `base`
    static Result<Config> parse(const std::string& toml_str, const Config& base);
    static Result<Config> parse(const std::string& toml_str);

    // Load a TOML file on top of `base`
    static Result<Config> load(const std::string& path, const Config& base);
    static Result<Config> load(const std::string& path);

    // Apply every existing file in order; missing files are skipped
    static Result<Config> layered(const std::vector<std::string>& paths);

    // Replace a leading "~" in every path setting with $HOME
    void expand_paths();
};

// /etc/softpack/config.toml
std::string system_config_path();

// ~/.softpack/config.toml
std::string user_config_path();

// Expand a leading "~" using $HOME
std::string expand_home(const std::string& path);

} // namespace softpack
