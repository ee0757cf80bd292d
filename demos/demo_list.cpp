// demo_list.cpp
//
// Lists the environments in an artifacts repository using the layered
// configuration (/etc/softpack/config.toml, then ~/.softpack/config.toml).
//
//     ./softpack-list                 # every environment
//     ./softpack-list ann             # environments visible to user "ann"
//     ./softpack-list --config x.toml # an explicit config file on top

#include <softpack/artifact_store.hpp>
#include <softpack/builder.hpp>
#include <softpack/config.hpp>
#include <softpack/environment.hpp>
#include <softpack/log.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace softpack;

int main(int argc, char** argv) {
    std::vector<std::string> layers = {system_config_path(), user_config_path()};
    std::optional<std::string> owner;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            layers.push_back(argv[++i]);
        } else {
            owner = arg;
        }
    }

    auto cfg = Config::layered(layers);
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    softpack::log::set_level(cfg.value().log_level);

    auto store = ArtifactStore::open(cfg.value().artifacts);
    if (store.is_err()) {
        std::cerr << store.error().format() << "\n";
        return 1;
    }
    auto synced = store.value()->sync();
    if (synced.is_err()) {
        softpack::log::warn("cannot sync with origin: %s", synced.error().message.c_str());
    }

    HttpBuilder builder(cfg.value().builder);
    BuildDispatcher dispatcher(builder);
    Environments envs(*store.value(), dispatcher, cfg.value());

    auto all = envs.iter(owner);
    for (const auto& env : all) {
        std::cout << env.path << "/" << env.name
                  << "  [" << (env.state ? state_name(*env.state) : "-") << "]";
        if (env.type == EnvironmentType::Module) std::cout << " module";
        std::cout << "\n";
        for (const auto& p : env.packages) std::cout << "    " << p.to_string() << "\n";
    }
    softpack::log::info("%zu environment(s)", all.size());
    return 0;
}
