#include <softpack/manifest.hpp>
#include <softpack/module_translator.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace softpack;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: softpack-translate <module file> <module load path> [--readme]\n";
        return 1;
    }

    std::string path = argv[1];
    std::string load_path = argv[2];
    bool show_readme = (argc > 3 && std::string(argv[3]) == "--readme");

    std::ifstream f(path);
    if (!f) {
        std::cerr << "error: cannot open " << path << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();

    // The declared name is the last segment of the load path
    std::string name = load_path.substr(load_path.rfind('/') + 1);
    std::string yml = to_softpack_yml(name, ss.str());

    auto manifest = EnvManifest::parse(yml);
    if (manifest.is_err()) {
        std::cerr << manifest.error().format() << "\n";
        return 1;
    }

    std::cout << "--- softpack.yml ---\n" << yml;
    std::cout << "\nPackages: " << manifest.value().packages.size() << "\n";
    for (const auto& p : manifest.value().packages) {
        std::cout << "  " << p.name;
        if (p.version) std::cout << "  (" << *p.version << ")";
        std::cout << "\n";
    }

    if (show_readme) {
        auto readme = generate_readme(load_path);
        if (readme.is_err()) {
            std::cerr << readme.error().format() << "\n";
            return 1;
        }
        std::cout << "\n--- README.md ---\n" << readme.value();
    }
    return 0;
}
