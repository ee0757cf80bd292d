#include <softpack/lockfile.hpp>
#include <nlohmann/json.hpp>

namespace softpack {

Result<Interpreters> parse_interpreters(const std::string& lock_json) {
    // ordered_json keeps the hashes in file order
    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(lock_json);
    } catch (const nlohmann::json::exception& e) {
        return SoftpackError{SoftpackError::Parse,
            std::string("invalid spack.lock: ") + e.what()};
    }

    Interpreters found;
    if (!doc.is_object()) return Result<Interpreters>::ok(found);

    auto specs = doc.find("concrete_specs");
    if (specs == doc.end() || !specs->is_object()) {
        return Result<Interpreters>::ok(found);
    }

    for (const auto& item : specs->items()) {
        const auto& spec = item.value();
        if (!spec.is_object()) continue;

        auto name = spec.find("name");
        auto version = spec.find("version");
        if (name == spec.end() || !name->is_string()) continue;
        if (version == spec.end() || !version->is_string()) continue;

        const std::string n = name->get<std::string>();
        if (n == "python" && !found.python) {
            found.python = version->get<std::string>();
        } else if (n == "r" && !found.r) {
            found.r = version->get<std::string>();
        }
        if (found.python && found.r) break;
    }

    return Result<Interpreters>::ok(std::move(found));
}

} // namespace softpack
