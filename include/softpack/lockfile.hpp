#pragma once

#include <softpack/result.hpp>
#include <optional>
#include <string>

namespace softpack {

// Interpreter versions pinned by a concretized environment
struct Interpreters {
    std::optional<std::string> python;
    std::optional<std::string> r;
};

// Read spack.lock (JSON). Under "concrete_specs", keyed by spec hash,
// only the first entry named "python" and the first named "r" are kept,
// in file order. A lock without "concrete_specs" yields no interpreters.
Result<Interpreters> parse_interpreters(const std::string& lock_json);

} // namespace softpack
