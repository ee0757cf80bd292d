#pragma once

#include <softpack/result.hpp>
#include <string>

namespace softpack {

// Convert an shpc-style Tcl module file into softpack.yml text.
//
// The `proc ModulesHelp` block supplies the description: each
// `puts stderr "..."` line inside it becomes one indented description line,
// unescaped and in order. Outside the block, `module-whatis` lines carry
//   Name: <name>[:<version>]
//   Version: <version>
//   Packages: <a>, <b> <c>
// The environment's own package entry is always first in the output,
// `declared_name` being used when no Name: line is present.
std::string to_softpack_yml(const std::string& declared_name,
                            const std::string& module_text);

// README.md for an environment loaded with `module load <module_path>`
Result<std::string> generate_readme(const std::string& module_path);

} // namespace softpack
