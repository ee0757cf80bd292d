#pragma once

#include <softpack/result.hpp>
#include <string>
#include <unordered_map>

namespace softpack {

using TemplateVars = std::unordered_map<std::string, std::string>;

// Substitute $name and ${name} placeholders in a template string.
// "$$" produces a literal "$". Names are [A-Za-z_][A-Za-z0-9_]*.
// Strict: undefined variables and malformed placeholders are errors.
Result<std::string> substitute(const std::string& tmpl, const TemplateVars& vars);

// Lenient substitution: undefined or malformed placeholders are copied
// through unchanged. Never returns an error.
std::string safe_substitute(const std::string& tmpl, const TemplateVars& vars);

} // namespace softpack
