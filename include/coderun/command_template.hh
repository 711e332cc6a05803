#pragma once

#include <map>
#include <string>
#include <string_view>

namespace coderun {

using Variables = std::map<std::string, std::string, std::less<>>;

/**
 * @brief Substitutes variables into a command template
 * @details A placeholder has the form {name}, where name is a non-empty
 *   sequence of [a-zA-Z0-9_]. A placeholder with a value in @p variables is
 *   replaced by that value, other placeholders are left untouched. The template
 *   is scanned once from left to right, substituted values are not scanned
 *   again.
 *
 * @param templ command template e.g. "gcc {file} -o {out}"
 * @param variables (name => value)
 *
 * @return the command
 */
std::string build_command(std::string_view templ, const Variables& variables);

} // namespace coderun
