#include <coderun/command_template.hh>

namespace coderun {

namespace {

constexpr bool is_placeholder_name_char(char c) noexcept {
    return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
        c == '_';
}

} // namespace

std::string build_command(std::string_view templ, const Variables& variables) {
    std::string res;
    res.reserve(templ.size());
    size_t i = 0;
    while (i < templ.size()) {
        if (templ[i] != '{') {
            res += templ[i++];
            continue;
        }

        size_t end = i + 1;
        while (end < templ.size() and is_placeholder_name_char(templ[end])) {
            ++end;
        }
        if (end == i + 1 or end == templ.size() or templ[end] != '}') {
            res += templ[i++]; // Not a placeholder
            continue;
        }

        auto name = templ.substr(i + 1, end - i - 1);
        if (auto it = variables.find(name); it != variables.end()) {
            res += it->second;
        } else {
            res += templ.substr(i, end - i + 1);
        }
        i = end + 1;
    }
    return res;
}

} // namespace coderun
