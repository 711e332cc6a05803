#include <algorithm>
#include <coderun/config_file.hh>
#include <utility>

using std::string;

namespace {

constexpr bool is_ws(char c) noexcept {
    return c == ' ' or c == '\t' or c == '\r' or c == '\v' or c == '\f';
}

constexpr bool is_space(char c) noexcept { return c == '\n' or is_ws(c); }

constexpr bool is_xdigit(char c) noexcept {
    return (c >= '0' and c <= '9') or (c >= 'a' and c <= 'f') or (c >= 'A' and c <= 'F');
}

constexpr bool is_print(unsigned char c) noexcept { return c >= 32 and c < 127; }

constexpr bool is_cntrl(unsigned char c) noexcept { return c < 32 or c == 127; }

// Checks whether character is one of these [a-zA-Z0-9\-_.]
constexpr bool is_name(char c) noexcept {
    return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
        c == '-' or c == '_' or c == '.';
}

constexpr int hex2dec(char c) noexcept {
    return (c >= '0' and c <= '9' ? c - '0' : ((c | 0x20) - 'a' + 10));
}

constexpr char dec2hex(int x) noexcept {
    return static_cast<char>(x < 10 ? '0' + x : 'a' + x - 10);
}

} // namespace

void ConfigFile::load_config_from_string(string config, bool load_all) {
    // Set all variables as unused
    for (auto& [name, var] : vars) {
        var.unset();
    }

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;

    Variable tmp; // Used for ignored variables

    auto throw_parse_error = [&](auto&&... args) {
        size_t err_pos = std::min(pos, config.size() - 1);
        size_t line_beg = err_pos;
        while (line_beg > 0 and config[line_beg - 1] != '\n') {
            --line_beg;
        }

        size_t line = 1 + std::count(config.begin(), config.begin() + line_beg, '\n');
        size_t col = err_pos - line_beg + 1; // Indexed from 1

        ParseError pe(line, col, std::forward<decltype(args)>(args)...);

        // Construct diagnostics
        auto& diags = pe.diagnostics_;
        auto append_char = [&](unsigned char c) {
            if (is_print(c)) {
                diags += static_cast<char>(c);
            } else {
                diags += "\\x";
                diags += dec2hex(c >> 4);
                diags += dec2hex(c & 15);
            }
        };

        // Left part
        constexpr size_t CONTEXT = 32;
        if (err_pos - line_beg <= CONTEXT) {
            for (size_t k = line_beg; k < err_pos; ++k) {
                append_char(config[k]);
            }
        } else {
            diags += "...";
            for (size_t k = err_pos - CONTEXT; k < err_pos; ++k) {
                append_char(config[k]);
            }
        }

        // Faulty position
        size_t padding = diags.size();
        size_t stress_len = 1;
        if (config[err_pos] != '\n') {
            append_char(config[err_pos]);
            stress_len = diags.size() - padding;

            // Right part
            size_t k = err_pos + 1;
            for (; config[k] != '\n' and k <= err_pos + CONTEXT; ++k) {
                append_char(config[k]);
            }

            if (config[k] != '\n') {
                diags += "...";
            }
        }

        // Diagnostics's second line - stress
        diags += '\n';
        diags.append(padding, ' ');
        diags += '^';
        diags.append(stress_len - 1, '~');

        throw std::move(pe);
    };

    auto skip_ws = [&] {
        while (is_ws(config[pos])) {
            ++pos;
        }
    };
    auto skip_comment = [&] {
        while (config[pos] != '\n') {
            ++pos;
        }
    };

    auto extract_value = [&](bool is_in_array) {
        string res;
        size_t i = pos;
        // Single-quoted string
        if (config[i] == '\'') {
            while (config[++i] != '\n') {
                if (config[i] == '\'') {
                    // Safe (newline is at the end of every line)
                    if (config[i + 1] != '\'') {
                        pos = i + 1;
                        return res;
                    }
                    ++i;
                }
                res += config[i];
            }
            pos = i;
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[i] == '"') {
            while (config[++i] != '\n') {
                if (config[i] == '"') {
                    pos = i + 1;
                    return res;
                }

                if (config[i] != '\\') {
                    res += config[i];
                    continue;
                }

                // Escape sequence
                switch (config[++i]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '?': res += '?'; continue;
                case '\\': res += '\\'; continue;
                case 't': res += '\t'; continue;
                case 'a': res += '\a'; continue;
                case 'b': res += '\b'; continue;
                case 'f': res += '\f'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case 'v': res += '\v'; continue;
                case '0': res += '\0'; continue;
                case 'x':
                    // i will not go out of the buffer (guard = newline)
                    for (int k = 0; k < 2; ++k) {
                        if (!is_xdigit(config[++i])) {
                            pos = i;
                            throw_parse_error("Invalid hexadecimal digit: `", config[i], '`');
                        }
                    }
                    res += static_cast<char>((hex2dec(config[i - 1]) << 4) + hex2dec(config[i]));
                    continue;
                default:
                    pos = i;
                    throw_parse_error("Unknown escape sequence: `\\", config[i], '`');
                }
            }
            pos = i;
            throw_parse_error("Missing terminating \" character");
        }

        // String literal
        if (config[i] == '[' or (is_in_array and (config[i] == ',' or config[i] == ']'))) {
            throw_parse_error("Invalid beginning of the string literal: `", config[i], '`');
        }

        auto is_terminator = [is_in_array](char c) {
            return c == '\n' or c == '#' or (is_in_array and (c == ']' or c == ','));
        };
        while (!is_terminator(config[i + 1])) {
            ++i;
        }
        // Remove white-spaces from ending
        while (is_ws(config[i])) {
            --i;
        }
        res = config.substr(pos, i + 1 - pos);
        pos = i + 1;
        return res;
    };

    while (pos < config.size()) {
        skip_ws();
        // Newline
        if (config[pos] == '\n') {
            ++pos;
            continue;
        }
        // Comment
        if (config[pos] == '#') {
            skip_comment();
            ++pos;
            continue;
        }

        /* Variable name */
        size_t name_beg = pos;
        while (is_name(config[pos])) {
            ++pos;
        }
        string name = config.substr(name_beg, pos - name_beg);
        if (name.empty()) {
            throw_parse_error("Invalid or missing variable's name");
        }

        /* Assignment operator */
        skip_ws();
        if (config[pos] == '\n' or config[pos] == '#') {
            throw_parse_error("Incomplete directive: `", name, '`');
        }
        if (config[pos] != '=' and config[pos] != ':') {
            throw_parse_error("Invalid assignment operator: `", config[pos], '`');
        }

        ++pos; // Assignment operator
        skip_ws();

        /* Value */
        Variable* varp = nullptr; // Safe, vars is not modified after that
        if (load_all) {
            varp = &vars[name];
        } else {
            auto it = vars.find(name);
            varp = (it != vars.end() ? &it->second : &tmp);
        }
        Variable& var = *varp;
        var.unset();
        var.flag_ = Variable::SET;

        if (config[pos] != '[') { // Normal
            if (config[pos] != '\n' and config[pos] != '#') {
                var.str_ = extract_value(false);
            }
        } else { // Array
            var.flag_ |= Variable::ARRAY;
            ++pos; // Skip [

            for (;;) {
                while (pos < config.size() and is_space(config[pos])) {
                    ++pos;
                }
                if (pos >= config.size()) {
                    throw_parse_error("Missing terminating ] character at the end of an array");
                }

                if (config[pos] == ']') { // End of the array
                    ++pos;
                    break;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                // Ignore extra delimiters
                if (config[pos] == ',') {
                    ++pos;
                    continue;
                }

                var.arr_.emplace_back(extract_value(true));

                skip_ws();
                // Delimiter
                if (config[pos] == ',' or config[pos] == '\n') {
                    ++pos;
                    continue;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }

                throw_parse_error("Unknown sequence after the value: `", config[pos], '`');
            }
        }

        /* After the value */
        skip_ws();
        if (config[pos] == '#') {
            skip_comment();
            continue;
        }

        if (config[pos] != '\n') {
            throw_parse_error("Unknown sequence after the value: `", config[pos], '`');
        }

        ++pos; // Newline
    }
}

bool ConfigFile::is_string_literal(std::string_view str) noexcept {
    if (str.empty()) {
        return false;
    }

    // Special check on the first and last character
    if (str[0] == '[' or str[0] == '\'' or str[0] == '"' or str[0] == '#' or is_space(str[0]) or
        is_space(str.back()))
    {
        return false;
    }

    return std::none_of(str.begin(), str.end(), [](char c) {
        return c == '\n' or c == ']' or c == ',' or c == '#';
    });
}

string ConfigFile::escape_to_single_quoted_string(std::string_view str) {
    string res{'\''};
    res.reserve(str.size() + 2);
    for (char c : str) {
        res += c;
        if (c == '\'') {
            res += '\'';
        }
    }
    return (res += '\'');
}

string ConfigFile::escape_to_double_quoted_string(std::string_view str) {
    string res{'"'};
    res.reserve(str.size() + 2);
    for (char c : str) {
        switch (c) {
        case '\\': res += "\\\\"; break;
        case '\0': res += "\\0"; break;
        case '"': res += "\\\""; break;
        case '\a': res += "\\a"; break;
        case '\b': res += "\\b"; break;
        case '\f': res += "\\f"; break;
        case '\n': res += "\\n"; break;
        case '\r': res += "\\r"; break;
        case '\t': res += "\\t"; break;
        case '\v': res += "\\v"; break;
        default:
            if (is_cntrl(c)) {
                res += "\\x";
                res += dec2hex(static_cast<unsigned char>(c) >> 4);
                res += dec2hex(static_cast<unsigned char>(c) & 15);
            } else {
                res += c;
            }
        }
    }

    return (res += '"');
}

string ConfigFile::escape_string(std::string_view str) {
    if (std::any_of(str.begin(), str.end(), [](char c) { return c == '\'' or is_cntrl(c); })) {
        return escape_to_double_quoted_string(str);
    }

    if (is_string_literal(str)) {
        return string{str};
    }

    return escape_to_single_quoted_string(str);
}
