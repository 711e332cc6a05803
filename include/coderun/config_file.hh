#pragma once

#include <charconv>
#include <coderun/concat_tostr.hh>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        explicit ParseError(const std::string& msg) : runtime_error(msg) {}

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)) {}

        ParseError(const ParseError& pe) = default;
        ParseError(ParseError&&) noexcept = default;
        ParseError& operator=(const ParseError& pe) = default;
        ParseError& operator=(ParseError&&) noexcept = default;

        using runtime_error::what;

        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

        ~ParseError() noexcept override = default;

        friend class ConfigFile;
    };

    class Variable {
    public:
        static constexpr uint8_t SET = 1; // set if variable appears in the config
        static constexpr uint8_t ARRAY = 2; // set if variable is an array

    private:
        uint8_t flag_ = 0;
        std::string str_;
        std::vector<std::string> arr_;

        void unset() noexcept {
            flag_ = 0;
            str_.clear();
            arr_.clear();
        }

    public:
        Variable() {} // NOLINT(modernize-use-equals-default): compiler bug

        [[nodiscard]] bool is_set() const noexcept { return flag_ & SET; }

        [[nodiscard]] bool is_array() const noexcept { return flag_ & ARRAY; }

        // Returns std::nullopt if the value is not a number of type T
        template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            T res{};
            auto [ptr, ec] = std::from_chars(str_.data(), str_.data() + str_.size(), res);
            if (ec != std::errc{} or ptr != str_.data() + str_.size()) {
                return std::nullopt;
            }
            return res;
        }

        // Returns value as string (empty if not a string or variable isn't set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Returns value as array (empty if not an array or variable isn't set)
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars; // (name => value)
    static inline const Variable null_var{};

public:
    ConfigFile() = default;

    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    // Returns a reference to a variable @p name from variable set or to a
    // null_var
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars.find(name);
        return (it != vars.end() ? it->second : null_var);
    }

    [[nodiscard]] const decltype(vars)& get_vars() const { return vars; }

    /**
     * @brief Loads config (variables) from string @p config
     *
     * @param config input string
     * @param load_all whether load all variables from @p config or load only
     *   these from variable set
     *
     * @errors Throws ParseError if an error occurs
     */
    void load_config_from_string(std::string config, bool load_all = false);

    // Checks if string @p str is a valid string literal
    static bool is_string_literal(std::string_view str) noexcept;

    // Returns @p str single-quoted, '\'' is replaced with "''"
    static std::string escape_to_single_quoted_string(std::string_view str);

    // Returns @p str double-quoted, '"', '\\' and control characters escaped
    static std::string escape_to_double_quoted_string(std::string_view str);

    /**
     * @brief Converts string @p str so that it can be safely placed in config
     *   file
     * @details Possible cases:
     *   1) @p str contains '\'' or a control character:
     *     escape_to_double_quoted_string(@p str) is returned.
     *   2) Otherwise if @p str is string literal (is_string_literal(@p str)):
     *     Unchanged @p str is returned.
     *   3) Otherwise:
     *     escape_to_single_quoted_string(@p str) is returned.
     *
     *   Examples:
     *     "" -> '' (single quoted string, special case)
     *     "gcc -O2" -> gcc -O2 (string literal)
     *     "a\nb" -> "a\nb" (double quoted string)
     *     " x" -> ' x' (single quoted string)
     */
    static std::string escape_string(std::string_view str);
};
