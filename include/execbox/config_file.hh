#pragma once

#include <charconv>
#include <cstdint>
#include <execbox/concat_tostr.hh>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        explicit ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(
              concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)
          ) {}

        ParseError(const ParseError& pe) = default;
        ParseError(ParseError&&) noexcept = default;
        ParseError& operator=(const ParseError& pe) = default;
        ParseError& operator=(ParseError&&) noexcept = default;

        // Offending line with the faulty position marked in the line below
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
        // User-provided because null_var is initialized before ConfigFile is complete
        Variable() {} // NOLINT(modernize-use-equals-default)

        [[nodiscard]] bool is_set() const noexcept { return flag_ & SET; }

        [[nodiscard]] bool is_array() const noexcept { return flag_ & ARRAY; }

        // Returns value as bool or false on error
        [[nodiscard]] bool as_bool() const noexcept {
            return str_ == "1" || str_ == "on" || str_ == "true";
        }

        // Returns std::nullopt if the value is not a valid number of type T
        template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            T res{};
            const char* end = str_.data() + str_.size();
            auto [ptr, ec] = std::from_chars(str_.data(), end, res);
            if (ec != std::errc{} or ptr != end or str_.empty()) {
                return std::nullopt;
            }
            return res;
        }

        // Returns value as string (empty if not a string or variable isn't set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Returns value as array (empty if not an array or variable isn't set)
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept {
            return arr_;
        }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars_; // (name => value)
    static inline const Variable null_var{};

public:
    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars_.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    // Returns a reference to the variable @p name or to a null variable if there is no such
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars_.find(name);
        return (it != vars_.end() ? it->second : null_var);
    }

    [[nodiscard]] const decltype(vars_)& get_vars() const noexcept { return vars_; }

    /**
     * @brief Loads config (variables) from file @p pathname
     * @details Uses load_config_from_string()
     *
     * @param pathname config file
     * @param load_all whether load all variables from @p pathname or load only
     *   these from variable set
     *
     * @errors Throws std::runtime_error if reading the file fails and all exceptions from
     *   load_config_from_string()
     */
    void load_config_from_file(const std::string& pathname, bool load_all = false);

    /**
     * @brief Loads config (variables) from string @p config
     * @details Format: one `name: value` (or `name = value`) per line, '#' starts a comment.
     *   Value is a literal, a 'single-quoted' string ('' stands for '), a "double-quoted"
     *   string with C escapes or an array: [value, value, ...] that may span many lines.
     *
     * @param config input string
     * @param load_all whether load all variables from @p config or load only
     *   these from variable set
     *
     * @errors Throws ParseError if the config is malformed
     */
    void load_config_from_string(std::string config, bool load_all = false);
};
