#include <algorithm>
#include <cctype>
#include <execbox/config_file.hh>
#include <execbox/file_manip.hh>

using std::string;

namespace {

bool is_ws(char c) noexcept { return c != '\n' and std::isspace(static_cast<unsigned char>(c)); }

// [a-zA-Z0-9\-_.]
bool is_name(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) or c == '-' or c == '_' or c == '.';
}

int hex2dec(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

char dec2hex(int x) noexcept { return static_cast<char>(x < 10 ? '0' + x : 'a' + x - 10); }

} // namespace

void ConfigFile::load_config_from_file(const string& pathname, bool load_all) {
    load_config_from_string(get_file_contents(pathname), load_all);
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    for (auto& [name, var] : vars_) {
        var.unset();
    }

    config += '\n'; // Now each line ends with a newline character
    size_t i = 0;

    auto throw_parse_error = [&](auto&&... args) {
        auto pos = std::min(i, config.size() - 1);
        size_t line_beg = pos;
        while (line_beg > 0 and config[line_beg - 1] != '\n') {
            --line_beg;
        }
        size_t line =
            1 + static_cast<size_t>(std::count(config.begin(), config.begin() + line_beg, '\n'));
        size_t col = pos - line_beg + 1;

        ParseError pe(line, col, std::forward<decltype(args)>(args)...);

        auto& diags = pe.diagnostics_;
        auto append_char = [&](unsigned char c) {
            if (std::isprint(c)) {
                diags += static_cast<char>(c);
            } else {
                diags += "\\x";
                diags += dec2hex(c >> 4);
                diags += dec2hex(c & 15);
            }
        };
        for (size_t k = line_beg; k < pos; ++k) {
            append_char(config[k]);
        }
        size_t padding = diags.size();
        for (size_t k = pos; config[k] != '\n'; ++k) {
            append_char(config[k]);
        }
        diags += '\n';
        diags.append(padding, ' ');
        diags += '^';
        throw std::move(pe);
    };

    auto skip_ws = [&] {
        while (is_ws(config[i])) {
            ++i;
        }
    };
    auto skip_comment = [&] {
        while (config[i] != '\n') {
            ++i;
        }
    };

    auto extract_value = [&](bool is_in_array) {
        string res;
        // Single-quoted string
        if (config[i] == '\'') {
            while (config[++i] != '\n') {
                if (config[i] == '\'') {
                    // Safe: newline is at the end of every line
                    if (config[i + 1] != '\'') {
                        ++i;
                        return res;
                    }
                    ++i;
                }
                res += config[i];
            }
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[i] == '"') {
            while (config[++i] != '\n') {
                if (config[i] == '"') {
                    ++i;
                    return res;
                }
                if (config[i] != '\\') {
                    res += config[i];
                    continue;
                }

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
                case 'x':
                    // The newline guard keeps i inside the buffer
                    for (int k = 0; k < 2; ++k) {
                        if (!std::isxdigit(static_cast<unsigned char>(config[++i]))) {
                            throw_parse_error("Invalid hexadecimal digit: `", config[i], '`');
                        }
                    }
                    res += static_cast<char>((hex2dec(config[i - 1]) << 4) + hex2dec(config[i]));
                    continue;
                default: throw_parse_error("Unknown escape sequence: `\\", config[i], '`');
                }
            }
            throw_parse_error("Missing terminating \" character");
        }

        // String literal
        if (config[i] == '[' or (is_in_array and (config[i] == ',' or config[i] == ']'))) {
            throw_parse_error("Invalid beginning of the string literal: `", config[i], '`');
        }
        size_t end = i;
        while (config[end] != '\n' and config[end] != '#' and
               not(is_in_array and (config[end] == ']' or config[end] == ',')))
        {
            ++end;
        }
        size_t val_end = end;
        while (val_end > i and std::isspace(static_cast<unsigned char>(config[val_end - 1]))) {
            --val_end;
        }
        res = config.substr(i, val_end - i);
        i = end;
        return res;
    };

    Variable ignored;
    while (i < config.size()) {
        skip_ws();
        if (config[i] == '\n') {
            ++i;
            continue;
        }
        if (config[i] == '#') {
            skip_comment();
            ++i;
            continue;
        }

        size_t name_beg = i;
        while (is_name(config[i])) {
            ++i;
        }
        if (i == name_beg) {
            throw_parse_error("Invalid or missing variable's name");
        }
        auto name = std::string_view{config}.substr(name_beg, i - name_beg);

        skip_ws();
        if (config[i] == '\n' or config[i] == '#') {
            throw_parse_error("Incomplete directive: `", name, '`');
        }
        if (config[i] != '=' and config[i] != ':') {
            throw_parse_error("Invalid assignment operator: `", config[i], '`');
        }
        ++i;
        skip_ws();

        Variable* varp = &ignored;
        if (load_all) {
            varp = &vars_[string{name}];
        } else if (auto it = vars_.find(name); it != vars_.end()) {
            varp = &it->second;
        }
        Variable& var = *varp;
        var.unset();
        var.flag_ = Variable::SET;

        if (config[i] != '[') {
            if (config[i] != '\n' and config[i] != '#') {
                var.str_ = extract_value(false);
            }
        } else {
            var.flag_ |= Variable::ARRAY;
            ++i; // Skip [
            for (;;) {
                while (i < config.size() and std::isspace(static_cast<unsigned char>(config[i]))) {
                    ++i;
                }
                if (i == config.size()) {
                    --i;
                    throw_parse_error("Missing terminating ] character at the end of an array");
                }
                if (config[i] == ']') {
                    ++i;
                    break;
                }
                if (config[i] == '#') {
                    skip_comment();
                    continue;
                }
                // Ignore extra delimiters
                if (config[i] == ',') {
                    ++i;
                    continue;
                }

                var.arr_.emplace_back(extract_value(true));

                skip_ws();
                if (config[i] == ',' or config[i] == '\n') {
                    ++i;
                    continue;
                }
                if (config[i] == '#') {
                    skip_comment();
                    continue;
                }
                if (config[i] == ']') {
                    ++i;
                    break;
                }
                throw_parse_error("Unknown sequence after the value: `", config[i], '`');
            }
        }

        // After the value
        skip_ws();
        if (config[i] == '#') {
            skip_comment();
        }
        if (config[i] != '\n') {
            throw_parse_error("Unknown sequence after the value: `", config[i], '`');
        }
        ++i;
    }
}
