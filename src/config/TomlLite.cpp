#include <cargo3ds/config/TomlLite.hpp>

#include <cargo3ds/config/Config.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace cargo3ds::config::toml_lite {

namespace {

std::string trim(std::string s) {
    const auto is_space = [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::string strip_comment(std::string_view line) {
    std::string out{};
    char quote = 0;
    bool escaped = false;
    for (char c : line) {
        if (quote == 0 && c == '#') break;
        out.push_back(c);
        if (quote == 0) {
            if (c == '"' || c == '\'') quote = c;
            continue;
        }
        if (escaped) {
            escaped = false;
            continue;
        }
        if (quote == '"' && c == '\\') {
            escaped = true;
            continue;
        }
        if (c == quote) quote = 0;
    }
    return out;
}

// Net '[' minus ']' outside of string literals.
int bracket_balance(std::string_view text) {
    int depth = 0;
    char quote = 0;
    bool escaped = false;
    for (char c : text) {
        if (quote != 0) {
            if (escaped) {
                escaped = false;
            } else if (quote == '"' && c == '\\') {
                escaped = true;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') quote = c;
        else if (c == '[') ++depth;
        else if (c == ']') --depth;
    }
    return depth;
}

bool parse_string_literal(std::string_view text, std::string& out, std::string& err) {
    if (text.size() >= 2 && text.front() == '\'' && text.back() == '\'') {
        out = std::string(text.substr(1, text.size() - 2));
        return true;
    }
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        err = "invalid string literal";
        return false;
    }
    out.clear();
    out.reserve(text.size() - 2);
    bool escaped = false;
    for (size_t i = 1; i + 1 < text.size(); ++i) {
        const char c = text[i];
        if (escaped) {
            switch (c) {
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                default: out.push_back(c); break;
            }
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        out.push_back(c);
    }
    if (escaped) {
        err = "unterminated escape in string literal";
        return false;
    }
    return true;
}

bool is_string_literal(std::string_view text) {
    if (text.size() < 2) return false;
    return (text.front() == '"' && text.back() == '"') || (text.front() == '\'' && text.back() == '\'');
}

bool parse_int_literal(std::string_view text, int64_t& out) {
    if (text.empty()) return false;
    size_t i = 0;
    if (text[0] == '+' || text[0] == '-') i = 1;
    if (i >= text.size()) return false;
    for (; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    try {
        out = std::stoll(std::string(text));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool split_array_items(std::string_view text, std::vector<std::string>& out, std::string& err) {
    out.clear();
    std::string cur{};
    char quote = 0;
    bool escaped = false;
    for (char c : text) {
        if (quote != 0) {
            cur.push_back(c);
            if (escaped) {
                escaped = false;
                continue;
            }
            if (quote == '"' && c == '\\') {
                escaped = true;
                continue;
            }
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            cur.push_back(c);
            continue;
        }
        if (c == ',') {
            cur = trim(std::move(cur));
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    if (quote != 0) {
        err = "unterminated string in array";
        return false;
    }
    cur = trim(std::move(cur));
    if (!cur.empty()) out.push_back(cur);
    return true;
}

bool parse_value(std::string_view text, Value& out, std::string& err) {
    const std::string v = trim(std::string(text));
    if (v.empty()) {
        err = "empty value";
        return false;
    }

    if (v == "true") {
        out = true;
        return true;
    }
    if (v == "false") {
        out = false;
        return true;
    }

    int64_t iv = 0;
    if (parse_int_literal(v, iv)) {
        out = iv;
        return true;
    }

    if (is_string_literal(v)) {
        std::string sv{};
        if (!parse_string_literal(v, sv, err)) return false;
        out = std::move(sv);
        return true;
    }

    if (v.front() == '[' && v.back() == ']') {
        const std::string inner = trim(v.substr(1, v.size() - 2));
        if (inner.empty()) {
            out = std::vector<std::string>{};
            return true;
        }
        std::vector<std::string> items{};
        if (!split_array_items(inner, items, err)) return false;
        if (items.empty()) {
            out = std::vector<std::string>{};
            return true;
        }

        bool all_str = true;
        bool all_int = true;
        std::vector<std::string> svals{};
        std::vector<int64_t> ivals{};
        for (const auto& it : items) {
            if (is_string_literal(it)) {
                std::string sv{};
                if (!parse_string_literal(it, sv, err)) return false;
                svals.push_back(std::move(sv));
                all_int = false;
                continue;
            }
            int64_t elem = 0;
            if (parse_int_literal(it, elem)) {
                ivals.push_back(elem);
                all_str = false;
                continue;
            }
            all_str = false;
            all_int = false;
            break;
        }
        if (!all_str && !all_int) {
            err = "array values must be homogeneous strings or integers";
            return false;
        }
        if (all_str) {
            out = std::move(svals);
            return true;
        }
        out = std::move(ivals);
        return true;
    }

    err = "unsupported TOML value";
    return false;
}

// Drops the quotes of quoted key segments: package.metadata."cargo-3ds" -> package.metadata.cargo-3ds
std::string unquote_key(std::string key) {
    std::string out{};
    out.reserve(key.size());
    for (char c : key) {
        if (c == '"' || c == '\'') continue;
        if ((c == ' ' || c == '\t') && (out.empty() || out.back() == '.')) continue;
        out.push_back(c);
    }
    while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) out.pop_back();
    std::string compact{};
    compact.reserve(out.size());
    for (size_t i = 0; i < out.size(); ++i) {
        if ((out[i] == ' ' || out[i] == '\t') && i + 1 < out.size() && out[i + 1] == '.') continue;
        compact.push_back(out[i]);
    }
    return compact;
}

bool valid_key(std::string_view key) {
    if (key.empty()) return false;
    for (char c : key) {
        const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

std::string where(std::string_view origin, size_t line_no) {
    return std::string(origin) + ":" + std::to_string(line_no);
}

} // namespace

bool parse_text(std::string_view text,
                std::string_view origin,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err,
                Strictness strictness) {
    out.clear();
    err.clear();
    const bool tolerant = strictness == Strictness::kTolerant;

    std::istringstream iss{std::string(text)};
    std::string section{};
    bool skip_section = false;
    std::string line{};
    size_t line_no = 0;
    while (std::getline(iss, line)) {
        ++line_no;
        const size_t start_line = line_no;

        // Multi-line basic/literal strings are only needed for Cargo.toml descriptions.
        const std::string raw_trimmed = trim(line);
        const auto ml_pos = raw_trimmed.find("= \"\"\"") != std::string::npos ? raw_trimmed.find("\"\"\"")
                          : raw_trimmed.find("= '''") != std::string::npos ? raw_trimmed.find("'''")
                          : std::string::npos;
        if (tolerant && ml_pos != std::string::npos) {
            const std::string delim = raw_trimmed.substr(ml_pos, 3);
            std::string key = unquote_key(trim(raw_trimmed.substr(0, raw_trimmed.find('='))));
            std::string body = raw_trimmed.substr(ml_pos + 3);
            size_t close = body.find(delim);
            while (close == std::string::npos && std::getline(iss, line)) {
                ++line_no;
                body += "\n" + line;
                close = body.find(delim);
            }
            if (close == std::string::npos) {
                err = where(origin, start_line) + ": unterminated multi-line string";
                return false;
            }
            body = body.substr(0, close);
            if (!body.empty() && body.front() == '\n') body.erase(body.begin());
            if (!skip_section && valid_key(key)) {
                out[section.empty() ? key : section + "." + key] = trim(std::move(body));
            }
            continue;
        }

        std::string content = trim(strip_comment(line));
        if (content.empty()) continue;

        if (content.front() == '[') {
            if (content.back() != ']') {
                err = where(origin, line_no) + ": invalid section header";
                return false;
            }
            const bool array_table = content.size() >= 4 && content.starts_with("[[") && content.ends_with("]]");
            const size_t bracket = array_table ? 2 : 1;
            const std::string sec = unquote_key(trim(content.substr(bracket, content.size() - 2 * bracket)));
            if (sec.empty() || !valid_key(sec)) {
                err = where(origin, line_no) + ": invalid section name";
                return false;
            }
            if (array_table && !tolerant) {
                err = where(origin, line_no) + ": arrays of tables are not supported";
                return false;
            }
            skip_section = array_table;
            section = sec;
            continue;
        }

        const auto eq = content.find('=');
        if (eq == std::string::npos) {
            err = where(origin, line_no) + ": expected '='";
            return false;
        }
        std::string key = unquote_key(trim(content.substr(0, eq)));
        std::string rhs = trim(content.substr(eq + 1));
        if (key.empty() || !valid_key(key)) {
            err = where(origin, line_no) + ": invalid key";
            return false;
        }

        if (tolerant && !rhs.empty() && rhs.front() == '[') {
            while (bracket_balance(rhs) > 0 && std::getline(iss, line)) {
                ++line_no;
                rhs += " " + trim(strip_comment(line));
            }
            // A trailing comma before ']' is legal TOML.
            const auto close = rhs.rfind(']');
            if (close != std::string::npos) {
                std::string head = trim(rhs.substr(0, close));
                if (!head.empty() && head.back() == ',') head.pop_back();
                rhs = head + "]";
            }
        }

        if (skip_section) continue;

        Value parsed{};
        std::string parse_err{};
        if (!parse_value(rhs, parsed, parse_err)) {
            if (tolerant) {
                warnings.push_back(where(origin, start_line) + ": skipped '" + key + "': " + parse_err);
                continue;
            }
            err = where(origin, start_line) + ": " + parse_err;
            return false;
        }

        const std::string fq = section.empty() ? key : section + "." + key;
        if (out.contains(fq)) {
            warnings.push_back(where(origin, start_line) + ": duplicate key '" + fq + "', overriding");
        }
        out[fq] = std::move(parsed);
    }

    return true;
}

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err,
                Strictness strictness) {
    out.clear();
    err.clear();

    if (path.empty()) return true;
    std::error_code ec{};
    if (!std::filesystem::exists(path, ec)) return true;
    if (!std::filesystem::is_regular_file(path, ec)) {
        err = "not a regular file: " + path.string();
        return false;
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        err = "failed to open file: " + path.string();
        return false;
    }
    const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parse_text(text, path.string(), out, warnings, err, strictness);
}

} // namespace cargo3ds::config::toml_lite
