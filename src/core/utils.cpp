#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cctype>
#include <stdexcept>

static std::string format_now(const char* pattern) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), pattern, &tm_buf);
    return std::string(buf);
}

std::string now_iso() {
    return format_now("%Y-%m-%dT%H:%M:%S");
}

std::string now_compact() {
    return format_now("%Y%m%d-%H%M%S");
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::optional<int> parse_int(const std::string& s) {
    if (s.empty()) return std::nullopt;
    size_t pos = 0;
    try {
        int v = std::stoi(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::vector<std::string>> split_command_line(const std::string& line) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    size_t i = 0;

    while (i < line.size()) {
        char c = line[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
            i++;
            continue;
        }

        in_word = true;

        if (c == '\'') {
            // Single quotes: everything literal up to the next quote
            auto close = line.find('\'', i + 1);
            if (close == std::string::npos) return std::nullopt;
            current.append(line, i + 1, close - i - 1);
            i = close + 1;
        } else if (c == '"') {
            // Double quotes: backslash escapes only \" \\ \$ \`
            i++;
            bool closed = false;
            while (i < line.size()) {
                char d = line[i];
                if (d == '"') { closed = true; i++; break; }
                if (d == '\\' && i + 1 < line.size()) {
                    char n = line[i + 1];
                    if (n == '"' || n == '\\' || n == '$' || n == '`') {
                        current += n;
                        i += 2;
                        continue;
                    }
                }
                current += d;
                i++;
            }
            if (!closed) return std::nullopt;
        } else if (c == '\\') {
            if (i + 1 >= line.size()) return std::nullopt;
            current += line[i + 1];
            i += 2;
        } else {
            current += c;
            i++;
        }
    }

    if (in_word) words.push_back(current);
    return words;
}

std::string shell_quote(const std::string& word) {
    if (word.empty()) return "''";

    bool plain = true;
    for (char c : word) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) ||
              c == '-' || c == '_' || c == '.' || c == '/' || c == ':' ||
              c == '=' || c == ',' || c == '@' || c == '+')) {
            plain = false;
            break;
        }
    }
    if (plain) return word;

    // 'it'\''s' style
    std::string out = "'";
    for (char c : word) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string truncate_text(const std::string& text, size_t max_length) {
    if (text.size() <= max_length) return text;
    if (max_length <= 3) return text.substr(0, max_length);
    return text.substr(0, max_length - 3) + "...";
}

bool is_valid_name(const std::string& name) {
    if (name.empty() || name.size() > 63 || name[0] == '-') return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
            return false;
        }
    }
    return true;
}
