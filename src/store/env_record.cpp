/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Env record - Implementation
 */

#include "store/env_record.hpp"

#include <cctype>

namespace bgctl::store {

namespace {

bool is_quote(char c) {
    return c == '"' || c == '\'';
}

std::string_view chomp(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

// Value part of `line` if it is a `key=` record
std::optional<std::string_view> match_line(std::string_view line, std::string_view key) {
    line = chomp(line);
    if (line.size() <= key.size() || !line.starts_with(key) || line[key.size()] != '=') {
        return std::nullopt;
    }
    return line.substr(key.size() + 1);
}

// Calls fn(line, line_start, line_length) for each line, excluding the '\n'
template<typename Fn>
void for_each_line(std::string_view content, Fn&& fn) {
    std::size_t pos = 0;
    while (pos < content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) end = content.size();
        if (!fn(content.substr(pos, end - pos), pos, end - pos)) return;
        pos = end + 1;
    }
}

} // namespace

std::string strip_quotes(std::string_view value) {
    if (value.size() >= 2 && is_quote(value.front()) && value.front() == value.back()) {
        value.remove_prefix(1);
        value.remove_suffix(1);
    }
    return std::string(value);
}

std::string encode_value(std::string_view value) {
    if (value.size() >= 2 && is_quote(value.front()) && value.front() == value.back()) {
        char wrap = value.front() == '"' ? '\'' : '"';
        std::string encoded;
        encoded.reserve(value.size() + 2);
        encoded.push_back(wrap);
        encoded.append(value);
        encoded.push_back(wrap);
        return encoded;
    }
    return std::string(value);
}

std::optional<std::string> lookup(std::string_view content, std::string_view key) {
    std::optional<std::string> result;
    for_each_line(content, [&](std::string_view line, std::size_t, std::size_t) {
        if (auto value = match_line(line, key)) {
            result = strip_quotes(*value);
            return false;
        }
        return true;
    });
    return result;
}

std::optional<std::string> replace_value(std::string_view content,
                                         std::string_view key,
                                         std::string_view value) {
    std::optional<std::string> result;
    for_each_line(content, [&](std::string_view line, std::size_t start, std::size_t length) {
        if (!match_line(line, key)) {
            return true;
        }

        std::string replacement(key);
        replacement.push_back('=');
        replacement.append(encode_value(value));
        if (!line.empty() && line.back() == '\r') {
            replacement.push_back('\r');
        }

        std::string updated;
        updated.reserve(content.size() + replacement.size());
        updated.append(content.substr(0, start));
        updated.append(replacement);
        updated.append(content.substr(start + length));
        result = std::move(updated);
        return false;
    });
    return result;
}

std::map<std::string, std::string> parse_record(std::string_view content) {
    std::map<std::string, std::string> record;
    for_each_line(content, [&](std::string_view line, std::size_t, std::size_t) {
        line = chomp(line);
        if (line.empty() || line.front() == '#') return true;

        auto eq = line.find('=');
        if (eq == std::string_view::npos || eq == 0) return true;

        auto key = line.substr(0, eq);
        if (!is_valid_key(key)) return true;

        record.emplace(std::string(key), strip_quotes(line.substr(eq + 1)));
        return true;
    });
    return record;
}

bool is_valid_key(std::string_view key) {
    if (key.empty() || key.front() == '#') return false;
    for (char c : key) {
        auto uc = static_cast<unsigned char>(c);
        if (c == '=' || std::isspace(uc) || std::iscntrl(uc)) return false;
    }
    return true;
}

} // namespace bgctl::store
