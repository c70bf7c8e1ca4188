/*
 * uri.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-13

Description: RFC 3986 reference resolution and RFC 6901 JSON Pointers

**************************************************/

#include "uri.hpp"

#include <cctype>
#include <limits>

#include "jsv/error/exception.hpp"

namespace jsv::schema::uri {

namespace {
auto isSchemeChar(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' ||
           c == '-' || c == '.';
}

auto hexValue(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

auto merge(const UriReference& base, const std::string& path) -> std::string {
    if (base.authority && base.path.empty()) {
        return "/" + path;
    }
    auto slash = base.path.rfind('/');
    if (slash == std::string::npos) {
        return path;
    }
    return base.path.substr(0, slash + 1) + path;
}
}  // namespace

auto UriReference::parse(std::string_view text) -> UriReference {
    UriReference ref;
    std::string_view rest = text;

    auto colon = rest.find(':');
    auto delimiter = rest.find_first_of("/?#");
    if (colon != std::string_view::npos && colon > 0 &&
        (delimiter == std::string_view::npos || colon < delimiter) &&
        std::isalpha(static_cast<unsigned char>(rest.front())) != 0) {
        bool valid = true;
        for (char c : rest.substr(0, colon)) {
            valid = valid && isSchemeChar(c);
        }
        if (valid) {
            ref.scheme = std::string(rest.substr(0, colon));
            rest.remove_prefix(colon + 1);
        }
    }

    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        ref.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    if (auto question = rest.find('?'); question != std::string_view::npos) {
        ref.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }
    if (rest.starts_with("//")) {
        rest.remove_prefix(2);
        auto end = rest.find('/');
        ref.authority = std::string(rest.substr(0, end));
        rest = end == std::string_view::npos ? std::string_view{}
                                             : rest.substr(end);
    }
    ref.path = std::string(rest);
    return ref;
}

auto UriReference::toString() const -> std::string {
    std::string out;
    if (scheme) {
        out += *scheme + ":";
    }
    if (authority) {
        out += "//" + *authority;
    }
    out += path;
    if (query) {
        out += "?" + *query;
    }
    if (fragment) {
        out += "#" + *fragment;
    }
    return out;
}

auto removeDotSegments(std::string_view path) -> std::string {
    std::string input(path);
    std::string output;
    while (!input.empty()) {
        if (input.starts_with("../")) {
            input.erase(0, 3);
        } else if (input.starts_with("./")) {
            input.erase(0, 2);
        } else if (input.starts_with("/./")) {
            input.erase(0, 2);
        } else if (input == "/.") {
            input = "/";
        } else if (input.starts_with("/../") || input == "/..") {
            input = input.size() == 3 ? "/" : input.substr(3);
            auto slash = output.rfind('/');
            output.erase(slash == std::string::npos ? 0 : slash);
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            auto next = input.find('/', input.front() == '/' ? 1 : 0);
            output += input.substr(0, next);
            input.erase(0, next == std::string::npos ? input.size() : next);
        }
    }
    return output;
}

auto join(std::string_view base, std::string_view reference) -> std::string {
    if (base.empty()) {
        return std::string(reference);
    }
    UriReference r = UriReference::parse(reference);
    UriReference b = UriReference::parse(base);
    UriReference t;
    if (r.scheme) {
        t.scheme = r.scheme;
        t.authority = r.authority;
        t.path = removeDotSegments(r.path);
        t.query = r.query;
    } else {
        if (r.authority) {
            t.authority = r.authority;
            t.path = removeDotSegments(r.path);
            t.query = r.query;
        } else {
            if (r.path.empty()) {
                t.path = b.path;
                t.query = r.query ? r.query : b.query;
            } else {
                t.path = r.path.front() == '/'
                             ? removeDotSegments(r.path)
                             : removeDotSegments(merge(b, r.path));
                t.query = r.query;
            }
            t.authority = b.authority;
        }
        t.scheme = b.scheme;
    }
    t.fragment = r.fragment;
    return t.toString();
}

auto defragment(std::string_view uri) -> std::pair<std::string, std::string> {
    auto hash = uri.find('#');
    if (hash == std::string_view::npos) {
        return {std::string(uri), std::string{}};
    }
    return {std::string(uri.substr(0, hash)),
            std::string(uri.substr(hash + 1))};
}

auto normalize(std::string_view uri) -> std::string {
    if (uri.ends_with('#')) {
        uri.remove_suffix(1);
    }
    return std::string(uri);
}

auto percentDecode(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
            out += static_cast<char>(hexValue(text[i + 1]) * 16 +
                                     hexValue(text[i + 2]));
            i += 2;
        } else {
            out += text[i];
        }
    }
    return out;
}

auto splitPointer(std::string_view pointer) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    if (pointer.empty()) {
        return tokens;
    }
    if (pointer.front() != '/') {
        THROW_INVALID_ARGUMENT("JSON Pointer must start with '/': ",
                               std::string(pointer));
    }
    std::size_t start = 1;
    while (true) {
        auto end = pointer.find('/', start);
        std::string_view raw = pointer.substr(
            start, end == std::string_view::npos ? end : end - start);
        std::string token;
        for (std::size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] == '~' && i + 1 < raw.size() &&
                (raw[i + 1] == '0' || raw[i + 1] == '1')) {
                token += raw[i + 1] == '0' ? '~' : '/';
                ++i;
            } else {
                token += raw[i];
            }
        }
        tokens.push_back(std::move(token));
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return tokens;
}

auto parseIndex(std::string_view token) -> std::optional<std::size_t> {
    if (token.empty() || (token.size() > 1 && token.front() == '0')) {
        return std::nullopt;
    }
    std::size_t index = 0;
    for (char c : token) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return std::nullopt;
        }
        auto digit = static_cast<std::size_t>(c - '0');
        if (index > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        index = index * 10 + digit;
    }
    return index;
}

auto step(const json& node, const std::string& token) -> const json* {
    if (node.is_object()) {
        auto it = node.find(token);
        return it == node.end() ? nullptr : &*it;
    }
    if (node.is_array()) {
        auto index = parseIndex(token);
        if (!index || *index >= node.size()) {
            return nullptr;
        }
        return &node[*index];
    }
    return nullptr;
}

auto resolvePointer(const json& document, std::string_view pointer)
    -> const json* {
    const json* node = &document;
    for (const auto& token : splitPointer(pointer)) {
        node = step(*node, token);
        if (node == nullptr) {
            return nullptr;
        }
    }
    return node;
}

}  // namespace jsv::schema::uri
