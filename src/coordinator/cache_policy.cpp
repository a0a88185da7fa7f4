/*
 * cache_policy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "cache_policy.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace helium::coordinator {

namespace {

const std::array<std::string, 18> MODIFYING_WORDS = {
    "install", "uninstall", "push",  "rm",     "mkdir",   "mv",
    "cp",      "chmod",     "chown", "input",  "setprop", "touch",
    "dd",      "settings",  "am",    "pm",     "reboot",  "svc"};

const std::array<std::string, 6> READ_ONLY_WORDS = {
    "getprop", "cat", "ls", "ps", "netstat", "dumpsys"};

auto containsWord(const std::vector<std::string>& tokens,
                  const std::string& word) -> bool {
    return std::any_of(tokens.begin(), tokens.end(),
                       [&word](const std::string& token) {
                           return CachePolicy::matchesWord(token, word);
                       });
}

template <size_t N>
auto containsAny(const std::vector<std::string>& tokens,
                 const std::array<std::string, N>& words) -> bool {
    return std::any_of(words.begin(), words.end(),
                       [&tokens](const std::string& word) {
                           return containsWord(tokens, word);
                       });
}

auto isRedirectDelimiter(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) || c == ';' ||
           c == '|' || c == '&' || c == ')';
}

/// True when an argument redirects output into a file. Descriptor
/// duplication (2>&1) and /dev/null are not writes.
auto writesToFile(const std::string& arg) -> bool {
    for (size_t pos = arg.find('>'); pos != std::string::npos;
         pos = arg.find('>', pos)) {
        ++pos;
        if (pos < arg.size() && (arg[pos] == '>' || arg[pos] == '|')) {
            ++pos;
        }
        if (pos < arg.size() && arg[pos] == '&') {
            continue;
        }
        while (pos < arg.size() &&
               std::isspace(static_cast<unsigned char>(arg[pos]))) {
            ++pos;
        }
        auto end = pos;
        while (end < arg.size() && !isRedirectDelimiter(arg[end])) {
            ++end;
        }
        if (arg.compare(pos, end - pos, "/dev/null") != 0) {
            return true;
        }
        pos = end;
    }
    return false;
}

}  // namespace

auto CachePolicy::tokenize(const dispatch::Command& command)
    -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&] {
        if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    };

    for (const auto& arg : command.argv) {
        for (char c : arg) {
            auto uc = static_cast<unsigned char>(c);
            if (std::isspace(uc) || c == ';' || c == '|' || c == '&' ||
                c == '"' || c == '\'' || c == '(' || c == ')') {
                flush();
            } else {
                current += static_cast<char>(std::tolower(uc));
            }
        }
        flush();
    }
    return tokens;
}

auto CachePolicy::matchesWord(const std::string& token, const std::string& word)
    -> bool {
    if (token == word) {
        return true;
    }
    if (token.size() > word.size() + 1) {
        if (token.starts_with(word + "-")) {
            return true;
        }
    }
    return token.ends_with("/" + word);
}

auto CachePolicy::isCacheable(const dispatch::Command& command) -> bool {
    switch (command.kind) {
        case dispatch::CommandKind::Install:
        case dispatch::CommandKind::Uninstall:
        case dispatch::CommandKind::Push:
        case dispatch::CommandKind::Input:
            return false;
        default:
            break;
    }

    if (std::any_of(command.argv.begin(), command.argv.end(), writesToFile)) {
        return false;
    }
    auto tokens = tokenize(command);
    if (containsAny(tokens, MODIFYING_WORDS)) {
        return false;
    }
    return command.kind == dispatch::CommandKind::Property ||
           containsAny(tokens, READ_ONLY_WORDS);
}

auto CachePolicy::ttlFor(const dispatch::Command& command)
    -> std::chrono::milliseconds {
    auto tokens = tokenize(command);

    if (containsWord(tokens, "ps") || containsWord(tokens, "netstat") ||
        containsWord(tokens, "top")) {
        return VOLATILE_TTL;
    }
    if (containsWord(tokens, "dumpsys") || containsWord(tokens, "getprop") ||
        command.kind == dispatch::CommandKind::Property) {
        return SEMI_STATIC_TTL;
    }
    bool reader = false;
    for (const auto& token : tokens) {
        if (matchesWord(token, "cat") || matchesWord(token, "ls")) {
            reader = true;
        } else if (reader && token.starts_with("/system")) {
            return STATIC_TTL;
        }
    }
    return DEFAULT_TTL;
}

}  // namespace helium::coordinator
