#include "mudgate/alias_engine.hpp"

#include <cctype>
#include <vector>

namespace mudgate {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

std::vector<std::string_view> split_words(std::string_view text) {
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) ++i;
        std::size_t start = i;
        while (i < text.size() && !is_space(text[i])) ++i;
        if (i > start) words.push_back(text.substr(start, i - start));
    }
    return words;
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

} // namespace

std::string expand_alias_template(std::string_view replacement, std::string_view rest) {
    const auto words = split_words(rest);

    std::string out;
    out.reserve(replacement.size() + rest.size());

    std::size_t i = 0;
    while (i < replacement.size()) {
        const char c = replacement[i];
        if (c != '$' || i + 1 >= replacement.size()) {
            out.push_back(c);
            ++i;
            continue;
        }

        const char next = replacement[i + 1];
        if (next == '*') {
            out.append(rest);
            i += 2;
            continue;
        }

        if (is_digit(next)) {
            std::size_t j = i + 1;
            std::size_t index = 0;
            while (j < replacement.size() && is_digit(replacement[j])) {
                if (index <= words.size()) {
                    index = index * 10 + static_cast<std::size_t>(replacement[j] - '0');
                }
                ++j;
            }
            if (index >= 1 && index <= words.size()) {
                out.append(words[index - 1]);
            }
            i = j;
            continue;
        }

        out.push_back(c);
        ++i;
    }

    return std::string(trim(out));
}

std::string apply_alias(std::string_view command, const AliasSet& aliases) {
    std::string_view head = command;
    std::string_view rest;

    for (std::size_t i = 0; i < command.size(); ++i) {
        if (is_space(command[i])) {
            head = command.substr(0, i);
            rest = command.substr(i + 1);
            break;
        }
    }

    for (const auto& alias : aliases) {
        if (!alias.enabled) continue;
        if (equals_ignore_case(head, alias.pattern)) {
            return expand_alias_template(alias.replacement, rest);
        }
    }

    return std::string(command);
}

} // namespace mudgate
