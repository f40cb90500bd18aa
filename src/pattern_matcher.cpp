#include "mudgate/pattern_matcher.hpp"

#include <cctype>
#include <stdexcept>

namespace mudgate {

namespace {

char fold(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

MatchType parse_match_type(std::string_view name) {
    if (name == "exact") return MatchType::Exact;
    if (name == "startsWith") return MatchType::StartsWith;
    if (name == "endsWith") return MatchType::EndsWith;
    if (name == "regex") return MatchType::Regex;
    return MatchType::Contains;
}

std::string_view to_string(MatchType type) {
    switch (type) {
        case MatchType::Exact: return "exact";
        case MatchType::Contains: return "contains";
        case MatchType::StartsWith: return "startsWith";
        case MatchType::EndsWith: return "endsWith";
        case MatchType::Regex: return "regex";
    }
    return "contains";
}

std::string to_lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out.push_back(fold(c));
    }
    return out;
}

std::string strip_ansi(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
            std::size_t j = i + 2;
            while (j < text.size() && (std::isdigit(static_cast<unsigned char>(text[j])) || text[j] == ';')) {
                ++j;
            }
            if (j < text.size() && text[j] == 'm') {
                i = j + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

Pattern::Pattern(std::string text, MatchType type)
    : text_(std::move(text)), type_(type)
{
    if (type_ != MatchType::Regex) {
        folded_ = to_lower(text_);
        return;
    }

    try {
        regex_ = std::make_shared<const boost::regex>(
            text_, boost::regex::perl | boost::regex::icase);
    } catch (const boost::regex_error&) {
        valid_ = false;
    }
}

MatchResult Pattern::match(std::string_view line) const {
    MatchResult result;

    switch (type_) {
        case MatchType::Exact:
            result.matched = to_lower(line) == folded_;
            break;

        case MatchType::Contains:
            result.matched = to_lower(line).find(folded_) != std::string::npos;
            break;

        case MatchType::StartsWith: {
            if (line.size() >= folded_.size()) {
                result.matched = to_lower(line.substr(0, folded_.size())) == folded_;
            }
            break;
        }

        case MatchType::EndsWith: {
            if (line.size() >= folded_.size()) {
                result.matched = to_lower(line.substr(line.size() - folded_.size())) == folded_;
            }
            break;
        }

        case MatchType::Regex: {
            if (!valid_ || !regex_) break;

            const auto input = line.substr(0, max_regex_input);
            boost::match_results<std::string_view::const_iterator> m;
            try {
                if (boost::regex_search(input.begin(), input.end(), m, *regex_)) {
                    result.matched = true;
                    result.groups.reserve(m.size());
                    for (const auto& sub : m) {
                        result.groups.emplace_back(sub.matched ? sub.str() : std::string());
                    }
                }
            } catch (const std::runtime_error&) {
                // 回溯过深、超出复杂度上限一律视为不匹配
                result = MatchResult{};
            }
            break;
        }
    }

    return result;
}

MatchResult match(std::string_view line, std::string_view pattern, MatchType type) {
    return Pattern(std::string(pattern), type).match(line);
}

bool matches(std::string_view line, std::string_view pattern, MatchType type) {
    return match(line, pattern, type).matched;
}

} // namespace mudgate
