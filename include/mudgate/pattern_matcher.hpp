#ifndef MUDGATE_PATTERN_MATCHER_HPP
#define MUDGATE_PATTERN_MATCHER_HPP

#include <boost/regex.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mudgate {

enum class MatchType {
    Exact,
    Contains,
    StartsWith,
    EndsWith,
    Regex
};

/**
 * 将客户端传来的matchType字符串转换为枚举。
 * 缺失或未知的值按contains处理。
 */
MatchType parse_match_type(std::string_view name);

std::string_view to_string(MatchType type);

struct MatchResult {
    bool matched = false;
    // 仅regex模式填充，groups[0]为整个匹配，未参与匹配的分组为空串
    std::vector<std::string> groups;
};

// regex模式只在行的前这么多字节上匹配
constexpr std::size_t max_regex_input = 4096;

/**
 * 一条预编译的匹配规则。
 *
 * 除regex以外的模式都做ASCII大小写不敏感比较；regex使用Boost.Regex的Perl语法并带icase标志，
 * 不做隐式锚定。用户提供的正则如果编译失败，该Pattern永远不匹配，而不会抛出异常。
 * 匹配时回溯超出Boost.Regex的复杂度上限同样按不匹配处理。
 */
class Pattern {
public:
    Pattern() = default;
    Pattern(std::string text, MatchType type);

    MatchResult match(std::string_view line) const;

    bool valid() const { return valid_; }
    MatchType type() const { return type_; }
    const std::string& text() const { return text_; }

private:
    std::string text_;
    std::string folded_;
    MatchType type_ = MatchType::Contains;
    std::shared_ptr<const boost::regex> regex_;
    bool valid_ = true;
};

/**
 * 一次性匹配，不缓存编译结果。
 */
MatchResult match(std::string_view line, std::string_view pattern, MatchType type);

bool matches(std::string_view line, std::string_view pattern, MatchType type);

std::string to_lower(std::string_view text);

/**
 * 去掉ANSI SGR颜色序列(ESC [ ... m)，用于触发器匹配。
 */
std::string strip_ansi(std::string_view text);

} // namespace mudgate

#endif // MUDGATE_PATTERN_MATCHER_HPP
