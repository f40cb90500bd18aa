#ifndef MUDGATE_RULES_HPP
#define MUDGATE_RULES_HPP

#include "mudgate/pattern_matcher.hpp"
#include "nlohmann/json.hpp"

#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace mudgate {

struct GagAction {};

struct HighlightAction {
    std::string color;
};

struct CommandAction {
    std::string command;
};

struct SoundAction {
    std::string sound;
};

using Action = std::variant<GagAction, HighlightAction, CommandAction, SoundAction>;

struct Trigger {
    std::string id;
    std::string name;
    Pattern pattern;
    std::vector<Action> actions;
    bool enabled = true;
    // 只用于存储层排序，实时求值按集合顺序进行
    int priority = 0;
};

struct Alias {
    std::string id;
    std::string pattern;
    std::string replacement;
    bool enabled = true;
};

struct Ticker {
    std::string id;
    std::string command;
    std::chrono::milliseconds interval{0};
    bool enabled = true;
};

using TriggerSet = std::vector<Trigger>;
using AliasSet = std::vector<Alias>;
using TickerSet = std::vector<Ticker>;

/**
 * 从客户端JSON解析规则集合。
 *
 * 采用宽松解析：缺失的字段取默认值，单个格式错误的条目被跳过，其余条目照常安装。
 * 传入的不是数组时返回空集合。
 */
TriggerSet parse_triggers(const nlohmann::json& list);
AliasSet parse_aliases(const nlohmann::json& list);
TickerSet parse_tickers(const nlohmann::json& list);

// 单条解析，格式错误时抛出 nlohmann::json::exception
Trigger parse_trigger(const nlohmann::json& obj);
Alias parse_alias(const nlohmann::json& obj);
Ticker parse_ticker(const nlohmann::json& obj);

} // namespace mudgate

#endif // MUDGATE_RULES_HPP
