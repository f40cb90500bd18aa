#include "mudgate/rules.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace mudgate {

using json = nlohmann::json;

namespace {

std::string text_or(const json& obj, const char* key, std::string fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    return it->get<std::string>();
}

bool flag_or(const json& obj, const char* key, bool fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (it->is_number()) return it->get<double>() != 0.0;
    return it->get<bool>();
}

std::optional<Action> parse_action(const json& obj) {
    const auto type = obj.at("type").get<std::string>();

    if (type == "gag") return Action{GagAction{}};
    if (type == "highlight") return Action{HighlightAction{text_or(obj, "color", "#ffff00")}};
    if (type == "command") return Action{CommandAction{text_or(obj, "command", "")}};
    if (type == "sound") return Action{SoundAction{text_or(obj, "sound", "beep")}};

    return std::nullopt;
}

template <typename T, typename Parse>
std::vector<T> parse_list(const json& list, Parse parse) {
    std::vector<T> out;
    if (!list.is_array()) return out;

    out.reserve(list.size());
    for (const auto& entry : list) {
        try {
            out.push_back(parse(entry));
        } catch (const json::exception&) {
            continue;
        }
    }
    return out;
}

} // namespace

Trigger parse_trigger(const json& obj) {
    Trigger trigger;
    trigger.id = text_or(obj, "id", "");
    trigger.name = text_or(obj, "name", "");
    trigger.enabled = flag_or(obj, "enabled", true);

    auto priority = obj.find("priority");
    if (priority != obj.end() && priority->is_number()) {
        // 超出int范围的值截到边界
        const double value = std::clamp(priority->get<double>(),
            static_cast<double>(std::numeric_limits<int>::min()),
            static_cast<double>(std::numeric_limits<int>::max()));
        trigger.priority = static_cast<int>(value);
    }

    auto type = parse_match_type(text_or(obj, "matchType", "contains"));
    trigger.pattern = Pattern(obj.at("pattern").get<std::string>(), type);

    auto actions = obj.find("actions");
    if (actions != obj.end() && actions->is_array()) {
        for (const auto& entry : *actions) {
            try {
                if (auto action = parse_action(entry)) {
                    trigger.actions.push_back(std::move(*action));
                }
            } catch (const json::exception&) {
                continue;
            }
        }
    }

    return trigger;
}

Alias parse_alias(const json& obj) {
    Alias alias;
    alias.id = text_or(obj, "id", "");
    alias.pattern = obj.at("pattern").get<std::string>();
    alias.replacement = text_or(obj, "replacement", "");
    alias.enabled = flag_or(obj, "enabled", true);
    return alias;
}

Ticker parse_ticker(const json& obj) {
    Ticker ticker;
    ticker.id = text_or(obj, "id", "");
    ticker.command = obj.at("command").get<std::string>();
    ticker.enabled = flag_or(obj, "enabled", true);

    // interval以秒为单位，允许小数
    const double seconds = obj.at("interval").get<double>();
    if (std::isfinite(seconds) && seconds > 0.0) {
        ticker.interval = std::chrono::milliseconds(std::llround(seconds * 1000.0));
    }
    return ticker;
}

TriggerSet parse_triggers(const json& list) {
    return parse_list<Trigger>(list, parse_trigger);
}

AliasSet parse_aliases(const json& list) {
    return parse_list<Alias>(list, parse_alias);
}

TickerSet parse_tickers(const json& list) {
    return parse_list<Ticker>(list, parse_ticker);
}

} // namespace mudgate
