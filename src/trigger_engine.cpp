#include "mudgate/trigger_engine.hpp"
#include "mudgate/overloaded.hpp"

#include <cctype>
#include <variant>

namespace mudgate {

LoopGuard::LoopGuard(std::size_t threshold, std::chrono::milliseconds window)
    : threshold_(threshold), window_(window) {}

bool LoopGuard::blocked(const std::string& trigger_id, Clock::time_point now) const {
    if (threshold_ == 0 || trigger_id.empty()) return false;

    auto it = fires_.find(trigger_id);
    if (it == fires_.end()) return false;
    if (now - it->second.first > window_) return false;
    return it->second.count >= threshold_;
}

bool LoopGuard::record(const std::string& trigger_id, Clock::time_point now) {
    if (threshold_ == 0 || trigger_id.empty()) return false;

    auto [it, inserted] = fires_.try_emplace(trigger_id);
    auto& fires = it->second;
    if (inserted || now - fires.first > window_) {
        fires.count = 1;
        fires.first = now;
    } else {
        ++fires.count;
    }
    return fires.count == threshold_;
}

std::string substitute_groups(std::string_view text, const std::vector<std::string>& groups) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '$' && i + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[i + 1]))) {
            std::size_t j = i + 1;
            std::size_t index = 0;
            while (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) {
                if (index <= groups.size()) {
                    index = index * 10 + static_cast<std::size_t>(text[j] - '0');
                }
                ++j;
            }
            if (index < groups.size()) {
                out.append(groups[index]);
            }
            i = j;
            continue;
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

TriggerEvaluation evaluate_triggers(std::string_view line, const TriggerSet& triggers) {
    return evaluate_triggers(line, triggers, nullptr, LoopGuard::Clock::now());
}

TriggerEvaluation evaluate_triggers(
    std::string_view line,
    const TriggerSet& triggers,
    LoopGuard* guard,
    LoopGuard::Clock::time_point now)
{
    TriggerEvaluation result;
    result.line = std::string(line);

    const std::string match_line = strip_ansi(line);

    for (const auto& trigger : triggers) {
        if (!trigger.enabled) continue;
        if (guard && guard->blocked(trigger.id, now)) continue;

        const auto m = trigger.pattern.match(match_line);
        if (!m.matched) continue;

        if (guard && guard->record(trigger.id, now)) {
            result.looping.push_back(trigger.id);
            continue;
        }

        const bool is_regex = trigger.pattern.type() == MatchType::Regex;

        for (const auto& action : trigger.actions) {
            std::visit(overloaded{
                [&](const GagAction&) {
                    result.suppressed = true;
                },
                [&](const HighlightAction& a) {
                    result.highlight = a.color;
                },
                [&](const CommandAction& a) {
                    result.commands.push_back(is_regex ? substitute_groups(a.command, m.groups) : a.command);
                },
                [&](const SoundAction& a) {
                    result.sound = a.sound;
                },
            }, action);
        }
    }

    return result;
}

} // namespace mudgate
