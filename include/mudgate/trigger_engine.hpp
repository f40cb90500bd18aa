#ifndef MUDGATE_TRIGGER_ENGINE_HPP
#define MUDGATE_TRIGGER_ENGINE_HPP

#include "mudgate/rules.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mudgate {

/**
 * 一行输入经过整个触发器集合后的结果。
 * line始终是原始文本，gag/highlight只会抑制或标记它，不会改写。
 */
struct TriggerEvaluation {
    std::string line;
    bool suppressed = false;
    std::optional<std::string> highlight;
    std::vector<std::string> commands;
    std::optional<std::string> sound;
    // 本行触发了死循环保护的触发器id
    std::vector<std::string> looping;
};

/**
 * 触发器死循环保护。
 *
 * 同一个触发器在window内触发达到threshold次时，本次动作被跳过并上报；
 * 窗口过去之前它都不会再生效。没有id的触发器不参与统计，threshold为0时关闭保护。
 */
class LoopGuard {
public:
    using Clock = std::chrono::steady_clock;

    LoopGuard(std::size_t threshold = 50, std::chrono::milliseconds window = std::chrono::milliseconds(2000));

    bool blocked(const std::string& trigger_id, Clock::time_point now) const;

    // 记录一次触发，恰好达到阈值时返回true
    bool record(const std::string& trigger_id, Clock::time_point now);

    void reset() { fires_.clear(); }

private:
    struct Fires {
        std::size_t count = 0;
        Clock::time_point first;
    };

    std::size_t threshold_;
    std::chrono::milliseconds window_;
    std::unordered_map<std::string, Fires> fires_;
};

TriggerEvaluation evaluate_triggers(std::string_view line, const TriggerSet& triggers);

TriggerEvaluation evaluate_triggers(
    std::string_view line,
    const TriggerSet& triggers,
    LoopGuard* guard,
    LoopGuard::Clock::time_point now);

/**
 * 把命令文本里的$0..$N替换成正则分组，越界的下标展开为空串。
 */
std::string substitute_groups(std::string_view text, const std::vector<std::string>& groups);

} // namespace mudgate

#endif // MUDGATE_TRIGGER_ENGINE_HPP
