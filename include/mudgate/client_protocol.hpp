#ifndef MUDGATE_CLIENT_PROTOCOL_HPP
#define MUDGATE_CLIENT_PROTOCOL_HPP

#include "mudgate/rules.hpp"
#include "mudgate/trigger_engine.hpp"
#include "nlohmann/json.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mudgate {

struct CommandMessage {
    std::string command;
};

struct SetTriggersMessage {
    TriggerSet triggers;
};

struct SetAliasesMessage {
    AliasSet aliases;
};

struct SetTickersMessage {
    TickerSet tickers;
};

struct KeepaliveMessage {};
struct HealthCheckMessage {};
struct ReconnectMessage {};
struct DisconnectMessage {};

struct TestLineMessage {
    std::string line;
};

using ClientMessage = std::variant<
    CommandMessage,
    SetTriggersMessage,
    SetAliasesMessage,
    SetTickersMessage,
    KeepaliveMessage,
    HealthCheckMessage,
    ReconnectMessage,
    DisconnectMessage,
    TestLineMessage>;

/**
 * 解析浏览器发来的一帧JSON。
 *
 * 无法解析的JSON、缺少type、未知type以及字段类型错误都返回std::nullopt，
 * 调用方直接忽略，不回复任何错误。
 */
std::optional<ClientMessage> parse_client_message(std::string_view text);

// 发往浏览器的消息
std::string system_message(std::string_view message);
std::string error_message(std::string_view message);
std::string mud_message(const TriggerEvaluation& evaluation, bool test = false);
std::string keepalive_ack_message();
std::string health_ok_message();
std::string disable_trigger_message(std::string_view trigger_id);

/**
 * MUD输出没有约定编码，序列化时把非法UTF-8替换为U+FFFD，而不是抛出异常。
 */
std::string dump_message(const nlohmann::json& message);

} // namespace mudgate

#endif // MUDGATE_CLIENT_PROTOCOL_HPP
