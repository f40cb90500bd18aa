#include "mudgate/client_protocol.hpp"

namespace mudgate {

using json = nlohmann::json;

namespace {

std::string text_or_empty(const json& msg, const char* key) {
    auto it = msg.find(key);
    if (it == msg.end() || it->is_null()) return {};
    return it->get<std::string>();
}

const json& list_or_null(const json& msg, const char* key) {
    static const json null_value;
    auto it = msg.find(key);
    return it == msg.end() ? null_value : *it;
}

std::optional<ClientMessage> decode(const json& msg) {
    if (!msg.is_object()) return std::nullopt;

    auto type_it = msg.find("type");
    if (type_it == msg.end() || !type_it->is_string()) return std::nullopt;
    const auto& type = type_it->get_ref<const std::string&>();

    if (type == "command") return ClientMessage{CommandMessage{text_or_empty(msg, "command")}};
    if (type == "set_triggers") return ClientMessage{SetTriggersMessage{parse_triggers(list_or_null(msg, "triggers"))}};
    if (type == "set_aliases") return ClientMessage{SetAliasesMessage{parse_aliases(list_or_null(msg, "aliases"))}};
    if (type == "set_tickers") return ClientMessage{SetTickersMessage{parse_tickers(list_or_null(msg, "tickers"))}};
    if (type == "keepalive") return ClientMessage{KeepaliveMessage{}};
    if (type == "health_check") return ClientMessage{HealthCheckMessage{}};
    if (type == "reconnect") return ClientMessage{ReconnectMessage{}};
    if (type == "disconnect") return ClientMessage{DisconnectMessage{}};
    if (type == "test_line") return ClientMessage{TestLineMessage{text_or_empty(msg, "line")}};

    return std::nullopt;
}

json nullable(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json typed(const char* type) {
    json msg = json::object();
    msg["type"] = type;
    return msg;
}

} // namespace

std::optional<ClientMessage> parse_client_message(std::string_view text) {
    try {
        return decode(json::parse(text.begin(), text.end()));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string dump_message(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string system_message(std::string_view message) {
    json msg = typed("system");
    msg["message"] = std::string(message);
    return dump_message(msg);
}

std::string error_message(std::string_view message) {
    json msg = typed("error");
    msg["message"] = std::string(message);
    return dump_message(msg);
}

std::string mud_message(const TriggerEvaluation& evaluation, bool test) {
    json msg = typed("mud");
    msg["line"] = evaluation.line;
    msg["highlight"] = nullable(evaluation.highlight);
    msg["sound"] = nullable(evaluation.sound);
    if (test) msg["test"] = true;
    return dump_message(msg);
}

std::string keepalive_ack_message() {
    return dump_message(typed("keepalive_ack"));
}

std::string health_ok_message() {
    return dump_message(typed("health_ok"));
}

std::string disable_trigger_message(std::string_view trigger_id) {
    json msg = typed("disable_trigger");
    msg["triggerId"] = std::string(trigger_id);
    return dump_message(msg);
}

} // namespace mudgate
