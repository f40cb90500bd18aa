#include "mudgate/gateway_config.hpp"

#include <stdexcept>
#include <string>

namespace mudgate {

namespace {

unsigned short read_port(const nlohmann::json& section, const char* name, unsigned short fallback) {
    const auto port = section.value("port", static_cast<long long>(fallback));
    if (port < 0 || port > 65535) {
        throw std::runtime_error(std::string(name) + ".port must be between 0 and 65535");
    }
    return static_cast<unsigned short>(port);
}

} // namespace

GatewayConfig GatewayConfig::from_json(const nlohmann::json& config) {
    GatewayConfig c;
    if (config.is_null()) return c;

    c.debug = config.value("debug", c.debug);

    if (config.contains("listen")) {
        const auto& listen = config["listen"];
        c.listen_host = listen.value("host", c.listen_host);
        c.listen_port = read_port(listen, "listen", c.listen_port);
    }

    if (config.contains("mud")) {
        const auto& mud = config["mud"];
        c.mud_host = mud.value("host", c.mud_host);
        c.mud_port = read_port(mud, "mud", c.mud_port);
    }

    const auto tick_ms = config.value("tick_interval_ms", static_cast<long long>(c.tick_interval.count()));
    if (tick_ms <= 0) throw std::runtime_error("tick_interval_ms must be positive");
    c.tick_interval = std::chrono::milliseconds(tick_ms);

    const auto max_read = config.value("max_read_bytes_per_tick", static_cast<long long>(c.max_read_bytes_per_tick));
    if (max_read <= 0) throw std::runtime_error("max_read_bytes_per_tick must be positive");
    c.max_read_bytes_per_tick = static_cast<std::size_t>(max_read);

    const auto dial_s = config.value("dial_timeout_seconds", static_cast<long long>(c.dial_timeout.count()));
    if (dial_s <= 0) throw std::runtime_error("dial_timeout_seconds must be positive");
    c.dial_timeout = std::chrono::seconds(dial_s);

    const auto flush_ms = config.value("prompt_flush_ms", static_cast<long long>(c.prompt_flush.count()));
    if (flush_ms < 0) throw std::runtime_error("prompt_flush_ms must not be negative");
    c.prompt_flush = std::chrono::milliseconds(flush_ms);

    const auto max_line = config.value("max_line_bytes", static_cast<long long>(c.max_line_bytes));
    if (max_line <= 0) throw std::runtime_error("max_line_bytes must be positive");
    c.max_line_bytes = static_cast<std::size_t>(max_line);

    const auto separator = config.value("command_separator", std::string(1, c.command_separator));
    if (separator.empty()) throw std::runtime_error("command_separator must not be empty");
    c.command_separator = separator.front();

    if (config.contains("loop_guard")) {
        const auto& guard = config["loop_guard"];
        const auto threshold = guard.value("threshold", static_cast<long long>(c.loop_guard_threshold));
        if (threshold < 0) throw std::runtime_error("loop_guard.threshold must not be negative");
        c.loop_guard_threshold = static_cast<std::size_t>(threshold);

        const auto window_ms = guard.value("window_ms", static_cast<long long>(c.loop_guard_window.count()));
        if (window_ms <= 0) throw std::runtime_error("loop_guard.window_ms must be positive");
        c.loop_guard_window = std::chrono::milliseconds(window_ms);
    }

    return c;
}

std::string GatewayConfig::mud_address() const {
    return mud_host + ":" + std::to_string(mud_port);
}

} // namespace mudgate
