#ifndef MUDGATE_GATEWAY_CONFIG_HPP
#define MUDGATE_GATEWAY_CONFIG_HPP

#include "nlohmann/json.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace mudgate {

/**
 * 网关配置，从JSON配置文件加载。缺失的键取默认值。
 */
struct GatewayConfig {
    bool debug = false;

    std::string listen_host = "0.0.0.0";
    unsigned short listen_port = 8080;

    std::string mud_host = "3k.org";
    unsigned short mud_port = 3000;

    std::chrono::milliseconds tick_interval{50};
    std::size_t max_read_bytes_per_tick = 16384;
    std::chrono::seconds dial_timeout{30};
    // 没有换行的残行(通常是提示符)静置多久后作为一行送出，0表示关闭
    std::chrono::milliseconds prompt_flush{500};
    // 残行超过这个长度时不再等待换行，直接作为一行送出
    std::size_t max_line_bytes = 65536;
    char command_separator = ';';

    std::size_t loop_guard_threshold = 50;
    std::chrono::milliseconds loop_guard_window{2000};

    /**
     * @brief 从配置JSON构造。
     * @throws nlohmann::json::exception 字段类型错误
     * @throws std::runtime_error 取值不合法
     */
    static GatewayConfig from_json(const nlohmann::json& config);

    std::string mud_address() const;
};

} // namespace mudgate

#endif // MUDGATE_GATEWAY_CONFIG_HPP
