#ifndef MUDGATE_GATEWAY_CORE_HPP
#define MUDGATE_GATEWAY_CORE_HPP

#include "mudgate/gateway_config.hpp"
#include "nlohmann/json.hpp"

namespace mudgate {

/**
 * 程序的组装入口。
 *
 * 根据配置创建io_context、WebSocket服务器、Gateway和驱动tick的定时器，
 * 所有异步操作都跑在同一个线程上，Gateway内部不加锁。
 */
class GatewayCore {
public:
    /**
     * @brief 构造函数。
     * @param config 从JSON文件加载的配置。
     */
    explicit GatewayCore(const nlohmann::json& config);

    /**
     * @brief 启动网关，阻塞直到收到SIGINT/SIGTERM。
     */
    void run();

private:
    GatewayConfig config_;
};

} // namespace mudgate

#endif // MUDGATE_GATEWAY_CORE_HPP
