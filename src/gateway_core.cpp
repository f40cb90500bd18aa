#include "mudgate/gateway_core.hpp"
#include "mudgate/gateway.hpp"
#include "mudgate/upstream_connection.hpp"
#include "mudgate/websocket_server.hpp"

#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <csignal>
#include <functional>
#include <iostream>

namespace mudgate {

GatewayCore::GatewayCore(const nlohmann::json& config)
    : config_(GatewayConfig::from_json(config)) {}

void GatewayCore::run() {
    // 1. 打印配置
    if (config_.debug) {
        std::cout << "[Core] MUD server: " << config_.mud_address() << std::endl;
        std::cout << "[Core] Tick every " << config_.tick_interval.count() << " ms, at most "
                  << config_.max_read_bytes_per_tick << " bytes per upstream per tick." << std::endl;
    }

    // 上游断开时不让SIGPIPE杀掉进程
    std::signal(SIGPIPE, SIG_IGN);

    // 2. 单线程的io_context就是唯一的调度器
    net::io_context ioc{1};

    // 3. 创建核心组件
    Gateway gateway(config_, [&ioc, this](SessionId id) -> std::shared_ptr<UpstreamConnection> {
        return std::make_shared<TcpUpstream>(ioc, config_.dial_timeout, config_.debug, id);
    });

    ChannelHandlers handlers;
    handlers.on_open = [&gateway](std::function<void(std::string)> send) {
        return gateway.open_session(std::move(send));
    };
    handlers.on_message = [&gateway](std::uint64_t id, const std::string& text) {
        gateway.handle_message(id, text);
    };
    handlers.on_close = [&gateway](std::uint64_t id) {
        gateway.close_session(id);
    };
    handlers.health = [&gateway, this]() {
        nlohmann::json body;
        body["status"] = "ok";
        body["mud"] = config_.mud_address();
        body["sessions"] = gateway.session_count();
        return body.dump();
    };

    auto const address = net::ip::make_address(config_.listen_host);
    auto server = std::make_shared<WebSocketServer>(
        ioc, tcp::endpoint{address, config_.listen_port}, std::move(handlers), config_.debug);

    // 4. 周期性tick
    net::steady_timer tick_timer(ioc);
    std::function<void()> schedule_tick;
    schedule_tick = [&]() {
        tick_timer.expires_after(config_.tick_interval);
        tick_timer.async_wait([&](beast::error_code ec) {
            if (ec) return;
            gateway.tick();
            schedule_tick();
        });
    };

    // 5. 启动所有组件
    server->run();
    schedule_tick();

    // 6. 设置信号处理，优雅地关闭
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](beast::error_code, int) {
        if (config_.debug) std::cout << "[Core] Signal received, shutting down." << std::endl;
        tick_timer.cancel();
        gateway.shutdown();
        server->stop();
        ioc.stop();
    });

    std::cout << "[Core] MudGate is running. Press Ctrl+C to exit." << std::endl;
    ioc.run();

    gateway.shutdown();
    if (config_.debug) std::cout << "[Core] Shutdown complete." << std::endl;
}

} // namespace mudgate
