#ifndef MUDGATE_GATEWAY_HPP
#define MUDGATE_GATEWAY_HPP

#include "mudgate/client_protocol.hpp"
#include "mudgate/gateway_config.hpp"
#include "mudgate/session.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace mudgate {

/**
 * 网关核心：持有所有Session，在浏览器协议和MUD文本流之间路由消息。
 *
 * 所有入口(open_session / handle_message / close_session / tick)都应在同一个
 * 调度线程上调用，内部不加锁。上游连接通过工厂创建，测试时可以替换为内存实现。
 */
class Gateway {
public:
    using Clock = std::chrono::steady_clock;
    using SendFn = Session::SendFn;
    using UpstreamFactory = std::function<std::shared_ptr<UpstreamConnection>(SessionId)>;

    Gateway(GatewayConfig config, UpstreamFactory upstream_factory);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /**
     * @brief 浏览器连接建立：创建Session，发送欢迎消息并立即拨号。
     * @param send 向该浏览器发送一帧文本的回调
     */
    SessionId open_session(SendFn send);

    /**
     * @brief 浏览器连接关闭：同步关闭上游连接并销毁Session。
     */
    void close_session(SessionId id);

    void handle_message(SessionId id, std::string_view text);

    /**
     * @brief 一次调度：对每个Open的Session做一次有上限的非阻塞读取，
     * 处理完整的行和到期的定时器。
     */
    void tick();
    void tick(Clock::time_point now);

    void shutdown();

    std::size_t session_count() const { return sessions_.size(); }
    const Session* find_session(SessionId id) const;
    const GatewayConfig& config() const { return config_; }

private:
    Session* find(SessionId id);

    void dial(Session& session);
    void on_dial(SessionId id, std::uint64_t serial, beast::error_code ec);

    void handle_command(Session& session, std::string_view command);
    void handle_test_line(Session& session, const std::string& line);
    void process_line(Session& session, const std::string& line, Clock::time_point now, bool test = false);
    void reconnect(Session& session);
    void disconnect(Session& session);
    void lose_upstream(Session& session, beast::error_code ec);

    void tick_session(Session& session, Clock::time_point now);

    GatewayConfig config_;
    UpstreamFactory upstream_factory_;
    std::map<SessionId, std::unique_ptr<Session>> sessions_;
    SessionId next_id_ = 1;
};

} // namespace mudgate

#endif // MUDGATE_GATEWAY_HPP
