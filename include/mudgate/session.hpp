#ifndef MUDGATE_SESSION_HPP
#define MUDGATE_SESSION_HPP

#include "mudgate/rules.hpp"
#include "mudgate/telnet_filter.hpp"
#include "mudgate/trigger_engine.hpp"
#include "mudgate/upstream_connection.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mudgate {

using SessionId = std::uint64_t;

enum class SessionState {
    Connecting,
    Open,
    Closed
};

std::string_view to_string(SessionState state);

/**
 * 一个浏览器连接对应的全部网关状态。
 *
 * 持有上游连接、未成行的接收缓冲、telnet过滤状态以及当前生效的别名/触发器/定时器集合。
 * Session只由Gateway在单线程的消息处理或tick中修改，不需要加锁。
 */
class Session {
public:
    using Clock = std::chrono::steady_clock;
    using SendFn = std::function<void(std::string)>;

    Session(SessionId id, SendFn send, LoopGuard loop_guard, std::size_t max_line_bytes = 65536);

    SessionId id() const { return id_; }
    SessionState state() const { return state_; }

    void send(std::string message) const;

    /**
     * @brief 换上新的上游连接并进入Connecting状态，旧连接会先被关闭。
     * @return 本次拨号的序号，用来识别过期的拨号回调。
     */
    std::uint64_t attach_upstream(std::shared_ptr<UpstreamConnection> upstream);
    void mark_open() { state_ = SessionState::Open; }
    void close_upstream();

    UpstreamConnection* upstream() const { return upstream_.get(); }
    std::uint64_t dial_serial() const { return dial_serial_; }

    /**
     * @brief 接收一段上游字节，返回其中所有完整的、非空白的行(已去掉\r)。
     *
     * 末尾不完整的部分留在缓冲区等待下一次tick。如果这段数据里出现了telnet GA/EOR，
     * 或者残行超过max_line_bytes，整个缓冲区(包括残行)都会作为行送出。
     */
    std::vector<std::string> receive(std::string_view bytes, Clock::time_point now);

    // 残行静置超过after时取出，after为0时不取
    std::vector<std::string> flush_stale(Clock::time_point now, std::chrono::milliseconds after);

    std::vector<std::string> flush();

    const std::string& pending() const { return buffer_; }

    const AliasSet& aliases() const { return aliases_; }
    const TriggerSet& triggers() const { return triggers_; }
    void set_aliases(AliasSet aliases) { aliases_ = std::move(aliases); }
    void set_triggers(TriggerSet triggers);

    // 只保留启用的、间隔为正且命令非空的定时器，第一次触发在now + interval
    void set_tickers(const TickerSet& tickers, Clock::time_point now);
    std::size_t ticker_count() const { return tickers_.size(); }

    // 返回到期的定时器命令(按集合顺序)并推进下一次触发时间
    std::vector<std::string> due_tickers(Clock::time_point now);

    bool disable_trigger(const std::string& trigger_id);

    LoopGuard& loop_guard() { return loop_guard_; }

private:
    struct ScheduledTicker {
        Ticker ticker;
        Clock::time_point next;
    };

    std::vector<std::string> take_lines(bool include_tail);

    SessionId id_;
    SendFn send_;
    SessionState state_ = SessionState::Closed;

    std::shared_ptr<UpstreamConnection> upstream_;
    std::uint64_t dial_serial_ = 0;

    std::string buffer_;
    Clock::time_point buffer_since_;
    std::size_t max_line_bytes_;
    TelnetFilter telnet_;

    AliasSet aliases_;
    TriggerSet triggers_;
    std::vector<ScheduledTicker> tickers_;
    LoopGuard loop_guard_;
};

} // namespace mudgate

#endif // MUDGATE_SESSION_HPP
