#include "mudgate/session.hpp"

#include <algorithm>
#include <cctype>

namespace mudgate {

namespace {

bool is_blank(std::string_view line) {
    return std::all_of(line.begin(), line.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

// 去掉所有\r，空白行丢弃
void push_line(std::vector<std::string>& lines, std::string_view raw) {
    std::string line;
    line.reserve(raw.size());
    for (char c : raw) {
        if (c != '\r') line.push_back(c);
    }
    if (!is_blank(line)) {
        lines.push_back(std::move(line));
    }
}

} // namespace

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "connecting";
        case SessionState::Open: return "open";
        case SessionState::Closed: return "closed";
    }
    return "closed";
}

Session::Session(SessionId id, SendFn send, LoopGuard loop_guard, std::size_t max_line_bytes)
    : id_(id), send_(std::move(send)), max_line_bytes_(max_line_bytes), loop_guard_(std::move(loop_guard)) {}

void Session::send(std::string message) const {
    if (send_) send_(std::move(message));
}

std::uint64_t Session::attach_upstream(std::shared_ptr<UpstreamConnection> upstream) {
    close_upstream();

    upstream_ = std::move(upstream);
    state_ = SessionState::Connecting;
    return ++dial_serial_;
}

void Session::close_upstream() {
    if (upstream_) {
        upstream_->close();
        upstream_.reset();
    }
    state_ = SessionState::Closed;
    buffer_.clear();
    telnet_.reset();
}

std::vector<std::string> Session::receive(std::string_view bytes, Clock::time_point now) {
    auto filtered = telnet_.feed(bytes);
    buffer_.append(filtered.text);
    if (!filtered.text.empty()) buffer_since_ = now;

    return take_lines(filtered.go_ahead);
}

std::vector<std::string> Session::flush_stale(Clock::time_point now, std::chrono::milliseconds after) {
    if (after.count() <= 0 || buffer_.empty()) return {};
    if (now - buffer_since_ < after) return {};
    return take_lines(true);
}

std::vector<std::string> Session::flush() {
    return take_lines(true);
}

std::vector<std::string> Session::take_lines(bool include_tail) {
    std::vector<std::string> lines;

    std::size_t start = 0;
    std::size_t pos;
    while ((pos = buffer_.find('\n', start)) != std::string::npos) {
        push_line(lines, std::string_view(buffer_).substr(start, pos - start));
        start = pos + 1;
    }

    if (include_tail || buffer_.size() - start > max_line_bytes_) {
        push_line(lines, std::string_view(buffer_).substr(start));
        buffer_.clear();
    } else {
        buffer_.erase(0, start);
    }

    return lines;
}

void Session::set_triggers(TriggerSet triggers) {
    triggers_ = std::move(triggers);
    loop_guard_.reset();
}

void Session::set_tickers(const TickerSet& tickers, Clock::time_point now) {
    tickers_.clear();
    for (const auto& ticker : tickers) {
        if (!ticker.enabled || ticker.interval.count() <= 0 || ticker.command.empty()) continue;
        tickers_.push_back(ScheduledTicker{ticker, now + ticker.interval});
    }
}

std::vector<std::string> Session::due_tickers(Clock::time_point now) {
    std::vector<std::string> commands;
    for (auto& scheduled : tickers_) {
        if (now < scheduled.next) continue;

        commands.push_back(scheduled.ticker.command);
        scheduled.next += scheduled.ticker.interval;
        // 落后超过一个周期时不补发
        if (scheduled.next <= now) scheduled.next = now + scheduled.ticker.interval;
    }
    return commands;
}

bool Session::disable_trigger(const std::string& trigger_id) {
    for (auto& trigger : triggers_) {
        if (trigger.id == trigger_id && trigger.enabled) {
            trigger.enabled = false;
            return true;
        }
    }
    return false;
}

} // namespace mudgate
