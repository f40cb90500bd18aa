#ifndef MUDGATE_TELNET_FILTER_HPP
#define MUDGATE_TELNET_FILTER_HPP

#include <string>
#include <string_view>

namespace mudgate {

/**
 * 从MUD字节流中剥离telnet IAC协商序列。
 *
 * 状态在多次feed之间保留，所以被拆到两次读取里的序列也能正确处理。
 * 不回应任何协商，只丢弃。遇到GA或EOR时置位go_ahead，表示服务器刚发完一个提示符。
 */
class TelnetFilter {
public:
    struct Output {
        std::string text;
        bool go_ahead = false;
    };

    Output feed(std::string_view bytes);

    void reset() { state_ = State::Data; }

private:
    enum class State {
        Data,
        Iac,
        Option,
        Sub,
        SubIac
    };

    State state_ = State::Data;
};

} // namespace mudgate

#endif // MUDGATE_TELNET_FILTER_HPP
