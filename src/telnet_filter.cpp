#include "mudgate/telnet_filter.hpp"

namespace mudgate {

namespace {

constexpr unsigned char IAC = 255;
constexpr unsigned char DONT = 254;
constexpr unsigned char WILL = 251;
constexpr unsigned char SB = 250;
constexpr unsigned char GA = 249;
constexpr unsigned char SE = 240;
constexpr unsigned char EOR = 239;

} // namespace

TelnetFilter::Output TelnetFilter::feed(std::string_view bytes) {
    Output out;
    out.text.reserve(bytes.size());

    for (char ch : bytes) {
        const auto c = static_cast<unsigned char>(ch);

        switch (state_) {
            case State::Data:
                if (c == IAC) {
                    state_ = State::Iac;
                } else {
                    out.text.push_back(ch);
                }
                break;

            case State::Iac:
                if (c == IAC) {
                    out.text.push_back(ch);
                    state_ = State::Data;
                } else if (c == SB) {
                    state_ = State::Sub;
                } else if (c >= WILL && c <= DONT) {
                    state_ = State::Option;
                } else {
                    if (c == GA || c == EOR) out.go_ahead = true;
                    state_ = State::Data;
                }
                break;

            case State::Option:
                state_ = State::Data;
                break;

            case State::Sub:
                if (c == IAC) state_ = State::SubIac;
                break;

            case State::SubIac:
                state_ = (c == SE) ? State::Data : State::Sub;
                break;
        }
    }

    return out;
}

} // namespace mudgate
