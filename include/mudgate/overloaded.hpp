#ifndef MUDGATE_OVERLOADED_HPP
#define MUDGATE_OVERLOADED_HPP

namespace mudgate {

// 把多个lambda合成一个std::visit访问器
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace mudgate

#endif // MUDGATE_OVERLOADED_HPP
