#ifndef MUDGATE_COMMAND_SPLITTER_HPP
#define MUDGATE_COMMAND_SPLITTER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace mudgate {

constexpr char kDefaultCommandSeparator = ';';

/**
 * 按未转义的分隔符把一段输入拆成多条命令。
 *
 * 反斜杠转义下一个字符(反斜杠本身被丢弃)。中间的空命令会保留，
 * 末尾为空的命令被丢弃："a;b" -> [a, b]，"a\;b" -> [a;b]，"a;" -> [a]，";" -> []。
 */
std::vector<std::string> split_commands(std::string_view text, char separator = kDefaultCommandSeparator);

} // namespace mudgate

#endif // MUDGATE_COMMAND_SPLITTER_HPP
