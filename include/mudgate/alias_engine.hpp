#ifndef MUDGATE_ALIAS_ENGINE_HPP
#define MUDGATE_ALIAS_ENGINE_HPP

#include "mudgate/rules.hpp"

#include <string>
#include <string_view>

namespace mudgate {

/**
 * 用会话的别名集合改写一条外发命令。
 *
 * 命令在第一个空白处拆成head和rest，按集合顺序查找第一个启用且pattern与head
 * (大小写不敏感)相同的别名，展开其replacement模板：
 *   $*      -> rest 原样
 *   $1..$N  -> rest按空白切分后的第N个词
 * 无法解析的占位符展开为空串，结果去掉首尾空白。
 * 每条命令至多一个别名生效，展开结果不会再次匹配别名。没有匹配时原样返回。
 */
std::string apply_alias(std::string_view command, const AliasSet& aliases);

/**
 * 展开单个替换模板，apply_alias在命中后调用。
 */
std::string expand_alias_template(std::string_view replacement, std::string_view rest);

} // namespace mudgate

#endif // MUDGATE_ALIAS_ENGINE_HPP
