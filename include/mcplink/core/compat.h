#ifndef MCPLINK_CORE_COMPAT_H
#define MCPLINK_CORE_COMPAT_H

#include <optional>
#include <variant>

namespace mcplink {

using std::get;
using std::get_if;
using std::holds_alternative;
using std::make_optional;
using std::monostate;
using std::nullopt;
using std::optional;
using std::variant;
using std::visit;

}  // namespace mcplink

#endif  // MCPLINK_CORE_COMPAT_H
