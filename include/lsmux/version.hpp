#pragma once

namespace lsmux {

inline constexpr const char kLsmuxVersion[] = "0.1.0";

} // namespace lsmux
