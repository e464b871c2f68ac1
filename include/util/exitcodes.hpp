#pragma once

namespace exitc
{

inline constexpr int ok              = 0;
inline constexpr int bad_args        = 1;
inline constexpr int no_server       = 2;
inline constexpr int transfer_failed = 3;

}  // namespace exitc
