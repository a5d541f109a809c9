#pragma once

namespace exitc
{

inline constexpr int ok         = 0;
inline constexpr int bad_args   = 2;
inline constexpr int io_error   = 3;
inline constexpr int bad_frame  = 4;  // malformed or inconsistent frames
inline constexpr int incomplete = 5;  // join: frames missing

}  // namespace exitc
