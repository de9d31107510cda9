#pragma once

#include <cstddef>
#include <new>

namespace tipflow::detail {
#if defined(__cpp_lib_hardware_interference_size) && __cpp_lib_hardware_interference_size >= 201703L
// std::hardware_destructive_interference_size reports 64 for Apple Silicon as of Apple clang version 17.0.0
// (clang-1700.0.13.5), but 128 should be used as reported by sysctl: hw.cachelinesize: 128
#if defined(__APPLE__) && defined(__arm64__)
constexpr inline size_t cacheline_size = 128;
#else
constexpr inline size_t cacheline_size = std::hardware_destructive_interference_size;
#endif
#else
constexpr inline size_t cacheline_size = 64; // Default to 64 bytes
#endif

template <typename... Ts>
struct overload : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
overload(Ts...) -> overload<Ts...>;
} // namespace tipflow::detail
