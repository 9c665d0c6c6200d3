#pragma once
#include <cstddef>

namespace fidelity::config {

inline constexpr std::size_t kMaxNestingDepth = 512;
inline constexpr std::size_t kStreamReadChunk = 64 * 1024;
inline constexpr std::size_t kMaxInflatedSize = 256 * 1024 * 1024;
inline constexpr const char kVersionString[] = "fidelity 0.3.0";

} // namespace fidelity::config
