#pragma once

#include <chrono>
#include <cstddef>

namespace looprunner {

namespace io {
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kInitialOutputReserve = 8192;
inline constexpr std::size_t kMaxOutputSize = 10 * 1024 * 1024;
}

namespace timing {
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
inline constexpr auto kChildPollInterval = std::chrono::milliseconds(20);
}

namespace limits {
inline constexpr std::size_t kErrorSummaryBytes = 4000;
inline constexpr std::size_t kDescriptionChars = 50;
}

}
