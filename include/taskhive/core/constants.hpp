#pragma once

#include <chrono>
#include <cstddef>

namespace taskhive {

namespace timing {
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
inline constexpr auto kSqlitePopPollInterval = std::chrono::milliseconds(50);
inline constexpr auto kCpuPrimeInterval = std::chrono::milliseconds(100);
inline constexpr auto kReapPollInterval = std::chrono::milliseconds(20);
}  // namespace timing

namespace limits {
inline constexpr std::size_t kLogQueueCapacity = 8192;
inline constexpr std::size_t kLogBatchSize = 64;
inline constexpr int kEnvelopeVersion = 1;
inline constexpr int kBackgroundNice = 10;
// Submission times are divided by this before being added to the priority
// value, which keeps the normalized part in [0, 1) until year 2286.
inline constexpr double kScoreTimeDivisor = 1e13;
}  // namespace limits

}  // namespace taskhive
