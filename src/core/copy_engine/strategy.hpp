#pragma once

#include <cstdint>
#include "../copy_types.hpp"

namespace cverify::core {

inline constexpr std::uint64_t kSmallFileThreshold = 1'000'000; // 1 MB

class CopyStrategySelector {
public:
    constexpr explicit CopyStrategySelector(std::uint64_t small_threshold = kSmallFileThreshold)
        : small_threshold_(small_threshold) {}

    [[nodiscard]] constexpr auto select(std::uint64_t file_size) const -> CopyStrategy {
        return file_size < small_threshold_ ? CopyStrategy::Small : CopyStrategy::Streamed;
    }

    [[nodiscard]] constexpr auto threshold() const -> std::uint64_t { return small_threshold_; }

private:
    std::uint64_t small_threshold_;
};

} // namespace cverify::core
