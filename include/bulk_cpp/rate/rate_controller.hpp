#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>

#include "bulk_cpp/rate/rate_preset.hpp"

namespace bulk_cpp {

    /// @brief Point-in-time view of a RateController.
    struct RateControllerSnapshot {
        RatePreset preset{RatePreset::Balanced};
        std::size_t budget{0};   ///< Current admission limit
        std::size_t floor{0};
        std::size_t ceiling{0};
        std::size_t consecutive_successes{0};
        std::size_t consecutive_throttles{0};
        std::uint64_t total_successes{0};
        std::uint64_t total_throttles{0};
        std::uint64_t increases{0};   ///< Additive increase steps taken
        std::uint64_t decreases{0};   ///< Multiplicative decreases applied
        std::size_t lowest_budget{0};  ///< Smallest budget ever reached
        /// Retry-after hint of the most recent throttle, if it carried one.
        std::optional<std::chrono::milliseconds> last_retry_after;
    };

    /**
     * @brief Additive-increase / multiplicative-decrease concurrency budget.
     *
     * The budget is the number of batches the executor may keep in flight.
     * A run of success_threshold consecutive successes raises it by
     * additive_step; a throttle multiplies it by decrease_factor. The budget
     * always stays within [floor, ceiling].
     *
     * Thread-safe: all transitions and reads take one mutex.
     */
    class RateController {
       public:
        explicit RateController(RatePreset preset = RatePreset::Balanced);

        /// @brief Custom numbers. Out-of-range values are clamped so the
        /// budget invariant holds.
        RateController(RatePreset preset, RatePresetSettings settings);

        RateController(const RateController&) = delete;
        RateController& operator=(const RateController&) = delete;

        /// @brief Record one successful batch.
        void on_success();

        /// @brief Record one throttled batch.
        void on_throttled(
            std::optional<std::chrono::milliseconds> retry_after = std::nullopt);

        std::size_t current_budget() const;

        RatePreset preset() const noexcept { return preset_; }

        RatePresetSettings const& settings() const noexcept {
            return settings_;
        }

        RateControllerSnapshot snapshot() const;

       private:
        const RatePreset preset_;
        RatePresetSettings settings_;

        mutable std::mutex mu_;
        std::size_t budget_;
        std::size_t consecutive_successes_{0};
        std::size_t consecutive_throttles_{0};
        std::uint64_t total_successes_{0};
        std::uint64_t total_throttles_{0};
        std::uint64_t increases_{0};
        std::uint64_t decreases_{0};
        std::size_t lowest_budget_;
        std::optional<std::chrono::milliseconds> last_retry_after_;
    };

}  // namespace bulk_cpp
