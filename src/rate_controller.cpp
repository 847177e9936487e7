#include "bulk_cpp/rate/rate_controller.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace bulk_cpp {

    namespace {
        RatePresetSettings sanitize(RatePresetSettings s) {
            s.floor = std::max<std::size_t>(s.floor, 1);
            s.ceiling = std::max(s.ceiling, s.floor);
            s.initial_budget = std::clamp(s.initial_budget, s.floor, s.ceiling);
            s.success_threshold = std::max<std::size_t>(s.success_threshold, 1);
            s.additive_step = std::max<std::size_t>(s.additive_step, 1);
            if (!(s.decrease_factor > 0.0 && s.decrease_factor < 1.0)) {
                s.decrease_factor = 0.5;
            }
            return s;
        }
    }  // namespace

    RateController::RateController(RatePreset preset)
        : RateController(preset, preset_settings(preset)) {}

    RateController::RateController(RatePreset preset,
                                   RatePresetSettings settings)
        : preset_(preset),
          settings_(sanitize(settings)),
          budget_(settings_.initial_budget),
          lowest_budget_(settings_.initial_budget) {}

    void RateController::on_success() {
        std::size_t before = 0;
        std::size_t after = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ++total_successes_;
            consecutive_throttles_ = 0;
            if (++consecutive_successes_ < settings_.success_threshold) return;

            consecutive_successes_ = 0;
            before = budget_;
            budget_ =
                std::min(settings_.ceiling, budget_ + settings_.additive_step);
            after = budget_;
            if (after == before) return;
            ++increases_;
        }
        spdlog::debug("Rate budget raised {} -> {}", before, after);
    }

    void RateController::on_throttled(
        std::optional<std::chrono::milliseconds> retry_after) {
        std::size_t before = 0;
        std::size_t after = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ++total_throttles_;
            ++consecutive_throttles_;
            consecutive_successes_ = 0;
            if (retry_after) last_retry_after_ = retry_after;

            before = budget_;
            auto scaled = static_cast<std::size_t>(std::floor(
                static_cast<double>(budget_) * settings_.decrease_factor));
            std::size_t next = std::max(settings_.floor, scaled);
            // At least one step down while above the floor
            if (next >= budget_ && budget_ > settings_.floor) next = budget_ - 1;
            budget_ = next;
            after = budget_;
            if (after < before) ++decreases_;
            lowest_budget_ = std::min(lowest_budget_, budget_);
        }
        spdlog::warn("Throttled by service (retry-after {} ms): rate budget {} -> {}",
                     retry_after ? retry_after->count() : 0, before, after);
    }

    std::size_t RateController::current_budget() const {
        std::lock_guard<std::mutex> lk(mu_);
        return budget_;
    }

    RateControllerSnapshot RateController::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        RateControllerSnapshot s;
        s.preset = preset_;
        s.budget = budget_;
        s.floor = settings_.floor;
        s.ceiling = settings_.ceiling;
        s.consecutive_successes = consecutive_successes_;
        s.consecutive_throttles = consecutive_throttles_;
        s.total_successes = total_successes_;
        s.total_throttles = total_throttles_;
        s.increases = increases_;
        s.decreases = decreases_;
        s.lowest_budget = lowest_budget_;
        s.last_retry_after = last_retry_after_;
        return s;
    }

}  // namespace bulk_cpp
