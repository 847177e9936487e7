#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bulk_cpp {

    /// @brief Named Rate Controller profiles.
    enum class RatePreset : std::uint8_t {
        Conservative,  ///< Low bounds, hard backoff. Destructive bulk deletes.
        Balanced,      ///< Moderate bounds. Default.
        Aggressive,    ///< High ceiling, gentle backoff. High-capacity tenants.
    };

    /// @brief Numbers behind a preset.
    struct RatePresetSettings {
        std::size_t initial_budget{8};
        std::size_t floor{1};
        std::size_t ceiling{16};
        /// Consecutive successes needed before one additive increase.
        std::size_t success_threshold{10};
        std::size_t additive_step{1};
        /// Budget multiplier applied on a throttle, in (0, 1).
        double decrease_factor{0.5};
    };

    inline constexpr RatePresetSettings preset_settings(RatePreset preset) {
        switch (preset) {
            case RatePreset::Conservative:
                return RatePresetSettings{2, 1, 4, 20, 1, 0.25};
            case RatePreset::Balanced:
                return RatePresetSettings{8, 1, 16, 10, 1, 0.5};
            case RatePreset::Aggressive:
                return RatePresetSettings{16, 2, 64, 5, 2, 0.75};
        }
        return RatePresetSettings{};
    }

    inline constexpr const char* to_string(RatePreset preset) {
        switch (preset) {
            case RatePreset::Conservative:
                return "Conservative";
            case RatePreset::Balanced:
                return "Balanced";
            case RatePreset::Aggressive:
                return "Aggressive";
        }
        return "Unknown";
    }

    /// @brief Parse a preset name, case-insensitive.
    inline std::optional<RatePreset> parse_rate_preset(std::string_view name) {
        using boost::algorithm::iequals;
        if (iequals(name, "conservative")) return RatePreset::Conservative;
        if (iequals(name, "balanced")) return RatePreset::Balanced;
        if (iequals(name, "aggressive")) return RatePreset::Aggressive;
        return std::nullopt;
    }

}  // namespace bulk_cpp
