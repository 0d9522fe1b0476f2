#pragma once

#include "fraudshield/history/HistoryBackend.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

namespace fraudshield {

// Summary of an identity's window as seen by the domain rules.
struct HistoryStats {
    std::size_t length = 0;

    // Past entries with timestamp in (now - velocity_window, now].
    std::size_t recent_count = 0;

    std::optional<int64_t> last_timestamp;
    std::optional<double> last_amount;
    std::optional<double> last_latitude;
    std::optional<double> last_longitude;

    std::unordered_set<std::string> devices;

    static HistoryStats compute(
        const HistoryWindow& window,
        int64_t now,
        int64_t velocity_window_seconds
    );
};

}
