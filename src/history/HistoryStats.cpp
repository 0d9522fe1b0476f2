#include "fraudshield/history/HistoryStats.hpp"

namespace fraudshield {

HistoryStats HistoryStats::compute(
    const HistoryWindow& window,
    int64_t now,
    int64_t velocity_window_seconds
) {
    HistoryStats s;
    s.length = window.size();

    const int64_t cutoff = now - velocity_window_seconds;
    for (const auto& e : window) {
        if (e.timestamp > cutoff && e.timestamp <= now) {
            s.recent_count++;
        }
        s.devices.insert(e.device_id);
    }

    if (!window.empty()) {
        const HistoryEntry& last = window.back();
        s.last_timestamp = last.timestamp;
        s.last_amount = last.amount;
        s.last_latitude = last.latitude;
        s.last_longitude = last.longitude;
    }

    return s;
}

}
