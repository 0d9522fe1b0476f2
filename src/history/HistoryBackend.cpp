#include "fraudshield/history/HistoryBackend.hpp"

namespace fraudshield {

HistoryWindow MemoryHistoryBackend::read(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mtx);

    auto it = windows.find(identity);
    if (it == windows.end()) return {};

    return HistoryWindow(it->second.begin(), it->second.end());
}

void MemoryHistoryBackend::append(
    const std::string& identity,
    const HistoryEntry& entry,
    std::size_t capacity
) {
    std::lock_guard<std::mutex> lock(mtx);

    auto& q = windows[identity];
    q.push_back(entry);
    while (q.size() > capacity) {
        q.pop_front();
    }
}

std::size_t MemoryHistoryBackend::identityCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return windows.size();
}

}
