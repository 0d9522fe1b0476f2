#pragma once

#include "fraudshield/core/Types.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fraudshield {

// What the store keeps per past transaction: the feature vector fed to the
// sequential model plus the raw facts the domain rules look at.
struct HistoryEntry {
    FeatureVector features;
    int64_t timestamp = 0;
    double amount = 0.0;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string device_id;
};

// Oldest first.
using HistoryWindow = std::vector<HistoryEntry>;

// Storage behind the identity store. Implementations must be safe to call
// concurrently for different identities; same-identity calls are already
// serialized by IdentityHistoryStore. Failures throw HistoryStoreError.
class HistoryBackend {
public:
    virtual ~HistoryBackend() = default;

    virtual HistoryWindow read(const std::string& identity) = 0;

    // Append and evict the oldest entries beyond capacity.
    virtual void append(
        const std::string& identity,
        const HistoryEntry& entry,
        std::size_t capacity
    ) = 0;

    virtual std::size_t identityCount() const = 0;
};

class MemoryHistoryBackend : public HistoryBackend {
public:
    HistoryWindow read(const std::string& identity) override;

    void append(
        const std::string& identity,
        const HistoryEntry& entry,
        std::size_t capacity
    ) override;

    std::size_t identityCount() const override;

private:
    mutable std::mutex mtx;
    std::unordered_map<std::string, std::deque<HistoryEntry>> windows;
};

}
