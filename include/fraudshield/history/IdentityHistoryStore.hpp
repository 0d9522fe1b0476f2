#pragma once

#include "fraudshield/history/HistoryBackend.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fraudshield {

// Bounded rolling window of past transactions per identity, with one owned
// mutex per identity. A Session holds that mutex for its whole lifetime so
// snapshot -> score -> append runs as one unit for the identity.
class IdentityHistoryStore {
public:
    class Session {
    public:
        Session(Session&&) noexcept = default;
        Session& operator=(Session&&) noexcept = default;
        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        // At most window() entries, oldest first. Retries transient backend
        // failures; throws HistoryStoreError once retries are exhausted.
        HistoryWindow snapshot();

        void append(const HistoryEntry& entry);

        const std::string& identity() const { return identity_; }

    private:
        friend class IdentityHistoryStore;

        Session(
            IdentityHistoryStore& store,
            std::string identity,
            std::unique_lock<std::mutex> lock
        );

        IdentityHistoryStore* store_;
        std::string identity_;
        std::unique_lock<std::mutex> lock_;
    };

    IdentityHistoryStore(
        std::shared_ptr<HistoryBackend> backend,
        std::size_t window,
        int retries = 1
    );

    // Blocks until no other session for this identity is open.
    Session open(const std::string& identity);

    // Single-operation forms; each takes the identity lock for its own duration.
    HistoryWindow snapshot(const std::string& identity);
    void append(const std::string& identity, const HistoryEntry& entry);

    std::size_t window() const { return window_; }
    std::size_t identityCount() const { return backend_->identityCount(); }

private:
    std::mutex& lockFor(const std::string& identity);

    HistoryWindow readWithRetry(const std::string& identity);
    void appendWithRetry(const std::string& identity, const HistoryEntry& entry);

    std::shared_ptr<HistoryBackend> backend_;
    std::size_t window_;
    int retries_;

    std::mutex table_mtx;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks;
};

}
