#include "fraudshield/history/IdentityHistoryStore.hpp"
#include "fraudshield/core/Errors.hpp"

#include <iostream>

namespace fraudshield {

IdentityHistoryStore::Session::Session(
    IdentityHistoryStore& store,
    std::string identity,
    std::unique_lock<std::mutex> lock
) : store_(&store),
    identity_(std::move(identity)),
    lock_(std::move(lock)) {}

HistoryWindow IdentityHistoryStore::Session::snapshot() {
    return store_->readWithRetry(identity_);
}

void IdentityHistoryStore::Session::append(const HistoryEntry& entry) {
    store_->appendWithRetry(identity_, entry);
}

IdentityHistoryStore::IdentityHistoryStore(
    std::shared_ptr<HistoryBackend> backend,
    std::size_t window,
    int retries
) : backend_(std::move(backend)),
    window_(window),
    retries_(retries < 0 ? 0 : retries) {
    if (!backend_) {
        throw HistoryStoreError("identity history store: no backend");
    }
    if (window_ == 0) {
        throw HistoryStoreError("identity history store: window must be positive");
    }
}

std::mutex& IdentityHistoryStore::lockFor(const std::string& identity) {
    std::lock_guard<std::mutex> lock(table_mtx);

    auto& slot = locks[identity];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

IdentityHistoryStore::Session IdentityHistoryStore::open(const std::string& identity) {
    std::unique_lock<std::mutex> lock(lockFor(identity));
    return Session(*this, identity, std::move(lock));
}

HistoryWindow IdentityHistoryStore::snapshot(const std::string& identity) {
    return open(identity).snapshot();
}

void IdentityHistoryStore::append(
    const std::string& identity,
    const HistoryEntry& entry
) {
    open(identity).append(entry);
}

HistoryWindow IdentityHistoryStore::readWithRetry(const std::string& identity) {
    for (int attempt = 0; ; ++attempt) {
        try {
            HistoryWindow w = backend_->read(identity);
            if (w.size() > window_) {
                w.erase(w.begin(), w.end() - static_cast<std::ptrdiff_t>(window_));
            }
            return w;
        } catch (const HistoryStoreError& e) {
            std::cerr << "[HISTORY] read failed (attempt " << attempt + 1
                      << "): " << e.what() << std::endl;
            if (attempt >= retries_) throw;
        }
    }
}

void IdentityHistoryStore::appendWithRetry(
    const std::string& identity,
    const HistoryEntry& entry
) {
    for (int attempt = 0; ; ++attempt) {
        try {
            backend_->append(identity, entry, window_);
            return;
        } catch (const HistoryStoreError& e) {
            std::cerr << "[HISTORY] append failed (attempt " << attempt + 1
                      << "): " << e.what() << std::endl;
            if (attempt >= retries_) throw;
        }
    }
}

}
