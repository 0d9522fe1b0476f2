#pragma once

#include <stdexcept>
#include <string>

namespace fraudshield {

// Malformed or out-of-range input. Never retried; no history mutation.
class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& field, const std::string& reason)
        : std::runtime_error(field + ": " + reason)
        , field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// A model artifact could not be loaded or verified. Fatal at startup.
class ModelUnavailableError : public std::runtime_error {
public:
    explicit ModelUnavailableError(const std::string& what)
        : std::runtime_error(what) {}
};

// Transient failure of the history backend.
class HistoryStoreError : public std::runtime_error {
public:
    explicit HistoryStoreError(const std::string& what)
        : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& key, const std::string& reason)
        : std::runtime_error("config " + key + ": " + reason) {}
};

// The caller abandoned the request before scoring started.
class RequestCancelled : public std::runtime_error {
public:
    explicit RequestCancelled(const std::string& transaction_id)
        : std::runtime_error("request cancelled: " + transaction_id) {}
};

}
