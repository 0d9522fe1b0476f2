#include "fraudshield/audit/AuditSink.hpp"
#include "fraudshield/core/Errors.hpp"

#include <boost/json.hpp>

#include <iostream>

namespace json = boost::json;

namespace fraudshield {

JsonlAuditSink::JsonlAuditSink(const std::string& path)
    : path_(path) {
    out.open(path, std::ios::out | std::ios::app);
    if (!out.is_open()) {
        throw ConfigError("audit.path", "cannot open " + path);
    }
}

JsonlAuditSink::~JsonlAuditSink() {
    flush();
}

std::string JsonlAuditSink::toJson(const AuditRecord& r) {
    json::object o;
    o["timestamp"] = r.timestamp;
    o["amount"] = r.amount;
    o["risk_score"] = r.risk_score;
    o["verdict"] = verdictToStr(r.verdict);
    return json::serialize(o);
}

void JsonlAuditSink::record(const AuditRecord& r) noexcept {
    try {
        const std::string line = toJson(r);

        std::lock_guard<std::mutex> lock(mtx);
        out << line << '\n';
        if (!out) {
            std::cerr << "[AUDIT] write to " << path_ << " failed" << std::endl;
            out.clear();
        }
    } catch (const std::exception& e) {
        std::cerr << "[AUDIT] record dropped: " << e.what() << std::endl;
    }
}

void JsonlAuditSink::flush() {
    std::lock_guard<std::mutex> lock(mtx);
    out.flush();
}

}
