#pragma once

#include "fraudshield/core/Types.hpp"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace fraudshield {

// Anonymized decision record: no identity, device or location.
struct AuditRecord {
    int64_t timestamp = 0;
    double amount = 0.0;
    double risk_score = 0.0;
    Verdict verdict = Verdict::ALLOW;
};

class AuditSink {
public:
    virtual ~AuditSink() = default;

    // Must not throw; failures are the sink's to report.
    virtual void record(const AuditRecord& r) noexcept = 0;
};

// One JSON object per line, appended.
class JsonlAuditSink : public AuditSink {
public:
    explicit JsonlAuditSink(const std::string& path);
    ~JsonlAuditSink() override;

    void record(const AuditRecord& r) noexcept override;
    void flush();

    static std::string toJson(const AuditRecord& r);

private:
    std::string path_;
    std::ofstream out;
    std::mutex mtx;
};

}
