#pragma once

#include "fraudshield/core/Types.hpp"

#include <cstdint>
#include <string>

namespace fraudshield {

// JSON payload -> Transaction. Throws ValidationError naming the field that
// is missing or has the wrong type. Domain checks are the validator's job.
Transaction parseTransaction(const std::string& json_text);

// "YYYY-MM-DDTHH:MM:SSZ" (a "+00:00" suffix is accepted) -> epoch seconds.
// Throws ValidationError on "timestamp".
int64_t parseIsoTimestamp(const std::string& s);

std::string serializeResponse(const ScoreResponse& r);

// {"error": kind, "message": ..., "transaction_id": ...}
std::string serializeError(
    const std::string& kind,
    const std::string& message,
    const std::string& transaction_id = ""
);

}
