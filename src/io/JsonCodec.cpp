#include "fraudshield/io/JsonCodec.hpp"
#include "fraudshield/core/Errors.hpp"
#include "fraudshield/infra/Calendar.hpp"

#include <boost/json.hpp>

#include <cctype>
#include <cmath>
#include <limits>

namespace json = boost::json;

namespace fraudshield {

namespace {

std::string requireString(const json::object& o, const char* key) {
    const json::value* v = o.if_contains(key);
    if (!v) throw ValidationError(key, "missing");
    if (!v->is_string()) throw ValidationError(key, "must be a string");
    return std::string(v->get_string().c_str());
}

double requireNumber(const json::object& o, const char* key) {
    const json::value* v = o.if_contains(key);
    if (!v) throw ValidationError(key, "missing");
    if (!v->is_number()) throw ValidationError(key, "must be a number");
    return v->to_number<double>();
}

std::optional<double> optionalNumber(const json::object& o, const char* key) {
    const json::value* v = o.if_contains(key);
    if (!v || v->is_null()) return std::nullopt;
    if (!v->is_number()) throw ValidationError(key, "must be a number");
    return v->to_number<double>();
}

std::optional<int> optionalInt(const json::object& o, const char* key) {
    auto d = optionalNumber(o, key);
    if (!d) return std::nullopt;
    if (!std::isfinite(*d) || std::floor(*d) != *d || std::fabs(*d) > 1e6) {
        throw ValidationError(key, "must be an integer");
    }
    return static_cast<int>(*d);
}

int digits(const std::string& s, std::size_t pos, std::size_t n) {
    int v = 0;
    for (std::size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            throw ValidationError("timestamp", "malformed ISO-8601 value '" + s + "'");
        }
        v = v * 10 + (s[i] - '0');
    }
    return v;
}

}

int64_t parseIsoTimestamp(const std::string& s) {
    // YYYY-MM-DDTHH:MM:SS followed by Z or +00:00
    const bool zulu = s.size() == 20 && s[19] == 'Z';
    const bool offset = s.size() == 25 && s.compare(19, 6, "+00:00") == 0;
    if (!(zulu || offset) || s[4] != '-' || s[7] != '-' ||
        (s[10] != 'T' && s[10] != ' ') || s[13] != ':' || s[16] != ':') {
        throw ValidationError("timestamp", "expected YYYY-MM-DDTHH:MM:SSZ, got '" + s + "'");
    }

    const int y = digits(s, 0, 4);
    const int mo = digits(s, 5, 2);
    const int d = digits(s, 8, 2);
    const int h = digits(s, 11, 2);
    const int mi = digits(s, 14, 2);
    const int se = digits(s, 17, 2);

    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || se > 59) {
        throw ValidationError("timestamp", "date or time out of range in '" + s + "'");
    }

    const int64_t days = infra::daysFromCivil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
    return days * 86400 + h * 3600 + mi * 60 + se;
}

Transaction parseTransaction(const std::string& json_text) {
    json::value doc;
    try {
        doc = json::parse(json_text);
    } catch (const std::exception& e) {
        throw ValidationError("payload", std::string("invalid JSON: ") + e.what());
    }

    const json::object* o = doc.if_object();
    if (!o) {
        throw ValidationError("payload", "expected a JSON object");
    }

    Transaction tx;

    if (const json::value* id = o->if_contains("transaction_id")) {
        if (!id->is_null()) {
            if (!id->is_string()) throw ValidationError("transaction_id", "must be a string");
            tx.transaction_id = id->get_string().c_str();
        }
    }

    tx.sender = requireString(*o, "sender");
    tx.receiver = requireString(*o, "receiver");
    tx.amount = requireNumber(*o, "amount");
    tx.device_id = requireString(*o, "device_id");
    tx.latitude = requireNumber(*o, "latitude");
    tx.longitude = requireNumber(*o, "longitude");

    const json::value* ts = o->if_contains("timestamp");
    if (!ts) {
        throw ValidationError("timestamp", "missing");
    }
    if (ts->is_string()) {
        tx.timestamp = parseIsoTimestamp(ts->get_string().c_str());
    } else if (ts->is_int64()) {
        tx.timestamp = ts->get_int64();
    } else if (ts->is_uint64()) {
        if (ts->get_uint64() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw ValidationError("timestamp", "out of range");
        }
        tx.timestamp = static_cast<int64_t>(ts->get_uint64());
    } else if (ts->is_double()) {
        const double d = ts->get_double();
        if (!std::isfinite(d) || std::fabs(d) > 9.0e15) {
            throw ValidationError("timestamp", "out of range");
        }
        tx.timestamp = static_cast<int64_t>(std::floor(d));
    } else {
        throw ValidationError("timestamp", "must be epoch seconds or an ISO-8601 string");
    }

    tx.hour = optionalInt(*o, "hour");
    tx.day_of_week = optionalInt(*o, "day_of_week");
    tx.day_of_month = optionalInt(*o, "day_of_month");
    tx.time_since_last = optionalNumber(*o, "time_since_last");
    tx.amount_delta = optionalNumber(*o, "amount_delta");

    return tx;
}

std::string serializeResponse(const ScoreResponse& r) {
    json::array factors;
    for (const auto& f : r.factors) {
        factors.push_back(json::object{
            {"name", f.name},
            {"value", f.value},
            {"description", f.description}
        });
    }

    json::array rules;
    for (const auto& o : r.triggered_rules) {
        rules.push_back(json::object{
            {"rule", o.rule},
            {"floor", o.floor},
            {"description", o.description}
        });
    }

    json::object root;
    root["transaction_id"] = r.transaction_id;
    root["risk_score"] = r.risk_score;
    root["verdict"] = verdictToStr(r.verdict);
    root["static_score"] = r.static_score;
    root["sequential_score"] = r.sequential_score;
    root["combined_score"] = r.combined_score;
    root["factors"] = std::move(factors);
    root["triggered_rules"] = std::move(rules);
    root["history_degraded"] = r.history_degraded;
    root["history_length"] = static_cast<uint64_t>(r.history_length);
    root["latency_us"] = r.latency_us;

    return json::serialize(root);
}

std::string serializeError(
    const std::string& kind,
    const std::string& message,
    const std::string& transaction_id
) {
    json::object root;
    root["error"] = kind;
    root["message"] = message;
    if (!transaction_id.empty()) {
        root["transaction_id"] = transaction_id;
    }
    return json::serialize(root);
}

}
