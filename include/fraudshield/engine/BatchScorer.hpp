#pragma once

#include "fraudshield/engine/ScoringEngine.hpp"

#include <cstddef>
#include <istream>
#include <ostream>

namespace fraudshield {

struct BatchSummary {
    std::size_t scored = 0;
    std::size_t rejected = 0;   // bad payloads and validation failures
    std::size_t cancelled = 0;
    std::size_t failed = 0;     // anything else; the batch carries on
};

// One JSON transaction per input line, one JSON response or error per
// output line. Blank lines are skipped. A failing line never ends the batch.
BatchSummary scoreJsonLines(ScoringEngine& engine, std::istream& in, std::ostream& out);

}
