#include "fraudshield/engine/BatchScorer.hpp"
#include "fraudshield/core/Errors.hpp"
#include "fraudshield/io/JsonCodec.hpp"

#include <iostream>
#include <string>

namespace fraudshield {

BatchSummary scoreJsonLines(ScoringEngine& engine, std::istream& in, std::ostream& out) {
    BatchSummary summary;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        try {
            const Transaction tx = parseTransaction(line);
            out << serializeResponse(engine.score(tx)) << "\n";
            ++summary.scored;
        } catch (const ValidationError& e) {
            out << serializeError("validation", e.what()) << "\n";
            std::cerr << "[SCORE] line " << line_no << ": " << e.what() << std::endl;
            ++summary.rejected;
        } catch (const RequestCancelled& e) {
            out << serializeError("cancelled", e.what()) << "\n";
            ++summary.cancelled;
        } catch (const std::exception& e) {
            out << serializeError("internal", e.what()) << "\n";
            std::cerr << "[SCORE] line " << line_no << " failed: " << e.what() << std::endl;
            ++summary.failed;
        }
    }

    return summary;
}

}
