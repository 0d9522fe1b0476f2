#include "fraudshield/config/EngineConfig.hpp"
#include "fraudshield/core/Errors.hpp"
#include "fraudshield/engine/BatchScorer.hpp"
#include "fraudshield/engine/ScoringEngine.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace fraudshield;

int main(int argc, char** argv) {
    std::string config_path;
    if (argc >= 2) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("FRAUDSHIELD_CONFIG")) {
        config_path = env;
    }

    if (config_path.empty()) {
        std::cerr << "usage: fraudshield_score <config.json> [transactions.jsonl]\n"
                  << "       (config may also come from FRAUDSHIELD_CONFIG)\n";
        return 1;
    }

    std::unique_ptr<ScoringEngine> engine;
    try {
        engine = ScoringEngine::create(loadEngineConfig(config_path));
    } catch (const ConfigError& e) {
        std::cerr << "[SCORE] " << e.what() << std::endl;
        return 2;
    } catch (const ModelUnavailableError& e) {
        std::cerr << "[SCORE] " << e.what() << std::endl;
        return 3;
    }

    BatchSummary summary;
    if (argc >= 3) {
        std::ifstream in(argv[2]);
        if (!in.is_open()) {
            std::cerr << "[SCORE] cannot open " << argv[2] << std::endl;
            return 1;
        }
        summary = scoreJsonLines(*engine, in, std::cout);
    } else {
        summary = scoreJsonLines(*engine, std::cin, std::cout);
    }

    std::cerr << "[SCORE] scored " << summary.scored
              << " rejected " << summary.rejected
              << " cancelled " << summary.cancelled
              << " failed " << summary.failed << std::endl;
    return 0;
}
