#include "fraudshield/core/Errors.hpp"
#include "fraudshield/models/ModelIntegrity.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

using namespace fraudshield;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: fraudshield_checksums <artifact-dir> [manifest.json]\n";
        return 1;
    }

    const std::string dir = argv[1];
    const std::string out_path = argc >= 3
        ? std::string(argv[2])
        : (std::filesystem::path(dir) / "checksums.json").string();

    try {
        const ChecksumManifest m = generateManifest(
            dir, "sha256", std::filesystem::path(out_path).filename().string());

        std::ofstream out(out_path);
        if (!out.is_open()) {
            std::cerr << "[CHECKSUMS] cannot write " << out_path << std::endl;
            return 1;
        }
        out << serializeManifest(m) << "\n";

        for (const auto& kv : m.files) {
            std::cout << kv.second << "  " << kv.first << "\n";
        }
        std::cout << "[CHECKSUMS] " << m.files.size() << " files -> " << out_path << std::endl;
    } catch (const ModelUnavailableError& e) {
        std::cerr << "[CHECKSUMS] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
