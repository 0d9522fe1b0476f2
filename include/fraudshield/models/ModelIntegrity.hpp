#pragma once

#include <map>
#include <string>
#include <vector>

namespace fraudshield {

// Expected digests of model artifacts, keyed by file basename.
struct ChecksumManifest {
    std::string algorithm = "sha256";
    std::map<std::string, std::string> files;
};

// Lower-case hex digest of a file. algorithm is any OpenSSL digest name
// ("sha256", "sha512", "md5"). Throws ModelUnavailableError.
std::string fileDigest(const std::string& path, const std::string& algorithm = "sha256");

ChecksumManifest loadManifest(const std::string& path);
ChecksumManifest parseManifest(const std::string& json_text);
std::string serializeManifest(const ChecksumManifest& m);

// Every path must be listed in the manifest under its basename with a
// matching digest, else ModelUnavailableError.
void verifyArtifacts(const ChecksumManifest& manifest, const std::vector<std::string>& paths);

// Digest every regular *.json file in dir except the manifest itself.
ChecksumManifest generateManifest(
    const std::string& dir,
    const std::string& algorithm = "sha256",
    const std::string& exclude_name = "checksums.json"
);

}
