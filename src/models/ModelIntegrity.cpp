#include "fraudshield/models/ModelIntegrity.hpp"
#include "fraudshield/core/Errors.hpp"

#include <boost/json.hpp>
#include <openssl/evp.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

namespace json = boost::json;
namespace fs = std::filesystem;

namespace fraudshield {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};

}

std::string fileDigest(const std::string& path, const std::string& algorithm) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (!md) {
        throw ModelUnavailableError("integrity: unknown digest '" + algorithm + "'");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw ModelUnavailableError("integrity: cannot open " + path);
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        throw ModelUnavailableError("integrity: digest init failed");
    }

    char buf[8192];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buf, static_cast<std::size_t>(in.gcount())) != 1) {
            throw ModelUnavailableError("integrity: digest update failed");
        }
    }
    if (in.bad()) {
        throw ModelUnavailableError("integrity: read error on " + path);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw ModelUnavailableError("integrity: digest final failed");
    }

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i)
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(digest[i]);
    return out.str();
}

ChecksumManifest parseManifest(const std::string& json_text) {
    json::value doc;
    try {
        doc = json::parse(json_text);
    } catch (const std::exception& e) {
        throw ModelUnavailableError(std::string("checksum manifest: ") + e.what());
    }

    const json::object* root = doc.if_object();
    const json::value* files = root ? root->if_contains("files") : nullptr;
    if (!files || !files->is_object()) {
        throw ModelUnavailableError("checksum manifest: needs a 'files' object");
    }

    ChecksumManifest m;
    if (const json::value* alg = root->if_contains("algorithm")) {
        if (!alg->is_string()) {
            throw ModelUnavailableError("checksum manifest: 'algorithm' must be a string");
        }
        m.algorithm = alg->get_string().c_str();
    }

    for (const auto& kv : files->get_object()) {
        if (!kv.value().is_string()) {
            throw ModelUnavailableError(
                "checksum manifest: digest for '" + std::string(kv.key()) + "' must be a string");
        }
        m.files[std::string(kv.key())] = kv.value().get_string().c_str();
    }
    return m;
}

ChecksumManifest loadManifest(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ModelUnavailableError("checksum manifest: cannot open " + path);
    }

    std::string data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );
    return parseManifest(data);
}

std::string serializeManifest(const ChecksumManifest& m) {
    json::object files;
    for (const auto& kv : m.files) {
        files[kv.first] = kv.second;
    }

    json::object root;
    root["algorithm"] = m.algorithm;
    root["files"] = std::move(files);
    return json::serialize(root);
}

void verifyArtifacts(const ChecksumManifest& manifest, const std::vector<std::string>& paths) {
    for (const auto& p : paths) {
        const std::string name = fs::path(p).filename().string();

        auto it = manifest.files.find(name);
        if (it == manifest.files.end()) {
            throw ModelUnavailableError("integrity: " + name + " is not in the checksum manifest");
        }

        const std::string actual = fileDigest(p, manifest.algorithm);
        if (actual != it->second) {
            throw ModelUnavailableError(
                "integrity: checksum mismatch for " + name +
                " (expected " + it->second + ", got " + actual + ")");
        }
        std::cout << "[INTEGRITY] " << name << " OK" << std::endl;
    }
}

ChecksumManifest generateManifest(
    const std::string& dir,
    const std::string& algorithm,
    const std::string& exclude_name
) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw ModelUnavailableError("integrity: not a directory: " + dir);
    }

    ChecksumManifest m;
    m.algorithm = algorithm;

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;

        const fs::path& p = entry.path();
        if (p.extension() != ".json") continue;
        if (p.filename() == exclude_name) continue;

        m.files[p.filename().string()] = fileDigest(p.string(), algorithm);
    }
    return m;
}

}
