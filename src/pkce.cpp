#include "pkce.hpp"
#include "oauth2_error.hpp"
#include "tokenward_tracing.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace tokenward {

std::vector<unsigned char> SecureRandomBytes(size_t count) {
    std::vector<unsigned char> bytes(count);
    if (count == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        // Entropy exhaustion is not recoverable
        TOKENWARD_TRACE_ERROR("PKCE", "RAND_bytes failed");
        throw std::runtime_error("Failed to obtain secure random bytes");
    }
    return bytes;
}

std::string Base64UrlEncode(const unsigned char* data, size_t length) {
    if (length == 0) {
        return std::string();
    }

    std::string encoded;
    encoded.resize(4 * ((length + 2) / 3));
    auto written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), data, static_cast<int>(length));
    encoded.resize(static_cast<size_t>(written));

    for (auto& c : encoded) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

std::string Base64UrlEncode(const std::string& data) {
    return Base64UrlEncode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string Sha256(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), digest_length);
}

std::string GenerateState() {
    auto bytes = SecureRandomBytes(16);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (auto b : bytes) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

PkceChallenge::PkceChallenge(std::string verifier, std::string challenge)
    : verifier(std::move(verifier)), challenge(std::move(challenge)) {
}

PkceChallenge PkceChallenge::Generate() {
    return FromRandomBytes(SecureRandomBytes(VERIFIER_BYTES));
}

PkceChallenge PkceChallenge::FromRandomBytes(const std::vector<unsigned char>& random_bytes) {
    if (random_bytes.empty()) {
        throw std::invalid_argument("PKCE verifier requires random input");
    }

    auto verifier = Base64UrlEncode(random_bytes.data(), random_bytes.size());
    auto challenge = ComputeChallenge(verifier);

    TOKENWARD_TRACE_DEBUG("PKCE", "Generated code challenge: " + TruncateSecret(challenge));
    return PkceChallenge(std::move(verifier), std::move(challenge));
}

std::string PkceChallenge::ComputeChallenge(const std::string& verifier) {
    if (verifier.empty()) {
        throw std::invalid_argument("Code verifier cannot be empty");
    }
    return Base64UrlEncode(Sha256(verifier));
}

} // namespace tokenward
