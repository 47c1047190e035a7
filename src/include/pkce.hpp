#pragma once

#include <string>
#include <vector>

namespace tokenward {

// PKCE verifier/challenge pair (RFC 7636) for one authorization attempt
class PkceChallenge {
public:
    static constexpr size_t VERIFIER_BYTES = 32;
    static constexpr const char* METHOD = "S256";

    // Draws 32 random bytes from the OpenSSL CSPRNG
    static PkceChallenge Generate();
    // Derives the pair from caller-supplied bytes; used for reproducible tests
    static PkceChallenge FromRandomBytes(const std::vector<unsigned char>& random_bytes);

    const std::string& Verifier() const { return verifier; }
    const std::string& Challenge() const { return challenge; }
    std::string Method() const { return METHOD; }

    // base64url(SHA-256(verifier)) without padding
    static std::string ComputeChallenge(const std::string& verifier);

private:
    PkceChallenge(std::string verifier, std::string challenge);

    std::string verifier;
    std::string challenge;
};

// Crypto helpers shared by PKCE and state generation
std::vector<unsigned char> SecureRandomBytes(size_t count);
std::string Base64UrlEncode(const unsigned char* data, size_t length);
std::string Base64UrlEncode(const std::string& data);
std::string Sha256(const std::string& data);

// 16 random bytes rendered as 32 lowercase hex characters
std::string GenerateState();

} // namespace tokenward
