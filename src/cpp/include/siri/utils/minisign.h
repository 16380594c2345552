#pragma once

#include <array>
#include <string>
#include <vector>

namespace siri {
namespace utils {

// Ed25519 public key in minisign format ("Ed" + key id + key)
struct MinisignPublicKey {
    std::array<unsigned char, 8> key_id{};
    std::array<unsigned char, 32> key{};

    // Accepts the key file text, its bare base64 line, or either of those
    // wrapped in one more layer of base64. Throws SignatureException.
    static MinisignPublicKey parse(const std::string& text);
};

struct MinisignSignature {
    bool prehashed = false;                       // "ED": signs BLAKE2b-512 of the file
    std::array<unsigned char, 8> key_id{};
    std::array<unsigned char, 64> signature{};
    std::string trusted_comment;
    std::array<unsigned char, 64> global_signature{};   // over signature + trusted comment

    // Accepts the .minisig text or the same text wrapped in base64.
    // Throws SignatureException.
    static MinisignSignature parse(const std::string& text);
};

// Throws SignatureException unless `signature` is a valid signature of the
// file at `path` by `key`, including the trusted comment.
void verify_file_signature(const std::string& path,
                           const MinisignSignature& signature,
                           const MinisignPublicKey& key);

// Standard base64 with padding; whitespace is ignored when decoding.
// decode_base64 throws SignatureException on malformed input.
std::vector<unsigned char> decode_base64(const std::string& text);
std::string encode_base64(const unsigned char* data, size_t size);

} // namespace utils
} // namespace siri
