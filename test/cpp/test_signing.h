#pragma once

// Produces real minisign keys and signatures for tests
#include <siri/utils/minisign.h>
#include <openssl/evp.h>
#include <array>
#include <memory>
#include <stdexcept>
#include <string>

namespace siri_test {

class TestSigner {
public:
    explicit TestSigner(std::array<unsigned char, 8> key_id = {1, 2, 3, 4, 5, 6, 7, 8})
        : key_id_(key_id)
    {
        std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
            EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free);
        EVP_PKEY* key = nullptr;
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 || EVP_PKEY_keygen(ctx.get(), &key) != 1) {
            throw std::runtime_error("Ed25519 key generation failed");
        }
        key_.reset(key);
    }

    // Key file text as minisign writes it
    std::string public_key_file() const {
        std::array<unsigned char, 32> raw{};
        size_t size = raw.size();
        if (EVP_PKEY_get_raw_public_key(key_.get(), raw.data(), &size) != 1) {
            throw std::runtime_error("cannot export public key");
        }
        std::string blob = "Ed" + bytes(key_id_.data(), key_id_.size()) + bytes(raw.data(), raw.size());
        return "untrusted comment: minisign public key\n" + b64(blob) + "\n";
    }

    // .minisig text for content; prehashed selects the "ED" algorithm
    std::string signature_file(const std::string& content, bool prehashed = true,
                               const std::string& trusted_comment = "timestamp:1714557600\tfile:update.bin") const {
        std::string message = prehashed ? blake2b512(content) : content;
        std::string sig = sign(message);
        std::string blob = std::string(prehashed ? "ED" : "Ed") + bytes(key_id_.data(), key_id_.size()) + sig;
        std::string global = sign(sig + trusted_comment);
        return "untrusted comment: signature from minisign secret key\n" + b64(blob) +
               "\ntrusted comment: " + trusted_comment + "\n" + b64(global) + "\n";
    }

    // Update manifests carry the signature file base64-encoded
    static std::string wrap(const std::string& text) { return b64(text); }

private:
    static std::string bytes(const unsigned char* data, size_t size) {
        return std::string(reinterpret_cast<const char*>(data), size);
    }

    static std::string b64(const std::string& data) {
        return siri::utils::encode_base64(reinterpret_cast<const unsigned char*>(data.data()), data.size());
    }

    static std::string blake2b512(const std::string& data) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_blake2b512(), nullptr) != 1) {
            throw std::runtime_error("BLAKE2b-512 failed");
        }
        return bytes(digest, length);
    }

    std::string sign(const std::string& message) const {
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
        unsigned char sig[64];
        size_t size = sizeof(sig);
        if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1 ||
            EVP_DigestSign(ctx.get(), sig, &size,
                           reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1) {
            throw std::runtime_error("Ed25519 signing failed");
        }
        return bytes(sig, size);
    }

    std::array<unsigned char, 8> key_id_;
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_{nullptr, EVP_PKEY_free};
};

} // namespace siri_test
