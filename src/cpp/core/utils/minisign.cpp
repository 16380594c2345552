#include <siri/utils/minisign.h>
#include <siri/error_types.h>
#include <spdlog/spdlog.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

namespace fs = std::filesystem;

namespace siri {
namespace utils {

namespace {

constexpr const char* UNTRUSTED_PREFIX = "untrusted comment:";
constexpr const char* TRUSTED_PREFIX = "trusted comment: ";
constexpr size_t PUBLIC_KEY_SIZE = 2 + 8 + 32;
constexpr size_t SIGNATURE_SIZE = 2 + 8 + 64;

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Non-blank lines with line endings removed
std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!trim(line).empty()) {
            lines.push_back(line);
        }
        start = end + 1;
    }
    return lines;
}

// Update manifests carry the whole minisign file base64-encoded once more
std::string unwrap(const std::string& text) {
    std::string t = trim(text);
    if (t.empty() || starts_with(t, UNTRUSTED_PREFIX) || t.find('\n') != std::string::npos) {
        return t;
    }

    std::vector<unsigned char> decoded;
    try {
        decoded = decode_base64(t);
    } catch (const SignatureException&) {
        return t;
    }
    std::string inner = trim(std::string(decoded.begin(), decoded.end()));
    return starts_with(inner, UNTRUSTED_PREFIX) ? inner : t;
}

template <size_t N>
void copy_bytes(std::array<unsigned char, N>& out, const std::vector<unsigned char>& in, size_t offset) {
    std::copy(in.begin() + offset, in.begin() + offset + N, out.begin());
}

bool ed25519_verify(const std::array<unsigned char, 32>& key,
                    const unsigned char* signature,
                    const unsigned char* message, size_t size) {
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.data(), key.size()));
    if (!pkey) {
        throw SignatureException("Invalid Ed25519 public key");
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        throw SignatureException("Failed to initialize signature verification");
    }
    return EVP_DigestVerify(ctx.get(), signature, 64, message, size) == 1;
}

std::vector<unsigned char> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw SignatureException("Cannot read " + path);
    }
    return std::vector<unsigned char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::vector<unsigned char> blake2b512_of_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw SignatureException("Cannot read " + path);
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_blake2b512(), nullptr) != 1) {
        throw SignatureException("BLAKE2b-512 is not available");
    }

    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            throw SignatureException("Failed to hash " + path);
        }
    }
    if (in.bad()) {
        throw SignatureException("Failed to read " + path);
    }

    std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        throw SignatureException("Failed to hash " + path);
    }
    digest.resize(length);
    return digest;
}

} // namespace

std::vector<unsigned char> decode_base64(const std::string& text) {
    std::string clean;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            clean.push_back(c);
        }
    }
    if (clean.empty() || clean.size() % 4 != 0) {
        throw SignatureException("Malformed base64 data");
    }

    std::vector<unsigned char> out(clean.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0) {
        throw SignatureException("Malformed base64 data");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') padding++;
    if (clean[clean.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

std::string encode_base64(const unsigned char* data, size_t size) {
    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(size));
    out.resize(static_cast<size_t>(n));
    return out;
}

MinisignPublicKey MinisignPublicKey::parse(const std::string& text) {
    std::string b64;
    for (const auto& line : lines_of(unwrap(text))) {
        if (!starts_with(line, UNTRUSTED_PREFIX)) {
            b64 = line;
            break;
        }
    }
    if (b64.empty()) {
        throw SignatureException("Public key is empty");
    }

    auto raw = decode_base64(b64);
    if (raw.size() != PUBLIC_KEY_SIZE || raw[0] != 'E' || raw[1] != 'd') {
        throw SignatureException("Not a minisign Ed25519 public key");
    }

    MinisignPublicKey key;
    copy_bytes(key.key_id, raw, 2);
    copy_bytes(key.key, raw, 10);
    return key;
}

MinisignSignature MinisignSignature::parse(const std::string& text) {
    auto lines = lines_of(unwrap(text));
    if (lines.size() < 4 || !starts_with(lines[0], UNTRUSTED_PREFIX) ||
        !starts_with(lines[2], TRUSTED_PREFIX)) {
        throw SignatureException("Malformed minisign signature");
    }

    auto raw = decode_base64(lines[1]);
    if (raw.size() != SIGNATURE_SIZE) {
        throw SignatureException("Malformed minisign signature");
    }

    MinisignSignature sig;
    if (raw[0] == 'E' && raw[1] == 'd') {
        sig.prehashed = false;
    } else if (raw[0] == 'E' && raw[1] == 'D') {
        sig.prehashed = true;
    } else {
        throw SignatureException("Unsupported signature algorithm");
    }
    copy_bytes(sig.key_id, raw, 2);
    copy_bytes(sig.signature, raw, 10);

    sig.trusted_comment = lines[2].substr(std::strlen(TRUSTED_PREFIX));

    auto global = decode_base64(lines[3]);
    if (global.size() != sig.global_signature.size()) {
        throw SignatureException("Malformed minisign signature");
    }
    copy_bytes(sig.global_signature, global, 0);
    return sig;
}

void verify_file_signature(const std::string& path,
                           const MinisignSignature& signature,
                           const MinisignPublicKey& key) {
    if (signature.key_id != key.key_id) {
        throw SignatureException("Signature was made with a different key");
    }

    bool valid;
    if (signature.prehashed) {
        auto digest = blake2b512_of_file(path);
        valid = ed25519_verify(key.key, signature.signature.data(), digest.data(), digest.size());
    } else {
        auto data = read_file(path);
        valid = ed25519_verify(key.key, signature.signature.data(), data.data(), data.size());
    }
    if (!valid) {
        throw SignatureException("Signature does not match " + fs::path(path).filename().string());
    }

    std::vector<unsigned char> global_message(signature.signature.begin(), signature.signature.end());
    global_message.insert(global_message.end(),
                          signature.trusted_comment.begin(), signature.trusted_comment.end());
    if (!ed25519_verify(key.key, signature.global_signature.data(),
                        global_message.data(), global_message.size())) {
        throw SignatureException("Trusted comment signature is invalid");
    }

    spdlog::debug("[Signature] Verified {} ({})", path, signature.trusted_comment);
}

} // namespace utils
} // namespace siri
