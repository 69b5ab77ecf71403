#include <openssl/evp.h>
#include <openssl/rand.h>
#include <sodium.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <string>
#include <vector>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include "Crypto.h"

namespace Crypto {

static const char *MESSAGE_MAGIC = "Bitcoin Signed Message:\n";
static constexpr uint8_t COMPRESSED_HEADER_BASE = 31;

// Global secp256k1 context (initialized once)
static secp256k1_context *GetSecp256k1Context() {
    static secp256k1_context *ctx =
        secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    return ctx;
}

// === Random Number Generation ===
bool RandBytes(void *buf, size_t len) {
    return RAND_bytes(static_cast<unsigned char *>(buf), static_cast<int>(len)) == 1;
}

// === Base64 Encoding/Decoding ===
std::string B64Encode(const std::vector<uint8_t> &data) {
    if (data.empty())
        return {};

    int outLen = 4 * ((data.size() + 2) / 3);
    std::string out(outLen + 1, '\0');
    int ret = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data.data(),
                              static_cast<int>(data.size()));
    if (ret < 0)
        return {};
    out.resize(ret);
    return out;
}

std::vector<uint8_t> B64Decode(const std::string &s) {
    if (s.empty() || s.size() % 4 != 0)
        return {};

    int outLen = 3 * (s.size() / 4);
    std::vector<uint8_t> out(outLen);
    int ret = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(s.c_str()),
                              static_cast<int>(s.size()));
    if (ret < 0)
        return {};

    // EVP_DecodeBlock counts padding characters as zero bytes
    int padding = 0;
    if (s[s.size() - 1] == '=')
        padding++;
    if (s[s.size() - 2] == '=')
        padding++;
    out.resize(ret - padding);
    return out;
}

// === Hex Encoding/Decoding ===
std::string BytesToHex(const std::vector<uint8_t> &bytes) {
    static const char *digits = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        hex.push_back(digits[b >> 4]);
        hex.push_back(digits[b & 0x0f]);
    }
    return hex;
}

static int HexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool HexToBytes(const std::string &hex, std::vector<uint8_t> &out) {
    out.clear();
    if (hex.size() % 2 != 0)
        return false;

    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = HexValue(hex[i]);
        int lo = HexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            out.clear();
            return false;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

// === Hash Functions ===
bool SHA256(const uint8_t *data, size_t len, std::array<uint8_t, 32> &out) {
    out.fill(uint8_t(0));
    unsigned int hashLen = 0;
    if (EVP_Digest(data, len, out.data(), &hashLen, EVP_sha256(), nullptr) != 1) {
        return false;
    }
    return hashLen == out.size();
}

bool DoubleSHA256(const uint8_t *data, size_t len, std::array<uint8_t, 32> &out) {
    std::array<uint8_t, 32> first{};
    if (!SHA256(data, len, first)) {
        return false;
    }
    return SHA256(first.data(), first.size(), out);
}

static void AppendVarInt(std::vector<uint8_t> &buf, uint64_t value) {
    if (value < 0xfd) {
        buf.push_back(static_cast<uint8_t>(value));
    } else if (value <= 0xffff) {
        buf.push_back(0xfd);
        for (int i = 0; i < 2; ++i)
            buf.push_back(static_cast<uint8_t>(value >> (8 * i)));
    } else if (value <= 0xffffffffULL) {
        buf.push_back(0xfe);
        for (int i = 0; i < 4; ++i)
            buf.push_back(static_cast<uint8_t>(value >> (8 * i)));
    } else {
        buf.push_back(0xff);
        for (int i = 0; i < 8; ++i)
            buf.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

bool MessageHash(const std::string &message, std::array<uint8_t, 32> &out) {
    const size_t magicLen = std::strlen(MESSAGE_MAGIC);

    std::vector<uint8_t> buf;
    buf.reserve(magicLen + message.size() + 10);
    AppendVarInt(buf, magicLen);
    buf.insert(buf.end(), MESSAGE_MAGIC, MESSAGE_MAGIC + magicLen);
    AppendVarInt(buf, message.size());
    buf.insert(buf.end(), message.begin(), message.end());

    return DoubleSHA256(buf.data(), buf.size(), out);
}

// === secp256k1 Keys ===
bool IsValidPrivateKey(const std::vector<uint8_t> &private_key) {
    if (private_key.size() != 32) {
        return false;
    }
    return secp256k1_ec_seckey_verify(GetSecp256k1Context(), private_key.data()) == 1;
}

bool GeneratePrivateKey(std::vector<uint8_t> &private_key) {
    private_key.assign(32, 0);

    // A random 32-byte string is out of range with negligible probability; retry anyway
    for (int attempt = 0; attempt < 16; ++attempt) {
        if (!RandBytes(private_key.data(), private_key.size())) {
            break;
        }
        if (IsValidPrivateKey(private_key)) {
            return true;
        }
    }

    SecureWipeVector(private_key);
    return false;
}

bool DerivePublicKey(const std::vector<uint8_t> &private_key, std::vector<uint8_t> &public_key) {
    if (private_key.size() != 32) {
        return false;
    }

    secp256k1_context *ctx = GetSecp256k1Context();

    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_create(ctx, &pubkey, private_key.data())) {
        return false;
    }

    unsigned char pubkey_serialized[33];
    size_t pubkey_len = 33;
    secp256k1_ec_pubkey_serialize(ctx, pubkey_serialized, &pubkey_len, &pubkey,
                                  SECP256K1_EC_COMPRESSED);

    public_key.assign(pubkey_serialized, pubkey_serialized + pubkey_len);

    return true;
}

// === Signing ===
bool SignHashRecoverable(const std::vector<uint8_t> &private_key,
                         const std::array<uint8_t, 32> &hash, RecoverableSignature &signature) {
    if (private_key.size() != 32) {
        return false;
    }

    auto *ctx = GetSecp256k1Context();

    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_sign_recoverable(ctx, &sig, hash.data(), private_key.data(), nullptr,
                                          nullptr)) {
        return false;
    }

    uint8_t compact[64];
    int recid;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx, compact, &recid, &sig);

    signature.r.assign(compact, compact + 32);
    signature.s.assign(compact + 32, compact + 64);
    signature.recovery_id = recid;

    return true;
}

bool RecoverPublicKey(const std::array<uint8_t, 32> &hash, const RecoverableSignature &signature,
                      std::vector<uint8_t> &public_key) {
    if (signature.r.size() != 32 || signature.s.size() != 32 || signature.recovery_id < 0 ||
        signature.recovery_id > 3) {
        return false;
    }

    auto *ctx = GetSecp256k1Context();

    uint8_t compact[64];
    std::copy(signature.r.begin(), signature.r.end(), compact);
    std::copy(signature.s.begin(), signature.s.end(), compact + 32);

    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(ctx, &sig, compact,
                                                             signature.recovery_id)) {
        return false;
    }

    secp256k1_pubkey pubkey;
    if (!secp256k1_ecdsa_recover(ctx, &pubkey, &sig, hash.data())) {
        return false;
    }

    unsigned char serialized[33];
    size_t serialized_len = sizeof(serialized);
    secp256k1_ec_pubkey_serialize(ctx, serialized, &serialized_len, &pubkey,
                                  SECP256K1_EC_COMPRESSED);
    public_key.assign(serialized, serialized + serialized_len);
    return true;
}

bool SignMessage(const std::vector<uint8_t> &private_key, const std::string &message,
                 std::vector<uint8_t> &compact_signature) {
    std::array<uint8_t, 32> hash{};
    if (!MessageHash(message, hash)) {
        return false;
    }

    RecoverableSignature sig;
    if (!SignHashRecoverable(private_key, hash, sig)) {
        return false;
    }

    compact_signature.clear();
    compact_signature.reserve(65);
    compact_signature.push_back(static_cast<uint8_t>(COMPRESSED_HEADER_BASE + sig.recovery_id));
    compact_signature.insert(compact_signature.end(), sig.r.begin(), sig.r.end());
    compact_signature.insert(compact_signature.end(), sig.s.begin(), sig.s.end());
    return true;
}

bool VerifyMessage(const std::vector<uint8_t> &public_key, const std::string &message,
                   const std::vector<uint8_t> &compact_signature) {
    if (public_key.empty() || compact_signature.size() != 65) {
        return false;
    }

    const uint8_t header = compact_signature[0];
    if (header < COMPRESSED_HEADER_BASE || header > COMPRESSED_HEADER_BASE + 3) {
        return false;
    }

    std::array<uint8_t, 32> hash{};
    if (!MessageHash(message, hash)) {
        return false;
    }

    RecoverableSignature sig;
    sig.recovery_id = header - COMPRESSED_HEADER_BASE;
    sig.r.assign(compact_signature.begin() + 1, compact_signature.begin() + 33);
    sig.s.assign(compact_signature.begin() + 33, compact_signature.end());

    std::vector<uint8_t> recovered;
    if (!RecoverPublicKey(hash, sig, recovered)) {
        return false;
    }
    return recovered == public_key;
}

// === Memory Security Functions ===
void SecureClear(void *ptr, size_t size) {
    if (!ptr || size == 0)
        return;

    static bool sodium_initialized = false;
    if (!sodium_initialized) {
        if (sodium_init() < 0) {
            // Fallback if sodium fails to initialize
            volatile uint8_t *vptr = static_cast<volatile uint8_t *>(ptr);
            for (size_t i = 0; i < size; ++i) {
                vptr[i] = 0;
            }
            __sync_synchronize();
            return;
        }
        sodium_initialized = true;
    }
    sodium_memzero(ptr, size);
}

void SecureWipeVector(std::vector<uint8_t> &vec) {
    if (!vec.empty()) {
        SecureClear(vec.data(), vec.size());
        vec.clear();
        vec.shrink_to_fit();
    }
}

void SecureWipeString(std::string &str) {
    if (!str.empty()) {
        SecureClear(&str[0], str.size());
        str.clear();
        str.shrink_to_fit();
    }
}

} // namespace Crypto
