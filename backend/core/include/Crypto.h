#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Crypto {

// === Random Number Generation ===
bool RandBytes(void *buf, size_t len);

// === Base64 Encoding/Decoding ===
std::string B64Encode(const std::vector<uint8_t> &data);
std::vector<uint8_t> B64Decode(const std::string &s);

// === Hex Encoding/Decoding ===
std::string BytesToHex(const std::vector<uint8_t> &bytes);
// Returns false on odd length or non-hex characters.
bool HexToBytes(const std::string &hex, std::vector<uint8_t> &out);

// === Hash Functions ===
bool SHA256(const uint8_t *data, size_t len, std::array<uint8_t, 32> &out);
bool DoubleSHA256(const uint8_t *data, size_t len, std::array<uint8_t, 32> &out);

// Hash of a text message in the Bitcoin signed-message format:
// SHA256d(varint(24) || "Bitcoin Signed Message:\n" || varint(len) || message)
bool MessageHash(const std::string &message, std::array<uint8_t, 32> &out);

// === secp256k1 Keys ===

// Generate a fresh valid 32-byte private key
bool GeneratePrivateKey(std::vector<uint8_t> &private_key);

bool IsValidPrivateKey(const std::vector<uint8_t> &private_key);

// Derive public key from private key (compressed format, 33 bytes)
bool DerivePublicKey(const std::vector<uint8_t> &private_key, std::vector<uint8_t> &public_key);

// === Signing ===

// Recoverable ECDSA signature (compact form)
struct RecoverableSignature {
  std::vector<uint8_t> r;  // 32 bytes
  std::vector<uint8_t> s;  // 32 bytes
  int recovery_id;         // 0..3
};

bool SignHashRecoverable(const std::vector<uint8_t> &private_key,
                         const std::array<uint8_t, 32> &hash, RecoverableSignature &signature);

// Recover the compressed public key that produced a recoverable signature
bool RecoverPublicKey(const std::array<uint8_t, 32> &hash, const RecoverableSignature &signature,
                      std::vector<uint8_t> &public_key);

// Sign a text message and return the 65-byte compact signature
// (header byte 31 + recid for compressed keys, then r, then s).
bool SignMessage(const std::vector<uint8_t> &private_key, const std::string &message,
                 std::vector<uint8_t> &compact_signature);

// Verify a 65-byte compact message signature against a compressed public key
bool VerifyMessage(const std::vector<uint8_t> &public_key, const std::string &message,
                   const std::vector<uint8_t> &compact_signature);

// === Memory Security Functions ===
void SecureClear(void *ptr, size_t size);
void SecureWipeVector(std::vector<uint8_t> &vec);
void SecureWipeString(std::string &str);

} // namespace Crypto
