#pragma once

#include "Common/CommonTypes.h"
#include <cstdint>
#include <string>
#include <vector>

namespace Wallet {

constexpr int WALLET_FILE_VERSION = 1;

// Contents of a wallet file. The key is wiped when the object is destroyed.
struct WalletFile {
  int version = WALLET_FILE_VERSION;
  std::vector<uint8_t> machineAuthKey;  // 32-byte secp256k1 private key
  int64_t createdAt = 0;                // unix seconds

  WalletFile() = default;
  WalletFile(const WalletFile &) = default;
  WalletFile &operator=(const WalletFile &) = default;
  ~WalletFile();
};

// True when a wallet file exists at path. Absence is not an error.
bool CheckWalletFile(const std::string &path);

// Load and validate the wallet file at path.
Common::Result<WalletFile> LoadWallet(const std::string &path);

// Create a new wallet with a fresh key. Refuses to overwrite an existing file.
Common::Result<WalletFile> CreateWallet(const std::string &path);

} // namespace Wallet
