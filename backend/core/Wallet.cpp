#include "Wallet.h"
#include "Common/AtomicFile.h"
#include "Common/Logger.h"
#include "Crypto.h"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Wallet {

static const char *COMPONENT_NAME = "Wallet";

WalletFile::~WalletFile() { Crypto::SecureWipeVector(machineAuthKey); }

bool CheckWalletFile(const std::string &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

Common::Result<WalletFile> LoadWallet(const std::string &path) {
  std::string contents;
  if (!Common::ReadFileToString(path, contents)) {
    WL_LOG_ERROR(COMPONENT_NAME, "Unable to read wallet file", path);
    return Common::Result<WalletFile>("Unable to read wallet file " + path, 500);
  }

  WalletFile wallet;
  try {
    json j = json::parse(contents);
    Crypto::SecureWipeString(contents);

    wallet.version = j.value("version", 0);
    if (wallet.version != WALLET_FILE_VERSION) {
      return Common::Result<WalletFile>(
          "Unsupported wallet file version " + std::to_string(wallet.version), 422);
    }

    std::string keyHex = j.value("machine_auth_key", "");
    bool decoded = Crypto::HexToBytes(keyHex, wallet.machineAuthKey);
    Crypto::SecureWipeString(keyHex);
    if (!decoded || !Crypto::IsValidPrivateKey(wallet.machineAuthKey)) {
      return Common::Result<WalletFile>("Wallet file " + path + " holds an invalid key", 422);
    }

    wallet.createdAt = j.value("created_at", static_cast<int64_t>(0));
  } catch (const json::exception &e) {
    Crypto::SecureWipeString(contents);
    WL_LOG_ERROR(COMPONENT_NAME, "Malformed wallet file", std::string(e.what()));
    return Common::Result<WalletFile>("Wallet file " + path + " is not valid JSON", 422);
  }

  WL_LOG_DEBUG(COMPONENT_NAME, "Wallet loaded", path);
  return Common::Result<WalletFile>(wallet);
}

Common::Result<WalletFile> CreateWallet(const std::string &path) {
  WL_SCOPED_LOG(COMPONENT_NAME, "CreateWallet");

  if (CheckWalletFile(path)) {
    return Common::Result<WalletFile>("Wallet file already exists at " + path, 409);
  }

  WalletFile wallet;
  if (!Crypto::GeneratePrivateKey(wallet.machineAuthKey)) {
    return Common::Result<WalletFile>("Failed to generate wallet key", 500);
  }
  wallet.createdAt = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();

  json j;
  j["version"] = wallet.version;
  j["machine_auth_key"] = Crypto::BytesToHex(wallet.machineAuthKey);
  j["created_at"] = wallet.createdAt;

  std::string serialized = j.dump(4) + "\n";
  std::string error;
  bool written = Common::AtomicWriteFile(path, serialized, &error);
  Crypto::SecureWipeString(serialized);
  if (!written) {
    WL_LOG_ERROR(COMPONENT_NAME, "Failed to write wallet file", error);
    return Common::Result<WalletFile>("Unable to write wallet file " + path + ": " + error, 500);
  }

  WL_LOG_INFO(COMPONENT_NAME, "Wallet created", path);
  return Common::Result<WalletFile>(wallet);
}

} // namespace Wallet
