#pragma once

#include "Common/CommonTypes.h"
#include "Wallet.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Auth {

/**
 * @brief Device-bound signing identity used to authenticate API requests
 */
class MachineAuth {
public:
  virtual ~MachineAuth() = default;

  // Compressed secp256k1 public key (33 bytes); stable for a given wallet
  virtual std::vector<uint8_t> PublicKey() const = 0;

  // Base64 compact signature over message; empty string on failure
  virtual std::string SignMessage(const std::string &message) const = 0;

  std::string PublicKeyBase64() const;
};

class WalletMachineAuth : public MachineAuth {
public:
  static Common::Result<std::shared_ptr<WalletMachineAuth>> FromWallet(const Wallet::WalletFile &wallet);

  ~WalletMachineAuth() override;

  std::vector<uint8_t> PublicKey() const override { return m_publicKey; }
  std::string SignMessage(const std::string &message) const override;

private:
  WalletMachineAuth(std::vector<uint8_t> privateKey, std::vector<uint8_t> publicKey);

  WalletMachineAuth(const WalletMachineAuth &) = delete;
  WalletMachineAuth &operator=(const WalletMachineAuth &) = delete;

  std::vector<uint8_t> m_privateKey;
  std::vector<uint8_t> m_publicKey;
};

// Load the wallet at walletPath and wrap its key. The caller checks for the
// file first; a missing file here is an error.
Common::Result<std::shared_ptr<const MachineAuth>> LoadMachineAuth(const std::string &walletPath);

} // namespace Auth
