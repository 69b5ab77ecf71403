#include "MachineAuth.h"
#include "Common/Logger.h"
#include "Crypto.h"

#include <utility>

namespace Auth {

std::string MachineAuth::PublicKeyBase64() const { return Crypto::B64Encode(PublicKey()); }

WalletMachineAuth::WalletMachineAuth(std::vector<uint8_t> privateKey,
                                     std::vector<uint8_t> publicKey)
    : m_privateKey(std::move(privateKey)), m_publicKey(std::move(publicKey)) {}

WalletMachineAuth::~WalletMachineAuth() { Crypto::SecureWipeVector(m_privateKey); }

Common::Result<std::shared_ptr<WalletMachineAuth>>
WalletMachineAuth::FromWallet(const Wallet::WalletFile &wallet) {
  using ResultType = Common::Result<std::shared_ptr<WalletMachineAuth>>;

  std::vector<uint8_t> publicKey;
  if (!Crypto::DerivePublicKey(wallet.machineAuthKey, publicKey)) {
    return ResultType("Unable to derive machine auth public key", 422);
  }

  std::shared_ptr<WalletMachineAuth> auth(
      new WalletMachineAuth(wallet.machineAuthKey, std::move(publicKey)));
  return ResultType(auth);
}

std::string WalletMachineAuth::SignMessage(const std::string &message) const {
  std::vector<uint8_t> signature;
  if (!Crypto::SignMessage(m_privateKey, message, signature)) {
    WL_LOG_ERROR("MachineAuth", "Failed to sign request message");
    return {};
  }
  return Crypto::B64Encode(signature);
}

Common::Result<std::shared_ptr<const MachineAuth>> LoadMachineAuth(const std::string &walletPath) {
  using ResultType = Common::Result<std::shared_ptr<const MachineAuth>>;

  auto wallet = Wallet::LoadWallet(walletPath);
  if (!wallet) {
    return ResultType(wallet.error(), wallet.errorCode);
  }

  auto auth = WalletMachineAuth::FromWallet(*wallet);
  if (!auth) {
    return ResultType(auth.error(), auth.errorCode);
  }

  WL_LOG_DEBUG("MachineAuth", "Machine auth loaded", "pubkey=" + auth.data->PublicKeyBase64());
  return ResultType(std::shared_ptr<const MachineAuth>(auth.data));
}

} // namespace Auth
