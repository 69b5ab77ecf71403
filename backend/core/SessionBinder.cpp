#include "SessionBinder.h"
#include "Common/Logger.h"

namespace Login {

Config::ConfigPatch ComputeSessionPatch(const Auth::MachineAuth &machineAuth,
                                        const std::string &username) {
  Config::ConfigPatch patch;
  patch.set(Config::KEY_USERNAME, username)
      .set(Config::KEY_MINING_AUTH_PUBKEY, machineAuth.PublicKeyBase64());
  return patch;
}

Common::Result<bool> BindSession(Config::ConfigStore &config, const Auth::MachineAuth &machineAuth,
                                 const std::string &username) {
  WL_SCOPED_LOG("SessionBinder", "BindSession");
  _scopedLogger.addContext("username", username);

  if (username.empty()) {
    _scopedLogger.failure("empty username");
    return Common::Result<bool>("Cannot bind a session without a username", 400);
  }

  Config::ConfigPatch patch = ComputeSessionPatch(machineAuth, username);
  if (patch.entries().at(Config::KEY_MINING_AUTH_PUBKEY).empty()) {
    _scopedLogger.failure("machine identity has no public key");
    return Common::Result<bool>("Machine identity has no public key", 500);
  }

  auto saved = config.apply(patch);
  if (!saved) {
    _scopedLogger.failure(saved.error());
    return saved;
  }

  _scopedLogger.success();
  return Common::Result<bool>(true);
}

} // namespace Login
