#pragma once

#include "Common/CommonTypes.h"
#include "Config/ConfigStore.h"
#include "MachineAuth.h"
#include <string>

namespace Login {

// Patch that makes (username, machine identity) the active session
Config::ConfigPatch ComputeSessionPatch(const Auth::MachineAuth &machineAuth,
                                        const std::string &username);

// Persist username and mining_auth_pubkey in one atomic save. Both keys
// change together or neither does; repeating the call is a no-op.
Common::Result<bool> BindSession(Config::ConfigStore &config, const Auth::MachineAuth &machineAuth,
                                 const std::string &username);

} // namespace Login
