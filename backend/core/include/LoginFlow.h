#pragma once

#include "AccountBootstrap.h"
#include "IdentityResolver.h"
#include "LoginTypes.h"
#include "SessionBinder.h"
#include <optional>
#include <string>

namespace Login {

enum class MachineAuthStatus { RESOLVED, ACCOUNT_CREATION_REQUIRED, FAILED };

struct MachineAuthResolution {
  MachineAuthStatus status;
  std::string message;
};

// Fill ctx.username from the config file. Fails on an unreadable config.
Common::Result<bool> LoadSessionContext(SessionContext &ctx);

// API host: WALLETLOGIN_API_HOST, then the api_host config key, then the default
std::string ResolveApiHost(const Config::Snapshot &snapshot);

// Reuse ctx.machineAuth when present; otherwise load the wallet at
// deps.walletPath. A missing wallet file asks for account creation.
MachineAuthResolution ResolveMachineAuth(SessionContext &ctx, const LoginDependencies &deps);

// List the accounts bound to this wallet and make the chosen one active
LoginResponse SwitchUser(SessionContext &ctx, const LoginDependencies &deps,
                         const std::optional<std::string> &username);

// Set or update the account password of the active user
LoginResponse SetPassword(SessionContext &ctx, const LoginDependencies &deps);

// Username/password login; missing values are prompted for
LoginResponse LoginWithPassword(SessionContext &ctx, const LoginDependencies &deps,
                                const std::optional<std::string> &username,
                                const std::optional<std::string> &password);

// Dispatch on the mutually exclusive login modes
LoginResponse RunLogin(SessionContext &ctx, const LoginDependencies &deps,
                       const LoginOptions &options);

// 6-128 bytes of valid UTF-8 with at least one letter and one digit
bool IsValidPassword(const std::string &password);

} // namespace Login
