#pragma once

#include "AccountClient.h"
#include "Common/CommonTypes.h"
#include "Config/ConfigStore.h"
#include "MachineAuth.h"
#include "Prompter.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace Login {

class AccountCreator;

enum class LoginResult {
  SUCCESS,
  CANCELLED,                 // user aborted a prompt; silent no-op
  USER_NOT_FOUND,
  NO_ACCOUNT_CONFIGURED,
  INVALID_CREDENTIALS,
  PROVIDER_UNAVAILABLE,
  PROVIDER_ERROR,
  ACCOUNT_CREATION_REQUIRED,
  ACCOUNT_CREATED,
  UNAUTHENTICATED,           // terminal: the dispatcher exits with status 1
  SYSTEM_ERROR
};

struct LoginResponse {
  LoginResult result;
  std::string message;
  std::string username;

  // True for every outcome the dispatcher treats as a zero exit status
  bool success() const {
    return result == LoginResult::SUCCESS || result == LoginResult::CANCELLED ||
           result == LoginResult::ACCOUNT_CREATED;
  }
};

const char *LoginResultName(LoginResult result);

// Per-invocation state. A null machineAuth or empty username means "not resolved yet".
struct SessionContext {
  Config::ConfigStore &config;
  std::shared_ptr<const Auth::MachineAuth> machineAuth;
  std::optional<std::string> username;
};

using AccountClientFactory = std::function<std::unique_ptr<AccountAPI::AccountClient>(
    std::shared_ptr<const Auth::MachineAuth>, std::optional<std::string>)>;

using MachineAuthLoader =
    std::function<Common::Result<std::shared_ptr<const Auth::MachineAuth>>(const std::string &)>;

struct LoginDependencies {
  Console::Prompter &prompter;
  AccountCreator &accountCreator;
  AccountClientFactory clientFactory;
  MachineAuthLoader machineAuthLoader;
  std::string walletPath;
};

struct LoginOptions {
  bool listAccounts = false;
  std::optional<std::string> switchUser;
  bool setPassword = false;
  std::optional<std::string> username;
  std::optional<std::string> password;
};

} // namespace Login
