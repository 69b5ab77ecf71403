#pragma once

#include "LoginTypes.h"
#include <string>

namespace Login {

enum class AccountCreationOutcome {
  CREATED,
  PROVIDER_UNAVAILABLE,
  PROVIDER_ERROR,
  UNAUTHENTICATED
};

/**
 * @brief Creates a wallet (when missing) and registers an account for it
 */
class AccountCreator {
public:
  virtual ~AccountCreator() = default;
  virtual AccountCreationOutcome CreateWalletAndAccount() = 0;
};

/**
 * @brief Prompts for a username and registers it with the account service
 *
 * On success the new account becomes the active session.
 */
class InteractiveAccountCreator : public AccountCreator {
public:
  InteractiveAccountCreator(Config::ConfigStore &config, Console::Prompter &prompter,
                            std::string walletPath, AccountClientFactory clientFactory,
                            MachineAuthLoader machineAuthLoader);

  AccountCreationOutcome CreateWalletAndAccount() override;

private:
  Config::ConfigStore &m_config;
  Console::Prompter &m_prompter;
  std::string m_walletPath;
  AccountClientFactory m_clientFactory;
  MachineAuthLoader m_machineAuthLoader;
};

// Runs account creation once and converts its outcome into a LoginResponse.
// Provider failures become fixed user-facing messages here.
LoginResponse CreateWalletAndAccount(AccountCreator &creator);

// 3-50 characters of [A-Za-z0-9_-]
bool IsValidUsername(const std::string &username);

} // namespace Login
