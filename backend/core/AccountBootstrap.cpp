#include "AccountBootstrap.h"
#include "Common/Logger.h"
#include "SessionBinder.h"
#include "UxStrings.h"
#include "Wallet.h"

#include <cctype>
#include <utility>

namespace Login {

static const char *COMPONENT_NAME = "AccountBootstrap";
static constexpr long HTTP_CONFLICT = 409;

bool IsValidUsername(const std::string &username) {
  if (username.size() < 3 || username.size() > 50)
    return false;

  for (char c : username) {
    if (!std::isalnum((unsigned char)c) && c != '_' && c != '-')
      return false;
  }
  return true;
}

InteractiveAccountCreator::InteractiveAccountCreator(Config::ConfigStore &config,
                                                     Console::Prompter &prompter,
                                                     std::string walletPath,
                                                     AccountClientFactory clientFactory,
                                                     MachineAuthLoader machineAuthLoader)
    : m_config(config), m_prompter(prompter), m_walletPath(std::move(walletPath)),
      m_clientFactory(std::move(clientFactory)),
      m_machineAuthLoader(std::move(machineAuthLoader)) {}

AccountCreationOutcome InteractiveAccountCreator::CreateWalletAndAccount() {
  WL_SCOPED_LOG(COMPONENT_NAME, "CreateWalletAndAccount");

  if (!Wallet::CheckWalletFile(m_walletPath)) {
    m_prompter.Print(UxString::CreatingWallet);
    auto wallet = Wallet::CreateWallet(m_walletPath);
    if (!wallet) {
      m_prompter.Print("Error: " + wallet.error());
      _scopedLogger.failure(wallet.error());
      return AccountCreationOutcome::UNAUTHENTICATED;
    }
  }

  auto machineAuth = m_machineAuthLoader(m_walletPath);
  if (!machineAuth) {
    m_prompter.Print("Error: " + machineAuth.error());
    _scopedLogger.failure(machineAuth.error());
    return AccountCreationOutcome::UNAUTHENTICATED;
  }

  auto client = m_clientFactory(machineAuth.data, std::nullopt);

  for (;;) {
    auto input = m_prompter.ReadLine(UxString::ChooseUsername);
    if (!input) {
      _scopedLogger.failure("username prompt aborted");
      return AccountCreationOutcome::UNAUTHENTICATED;
    }

    const std::string username = *input;
    if (!IsValidUsername(username)) {
      m_prompter.Print(UxString::UsernamePolicy);
      continue;
    }

    auto registered = client->RegisterAccount(username);
    if (!registered.ok()) {
      switch (registered.status) {
      case AccountAPI::ProviderStatus::UNAVAILABLE:
        _scopedLogger.failure("account service unavailable");
        return AccountCreationOutcome::PROVIDER_UNAVAILABLE;
      case AccountAPI::ProviderStatus::UNAUTHORIZED:
        _scopedLogger.failure("registration rejected");
        return AccountCreationOutcome::UNAUTHENTICATED;
      default:
        if (registered.httpStatus == HTTP_CONFLICT) {
          m_prompter.Print(UxString::UsernameTaken(username));
          continue;
        }
        _scopedLogger.failure("server error", std::to_string(registered.httpStatus));
        return AccountCreationOutcome::PROVIDER_ERROR;
      }
    }

    auto bound = BindSession(m_config, *machineAuth.data, username);
    if (!bound) {
      // The account exists server-side; the next login run can still select it
      m_prompter.Print("Warning: " + bound.error());
      m_prompter.Print(UxString::RetryLogin);
    } else {
      m_prompter.Print(UxString::AccountCreated(username));
    }

    _scopedLogger.success(username);
    return AccountCreationOutcome::CREATED;
  }
}

LoginResponse CreateWalletAndAccount(AccountCreator &creator) {
  switch (creator.CreateWalletAndAccount()) {
  case AccountCreationOutcome::CREATED:
    return {LoginResult::ACCOUNT_CREATED, "", ""};
  case AccountCreationOutcome::PROVIDER_UNAVAILABLE:
    return {LoginResult::PROVIDER_UNAVAILABLE, UxString::Error::ConnectionCli, ""};
  case AccountCreationOutcome::PROVIDER_ERROR:
    return {LoginResult::PROVIDER_ERROR, UxString::Error::ServerErr, ""};
  case AccountCreationOutcome::UNAUTHENTICATED:
    break;
  }
  return {LoginResult::UNAUTHENTICATED, "", ""};
}

} // namespace Login
