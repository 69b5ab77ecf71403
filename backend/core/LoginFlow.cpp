#include "LoginFlow.h"
#include "Common/Logger.h"
#include "Common/Paths.h"
#include "Crypto.h"
#include "UxStrings.h"
#include "Wallet.h"

#include <cctype>
#include <cstdint>

namespace Login {

static const char *COMPONENT_NAME = "LoginFlow";

const char *LoginResultName(LoginResult result) {
  switch (result) {
  case LoginResult::SUCCESS:
    return "SUCCESS";
  case LoginResult::CANCELLED:
    return "CANCELLED";
  case LoginResult::USER_NOT_FOUND:
    return "USER_NOT_FOUND";
  case LoginResult::NO_ACCOUNT_CONFIGURED:
    return "NO_ACCOUNT_CONFIGURED";
  case LoginResult::INVALID_CREDENTIALS:
    return "INVALID_CREDENTIALS";
  case LoginResult::PROVIDER_UNAVAILABLE:
    return "PROVIDER_UNAVAILABLE";
  case LoginResult::PROVIDER_ERROR:
    return "PROVIDER_ERROR";
  case LoginResult::ACCOUNT_CREATION_REQUIRED:
    return "ACCOUNT_CREATION_REQUIRED";
  case LoginResult::ACCOUNT_CREATED:
    return "ACCOUNT_CREATED";
  case LoginResult::UNAUTHENTICATED:
    return "UNAUTHENTICATED";
  case LoginResult::SYSTEM_ERROR:
    return "SYSTEM_ERROR";
  }
  return "UNKNOWN";
}

// Well-formed UTF-8: no stray continuation bytes, overlong forms or surrogates
static bool IsValidUtf8(const std::string &text) {
  size_t i = 0;
  while (i < text.size()) {
    const unsigned char lead = static_cast<unsigned char>(text[i]);
    size_t extra = 0;
    uint32_t codepoint = 0;
    if (lead < 0x80) {
      i++;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      codepoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      codepoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      codepoint = lead & 0x07;
    } else {
      return false;
    }

    if (text.size() - i <= extra) {
      return false;
    }
    for (size_t k = 1; k <= extra; k++) {
      const unsigned char next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0) != 0x80)
        return false;
      codepoint = (codepoint << 6) | (next & 0x3F);
    }

    static const uint32_t minimum[] = {0, 0x80, 0x800, 0x10000};
    if (codepoint < minimum[extra] || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF))
      return false;
    i += extra + 1;
  }
  return true;
}

bool IsValidPassword(const std::string &password) {
  if (password.size() < 6 || password.size() > 128)
    return false;
  if (!IsValidUtf8(password))
    return false;

  bool hasLetter = false, hasDigit = false;

  for (char c : password) {
    if (std::isalpha((unsigned char)c))
      hasLetter = true;
    else if (std::isdigit((unsigned char)c))
      hasDigit = true;
  }

  return hasLetter && hasDigit;
}

Common::Result<bool> LoadSessionContext(SessionContext &ctx) {
  auto snapshot = ctx.config.load();
  if (!snapshot) {
    return Common::Result<bool>(snapshot.error(), snapshot.errorCode);
  }

  auto username = snapshot->getString(Config::KEY_USERNAME);
  if (username && !username->empty()) {
    ctx.username = *username;
  } else {
    ctx.username.reset();
  }
  return Common::Result<bool>(true);
}

std::string ResolveApiHost(const Config::Snapshot &snapshot) {
  std::string fallback = snapshot.getString(Config::KEY_API_HOST).value_or(AccountAPI::DEFAULT_API_HOST);
  if (fallback.empty()) {
    fallback = AccountAPI::DEFAULT_API_HOST;
  }
  return Common::EnvOr("WALLETLOGIN_API_HOST", fallback);
}

MachineAuthResolution ResolveMachineAuth(SessionContext &ctx, const LoginDependencies &deps) {
  if (ctx.machineAuth) {
    return {MachineAuthStatus::RESOLVED, ""};
  }

  if (!Wallet::CheckWalletFile(deps.walletPath)) {
    WL_LOG_INFO(COMPONENT_NAME, "No wallet file found", deps.walletPath);
    return {MachineAuthStatus::ACCOUNT_CREATION_REQUIRED, ""};
  }

  auto loaded = deps.machineAuthLoader(deps.walletPath);
  if (!loaded) {
    WL_LOG_ERROR(COMPONENT_NAME, "Failed to load machine auth", loaded.error());
    return {MachineAuthStatus::FAILED, "Error: " + loaded.error()};
  }

  ctx.machineAuth = loaded.data;
  return {MachineAuthStatus::RESOLVED, ""};
}

// Shared prologue of every mode: RESOLVED continues, anything else ends the command
static bool EnsureMachineAuth(SessionContext &ctx, const LoginDependencies &deps,
                              LoginResponse &outResponse) {
  auto resolution = ResolveMachineAuth(ctx, deps);
  switch (resolution.status) {
  case MachineAuthStatus::RESOLVED:
    return true;
  case MachineAuthStatus::ACCOUNT_CREATION_REQUIRED:
    outResponse = CreateWalletAndAccount(deps.accountCreator);
    return false;
  case MachineAuthStatus::FAILED:
    break;
  }
  outResponse = {LoginResult::SYSTEM_ERROR, resolution.message, ""};
  return false;
}

template <typename T>
static LoginResponse ProviderFailure(const AccountAPI::ApiResponse<T> &response) {
  if (response.status == AccountAPI::ProviderStatus::UNAVAILABLE) {
    return {LoginResult::PROVIDER_UNAVAILABLE, UxString::Error::ConnectionCli, ""};
  }
  return {LoginResult::PROVIDER_ERROR, UxString::Error::ServerErr, ""};
}

static LoginResponse Resolve(SessionContext &ctx, const LoginDependencies &deps,
                             const UsernameResolution &resolution) {
  if (resolution.result == LoginResult::ACCOUNT_CREATION_REQUIRED) {
    return CreateWalletAndAccount(deps.accountCreator);
  }
  if (resolution.result != LoginResult::SUCCESS) {
    return {resolution.result, resolution.message, ""};
  }

  deps.prompter.Print(UxString::LoggingIn(resolution.username));
  auto bound = BindSession(ctx.config, *ctx.machineAuth, resolution.username);
  if (!bound) {
    return {LoginResult::SYSTEM_ERROR, "Error: " + bound.error(), ""};
  }

  ctx.username = resolution.username;
  WL_LOG_INFO(COMPONENT_NAME, "Active session changed", resolution.username);
  return {LoginResult::SUCCESS, "", resolution.username};
}

LoginResponse SwitchUser(SessionContext &ctx, const LoginDependencies &deps,
                         const std::optional<std::string> &username) {
  WL_SCOPED_LOG(COMPONENT_NAME, "SwitchUser");

  if (ctx.username) {
    deps.prompter.Print(UxString::CurrentlyLoggedInAs(*ctx.username));
  }

  LoginResponse response{LoginResult::SUCCESS, "", ""};
  if (!EnsureMachineAuth(ctx, deps, response)) {
    return response;
  }

  auto client = deps.clientFactory(ctx.machineAuth, std::nullopt);
  return Resolve(ctx, deps, ResolveUsername(*client, deps.prompter, username));
}

static std::optional<std::string> PromptNewPassword(Console::Prompter &prompter) {
  for (;;) {
    auto password = prompter.ReadHidden(UxString::SetPasswordPrompt);
    if (!password) {
      return std::nullopt;
    }
    if (!IsValidPassword(*password)) {
      Crypto::SecureWipeString(*password);
      prompter.Print(UxString::PasswordPolicy);
      continue;
    }

    auto confirmation = prompter.ReadHidden(UxString::ConfirmPasswordPrompt);
    if (!confirmation) {
      Crypto::SecureWipeString(*password);
      return std::nullopt;
    }

    bool matches = (*confirmation == *password);
    Crypto::SecureWipeString(*confirmation);
    if (!matches) {
      Crypto::SecureWipeString(*password);
      prompter.Print(UxString::PasswordsDoNotMatch);
      continue;
    }
    return password;
  }
}

LoginResponse SetPassword(SessionContext &ctx, const LoginDependencies &deps) {
  WL_SCOPED_LOG(COMPONENT_NAME, "SetPassword");

  if (!ctx.username) {
    return {LoginResult::NO_ACCOUNT_CONFIGURED, UxString::NoAccountFound, ""};
  }

  LoginResponse response{LoginResult::SUCCESS, "", ""};
  if (!EnsureMachineAuth(ctx, deps, response)) {
    return response;
  }

  auto password = PromptNewPassword(deps.prompter);
  if (!password) {
    WL_LOG_INFO(COMPONENT_NAME, "Password update cancelled");
    return {LoginResult::CANCELLED, "", *ctx.username};
  }

  auto client = deps.clientFactory(ctx.machineAuth, ctx.username);
  auto updated = client->UpdatePassword(*password);
  Crypto::SecureWipeString(*password);

  if (!updated.ok()) {
    return ProviderFailure(updated);
  }

  deps.prompter.Print(UxString::PasswordUpdated(*ctx.username));
  return {LoginResult::SUCCESS, "", *ctx.username};
}

LoginResponse LoginWithPassword(SessionContext &ctx, const LoginDependencies &deps,
                                const std::optional<std::string> &username,
                                const std::optional<std::string> &password) {
  WL_SCOPED_LOG(COMPONENT_NAME, "LoginWithPassword");

  LoginResponse response{LoginResult::SUCCESS, "", ""};
  if (!EnsureMachineAuth(ctx, deps, response)) {
    return response;
  }

  std::optional<std::string> user = username;
  while (!user || user->empty()) {
    user = deps.prompter.ReadLine(UxString::LoginUsername);
    if (!user) {
      return {LoginResult::CANCELLED, "", ""};
    }
  }

  std::optional<std::string> secret = password;
  if (!secret) {
    secret = deps.prompter.ReadHidden(UxString::LoginPassword);
    if (!secret) {
      return {LoginResult::CANCELLED, "", ""};
    }
  }

  // No account password can contain bytes that are not UTF-8
  if (!IsValidUtf8(*secret)) {
    Crypto::SecureWipeString(*secret);
    WL_LOG_WARNING(COMPONENT_NAME, "Password is not valid UTF-8", *user);
    return {LoginResult::INVALID_CREDENTIALS, UxString::InvalidCredentials, ""};
  }

  auto client = deps.clientFactory(ctx.machineAuth, std::nullopt);
  auto resolution = ResolveUsername(*client, deps.prompter, user);
  if (resolution.result != LoginResult::SUCCESS) {
    Crypto::SecureWipeString(*secret);
    return Resolve(ctx, deps, resolution);
  }

  auto verified = client->VerifyPassword(resolution.username, *secret);
  Crypto::SecureWipeString(*secret);
  if (!verified.ok()) {
    if (verified.status == AccountAPI::ProviderStatus::UNAUTHORIZED) {
      WL_LOG_WARNING(COMPONENT_NAME, "Password rejected", resolution.username);
      return {LoginResult::INVALID_CREDENTIALS, UxString::InvalidCredentials, ""};
    }
    return ProviderFailure(verified);
  }

  return Resolve(ctx, deps, resolution);
}

LoginResponse RunLogin(SessionContext &ctx, const LoginDependencies &deps,
                       const LoginOptions &options) {
  LoginResponse response{LoginResult::SUCCESS, "", ""};
  if (options.setPassword) {
    response = SetPassword(ctx, deps);
  } else if (options.switchUser || options.listAccounts) {
    response = SwitchUser(ctx, deps, options.switchUser);
  } else {
    response = LoginWithPassword(ctx, deps, options.username, options.password);
  }

  WL_LOG_INFO(COMPONENT_NAME, std::string("login finished: ") + LoginResultName(response.result),
              response.username);
  return response;
}

} // namespace Login
