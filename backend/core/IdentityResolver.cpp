#include "IdentityResolver.h"
#include "Common/Logger.h"
#include "UxStrings.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace Login {

static const char *COMPONENT_NAME = "IdentityResolver";

static std::string Trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(start, end - start);
}

std::optional<long long> ParseIndex(const std::string &text) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  size_t pos = (trimmed[0] == '+' || trimmed[0] == '-') ? 1 : 0;
  if (pos == trimmed.size()) {
    return std::nullopt;
  }
  for (size_t i = pos; i < trimmed.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
      return std::nullopt;
    }
  }

  errno = 0;
  long long value = std::strtoll(trimmed.c_str(), nullptr, 10);
  if (errno == ERANGE) {
    // Still an integer, just one no account list can hold
    return trimmed[0] == '-' ? std::numeric_limits<long long>::min()
                             : std::numeric_limits<long long>::max();
  }
  return value;
}

static UsernameResolution ProviderFailure(const AccountAPI::ApiResponse<AccountAPI::AccountInfo> &response) {
  if (response.status == AccountAPI::ProviderStatus::UNAVAILABLE) {
    return {LoginResult::PROVIDER_UNAVAILABLE, "", UxString::Error::ConnectionCli};
  }
  return {LoginResult::PROVIDER_ERROR, "", UxString::Error::ServerErr};
}

UsernameResolution ResolveUsername(AccountAPI::AccountClient &client, Console::Prompter &prompter,
                                   const std::optional<std::string> &explicitUsername) {
  auto response = client.GetAccountInfo();
  if (!response.ok()) {
    WL_LOG_ERROR(COMPONENT_NAME, "Failed to fetch account info",
                 std::string(AccountAPI::ProviderStatusName(response.status)) + " " +
                     response.errorMessage);
    return ProviderFailure(response);
  }

  const std::vector<std::string> &usernames = response.data.usernames;
  WL_LOG_DEBUG(COMPONENT_NAME, "Accounts bound to wallet: " + std::to_string(usernames.size()));

  if (usernames.empty()) {
    return {LoginResult::ACCOUNT_CREATION_REQUIRED, "", ""};
  }

  if (explicitUsername) {
    if (std::find(usernames.begin(), usernames.end(), *explicitUsername) == usernames.end()) {
      WL_LOG_WARNING(COMPONENT_NAME, "Requested user is not bound to this wallet",
                     *explicitUsername);
      return {LoginResult::USER_NOT_FOUND, "", UxString::UserDoesNotExist(*explicitUsername)};
    }
    return {LoginResult::SUCCESS, *explicitUsername, ""};
  }

  prompter.Print(UxString::RegisteredUsernamesTitle);
  for (size_t i = 0; i < usernames.size(); ++i) {
    prompter.Print(UxString::AccountListEntry(i + 1, usernames[i]));
  }

  if (usernames.size() == 1) {
    return {LoginResult::SUCCESS, usernames.front(), ""};
  }

  const long long count = static_cast<long long>(usernames.size());
  for (;;) {
    auto input = prompter.ReadLine(UxString::LoginPrompt);
    if (!input) {
      WL_LOG_INFO(COMPONENT_NAME, "Account selection cancelled");
      return {LoginResult::CANCELLED, "", ""};
    }

    auto index = ParseIndex(*input);
    if (!index) {
      prompter.Print(UxString::NotAnInteger(Trim(*input)));
      continue;
    }
    if (*index <= 0 || *index > count) {
      prompter.Print(UxString::InvalidIndex(1, usernames.size()));
      continue;
    }

    return {LoginResult::SUCCESS, usernames[static_cast<size_t>(*index - 1)], ""};
  }
}

} // namespace Login
