#pragma once

#include "LoginTypes.h"
#include <optional>
#include <string>

namespace Login {

struct UsernameResolution {
  LoginResult result;
  std::string username;
  std::string message;
};

// Picks exactly one account name bound to the client's machine identity.
//
// - an empty account set yields ACCOUNT_CREATION_REQUIRED without prompting
// - an explicit username must match a listed name exactly, else USER_NOT_FOUND
// - otherwise the names are listed 1-based; a single name is selected
//   directly, else the user picks an index. Invalid input is re-prompted,
//   EOF yields CANCELLED
// Provider failures map to PROVIDER_UNAVAILABLE / PROVIDER_ERROR.
UsernameResolution ResolveUsername(AccountAPI::AccountClient &client, Console::Prompter &prompter,
                                   const std::optional<std::string> &explicitUsername);

// Parses a 1-based index; nullopt when the text is not an integer
std::optional<long long> ParseIndex(const std::string &text);

} // namespace Login
