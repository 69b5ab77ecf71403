#pragma once

#include <cstddef>
#include <string>

// User-facing text for the login command
namespace UxString {

constexpr const char *LoginUsername = "Username";
constexpr const char *LoginPassword = "Password";
constexpr const char *RegisteredUsernamesTitle = "Registered usernames for this wallet:";
constexpr const char *LoginPrompt = "Select the number of the account to log in with";
constexpr const char *NoAccountFound =
    "Account not found. Run 'walletlogin login' to create or select an account first.";
constexpr const char *SetPasswordPrompt = "New password";
constexpr const char *ConfirmPasswordPrompt = "Repeat the new password";
constexpr const char *PasswordsDoNotMatch = "Passwords do not match. Please try again.";
constexpr const char *PasswordPolicy =
    "Passwords must be 6 to 128 characters long and contain at least one letter and one digit.";
constexpr const char *InvalidCredentials = "Incorrect username or password.";
constexpr const char *CreatingWallet = "No wallet found. Creating a new wallet...";
constexpr const char *ChooseUsername = "Choose a username for your new account";
constexpr const char *UsernamePolicy =
    "Usernames must be 3 to 50 characters long and use only letters, digits, '_' or '-'.";
constexpr const char *RetryLogin = "Run 'walletlogin login' again to select your account.";

namespace Error {
constexpr const char *ConnectionCli =
    "Error: Cannot connect to the account service. Please check your connection.";
constexpr const char *ServerErr =
    "Error: The account service returned an error. Please try again later.";
} // namespace Error

inline std::string AccountListEntry(size_t index, const std::string &username) {
  return std::to_string(index) + "- " + username;
}

inline std::string InvalidIndex(size_t low, size_t high) {
  return "Please select a number between " + std::to_string(low) + " and " +
         std::to_string(high) + ".";
}

inline std::string NotAnInteger(const std::string &input) {
  return "Error: " + input + " is not a valid integer.";
}

inline std::string UserDoesNotExist(const std::string &username) {
  return "User " + username + " does not exist.";
}

inline std::string CurrentlyLoggedInAs(const std::string &username) {
  return "Currently logged in as: " + username;
}

inline std::string LoggingIn(const std::string &username) { return "Logging in " + username; }

inline std::string PasswordUpdated(const std::string &username) {
  return "Password updated for " + username + ".";
}

inline std::string UsernameTaken(const std::string &username) {
  return "The username " + username + " is already taken.";
}

inline std::string AccountCreated(const std::string &username) {
  return "Account " + username + " created and bound to this wallet.";
}

} // namespace UxString
