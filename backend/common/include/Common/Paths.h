#pragma once

#include <string>

namespace Common {

// $HOME/.walletlogin (falls back to ./.walletlogin when HOME is unset)
std::string DataDirectory();

// Value of an environment variable, or the fallback when unset or empty
std::string EnvOr(const char* name, const std::string& fallback);

// Default paths, each overridable through the environment
std::string DefaultConfigPath();    // WALLETLOGIN_CONFIG
std::string DefaultWalletPath();    // WALLETLOGIN_WALLET_PATH
std::string DefaultLogPath();

} // namespace Common
