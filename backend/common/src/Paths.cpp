#include "../include/Common/Paths.h"
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace Common {

static const char* DATA_DIR_NAME = ".walletlogin";

std::string EnvOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return std::string(value);
    }
    return fallback;
}

std::string DataDirectory() {
    const char* home = std::getenv("HOME");
    fs::path base = (home && *home) ? fs::path(home) : fs::path(".");
    return (base / DATA_DIR_NAME).string();
}

std::string DefaultConfigPath() {
    return EnvOr("WALLETLOGIN_CONFIG", (fs::path(DataDirectory()) / "config.json").string());
}

std::string DefaultWalletPath() {
    return EnvOr("WALLETLOGIN_WALLET_PATH",
                 (fs::path(DataDirectory()) / "wallet" / "default_wallet.json").string());
}

std::string DefaultLogPath() {
    return (fs::path(DataDirectory()) / "walletlogin.log").string();
}

} // namespace Common
