// walletlogin - wallet-authenticated account login
#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "AccountBootstrap.h"
#include "AccountClient.h"
#include "Common/Logger.h"
#include "Common/Paths.h"
#include "Config/ConfigStore.h"
#include "Crypto.h"
#include "LoginFlow.h"
#include "MachineAuth.h"
#include "Prompter.h"

static constexpr int EXIT_UNAUTHENTICATED = 1;
static constexpr int EXIT_ERROR = 2;

static int ExitCodeFor(const Login::LoginResponse &response) {
  if (response.success()) {
    return 0;
  }
  if (response.result == Login::LoginResult::UNAUTHENTICATED) {
    return EXIT_UNAUTHENTICATED;
  }
  return EXIT_ERROR;
}

// -p leaves the password in two places: the CLI11 target and the options copy
static void WipePasswords(std::string &password, Login::LoginOptions &options) {
  Crypto::SecureWipeString(password);
  if (options.password) {
    Crypto::SecureWipeString(*options.password);
  }
}

int main(int argc, char **argv) {
  CLI::App app{"Log in to your accounts with your wallet identity", "walletlogin"};
  app.require_subcommand(1);

  std::string logLevel = "info";
  bool verbose = false;
  app.add_option("--log-level", logLevel, "Minimum level written to the log file")
      ->check(CLI::IsMember({"debug", "info", "warning", "warn", "error"}));
  app.add_flag("--verbose", verbose, "Mirror log output to the console");

  Login::LoginOptions options;
  std::string switchUser;
  std::string username;
  std::string password;

  CLI::App *login = app.add_subcommand("login", "Log in to your different accounts");
  CLI::Option *accountsFlag =
      login->add_flag("-a,--accounts", options.listAccounts, "Shows a list of your accounts");
  CLI::Option *switchOption =
      login->add_option("--su,--switchuser", switchUser, "Switch the active user");
  CLI::Option *setPasswordFlag =
      login->add_flag("--sp,--setpassword", options.setPassword, "Set/update your password");
  CLI::Option *usernameOption =
      login->add_option("-u,--username", username, "The username to login with");
  CLI::Option *passwordOption =
      login->add_option("-p,--password", password, "The password to login with");

  accountsFlag->excludes(switchOption);
  accountsFlag->excludes(setPasswordFlag);
  switchOption->excludes(setPasswordFlag);

  CLI11_PARSE(app, argc, argv);

  if (switchOption->count() > 0) {
    options.switchUser = switchUser;
  }
  if (usernameOption->count() > 0) {
    options.username = username;
  }
  if (passwordOption->count() > 0) {
    options.password = password;
  }

  const std::string logPath = Common::DefaultLogPath();
  if (!Common::Logger::getInstance().initialize(logPath, Common::ParseLogLevel(logLevel), verbose)) {
    std::cerr << "Warning: cannot open log file " << logPath << "; continuing without a log"
              << std::endl;
  }

  Config::ConfigStore config(Common::DefaultConfigPath());
  Login::SessionContext ctx{config, nullptr, std::nullopt};

  auto loaded = Login::LoadSessionContext(ctx);
  if (!loaded) {
    std::cerr << "Error: " << loaded.error() << std::endl;
    WipePasswords(password, options);
    Common::Logger::getInstance().shutdown();
    return EXIT_ERROR;
  }

  auto snapshot = config.load();
  const std::string apiHost = Login::ResolveApiHost(snapshot ? *snapshot : Config::Snapshot());
  WL_LOG_DEBUG("main", "Using account service", apiHost);

  Login::AccountClientFactory clientFactory =
      [apiHost](std::shared_ptr<const Auth::MachineAuth> machineAuth,
                std::optional<std::string> user) -> std::unique_ptr<AccountAPI::AccountClient> {
    return std::make_unique<AccountAPI::RestAccountClient>(apiHost, std::move(machineAuth),
                                                           std::move(user));
  };

  Console::TerminalPrompter prompter;
  const std::string walletPath = Common::DefaultWalletPath();
  Login::InteractiveAccountCreator creator(config, prompter, walletPath, clientFactory,
                                           Auth::LoadMachineAuth);
  Login::LoginDependencies deps{prompter, creator, clientFactory, Auth::LoadMachineAuth,
                                walletPath};

  Login::LoginResponse response = Login::RunLogin(ctx, deps, options);
  WipePasswords(password, options);

  int exitCode = ExitCodeFor(response);
  if (exitCode == EXIT_ERROR && !response.message.empty()) {
    std::cerr << response.message << std::endl;
  }

  Common::Logger::getInstance().shutdown();
  return exitCode;
}
