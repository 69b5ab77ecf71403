#pragma once

#include "MachineAuth.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace AccountAPI {

constexpr const char *DEFAULT_API_HOST = "https://api.walletlogin.io";

enum class ProviderStatus {
  OK,
  UNAVAILABLE,   // no HTTP response: DNS, connect, TLS or timeout failure
  UNAUTHORIZED,  // 401 / 403
  SERVER_ERROR   // any other non-2xx status, or an unparseable body
};

template <typename T>
struct ApiResponse {
  ProviderStatus status = ProviderStatus::OK;
  long httpStatus = 0;
  std::string errorMessage;
  T data{};

  bool ok() const { return status == ProviderStatus::OK; }

  static ApiResponse Success(const T &value, long code = 200) {
    ApiResponse response;
    response.httpStatus = code;
    response.data = value;
    return response;
  }

  static ApiResponse Failure(ProviderStatus failure, const std::string &message, long code = 0) {
    ApiResponse response;
    response.status = failure;
    response.httpStatus = code;
    response.errorMessage = message;
    return response;
  }
};

// Usernames bound to the calling machine identity, in service order
struct AccountInfo {
  std::vector<std::string> usernames;
};

/**
 * @brief Typed interface to the remote account service
 *
 * Requests are signed with the machine identity the client was built with.
 */
class AccountClient {
public:
  virtual ~AccountClient() = default;

  virtual ApiResponse<AccountInfo> GetAccountInfo() = 0;
  virtual ApiResponse<bool> UpdatePassword(const std::string &newPassword) = 0;
  virtual ApiResponse<bool> VerifyPassword(const std::string &username,
                                           const std::string &password) = 0;
  virtual ApiResponse<bool> RegisterAccount(const std::string &username) = 0;
};

class RestAccountClient : public AccountClient {
public:
  RestAccountClient(std::string host, std::shared_ptr<const Auth::MachineAuth> machineAuth,
                    std::optional<std::string> username = std::nullopt);

  ApiResponse<AccountInfo> GetAccountInfo() override;
  ApiResponse<bool> UpdatePassword(const std::string &newPassword) override;
  ApiResponse<bool> VerifyPassword(const std::string &username,
                                   const std::string &password) override;
  ApiResponse<bool> RegisterAccount(const std::string &username) override;

  // "21 <timestamp> [<username> ]<signature>" over url + timestamp + body
  std::string BuildAuthHeader(const std::string &url, const std::string &timestamp,
                              const std::string &body) const;

private:
  ApiResponse<std::string> MakeRequest(const std::string &method, const std::string &path,
                                       const std::string &payload = "");
  std::string BuildUrl(const std::string &path) const;

  std::string m_host;
  std::shared_ptr<const Auth::MachineAuth> m_machineAuth;
  std::optional<std::string> m_username;
};

// Human-readable name for log lines
const char *ProviderStatusName(ProviderStatus status);

} // namespace AccountAPI
