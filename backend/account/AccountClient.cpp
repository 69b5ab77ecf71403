#include "AccountClient.h"
#include "Common/Logger.h"
#include "Crypto.h"

#include <chrono>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace AccountAPI {

static const char *COMPONENT_NAME = "AccountClient";
static constexpr int CONNECT_TIMEOUT_MS = 10000;
static constexpr int REQUEST_TIMEOUT_MS = 30000;

const char *ProviderStatusName(ProviderStatus status) {
  switch (status) {
  case ProviderStatus::OK:
    return "OK";
  case ProviderStatus::UNAVAILABLE:
    return "UNAVAILABLE";
  case ProviderStatus::UNAUTHORIZED:
    return "UNAUTHORIZED";
  case ProviderStatus::SERVER_ERROR:
    return "SERVER_ERROR";
  }
  return "UNKNOWN";
}

template <typename T, typename U>
static ApiResponse<T> Propagate(const ApiResponse<U> &from) {
  return ApiResponse<T>::Failure(from.status, from.errorMessage, from.httpStatus);
}

// Serialize a request body. Strings that are not valid UTF-8 cannot be
// encoded as JSON; the request is refused before anything is sent.
static std::optional<std::string> EncodeBody(const json &body, const std::string &what) {
  try {
    return body.dump();
  } catch (const json::exception &e) {
    WL_LOG_WARNING(COMPONENT_NAME, "Cannot encode " + what, e.what());
    return std::nullopt;
  }
}

RestAccountClient::RestAccountClient(std::string host,
                                     std::shared_ptr<const Auth::MachineAuth> machineAuth,
                                     std::optional<std::string> username)
    : m_host(std::move(host)), m_machineAuth(std::move(machineAuth)),
      m_username(std::move(username)) {
  while (!m_host.empty() && m_host.back() == '/') {
    m_host.pop_back();
  }
}

std::string RestAccountClient::BuildUrl(const std::string &path) const { return m_host + path; }

std::string RestAccountClient::BuildAuthHeader(const std::string &url,
                                               const std::string &timestamp,
                                               const std::string &body) const {
  std::string signature = m_machineAuth->SignMessage(url + timestamp + body);

  std::string header = "21 " + timestamp + " ";
  if (m_username && !m_username->empty()) {
    header += *m_username + " ";
  }
  header += signature;
  return header;
}

ApiResponse<std::string> RestAccountClient::MakeRequest(const std::string &method,
                                                        const std::string &path,
                                                        const std::string &payload) {
  const std::string url = BuildUrl(path);
  const std::string timestamp = std::to_string(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());

  cpr::Header headers{{"Authorization", BuildAuthHeader(url, timestamp, payload)},
                      {"Accept", "application/json"}};
  if (!payload.empty()) {
    headers.insert({"Content-Type", "application/json"});
  }

  cpr::Response response;
  try {
    if (method == "GET") {
      response = cpr::Get(cpr::Url{url}, headers, cpr::ConnectTimeout{CONNECT_TIMEOUT_MS},
                          cpr::Timeout{REQUEST_TIMEOUT_MS});
    } else if (method == "POST") {
      response = cpr::Post(cpr::Url{url}, cpr::Body{payload}, headers,
                           cpr::ConnectTimeout{CONNECT_TIMEOUT_MS},
                           cpr::Timeout{REQUEST_TIMEOUT_MS});
    } else if (method == "PATCH") {
      response = cpr::Patch(cpr::Url{url}, cpr::Body{payload}, headers,
                            cpr::ConnectTimeout{CONNECT_TIMEOUT_MS},
                            cpr::Timeout{REQUEST_TIMEOUT_MS});
    } else {
      return ApiResponse<std::string>::Failure(ProviderStatus::SERVER_ERROR,
                                               "Unsupported HTTP method " + method);
    }
  } catch (const std::exception &e) {
    WL_LOG_ERROR(COMPONENT_NAME, "Request error: " + std::string(e.what()), method + " " + url);
    return ApiResponse<std::string>::Failure(ProviderStatus::UNAVAILABLE, e.what());
  }

  if (response.error.code != cpr::ErrorCode::OK || response.status_code == 0) {
    WL_LOG_ERROR(COMPONENT_NAME, "Account service unreachable",
                 method + " " + url + " | " + response.error.message);
    return ApiResponse<std::string>::Failure(ProviderStatus::UNAVAILABLE,
                                             response.error.message);
  }

  if (response.status_code >= 200 && response.status_code < 300) {
    WL_LOG_DEBUG(COMPONENT_NAME, method + " " + path,
                 "HTTP " + std::to_string(response.status_code));
    return ApiResponse<std::string>::Success(response.text, response.status_code);
  }

  WL_LOG_ERROR(COMPONENT_NAME, "HTTP Error " + std::to_string(response.status_code),
               method + " " + path);
  ProviderStatus failure = (response.status_code == 401 || response.status_code == 403)
                               ? ProviderStatus::UNAUTHORIZED
                               : ProviderStatus::SERVER_ERROR;
  return ApiResponse<std::string>::Failure(failure, response.text, response.status_code);
}

ApiResponse<AccountInfo> RestAccountClient::GetAccountInfo() {
  auto response = MakeRequest("GET", "/pool/account/info/");
  if (!response.ok()) {
    return Propagate<AccountInfo>(response);
  }

  try {
    json j = json::parse(response.data);
    if (!j.contains("usernames") || !j["usernames"].is_array()) {
      return ApiResponse<AccountInfo>::Failure(ProviderStatus::SERVER_ERROR,
                                               "Response is missing the usernames list",
                                               response.httpStatus);
    }

    AccountInfo info;
    for (const auto &name : j["usernames"]) {
      if (name.is_string()) {
        info.usernames.push_back(name.get<std::string>());
      }
    }
    return ApiResponse<AccountInfo>::Success(info, response.httpStatus);
  } catch (const json::exception &e) {
    WL_LOG_ERROR(COMPONENT_NAME, "Error parsing account info: " + std::string(e.what()));
    return ApiResponse<AccountInfo>::Failure(ProviderStatus::SERVER_ERROR, e.what(),
                                             response.httpStatus);
  }
}

ApiResponse<bool> RestAccountClient::UpdatePassword(const std::string &newPassword) {
  if (!m_username || m_username->empty()) {
    return ApiResponse<bool>::Failure(ProviderStatus::UNAUTHORIZED,
                                      "Password update requires a username");
  }

  json body;
  body["password"] = newPassword;
  auto payload = EncodeBody(body, "password update");
  Crypto::SecureWipeString(body["password"].get_ref<std::string &>());
  if (!payload) {
    return ApiResponse<bool>::Failure(ProviderStatus::SERVER_ERROR, "Password is not valid UTF-8");
  }
  auto response = MakeRequest("PATCH", "/pool/account/" + *m_username + "/password/", *payload);
  Crypto::SecureWipeString(*payload);

  if (!response.ok()) {
    return Propagate<bool>(response);
  }
  return ApiResponse<bool>::Success(true, response.httpStatus);
}

ApiResponse<bool> RestAccountClient::VerifyPassword(const std::string &username,
                                                    const std::string &password) {
  json body;
  body["password"] = password;
  auto payload = EncodeBody(body, "login request");
  Crypto::SecureWipeString(body["password"].get_ref<std::string &>());
  if (!payload) {
    return ApiResponse<bool>::Failure(ProviderStatus::SERVER_ERROR, "Password is not valid UTF-8");
  }
  auto response = MakeRequest("POST", "/pool/account/" + username + "/login/", *payload);
  Crypto::SecureWipeString(*payload);

  if (!response.ok()) {
    return Propagate<bool>(response);
  }
  return ApiResponse<bool>::Success(true, response.httpStatus);
}

ApiResponse<bool> RestAccountClient::RegisterAccount(const std::string &username) {
  json body;
  body["username"] = username;
  body["public_key"] = m_machineAuth->PublicKeyBase64();

  auto payload = EncodeBody(body, "registration");
  if (!payload) {
    return ApiResponse<bool>::Failure(ProviderStatus::SERVER_ERROR, "Username is not valid UTF-8");
  }
  auto response = MakeRequest("POST", "/pool/account/", *payload);
  if (!response.ok()) {
    return Propagate<bool>(response);
  }

  WL_LOG_INFO(COMPONENT_NAME, "Account registered", username);
  return ApiResponse<bool>::Success(true, response.httpStatus);
}

} // namespace AccountAPI
