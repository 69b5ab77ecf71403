/**
 * @file TestFakes.h
 * @brief In-memory stand-ins for the account service, terminal and account creator
 */

#pragma once

#include "AccountBootstrap.h"
#include "AccountClient.h"
#include "LoginTypes.h"
#include "MachineAuth.h"
#include "Prompter.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TestFakes {

// Machine identity with a fixed 33-byte public key
class FakeMachineAuth : public Auth::MachineAuth {
public:
    explicit FakeMachineAuth(uint8_t fill = 0x11) : m_publicKey(33, fill) { m_publicKey[0] = 0x02; }

    std::vector<uint8_t> PublicKey() const override { return m_publicKey; }
    std::string SignMessage(const std::string&) const override { return "ZmFrZS1zaWduYXR1cmU="; }

private:
    std::vector<uint8_t> m_publicKey;
};

// Machine identity that cannot produce a public key
class BrokenMachineAuth : public Auth::MachineAuth {
public:
    std::vector<uint8_t> PublicKey() const override { return {}; }
    std::string SignMessage(const std::string&) const override { return {}; }
};

/**
 * @brief Scripted account service state shared by every client a factory hands out
 */
struct FakeAccountService {
    AccountAPI::ApiResponse<AccountAPI::AccountInfo> accountInfo =
        AccountAPI::ApiResponse<AccountAPI::AccountInfo>::Success(AccountAPI::AccountInfo{});
    AccountAPI::ApiResponse<bool> updateResponse = AccountAPI::ApiResponse<bool>::Success(true);
    AccountAPI::ApiResponse<bool> verifyResponse = AccountAPI::ApiResponse<bool>::Success(true);
    // Consumed front to back; success once exhausted
    std::deque<AccountAPI::ApiResponse<bool>> registerResponses;

    int clientsCreated = 0;
    int getAccountInfoCalls = 0;
    int updatePasswordCalls = 0;
    int verifyPasswordCalls = 0;
    int registerCalls = 0;

    std::optional<std::string> lastClientUsername;
    std::string lastPassword;
    std::string lastVerifiedUsername;
    std::vector<std::string> registeredUsernames;

    void setUsernames(const std::vector<std::string>& usernames) {
        accountInfo = AccountAPI::ApiResponse<AccountAPI::AccountInfo>::Success(
            AccountAPI::AccountInfo{usernames});
    }

    int totalCalls() const {
        return getAccountInfoCalls + updatePasswordCalls + verifyPasswordCalls + registerCalls;
    }

    Login::AccountClientFactory factory();
};

class FakeAccountClient : public AccountAPI::AccountClient {
public:
    explicit FakeAccountClient(FakeAccountService& service) : m_service(service) {}

    AccountAPI::ApiResponse<AccountAPI::AccountInfo> GetAccountInfo() override {
        m_service.getAccountInfoCalls++;
        return m_service.accountInfo;
    }

    AccountAPI::ApiResponse<bool> UpdatePassword(const std::string& newPassword) override {
        m_service.updatePasswordCalls++;
        m_service.lastPassword = newPassword;
        return m_service.updateResponse;
    }

    AccountAPI::ApiResponse<bool> VerifyPassword(const std::string& username,
                                                 const std::string& password) override {
        m_service.verifyPasswordCalls++;
        m_service.lastVerifiedUsername = username;
        m_service.lastPassword = password;
        return m_service.verifyResponse;
    }

    AccountAPI::ApiResponse<bool> RegisterAccount(const std::string& username) override {
        m_service.registerCalls++;
        if (m_service.registerResponses.empty()) {
            m_service.registeredUsernames.push_back(username);
            return AccountAPI::ApiResponse<bool>::Success(true, 201);
        }
        auto response = m_service.registerResponses.front();
        m_service.registerResponses.pop_front();
        if (response.ok()) {
            m_service.registeredUsernames.push_back(username);
        }
        return response;
    }

private:
    FakeAccountService& m_service;
};

inline Login::AccountClientFactory FakeAccountService::factory() {
    return [this](std::shared_ptr<const Auth::MachineAuth>, std::optional<std::string> username)
               -> std::unique_ptr<AccountAPI::AccountClient> {
        clientsCreated++;
        lastClientUsername = std::move(username);
        return std::make_unique<FakeAccountClient>(*this);
    };
}

/**
 * @brief Prompter fed from a queue of answers
 *
 * std::nullopt in the queue, or an empty queue, reads as EOF.
 */
class ScriptedPrompter : public Console::Prompter {
public:
    ScriptedPrompter() = default;
    explicit ScriptedPrompter(std::deque<std::optional<std::string>> answers)
        : m_answers(std::move(answers)) {}

    void push(std::optional<std::string> answer) { m_answers.push_back(std::move(answer)); }

    void Print(const std::string& line) override { printed.push_back(line); }

    std::optional<std::string> ReadLine(const std::string& prompt) override {
        readLineCalls++;
        prompts.push_back(prompt);
        return next();
    }

    std::optional<std::string> ReadHidden(const std::string& prompt) override {
        readHiddenCalls++;
        prompts.push_back(prompt);
        return next();
    }

    int countPrinted(const std::string& line) const {
        int count = 0;
        for (const auto& p : printed) {
            if (p == line) count++;
        }
        return count;
    }

    std::vector<std::string> printed;
    std::vector<std::string> prompts;
    int readLineCalls = 0;
    int readHiddenCalls = 0;

private:
    std::optional<std::string> next() {
        if (m_answers.empty()) return std::nullopt;
        auto answer = m_answers.front();
        m_answers.pop_front();
        return answer;
    }

    std::deque<std::optional<std::string>> m_answers;
};

// Account creator that returns a fixed outcome and records when it ran
class FakeAccountCreator : public Login::AccountCreator {
public:
    explicit FakeAccountCreator(Login::AccountCreationOutcome outcome = Login::AccountCreationOutcome::CREATED)
        : outcome(outcome) {}

    Login::AccountCreationOutcome CreateWalletAndAccount() override {
        calls++;
        if (onCreate) onCreate();
        return outcome;
    }

    Login::AccountCreationOutcome outcome;
    int calls = 0;
    std::function<void()> onCreate;
};

// Machine auth loader that hands out the same fake identity and counts loads
struct FakeMachineAuthLoader {
    std::shared_ptr<const Auth::MachineAuth> machineAuth = std::make_shared<FakeMachineAuth>();
    int loads = 0;

    Login::MachineAuthLoader loader() {
        return [this](const std::string&) -> Common::Result<std::shared_ptr<const Auth::MachineAuth>> {
            loads++;
            return Common::Result<std::shared_ptr<const Auth::MachineAuth>>(machineAuth);
        };
    }
};

} // namespace TestFakes
