/**
 * @file test_identity_resolver.cpp
 * @brief Unit tests for account selection (ResolveUsername / ParseIndex)
 *
 * Covers the numbered selection loop, explicit usernames, empty account sets
 * and provider failures.
 */

#include "TestFakes.h"
#include "TestUtils.h"

#include "IdentityResolver.h"
#include "UxStrings.h"

using namespace TestFakes;

static FakeAccountService makeService() {
    FakeAccountService service;
    service.setUsernames({"alice", "bob", "carol"});
    return service;
}

// ============================================================================
// Test Cases
// ============================================================================

static bool testListsAccountsInServiceOrder() {
    TEST_START("ResolveUsername - Lists accounts 1-based in service order");

    FakeAccountService service = makeService();
    FakeAccountClient client(service);
    ScriptedPrompter prompter({std::string("2")});

    auto resolution = Login::ResolveUsername(client, prompter, std::nullopt);
    TEST_ASSERT(resolution.result == Login::LoginResult::SUCCESS, "Selection should succeed");
    TEST_ASSERT(resolution.username == "bob", "Index 2 should select bob");

    TEST_ASSERT(prompter.printed.size() == 4, "Title plus three entries should be printed");
    TEST_ASSERT(prompter.printed[0] == UxString::RegisteredUsernamesTitle, "Title should come first");
    TEST_ASSERT(prompter.printed[1] == "1- alice", "First entry should be alice");
    TEST_ASSERT(prompter.printed[2] == "2- bob", "Second entry should be bob");
    TEST_ASSERT(prompter.printed[3] == "3- carol", "Third entry should be carol");
    TEST_ASSERT(service.getAccountInfoCalls == 1, "Account info should be fetched once");

    TEST_PASS();
}

static bool testOutOfRangeIndexIsRejected() {
    TEST_START("ResolveUsername - Out of range index is rejected then re-prompted");

    FakeAccountService service = makeService();
    FakeAccountClient client(service);
    ScriptedPrompter prompter({std::string("5"), std::string("1")});

    auto resolution = Login::ResolveUsername(client, prompter, std::nullopt);
    TEST_ASSERT(resolution.result == Login::LoginResult::SUCCESS, "Second answer should succeed");
    TEST_ASSERT(resolution.username == "alice", "Index 1 should select alice");
    TEST_ASSERT(prompter.readLineCalls == 2, "User should be prompted twice");
    TEST_ASSERT(prompter.countPrinted(UxString::InvalidIndex(1, 3)) == 1,
                "Exactly one range rejection should be printed");
    TEST_ASSERT(prompter.countPrinted("Please select a number between 1 and 3.") == 1,
                "Rejection text should name the valid range");

    TEST_PASS();
}

static bool testZeroAndNegativeAreRejected() {
    TEST_START("ResolveUsername - Zero and negative indices are rejected");

    FakeAccountService service = makeService();
    FakeAccountClient client(service);
    ScriptedPrompter prompter({std::string("0"), std::string("-1"), std::string("3")});

    auto resolution = Login::ResolveUsername(client, prompter, std::nullopt);
    TEST_ASSERT(resolution.result == Login::LoginResult::SUCCESS, "Third answer should succeed");
    TEST_ASSERT(resolution.username == "carol", "Index 3 should select carol");
    TEST_ASSERT(prompter.countPrinted(UxString::InvalidIndex(1, 3)) == 2,
                "Both 0 and -1 should be rejected");

    TEST_PASS();
}

static bool testNonIntegerIsRejected() {
    TEST_START("ResolveUsername - Non-integer input is rejected then re-prompted");

    FakeAccountService service = makeService();
    FakeAccountClient client(service);
    ScriptedPrompter prompter({std::string("abc"), std::string(" 2 ")});

    auto resolution = Login::ResolveUsername(client, prompter, std::nullopt);
    TEST_ASSERT(resolution.result == Login::LoginResult::SUCCESS, "Second answer should succeed");
    TEST_ASSERT(resolution.username == "bob", "Whitespace around the index should be ignored");
    TEST_ASSERT(prompter.countPrinted("Error: abc is not a valid integer.") == 1,
                "Non-integer message should be printed once");

    TEST_PASS();
}

static bool testEmptyAccountSetRequiresCreation() {
    TEST_START("ResolveUsername - Empty account set requires creation without prompting");

    FakeAccountService service;
    FakeAccountClient client(service);
    ScriptedPrompter prompter({std::string("1")});

    auto resolution = Login::ResolveUsername(client, prompter, std::nullopt);
    TEST_ASSERT(resolution.result == Login::LoginResult::ACCOUNT_CREATION_REQUIRED,
                "Empty set should require account creation");
    TEST_ASSERT(prompter.readLineCalls == 0, "No prompt should be shown");
    TEST_ASSERT(prompter.printed.empty(), "Nothing should be printed");

    auto explicitResolution = Login::ResolveUsername(client, prompter, std::string("alice"));
    TEST_ASSERT(explicitResolution.result == Login::LoginResult::ACCOUNT_CREATION_REQUIRED,
                "Empty set should win over an explicit username");

    TEST_PASS();
}

static bool testSingleAccountIsSelected() {
    TEST_START("ResolveUsername - Single account is selected without prompting");

    FakeAccountService service;
    service.setUsernames({"alice"});
    FakeAccountClient client(service);
    ScriptedPrompter prompter;

    auto resolution = Login::ResolveUsername(client, prompter, std::nullopt);
    TEST_ASSERT(resolution.result == Login::LoginResult::SUCCESS, "Single account should resolve");
    TEST_ASSERT(resolution.username == "alice", "alice should be selected");
    TEST_ASSERT(prompter.readLineCalls == 0, "No prompt should be shown");
    TEST_ASSERT(prompter.countPrinted("1- alice") == 1, "The account should still be listed");

    TEST_PASS();
}

static bool testExplicitUsernameMatch() {
    TEST_START("ResolveUsername - Explicit username matches exactly");

    FakeAccountService service = makeService();
    FakeAccountClient client(service);
    ScriptedPrompter prompter;

    auto resolution = Login::ResolveUsername(client, prompter, std::string("carol"));
    TEST_ASSERT(resolution.result == Login::LoginResult::SUCCESS, "Known username should resolve");
    TEST_ASSERT(resolution.username == "carol", "Resolved name should be carol");
    TEST_ASSERT(prompter.readLineCalls == 0, "Explicit username should not prompt");

    auto caseMismatch = Login::ResolveUsername(client, prompter, std::string("Carol"));
    TEST_ASSERT(caseMismatch.result == Login::LoginResult::USER_NOT_FOUND,
                "Matching should be case sensitive");

    TEST_PASS();
}

static bool testExplicitUsernameNotFound() {
    TEST_START("ResolveUsername - Unknown explicit username");

    FakeAccountService service = makeService();
    FakeAccountClient client(service);
    ScriptedPrompter prompter;

    auto resolution = Login::ResolveUsername(client, prompter, std::string("dave"));
    TEST_ASSERT(resolution.result == Login::LoginResult::USER_NOT_FOUND, "Result should be USER_NOT_FOUND");
    TEST_ASSERT(resolution.message == "User dave does not exist.", "Message should name the user");
    TEST_ASSERT(resolution.username.empty(), "No username should be resolved");

    TEST_PASS();
}

static bool testEofCancels() {
    TEST_START("ResolveUsername - EOF at the prompt cancels");

    FakeAccountService service = makeService();
    FakeAccountClient client(service);
    ScriptedPrompter prompter({std::string("9"), std::nullopt});

    auto resolution = Login::ResolveUsername(client, prompter, std::nullopt);
    TEST_ASSERT(resolution.result == Login::LoginResult::CANCELLED, "EOF should cancel");
    TEST_ASSERT(resolution.username.empty(), "No username should be resolved");

    TEST_PASS();
}

static bool testProviderFailures() {
    TEST_START("ResolveUsername - Provider failures are mapped");

    FakeAccountService service;
    service.accountInfo = AccountAPI::ApiResponse<AccountAPI::AccountInfo>::Failure(
        AccountAPI::ProviderStatus::UNAVAILABLE, "connection refused");
    FakeAccountClient client(service);
    ScriptedPrompter prompter;

    auto unavailable = Login::ResolveUsername(client, prompter, std::nullopt);
    TEST_ASSERT(unavailable.result == Login::LoginResult::PROVIDER_UNAVAILABLE,
                "Unreachable service should be PROVIDER_UNAVAILABLE");
    TEST_ASSERT(unavailable.message == UxString::Error::ConnectionCli, "Connection message expected");

    service.accountInfo = AccountAPI::ApiResponse<AccountAPI::AccountInfo>::Failure(
        AccountAPI::ProviderStatus::SERVER_ERROR, "boom", 500);
    auto serverError = Login::ResolveUsername(client, prompter, std::nullopt);
    TEST_ASSERT(serverError.result == Login::LoginResult::PROVIDER_ERROR,
                "HTTP 500 should be PROVIDER_ERROR");
    TEST_ASSERT(serverError.message == UxString::Error::ServerErr, "Server error message expected");
    TEST_ASSERT(prompter.readLineCalls == 0, "Failures should not prompt");

    TEST_PASS();
}

static bool testParseIndex() {
    TEST_START("ParseIndex - Integer parsing");

    TEST_ASSERT(Login::ParseIndex("3").value_or(0) == 3, "Plain digits should parse");
    TEST_ASSERT(Login::ParseIndex("  7\n").value_or(0) == 7, "Surrounding whitespace should be ignored");
    TEST_ASSERT(Login::ParseIndex("+4").value_or(0) == 4, "Leading plus should parse");
    TEST_ASSERT(Login::ParseIndex("-2").value_or(0) == -2, "Negative numbers should parse");
    TEST_ASSERT(!Login::ParseIndex("").has_value(), "Empty input is not an integer");
    TEST_ASSERT(!Login::ParseIndex("-").has_value(), "Lone sign is not an integer");
    TEST_ASSERT(!Login::ParseIndex("1.5").has_value(), "Decimals are not integers");
    TEST_ASSERT(!Login::ParseIndex("2a").has_value(), "Trailing letters are rejected");

    auto huge = Login::ParseIndex("99999999999999999999999");
    TEST_ASSERT(huge.has_value(), "Overlong integers still parse");
    TEST_ASSERT(*huge > 3, "Overlong integers should fall outside any list");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("IdentityResolver Unit Tests");
    TestUtils::TempDir dir("identity_resolver");
    TestUtils::initializeTestLogger(dir.file("test_identity_resolver.log"));

    testListsAccountsInServiceOrder();
    testOutOfRangeIndexIsRejected();
    testZeroAndNegativeAreRejected();
    testNonIntegerIsRejected();
    testEmptyAccountSetRequiresCreation();
    testSingleAccountIsSelected();
    testExplicitUsernameMatch();
    testExplicitUsernameNotFound();
    testEofCancels();
    testProviderFailures();
    testParseIndex();

    TestUtils::shutdownTestLogger();
    TestUtils::printTestSummary("IdentityResolver Tests");
    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
