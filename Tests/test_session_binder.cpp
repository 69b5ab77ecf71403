/**
 * @file test_session_binder.cpp
 * @brief Unit tests for binding (username, machine identity) as the active session
 */

#include "TestFakes.h"
#include "TestUtils.h"

#include "SessionBinder.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace TestFakes;

// ============================================================================
// Test Cases
// ============================================================================

static bool testComputeSessionPatch() {
    TEST_START("ComputeSessionPatch - Holds username and base64 public key");

    FakeMachineAuth auth;
    auto patch = Login::ComputeSessionPatch(auth, "alice");

    TEST_ASSERT(patch.entries().size() == 2, "Patch should hold exactly two keys");
    TEST_ASSERT(patch.entries().at(Config::KEY_USERNAME) == "alice", "Username should be set");

    const std::string& pubkey = patch.entries().at(Config::KEY_MINING_AUTH_PUBKEY);
    TEST_ASSERT(pubkey == auth.PublicKeyBase64(), "Public key should be the base64 encoding");
    TEST_ASSERT(pubkey.size() == 44, "33 bytes encode to 44 base64 characters");

    TEST_PASS();
}

static bool testBindWritesBothKeys(const TestUtils::TempDir& dir) {
    TEST_START("BindSession - Writes username and public key together");

    const std::string path = dir.file("bind.json");
    Config::ConfigStore store(path);
    FakeMachineAuth auth;

    auto bound = Login::BindSession(store, auth, "bob");
    TEST_ASSERT(bound.hasValue(), "Bind should succeed: " + bound.error());

    json written = json::parse(TestUtils::readFile(path));
    TEST_ASSERT(written["username"] == "bob", "Username should be written");
    TEST_ASSERT(written["mining_auth_pubkey"] == auth.PublicKeyBase64(), "Public key should be written");

    TEST_PASS();
}

static bool testBindIsIdempotent(const TestUtils::TempDir& dir) {
    TEST_START("BindSession - Repeating the same bind leaves the file unchanged");

    const std::string path = dir.file("idempotent.json");
    Config::ConfigStore store(path);
    FakeMachineAuth auth;

    TEST_ASSERT(Login::BindSession(store, auth, "carol").hasValue(), "First bind should succeed");
    const std::string first = TestUtils::readFile(path);

    TEST_ASSERT(Login::BindSession(store, auth, "carol").hasValue(), "Second bind should succeed");
    const std::string second = TestUtils::readFile(path);

    TEST_ASSERT(first == second, "Config contents should be identical after a repeated bind");

    TEST_PASS();
}

static bool testBindReplacesPreviousSession(const TestUtils::TempDir& dir) {
    TEST_START("BindSession - Switching users replaces both keys and keeps the rest");

    const std::string path = dir.file("switch.json");
    TEST_ASSERT(TestUtils::writeFile(path, R"({"username": "alice", "mining_auth_pubkey": "old", "auto_update": false})"),
                "Fixture should be written");

    Config::ConfigStore store(path);
    FakeMachineAuth auth(0x22);
    TEST_ASSERT(Login::BindSession(store, auth, "bob").hasValue(), "Bind should succeed");

    auto snapshot = store.load();
    TEST_ASSERT(snapshot.hasValue(), "Reload should succeed");
    TEST_ASSERT(snapshot->getString(Config::KEY_USERNAME).value_or("") == "bob", "Username should switch");
    TEST_ASSERT(snapshot->getString(Config::KEY_MINING_AUTH_PUBKEY).value_or("") == auth.PublicKeyBase64(),
                "Public key should switch");
    TEST_ASSERT(snapshot->values()["auto_update"] == false, "Unrelated key should survive");

    TEST_PASS();
}

static bool testBindRejectsEmptyUsername(const TestUtils::TempDir& dir) {
    TEST_START("BindSession - Empty username is rejected without writing");

    const std::string path = dir.file("empty_user.json");
    Config::ConfigStore store(path);
    FakeMachineAuth auth;

    auto bound = Login::BindSession(store, auth, "");
    TEST_ASSERT(!bound.hasValue(), "Empty username should fail");
    TEST_ASSERT(!fs::exists(path), "No config file should be written");

    TEST_PASS();
}

static bool testBindRejectsMissingPublicKey(const TestUtils::TempDir& dir) {
    TEST_START("BindSession - Identity without a public key is rejected without writing");

    const std::string path = dir.file("no_pubkey.json");
    Config::ConfigStore store(path);
    BrokenMachineAuth auth;

    auto bound = Login::BindSession(store, auth, "alice");
    TEST_ASSERT(!bound.hasValue(), "Missing public key should fail");
    TEST_ASSERT(!fs::exists(path), "No config file should be written");

    TEST_PASS();
}

static bool testFailedBindLeavesFileIntact(const TestUtils::TempDir& dir) {
    TEST_START("BindSession - Failure leaves the existing file intact");

    const std::string path = dir.file("corrupt.json");
    const std::string corrupt = "not json at all";
    TEST_ASSERT(TestUtils::writeFile(path, corrupt), "Fixture should be written");

    Config::ConfigStore store(path);
    FakeMachineAuth auth;
    auto bound = Login::BindSession(store, auth, "alice");

    TEST_ASSERT(!bound.hasValue(), "Bind over a corrupt config should fail");
    TEST_ASSERT(TestUtils::readFile(path) == corrupt, "Corrupt file must not be replaced");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("SessionBinder Unit Tests");
    TestUtils::TempDir dir("session_binder");
    TestUtils::initializeTestLogger(dir.file("test_session_binder.log"));

    testComputeSessionPatch();
    testBindWritesBothKeys(dir);
    testBindIsIdempotent(dir);
    testBindReplacesPreviousSession(dir);
    testBindRejectsEmptyUsername(dir);
    testBindRejectsMissingPublicKey(dir);
    testFailedBindLeavesFileIntact(dir);

    TestUtils::shutdownTestLogger();
    TestUtils::printTestSummary("SessionBinder Tests");
    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
