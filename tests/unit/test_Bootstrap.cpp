#include <gtest/gtest.h>
#include "bootstrap/Bootstrap.hpp"
#include "errors/BootstrapError.hpp"
#include "util/Cancellation.hpp"
#include "util/files.hpp"
#include "FakeEngineClient.hpp"
#include "FakeIkmReader.hpp"
#include "TempDir.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace kw;
using namespace kw::bootstrap;
using namespace kw::test;
using Outcome = RunResult::Outcome;

class BootstrapTest : public ::testing::Test {
protected:
    TempDir dir;
    FakeEngineClient engine;
    config::Config cfg;
    util::Cancellation cancellation;
    std::shared_ptr<FakeIkmReader> ikm = std::make_shared<FakeIkmReader>();

    void SetUp() override {
        auto& ss = cfg.secret_store;
        ss.token_folder_path = dir / "assets";
        ss.vault_secret_threshold = 2;
        ss.vault_secret_shares = 3;
        ss.vault_interval_seconds = 0;
        ss.health_poll_interval_ms = 1;
        ss.cert_path.clear();
        cfg.databases = {{"edgex-core-data", "redisdb"}, {"edgex-core-metadata", "redisdb"}};
    }

    RunResult run(std::optional<std::string> hook = std::nullopt) {
        Bootstrap bootstrap(engine, cfg, std::move(hook), ikm);
        return bootstrap.run(cancellation);
    }

    void expectTransientRootRevokedOnce() const {
        EXPECT_EQ(std::ranges::count(engine.revokedSelf, std::string(FakeEngineClient::GENERATED_ROOT)), 1);
        EXPECT_FALSE(engine.hasToken(FakeEngineClient::GENERATED_ROOT));
    }

    [[nodiscard]] bool accessorRevoked(const std::string& accessor) const {
        return std::ranges::find(engine.revokedAccessors, accessor) != engine.revokedAccessors.end();
    }
};

TEST_F(BootstrapTest, FreshEngineIsFullyProvisioned) {
    engine.addToken("s.stale-service", "acc-stale", {"edgex-service"});

    const auto result = run();

    EXPECT_EQ(result.outcome, Outcome::Completed);
    EXPECT_FALSE(result.shouldContinue);
    EXPECT_FALSE(engine.sealed);

    expectTransientRootRevokedOnce();
    EXPECT_TRUE(accessorRevoked("acc-initial-root"));
    EXPECT_TRUE(accessorRevoked("acc-stale"));

    EXPECT_EQ(engine.enabledMounts, std::vector<std::string>{"secret@1"});
    EXPECT_TRUE(engine.secrets.contains("secret/edgex/edgex-core-data/redisdb"));
    EXPECT_TRUE(engine.secrets.contains("secret/edgex/redisdb/edgex-core-metadata"));
    EXPECT_TRUE(engine.secrets.contains("secret/edgex/bootstrap-redis/redisdb"));

    const auto persisted = nlohmann::json::parse(util::readFileToString(cfg.secret_store.tokenFilePath()));
    EXPECT_EQ(persisted["root_token"], "");
}

TEST_F(BootstrapTest, SecondRunIsIdempotent) {
    ASSERT_EQ(run().outcome, Outcome::Completed);
    const auto secretsAfterFirst = engine.secrets;
    engine.writes.clear();

    ASSERT_EQ(run().outcome, Outcome::Completed);
    EXPECT_EQ(engine.initCalls, 1);
    EXPECT_TRUE(engine.writes.empty());
    EXPECT_EQ(engine.secrets, secretsAfterFirst);
    EXPECT_EQ(std::ranges::count(engine.revokedSelf, std::string(FakeEngineClient::GENERATED_ROOT)), 2);
}

TEST_F(BootstrapTest, RetainedRootTokenIsLeftInPlace) {
    cfg.secret_store.revoke_root_tokens = false;

    ASSERT_EQ(run().outcome, Outcome::Completed);
    EXPECT_TRUE(engine.hasToken(FakeEngineClient::INITIAL_ROOT));
    const auto persisted = nlohmann::json::parse(util::readFileToString(cfg.secret_store.tokenFilePath()));
    EXPECT_EQ(persisted["root_token"], FakeEngineClient::INITIAL_ROOT);
}

TEST_F(BootstrapTest, PersistedRootTokenIsStrippedOnLaterRun) {
    cfg.secret_store.revoke_root_tokens = false;
    ASSERT_EQ(run().outcome, Outcome::Completed);

    cfg.secret_store.revoke_root_tokens = true;
    engine.sealed = true;
    ASSERT_EQ(run().outcome, Outcome::Completed);

    const auto persisted = nlohmann::json::parse(util::readFileToString(cfg.secret_store.tokenFilePath()));
    EXPECT_EQ(persisted["root_token"], "");
    EXPECT_FALSE(engine.hasToken(FakeEngineClient::INITIAL_ROOT));
}

TEST_F(BootstrapTest, EncryptsInitMaterialWhenHookIsSet) {
    ASSERT_EQ(run("/usr/local/bin/ikm-hook").outcome, Outcome::Completed);
    EXPECT_EQ(ikm->lastHandle, "/usr/local/bin/ikm-hook");

    const auto persisted = nlohmann::json::parse(util::readFileToString(cfg.secret_store.tokenFilePath()));
    EXPECT_TRUE(persisted["keys"].empty());
    EXPECT_EQ(persisted["encrypted_keys"].size(), 3u);

    // A sealed engine comes back up from the encrypted file
    engine.sealed = true;
    ASSERT_EQ(run("/usr/local/bin/ikm-hook").outcome, Outcome::Completed);
    EXPECT_FALSE(engine.sealed);
}

TEST_F(BootstrapTest, IkmFailureIsFatalBeforeTouchingTheEngine) {
    ikm->fail = true;
    EXPECT_THROW((void)run("hook"), errors::BootstrapError);
    EXPECT_EQ(engine.healthChecks, 0);
}

TEST_F(BootstrapTest, StandbyNodeStopsQuietly) {
    (void)engine.initialize(1, 1);
    engine.sealed = false;
    engine.standby = true;

    const auto result = run();
    EXPECT_EQ(result.outcome, Outcome::Standby);
    EXPECT_EQ(to_string(result.outcome), "standby");
    EXPECT_FALSE(result.shouldContinue);
    EXPECT_TRUE(engine.revokedSelf.empty());
    EXPECT_EQ(engine.initCalls, 1);
    EXPECT_EQ(engine.unsealCalls, 0);
}

TEST_F(BootstrapTest, CancelledRunMintsNothing) {
    cancellation.cancel();
    EXPECT_EQ(run().outcome, Outcome::Cancelled);
    EXPECT_EQ(engine.initCalls, 0);
    EXPECT_TRUE(engine.revokedSelf.empty());
}

TEST_F(BootstrapTest, RootTokenIsRevokedWhenProvisioningFails) {
    engine.failWrites = true;
    EXPECT_THROW((void)run(), errors::BootstrapError);
    expectTransientRootRevokedOnce();
}

TEST_F(BootstrapTest, RootTokenIsRevokedWhenCertificateUploadFails) {
    cfg.secret_store.cert_path = "secret/edgex/pki/tls/edgex-kong";
    cfg.secret_store.cert_file_path = (dir / "missing.crt").string();
    cfg.secret_store.key_file_path = (dir / "missing.key").string();

    EXPECT_THROW((void)run(), errors::BootstrapError);
    expectTransientRootRevokedOnce();
}

TEST_F(BootstrapTest, StaleTokenCleanupFailureIsOnlyAWarning) {
    engine.failListAccessors = true;
    EXPECT_EQ(run().outcome, Outcome::Completed);
    expectTransientRootRevokedOnce();
}

TEST_F(BootstrapTest, LookupSelfFailureStillRevokesTransientRoot) {
    engine.failLookupSelf = true;

    EXPECT_EQ(run().outcome, Outcome::Completed);
    EXPECT_EQ(engine.revokedSelf, std::vector<std::string>{FakeEngineClient::GENERATED_ROOT});
    expectTransientRootRevokedOnce();
}

TEST_F(BootstrapTest, OneShotProviderDelegateTokenIsRevokedAtEnd) {
    auto& ss = cfg.secret_store;
    ss.token_provider_admin_token_path = (dir / "tokenprovider/secrets-token.json").string();
    ss.token_provider = "true";
    ss.token_provider_type = "oneshot";

    ASSERT_EQ(run().outcome, Outcome::Completed);

    const auto tokenFile = nlohmann::json::parse(util::readFileToString(ss.token_provider_admin_token_path));
    EXPECT_EQ(tokenFile["auth"]["client_token"], "s.delegate-1");
    EXPECT_EQ(fileMode(ss.token_provider_admin_token_path), 0600u);
    EXPECT_TRUE(accessorRevoked("acc-delegate-1"));
    expectTransientRootRevokedOnce();
}

TEST_F(BootstrapTest, LongRunningProviderKeepsItsDelegateToken) {
    cfg.secret_store.token_provider_admin_token_path = (dir / "secrets-token.json").string();
    cfg.secret_store.token_provider_type = "daemon";

    ASSERT_EQ(run().outcome, Outcome::Completed);
    EXPECT_TRUE(engine.hasToken("s.delegate-1"));
    EXPECT_FALSE(accessorRevoked("acc-delegate-1"));
}

TEST_F(BootstrapTest, FailingOneShotProviderIsFatalAndCleansUp) {
    auto& ss = cfg.secret_store;
    ss.token_provider_admin_token_path = (dir / "secrets-token.json").string();
    ss.token_provider = "false";

    EXPECT_THROW((void)run(), errors::BootstrapError);
    EXPECT_TRUE(accessorRevoked("acc-delegate-1"));
    expectTransientRootRevokedOnce();
    EXPECT_TRUE(engine.enabledMounts.empty());
}

TEST_F(BootstrapTest, DelegateTokenCreationFailureIsFatal) {
    cfg.secret_store.token_provider_admin_token_path = (dir / "secrets-token.json").string();
    engine.failCreateToken = true;

    EXPECT_THROW((void)run(), errors::BootstrapError);
    expectTransientRootRevokedOnce();
}
