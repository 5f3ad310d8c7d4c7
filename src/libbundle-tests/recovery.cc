#include "charx/bundle/recovery.hh"
#include "charx/bundle/tests/archives.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace charx {

using testing::FakeStateContainer;

static ref<FakeStateContainer> good(std::string name, int n)
{
    return make_ref<FakeStateContainer>(std::move(name), StateObject{{"n", n}});
}

static ref<FakeStateContainer> bad(std::string name)
{
    return make_ref<FakeStateContainer>(std::move(name));
}

TEST(RecoveryOrchestrator, primaryWins)
{
    auto primary = good("primary", 0);
    auto backup = good("backup-1", 1);

    RecoveryOrchestrator orchestrator({.primary = primary, .backups = {backup}});
    auto res = orchestrator.recover();

    ASSERT_EQ(res.tier, RecoveryTier::Primary);
    ASSERT_EQ(res.state["n"], 0);
    ASSERT_FALSE(res.degraded);
    ASSERT_EQ(backup->loads.load(), 0u);
    ASSERT_EQ(orchestrator.stage(), RecoveryOrchestrator::Stage::Done);
}

TEST(RecoveryOrchestrator, fallsBackThroughBackupsInOrder)
{
    auto primary = bad("primary");
    auto b1 = bad("backup-1");
    auto b2 = good("backup-2", 2);
    auto b3 = good("backup-3", 3);

    auto res = recover({.primary = primary, .backups = {b1, b2, b3}});

    ASSERT_EQ(res.tier, RecoveryTier::Backup);
    ASSERT_EQ(res.source, "backup-2");
    ASSERT_EQ(res.state["n"], 2);
    ASSERT_FALSE(res.degraded);
    ASSERT_EQ(b3->loads.load(), 0u);

    ASSERT_EQ(res.attempts.size(), 3u);
    ASSERT_EQ(res.attempts[0].source, "primary");
    ASSERT_TRUE(res.attempts[0].error);
    ASSERT_EQ(res.attempts[1].source, "backup-1");
    ASSERT_TRUE(res.attempts[1].error);
    ASSERT_EQ(res.attempts[2].source, "backup-2");
    ASSERT_FALSE(res.attempts[2].error);
}

TEST(RecoveryOrchestrator, remoteFallbackIsDegraded)
{
    auto remote = good("https://sync.example/state", 9);
    auto res = recover({.primary = bad("primary"), .backups = {bad("backup-1")}, .remote = remote.get_ptr()});

    ASSERT_EQ(res.tier, RecoveryTier::Remote);
    ASSERT_TRUE(res.degraded);
    ASSERT_EQ(res.state["n"], 9);
    ASSERT_EQ(res.attempts.size(), 3u);
}

TEST(RecoveryOrchestrator, accountSyncSkipsLocalBackups)
{
    auto backup = good("backup-1", 1);
    auto remote = good("remote", 7);

    auto res = recover({
        .primary = bad("primary"),
        .backups = {backup},
        .remote = remote.get_ptr(),
        .accountSyncAuthoritative = true,
    });

    ASSERT_EQ(res.tier, RecoveryTier::Remote);
    ASSERT_EQ(backup->loads.load(), 0u);
}

TEST(RecoveryOrchestrator, everyTierFailing)
{
    RecoveryOrchestrator orchestrator({.primary = bad("primary"), .backups = {bad("backup-1"), bad("backup-2")}});

    try {
        orchestrator.recover();
        FAIL() << "expected CorruptionExhausted";
    } catch (CorruptionExhausted & e) {
        ASSERT_EQ(e.info().status, 2u);
        ASSERT_THAT(e.msg(), ::testing::HasSubstr("primary"));
        ASSERT_THAT(e.msg(), ::testing::HasSubstr("backup-2"));
        ASSERT_THAT(e.msg(), ::testing::HasSubstr("no remote copy is configured"));
    }
    ASSERT_EQ(orchestrator.stage(), RecoveryOrchestrator::Stage::FatalCorruption);
}

TEST(RecoveryOrchestrator, failingRemoteIsExhaustion)
{
    ASSERT_THROW((recover({.primary = bad("primary"), .remote = bad("remote").get_ptr()})), CorruptionExhausted);
}

TEST(RecoveryOrchestrator, nothingIsLoadedOnExhaustion)
{
    auto primary = bad("primary");
    auto backup = bad("backup-1");
    ASSERT_THROW((recover({.primary = primary, .backups = {backup}})), CorruptionExhausted);
    ASSERT_EQ(primary->loads.load(), 1u);
    ASSERT_EQ(backup->loads.load(), 1u);
}

} // namespace charx
