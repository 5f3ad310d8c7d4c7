#include "charx/bundle/recovery.hh"
#include "charx/util/logging.hh"

namespace charx {

std::string_view showRecoveryTier(RecoveryTier tier)
{
    switch (tier) {
    case RecoveryTier::Primary:
        return "primary";
    case RecoveryTier::Backup:
        return "backup";
    case RecoveryTier::Remote:
        return "remote";
    }
    unreachable();
}

bool RecoveryOrchestrator::attempt(RecoveryTier tier, StateContainer & container, RecoveryResult & res)
{
    auto source = container.describe();
    debug("trying to load state from %s '%s'", showRecoveryTier(tier), source);

    std::optional<std::string> error;
    try {
        res.state = container.load();
    } catch (Error & e) {
        error = e.message();
    } catch (std::exception & e) {
        error = e.what();
    }

    res.attempts.push_back(RecoveryAttempt{.tier = tier, .source = source, .error = error});

    if (error) {
        warn("could not load state from %s '%s': %s", showRecoveryTier(tier), source, *error);
        return false;
    }

    res.tier = tier;
    res.source = source;
    return true;
}

RecoveryResult RecoveryOrchestrator::recover()
{
    Activity act(*logger, lvlTalkative, actRecover, "recovering application state");

    RecoveryResult res;
    current = Stage::TryPrimary;

    while (true) {
        switch (current) {

        case Stage::TryPrimary:
            current = attempt(RecoveryTier::Primary, *plan.primary, res) ? Stage::Done : Stage::TryBackups;
            break;

        case Stage::TryBackups:
            current = Stage::TryRemoteFallback;
            if (plan.accountSyncAuthoritative) {
                debug("account sync is authoritative; not using local backups");
                break;
            }
            for (auto & backup : plan.backups)
                if (attempt(RecoveryTier::Backup, *backup, res)) {
                    current = Stage::Done;
                    break;
                }
            break;

        case Stage::TryRemoteFallback:
            if (plan.remote && attempt(RecoveryTier::Remote, *plan.remote, res)) {
                res.degraded = true;
                warn("application state was recovered from the remote copy '%s'", res.source);
                current = Stage::Done;
            } else
                current = Stage::FatalCorruption;
            break;

        case Stage::Done:
            if (res.tier != RecoveryTier::Primary)
                printInfo("recovered application state from %s '%s'", showRecoveryTier(res.tier), res.source);
            return res;

        case Stage::FatalCorruption: {
            std::string details;
            for (auto & a : res.attempts)
                details += fmt("\n  %s '%s': %s", showRecoveryTier(a.tier), a.source, a.error.value_or("failed"));
            if (!plan.remote)
                details += "\n  remote: no remote copy is configured";
            CorruptionExhausted err(
                "unable to load the application state; every source failed and nothing was loaded:%s",
                Uncolored(details));
            err.withExitStatus(2);
            throw err;
        }
        }
    }
}

RecoveryResult recover(RecoveryPlan plan)
{
    return RecoveryOrchestrator(std::move(plan)).recover();
}

} // namespace charx
