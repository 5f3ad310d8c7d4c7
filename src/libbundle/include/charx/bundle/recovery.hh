#pragma once
/**
 * @file
 *
 * Loading application state with fallback: the primary save, then the
 * backup chain, then a remote copy. Failing every tier is an explicit
 * error rather than a silent start from an empty state.
 */

#include "charx/bundle/errors.hh"
#include "charx/bundle/state-container.hh"

#include <memory>

namespace charx {

enum class RecoveryTier { Primary, Backup, Remote };

std::string_view showRecoveryTier(RecoveryTier tier);

struct RecoveryPlan
{
    ref<StateContainer> primary;

    /// Tried in order; the first that loads wins.
    std::vector<ref<StateContainer>> backups;

    /// Last resort, if any.
    std::shared_ptr<StateContainer> remote;

    /**
     * The account sync holds the authoritative state, so local backups
     * must not be used.
     */
    bool accountSyncAuthoritative = false;
};

struct RecoveryAttempt
{
    RecoveryTier tier;
    std::string source;
    /// Unset if this attempt succeeded.
    std::optional<std::string> error;
};

struct RecoveryResult
{
    StateObject state;
    RecoveryTier tier = RecoveryTier::Primary;
    std::string source;
    /// Set if the state came from the remote fallback.
    bool degraded = false;
    /// Every container tried, in order.
    std::vector<RecoveryAttempt> attempts;
};

class RecoveryOrchestrator
{
public:

    enum class Stage { TryPrimary, TryBackups, TryRemoteFallback, Done, FatalCorruption };

    explicit RecoveryOrchestrator(RecoveryPlan plan)
        : plan(std::move(plan))
    {
    }

    /**
     * Run the fallback sequence.
     *
     * @throws CorruptionExhausted listing every attempt if no tier
     * yields a state.
     */
    RecoveryResult recover();

    Stage stage() const
    {
        return current;
    }

private:
    RecoveryPlan plan;
    Stage current = Stage::TryPrimary;

    bool attempt(RecoveryTier tier, StateContainer & container, RecoveryResult & res);
};

/**
 * Convenience wrapper around `RecoveryOrchestrator`.
 */
RecoveryResult recover(RecoveryPlan plan);

} // namespace charx
