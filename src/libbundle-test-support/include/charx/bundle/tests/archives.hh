#pragma once
///@file

#include "charx/bundle/state-container.hh"

#include <atomic>
#include <utility>
#include <vector>

namespace charx::testing {

typedef std::vector<std::pair<std::string, std::string>> Entries;

/**
 * A zip container holding `entries`, in order, written with
 * `ArchiveWriter`.
 */
std::string makeArchive(const Entries & entries, int level = 0);

/**
 * A `StateContainer` that either yields a fixed state or fails, and
 * counts how often it was asked.
 */
class FakeStateContainer : public StateContainer
{
    std::string name;
    std::optional<StateObject> state;

public:

    std::atomic<unsigned int> loads{0};

    /// A container that fails to load.
    explicit FakeStateContainer(std::string name)
        : name(std::move(name))
    {
    }

    FakeStateContainer(std::string name, StateObject state)
        : name(std::move(name))
        , state(std::move(state))
    {
    }

    std::string describe() const override
    {
        return name;
    }

    StateObject load() override;
};

} // namespace charx::testing
