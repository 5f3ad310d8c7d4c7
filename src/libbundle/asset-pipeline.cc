#include "charx/bundle/asset-pipeline.hh"

namespace charx {

static std::string describeFailures(const AssetPipelineFailure::Failures & failures)
{
    if (failures.size() == 1)
        return fmt("failed to save asset '%s': %s", failures[0].first, failures[0].second);
    std::string names;
    for (auto & [name, msg] : failures)
        names += (names.empty() ? "" : ", ") + ("'" + name + "'");
    return fmt("failed to save %d assets: %s", failures.size(), names);
}

AssetPipelineFailure::AssetPipelineFailure(Failures failures)
    : AssetError(describeFailures(failures))
    , failures(std::move(failures))
{
    for (auto & [name, msg] : this->failures)
        addTrace("asset '%s': %s", name, msg);
}

AssetPipeline::AssetPipeline(AssetStore & store, Options options)
    : store(store)
    , options(std::move(options))
    , act(*logger, lvlTalkative, actImportAssets, fmt("saving assets to %s", store.describe()))
    , completion(promise.get_future().share())
    , pool(std::max(1u, this->options.maxConcurrentSaves))
{
    if (!this->options.maxQueuedSaves)
        this->options.maxQueuedSaves = 1;
}

void AssetPipeline::enqueue(std::string name, std::string data)
{
    {
        auto state(state_.lock());
        if (state->isFinalized)
            throw AssetError("cannot enqueue asset '%s' after the input has been finished", name);
        state->totalEnqueued++;
    }

    try {
        auto shared = std::make_shared<std::pair<std::string, std::string>>(std::move(name), std::move(data));
        pool.enqueue([this, shared]() { persist(shared->first, shared->second); });
    } catch (std::exception &) {
        /* The asset will never complete, so it must not count as
           outstanding. */
        auto state(state_.lock());
        state->totalEnqueued--;
        checkCompletion(*state);
        wakeup.notify_all();
        throw;
    }
}

void AssetPipeline::persist(const std::string & name, const std::string & data)
{
    AssetId id;
    std::optional<std::string> failure;

    try {
        id = options.hashOnly ? makeAssetId(store.hash(data), "png") : store.save(data, name);
    } catch (Error & e) {
        failure = e.message();
    } catch (std::exception & e) {
        failure = e.what();
    }

    if (failure)
        warn("could not save asset '%s': %s", name, *failure);

    auto state(state_.lock());
    if (failure)
        state->errors.emplace_back(name, *failure);
    else
        state->assetIdByName.insert_or_assign(name, id);
    state->totalCompleted++;
    act.progress(state->totalCompleted, state->totalEnqueued, 0, state->errors.size());
    if (options.onProgress)
        options.onProgress(state->totalCompleted, state->totalEnqueued);
    checkCompletion(*state);
    wakeup.notify_all();
}

void AssetPipeline::finalize()
{
    auto state(state_.lock());
    if (state->isFinalized)
        throw AssetError("asset pipeline has already been finalised");
    state->isFinalized = true;
    checkCompletion(*state);
}

void AssetPipeline::checkCompletion(State & state)
{
    if (state.settled || !state.isFinalized || state.totalCompleted < state.totalEnqueued)
        return;
    state.settled = true;

    if (state.errors.empty()) {
        debug("saved %d assets", state.totalCompleted);
        promise.set_value();
    } else
        promise.set_exception(std::make_exception_ptr(AssetPipelineFailure(state.errors)));
}

void AssetPipeline::waitForCapacity()
{
    auto state(state_.lock());
    state.wait(
        wakeup, [&]() { return state->totalEnqueued - state->totalCompleted < options.maxQueuedSaves; });
}

std::map<std::string, AssetId> AssetPipeline::assets()
{
    return state_.lock()->assetIdByName;
}

size_t AssetPipeline::enqueued()
{
    return state_.lock()->totalEnqueued;
}

size_t AssetPipeline::completed()
{
    return state_.lock()->totalCompleted;
}

} // namespace charx
