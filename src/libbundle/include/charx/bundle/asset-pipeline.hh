#pragma once
/**
 * @file
 *
 * Bounded-concurrency persistence of decoded assets.
 */

#include "charx/store/asset-store.hh"
#include "charx/util/logging.hh"
#include "charx/util/sync.hh"
#include "charx/util/thread-pool.hh"

#include <functional>
#include <future>
#include <map>
#include <memory>

namespace charx {

/**
 * One asset failed to decode or persist.
 */
MakeError(AssetError, Error);

/**
 * The overall result of a pipeline in which at least one asset failed.
 * Carries every failed `(name, message)` pair.
 */
class AssetPipelineFailure : public AssetError
{
public:
    typedef std::vector<std::pair<std::string, std::string>> Failures;

    Failures failures;

    AssetPipelineFailure(Failures failures);
};

/**
 * Persists assets through an `AssetStore` on a fixed number of worker
 * threads and reports a single completion once the input is finished
 * and every enqueued asset has been handled.
 *
 * Failures of individual assets are recorded rather than thrown, so
 * one bad asset never holds up the others. Completion fails with an
 * `AssetPipelineFailure` naming every failed asset.
 *
 * Destroying the pipeline lets saves that are already running finish
 * and drops the ones that have not started.
 */
class AssetPipeline
{
public:

    /**
     * Called after every asset with the number of completed and
     * enqueued assets. It runs with the pipeline's lock held and must
     * not call back into the pipeline.
     */
    typedef std::function<void(size_t done, size_t total)> ProgressCallback;

    struct Options
    {
        /// Number of saves that may run at the same time.
        unsigned int maxConcurrentSaves = 10;

        /// `waitForCapacity()` blocks while this many assets are outstanding.
        unsigned int maxQueuedSaves = 30;

        /// Only compute identifiers; write nothing.
        bool hashOnly = false;

        ProgressCallback onProgress;
    };

    AssetPipeline(AssetStore & store, Options options);

    AssetPipeline(const AssetPipeline &) = delete;

    /**
     * Queue an asset for persistence. Returns immediately.
     *
     * @throws AssetError if the pipeline has already been finalised.
     */
    void enqueue(std::string name, std::string data);

    /**
     * Declare that no further assets will be enqueued. Must be called
     * once, after the whole input has been consumed.
     */
    void finalize();

    /**
     * The completion signal. It becomes ready exactly once, at the
     * first moment the pipeline is finalised and every enqueued asset
     * has completed.
     */
    std::shared_future<void> awaitCompletion() const
    {
        return completion;
    }

    /**
     * Block until fewer than `maxQueuedSaves` assets are outstanding.
     */
    void waitForCapacity();

    /**
     * Snapshot of the asset identifiers assigned so far, keyed by entry
     * name. Identifiers may appear in any order.
     */
    std::map<std::string, AssetId> assets();

    size_t enqueued();

    size_t completed();

private:

    struct State
    {
        size_t totalEnqueued = 0;
        size_t totalCompleted = 0;
        bool isFinalized = false;
        bool settled = false;
        AssetPipelineFailure::Failures errors;
        std::map<std::string, AssetId> assetIdByName;
    };

    AssetStore & store;
    Options options;
    Activity act;

    Sync<State> state_;
    std::condition_variable wakeup;

    std::promise<void> promise;
    std::shared_future<void> completion;

    void persist(const std::string & name, const std::string & data);

    /**
     * Settle the completion signal if the pipeline is done. Must be
     * called with the state lock held.
     */
    void checkCompletion(State & state);

    /* Must be the last member so its workers are joined before the
       state they use is destroyed. */
    ThreadPool pool;
};

} // namespace charx
