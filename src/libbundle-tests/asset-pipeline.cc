#include "charx/bundle/asset-pipeline.hh"
#include "charx/store/tests/memory-asset-store.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <thread>

namespace charx {

using testing::MemoryAssetStore;

static bool isReady(const std::shared_future<void> & f)
{
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

static void waitUntil(const std::function<bool()> & pred)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!pred()) {
        ASSERT_LT(std::chrono::steady_clock::now(), deadline) << "timed out";
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

/**
 * A store whose saves block until the test opens the gate.
 */
struct GatedStore : MemoryAssetStore
{
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<int> started{0};

    GatedStore()
    {
        onSave = [this](std::string_view, std::string_view) {
            started++;
            opened.wait();
        };
    }

    void open()
    {
        gate.set_value();
    }
};

/* ----------------------------------------------------------------------------
 * completion
 * --------------------------------------------------------------------------*/

TEST(AssetPipeline, emptyPipelineCompletesOnFinalize)
{
    MemoryAssetStore store;
    AssetPipeline pipeline(store, {});
    ASSERT_FALSE(isReady(pipeline.awaitCompletion()));
    pipeline.finalize();
    ASSERT_TRUE(isReady(pipeline.awaitCompletion()));
    pipeline.awaitCompletion().get();
}

TEST(AssetPipeline, finalizeBeforeLastSaveCompletes)
{
    GatedStore store;
    AssetPipeline pipeline(store, {});

    pipeline.enqueue("a.png", "a");
    waitUntil([&]() { return store.started == 1; });

    pipeline.finalize();
    ASSERT_FALSE(isReady(pipeline.awaitCompletion()));

    store.open();
    pipeline.awaitCompletion().get();
    ASSERT_EQ(pipeline.completed(), 1u);
    ASSERT_EQ(pipeline.assets().size(), 1u);
}

TEST(AssetPipeline, lastSaveCompletesBeforeFinalize)
{
    MemoryAssetStore store;
    AssetPipeline pipeline(store, {});

    pipeline.enqueue("a.png", "a");
    pipeline.enqueue("b.png", "b");
    waitUntil([&]() { return pipeline.completed() == 2; });

    ASSERT_FALSE(isReady(pipeline.awaitCompletion()));
    pipeline.finalize();
    ASSERT_TRUE(isReady(pipeline.awaitCompletion()));
    pipeline.awaitCompletion().get();
}

TEST(AssetPipeline, manyAssetsAllComplete)
{
    MemoryAssetStore store;
    AssetPipeline pipeline(store, {.maxConcurrentSaves = 4, .maxQueuedSaves = 8});

    for (int i = 0; i < 200; i++) {
        pipeline.enqueue(fmt("%d.bin", i), fmt("content %d", i));
        pipeline.waitForCapacity();
    }
    pipeline.finalize();
    pipeline.awaitCompletion().get();

    ASSERT_EQ(pipeline.enqueued(), 200u);
    ASSERT_EQ(pipeline.completed(), 200u);
    ASSERT_EQ(store.keys().size(), 200u);
}

TEST(AssetPipeline, enqueueAfterFinalizeThrows)
{
    MemoryAssetStore store;
    AssetPipeline pipeline(store, {});
    pipeline.finalize();
    ASSERT_THROW(pipeline.enqueue("late.png", "x"), AssetError);
    ASSERT_THROW(pipeline.finalize(), AssetError);
}

/* ----------------------------------------------------------------------------
 * failures
 * --------------------------------------------------------------------------*/

TEST(AssetPipeline, failuresAreCollected)
{
    MemoryAssetStore store;
    store.onSave = [](std::string_view data, std::string_view name) {
        if (name.starts_with("bad"))
            throw AssetStoreError("cannot write '%s'", name);
    };

    AssetPipeline pipeline(store, {.maxConcurrentSaves = 2});
    for (auto name : {"good1.png", "bad1.png", "good2.png", "bad2.png"})
        pipeline.enqueue(name, name);
    pipeline.finalize();

    try {
        pipeline.awaitCompletion().get();
        FAIL() << "expected AssetPipelineFailure";
    } catch (AssetPipelineFailure & e) {
        ASSERT_EQ(e.failures.size(), 2u);
        ASSERT_THAT(e.what(), ::testing::HasSubstr("failed to save 2 assets"));
    }

    ASSERT_EQ(pipeline.completed(), 4u);
    auto assets = pipeline.assets();
    ASSERT_EQ(assets.size(), 2u);
    ASSERT_TRUE(assets.count("good1.png"));
    ASSERT_TRUE(assets.count("good2.png"));
}

TEST(AssetPipeline, singleFailureNamesTheAsset)
{
    AssetPipelineFailure e(AssetPipelineFailure::Failures{{"x.png", "disk full"}});
    ASSERT_THAT(e.what(), ::testing::HasSubstr("failed to save asset 'x.png': disk full"));
}

TEST(AssetPipeline, nonCharxExceptionsAreCollected)
{
    MemoryAssetStore store;
    store.onSave = [](std::string_view, std::string_view) { throw std::runtime_error("boom"); };

    AssetPipeline pipeline(store, {});
    pipeline.enqueue("a.png", "a");
    pipeline.finalize();
    ASSERT_THROW(pipeline.awaitCompletion().get(), AssetPipelineFailure);
}

/* ----------------------------------------------------------------------------
 * concurrency limits
 * --------------------------------------------------------------------------*/

TEST(AssetPipeline, concurrentSavesAreBounded)
{
    MemoryAssetStore store;
    std::atomic<int> running{0}, peak{0};
    store.onSave = [&](std::string_view, std::string_view) {
        int now = ++running;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now))
            ;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --running;
    };

    AssetPipeline pipeline(store, {.maxConcurrentSaves = 3, .maxQueuedSaves = 100});
    for (int i = 0; i < 30; i++)
        pipeline.enqueue(fmt("%d.png", i), fmt("%d", i));
    pipeline.finalize();
    pipeline.awaitCompletion().get();

    ASSERT_LE(peak.load(), 3);
}

TEST(AssetPipeline, waitForCapacityBlocksWhileQueueIsFull)
{
    GatedStore store;
    AssetPipeline pipeline(store, {.maxConcurrentSaves = 1, .maxQueuedSaves = 2});

    pipeline.enqueue("a.png", "a");
    pipeline.enqueue("b.png", "b");

    auto waiter = std::async(std::launch::async, [&]() { pipeline.waitForCapacity(); });
    ASSERT_EQ(waiter.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

    store.open();
    waiter.get();
    pipeline.finalize();
    pipeline.awaitCompletion().get();
}

TEST(AssetPipeline, progressIsReported)
{
    MemoryAssetStore store;
    std::vector<std::pair<size_t, size_t>> reports;
    AssetPipeline pipeline(
        store, {.maxConcurrentSaves = 1, .onProgress = [&](size_t done, size_t total) {
                    reports.emplace_back(done, total);
                }});

    pipeline.enqueue("a.png", "a");
    pipeline.enqueue("b.png", "b");
    pipeline.finalize();
    pipeline.awaitCompletion().get();

    ASSERT_EQ(reports.size(), 2u);
    ASSERT_EQ(reports.back().first, 2u);
}

/* ----------------------------------------------------------------------------
 * hash-only mode
 * --------------------------------------------------------------------------*/

TEST(AssetPipeline, hashOnlyComputesIdsWithoutSaving)
{
    MemoryAssetStore store;
    AssetPipeline pipeline(store, {.hashOnly = true});
    pipeline.enqueue("clip.mp4", "video");
    pipeline.finalize();
    pipeline.awaitCompletion().get();

    ASSERT_EQ(pipeline.assets().at("clip.mp4"), makeAssetId(store.hash("video"), "png"));
    ASSERT_EQ(store.saves.load(), 0u);
}

} // namespace charx
