#pragma once

#include "stvox/core/pipeline/SceneCache.hpp"
#include "stvox/core/types/Dataset.hpp"
#include "stvox/core/types/Voxel.hpp"
#include "stvox/core/types/VoxelConfig.hpp"
#include "stvox/core/util/Cancellation.hpp"
#include "stvox/core/util/Color.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace stvox {

/**
 * @brief Runs voxel scene builds off the caller's thread, latest request wins
 *
 * One worker thread and at most one queued request. Every submit() bumps the
 * generation, cancels the build in flight and replaces whatever was queued.
 * A build that finishes after a newer submit is dropped; only complete
 * builds of the newest generation reach the SceneCache.
 *
 * An EmptyRegionError publishes an empty scene (nothing to draw). Other
 * build failures are logged and leave the previous scene in place.
 */
class VoxelBuildScheduler
{
public:
    // Called on the worker thread after a scene is published
    using PublishCallback = std::function<void(uint64_t generation, std::shared_ptr<const VoxelScene>)>;

    explicit VoxelBuildScheduler(PublishCallback onPublished = {});
    ~VoxelBuildScheduler();

    VoxelBuildScheduler(const VoxelBuildScheduler&) = delete;
    VoxelBuildScheduler& operator=(const VoxelBuildScheduler&) = delete;

    // Returns the generation assigned to this request
    uint64_t submit(std::shared_ptr<const Dataset> dataset,
                    VoxelConfig config,
                    GeneColorTable colors);

    // Cancels the running and queued builds without queueing a new one
    void cancelAll();

    // Blocks until nothing is queued or running; false on timeout
    bool waitIdle(std::chrono::milliseconds timeout);

    std::shared_ptr<const VoxelScene> latestScene() const { return _cache.latest(); }
    const SceneCache& cache() const { return _cache; }

    uint64_t requestedGeneration() const { return _generation.load(std::memory_order_acquire); }
    uint64_t publishedGeneration() const { return _cache.generation(); }

    size_t publishedBuilds() const { return _published.load(); }
    size_t cancelledBuilds() const { return _cancelled.load(); }
    size_t staleBuilds() const { return _stale.load(); }
    size_t failedBuilds() const { return _failed.load(); }
    std::optional<std::string> lastError() const;

private:
    struct BuildRequest {
        uint64_t generation = 0;
        std::shared_ptr<const Dataset> dataset;
        VoxelConfig config;
        GeneColorTable colors;
        CancelToken token;
    };

    void workerLoop();
    void runBuild(BuildRequest& req);
    void publish(uint64_t generation, std::shared_ptr<const VoxelScene> scene);

    SceneCache _cache;
    PublishCallback _onPublished;

    mutable std::mutex _mutex;
    std::condition_variable _queueCV;
    std::condition_variable _idleCV;
    std::optional<BuildRequest> _pending;
    std::optional<CancelToken> _runningToken;
    bool _running = false;
    std::optional<std::string> _lastError;

    std::atomic<uint64_t> _generation{0};
    std::atomic<bool> _shutdown{false};
    std::atomic<size_t> _published{0};
    std::atomic<size_t> _cancelled{0};
    std::atomic<size_t> _stale{0};
    std::atomic<size_t> _failed{0};

    std::thread _worker;
};

}  // namespace stvox
