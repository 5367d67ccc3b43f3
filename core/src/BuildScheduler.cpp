#include "stvox/core/pipeline/BuildScheduler.hpp"
#include "stvox/core/pipeline/VoxelPipeline.hpp"
#include "stvox/core/util/Bounds.hpp"
#include "stvox/core/util/Logging.hpp"

namespace stvox {

VoxelBuildScheduler::VoxelBuildScheduler(PublishCallback onPublished)
    : _onPublished(std::move(onPublished))
{
    _worker = std::thread(&VoxelBuildScheduler::workerLoop, this);
}

VoxelBuildScheduler::~VoxelBuildScheduler()
{
    {
        std::lock_guard<std::mutex> lk(_mutex);
        _shutdown.store(true, std::memory_order_release);
        if (_runningToken)
            _runningToken->cancel();
        if (_pending)
            _pending->token.cancel();
    }
    _queueCV.notify_all();

    if (_worker.joinable())
        _worker.join();
}

uint64_t VoxelBuildScheduler::submit(std::shared_ptr<const Dataset> dataset,
                                     VoxelConfig config,
                                     GeneColorTable colors)
{
    uint64_t gen;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        // Bump generation so the build in flight becomes stale
        gen = _generation.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (_runningToken)
            _runningToken->cancel();
        if (_pending) {
            _pending->token.cancel();
            Logger()->debug("Build request {} replaced by {}", _pending->generation, gen);
        }

        BuildRequest req;
        req.generation = gen;
        req.dataset = std::move(dataset);
        req.config = std::move(config);
        req.colors = std::move(colors);
        _pending = std::move(req);
    }
    _queueCV.notify_one();
    return gen;
}

void VoxelBuildScheduler::cancelAll()
{
    std::lock_guard<std::mutex> lk(_mutex);
    _generation.fetch_add(1, std::memory_order_acq_rel);
    if (_runningToken)
        _runningToken->cancel();
    if (_pending) {
        _pending->token.cancel();
        _pending.reset();
    }
    _idleCV.notify_all();
}

bool VoxelBuildScheduler::waitIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(_mutex);
    return _idleCV.wait_for(lk, timeout, [this] { return !_pending && !_running; });
}

std::optional<std::string> VoxelBuildScheduler::lastError() const
{
    std::lock_guard<std::mutex> lk(_mutex);
    return _lastError;
}

void VoxelBuildScheduler::workerLoop()
{
    while (true) {
        BuildRequest req;

        // Wait for work
        {
            std::unique_lock<std::mutex> lk(_mutex);
            _queueCV.wait(lk, [this] {
                return _shutdown.load(std::memory_order_acquire) || _pending.has_value();
            });

            if (_shutdown.load(std::memory_order_acquire))
                return;

            req = std::move(*_pending);
            _pending.reset();
            _running = true;
            _runningToken = req.token;
        }

        if (req.generation == _generation.load(std::memory_order_acquire))
            runBuild(req);
        else
            _stale.fetch_add(1);

        {
            std::lock_guard<std::mutex> lk(_mutex);
            _running = false;
            _runningToken.reset();
        }
        _idleCV.notify_all();
    }
}

void VoxelBuildScheduler::runBuild(BuildRequest& req)
{
    std::shared_ptr<const VoxelScene> scene;
    try {
        scene = std::make_shared<const VoxelScene>(
            buildVoxelScene(*req.dataset, req.config, req.colors, checkpointFor(req.token)));
    } catch (const BuildCancelledError& e) {
        Logger()->debug("Build {} cancelled: {}", req.generation, e.what());
        _cancelled.fetch_add(1);
        return;
    } catch (const EmptyRegionError& e) {
        Logger()->warn("Build {}: {}; nothing to render", req.generation, e.what());
        scene = std::make_shared<const VoxelScene>();
    } catch (const std::exception& e) {
        Logger()->error("Build {} failed: {}", req.generation, e.what());
        _failed.fetch_add(1);
        std::lock_guard<std::mutex> lk(_mutex);
        _lastError = e.what();
        return;
    }

    // Discard results from stale generations
    if (req.generation != _generation.load(std::memory_order_acquire)) {
        Logger()->debug("Discarding build {}, newest request is {}", req.generation, _generation.load());
        _stale.fetch_add(1);
        return;
    }
    publish(req.generation, std::move(scene));
}

void VoxelBuildScheduler::publish(uint64_t generation, std::shared_ptr<const VoxelScene> scene)
{
    if (!_cache.store(generation, scene)) {
        _stale.fetch_add(1);
        return;
    }
    _published.fetch_add(1);
    if (_onPublished)
        _onPublished(generation, std::move(scene));
}

}  // namespace stvox
