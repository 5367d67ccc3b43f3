#include "stvox/core/pipeline/SceneCache.hpp"

namespace stvox {

bool SceneCache::store(uint64_t generation, std::shared_ptr<const VoxelScene> scene)
{
    std::lock_guard<std::mutex> lk(_mutex);
    if (_scene && generation < _generation)
        return false;
    _scene = std::move(scene);
    _generation = generation;
    return true;
}

std::shared_ptr<const VoxelScene> SceneCache::latest() const
{
    std::lock_guard<std::mutex> lk(_mutex);
    return _scene;
}

uint64_t SceneCache::generation() const
{
    std::lock_guard<std::mutex> lk(_mutex);
    return _scene ? _generation : 0;
}

bool SceneCache::empty() const
{
    std::lock_guard<std::mutex> lk(_mutex);
    return !_scene;
}

void SceneCache::invalidate()
{
    std::lock_guard<std::mutex> lk(_mutex);
    _scene.reset();
    _generation = 0;
}

}  // namespace stvox
