#pragma once

#include "stvox/core/types/Voxel.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace stvox {

/**
 * @brief Holds the most recent complete VoxelScene
 *
 * Scenes are tagged with the generation of the request that produced them.
 * A scene older than the one already held is refused, so a slow stale build
 * can never replace a newer result. Readers get a shared snapshot that stays
 * valid after the cache moves on.
 */
class SceneCache
{
public:
    // Returns false when a newer generation is already stored
    bool store(uint64_t generation, std::shared_ptr<const VoxelScene> scene);

    std::shared_ptr<const VoxelScene> latest() const;

    // Generation of the stored scene, 0 when empty
    uint64_t generation() const;

    bool empty() const;

    // Drops the stored scene; the next store of any generation is accepted
    void invalidate();

private:
    mutable std::mutex _mutex;
    std::shared_ptr<const VoxelScene> _scene;
    uint64_t _generation = 0;
};

}  // namespace stvox
