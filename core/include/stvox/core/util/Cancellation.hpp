#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace stvox {

// A build was abandoned at a checkpoint; its partial output is discarded
class BuildCancelledError : public std::runtime_error
{
public:
    explicit BuildCancelledError(const std::string& what) : std::runtime_error(what) {}
};

// Shared cancel flag. Copies observe the same flag.
class CancelToken
{
public:
    CancelToken() : _flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { _flag->store(true, std::memory_order_release); }
    bool cancelled() const { return _flag->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> _flag;
};

// Polled by long loops, possibly from several threads at once.
// Returns false when the build should stop.
using BuildCheckpoint = std::function<bool()>;

inline BuildCheckpoint checkpointFor(const CancelToken& token)
{
    return [token] { return !token.cancelled(); };
}

inline BuildCheckpoint neverCancel()
{
    return [] { return true; };
}

}  // namespace stvox
