/**
 * @file container_pool.hpp
 * @brief Bounded pool of warm, reusable containers
 *
 * Starting a container costs far more than exec'ing into a running one, so
 * the container backend keeps finished containers idle and hands them to the
 * next command that asks for the same image and creation options.
 *
 * **Container States**:
 * ```
 * CREATED → IDLE ⇄ IN_USE → DESTROYED
 * ```
 *
 * **Capacity**: idle + in-use + being created + being removed never exceeds
 * max_size. When full, Acquire() first evicts the least recently used idle
 * container of another family, and otherwise waits for a release.
 *
 * **Families**: containers are interchangeable only when they share the image
 * and every creation option (limits, network, mounts, user). The family key
 * is the image plus a SHA-256 fingerprint of the options.
 *
 * All methods are thread-safe. Slow runtime calls (create, start, remove)
 * run outside the pool lock.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/result.hpp"
#include "warden/core/types.hpp"
#include "warden/runtime/container_runtime.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace warden {
namespace pool {

/**
 * @enum ContainerState
 * @brief Lifecycle state of a pooled container
 */
enum class ContainerState {
    CREATED,    ///< Being created/started, not yet lendable
    IDLE,       ///< Running and free
    IN_USE,     ///< Lent to exactly one execution
    DESTROYED   ///< Removed from the runtime
};

const char* ContainerStateToString(ContainerState state);

/**
 * @struct PooledContainer
 * @brief Pool bookkeeping for one container
 *
 * Acquire() returns a copy; the pool's own entry is authoritative.
 */
struct PooledContainer {
    std::string id;                                   ///< Runtime container ID
    std::string image;                                ///< Image it was created from
    std::string family_key;                           ///< Image + options fingerprint
    ContainerState state{ContainerState::CREATED};    ///< Current state
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used_at;
};

/**
 * @struct PoolConfig
 * @brief Pool sizing and eviction settings
 */
struct PoolConfig {
    std::size_t max_size{5};                        ///< Max live containers
    std::chrono::milliseconds idle_timeout{60000};  ///< Idle time before eviction
    bool run_sweeper{true};                         ///< Background sweep every idle_timeout/2
    std::chrono::seconds stop_grace{1};             ///< docker stop grace used by DestroyAll
};

/**
 * @struct PoolStats
 * @brief Point-in-time pool counters
 */
struct PoolStats {
    std::size_t idle{0};
    std::size_t in_use{0};
    std::size_t creating{0};
    std::size_t removing{0};
    std::uint64_t total_created{0};
    std::uint64_t total_reused{0};
    std::uint64_t total_destroyed{0};
};

/**
 * @class ContainerPool
 * @brief Lends containers to executions and reclaims them
 *
 * **Usage Example**:
 * @code
 * ContainerPool pool(runtime, PoolConfig{});
 * auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
 *
 * auto container = pool.Acquire("alpine:3.19", options, deadline);
 * if (!container) return container.GetError();
 *
 * auto exec = runtime->Exec(container.Value().id, exec_options);
 * pool.Release(container.Value(), !exec || exec.Value().timed_out);
 * @endcode
 */
class ContainerPool {
public:
    ContainerPool(std::shared_ptr<runtime::ContainerRuntime> runtime, const PoolConfig& config);

    /// Stops the sweeper and destroys every tracked container
    ~ContainerPool();

    ContainerPool(const ContainerPool&) = delete;
    ContainerPool& operator=(const ContainerPool&) = delete;

    /**
     * @brief Borrow a running container for @p image
     *
     * Reuses an idle container of the same family, else creates one if
     * capacity allows (evicting the least recently used idle container of
     * another family when full), else waits for a release.
     *
     * @param image Image reference (overrides options.image)
     * @param options Creation options; part of the family key
     * @param deadline Give up waiting at this point
     * @param cancel Stop waiting when cancelled
     * @return Container marked IN_USE, or POOL_EXHAUSTED / CANCELLED /
     *         the runtime's creation error
     */
    Result<PooledContainer> Acquire(const std::string& image,
                                    const runtime::ContainerCreateOptions& options,
                                    std::chrono::steady_clock::time_point deadline,
                                    const CancellationToken& cancel = {});

    /**
     * @brief Return a borrowed container
     *
     * @param container Container from Acquire()
     * @param corrupted Destroy instead of reusing (killed process, failed exec)
     *
     * Unknown IDs (e.g. after DestroyAll) are ignored.
     */
    void Release(const PooledContainer& container, bool corrupted = false);

    /**
     * @brief Destroy containers idle longer than idle_timeout
     * @return Number of containers destroyed
     */
    std::size_t SweepIdle();

    /**
     * @brief Stop and remove every tracked container
     *
     * Each container gets stop_grace to exit before the forced removal.
     * Safe to call repeatedly.
     */
    void DestroyAll();

    PoolStats GetStats() const;

    const PoolConfig& GetConfig() const { return config_; }

    /**
     * @brief Family key of a set of creation options
     *
     * `image@sha256(canonical JSON of the remaining options)`
     */
    static std::string ComputeFamilyKey(const runtime::ContainerCreateOptions& options);

private:
    Result<PooledContainer> CreateReserved(const runtime::ContainerCreateOptions& options,
                                           const std::string& family_key);
    void RemoveUnlocked(const std::vector<std::string>& ids, bool stop_first = false);
    std::size_t LiveCountLocked() const;
    void SweeperLoop();

    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    PoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable slot_changed_;
    std::map<std::string, PooledContainer> containers_;  ///< By container ID
    std::size_t creating_{0};
    std::size_t removing_{0};
    std::uint64_t total_created_{0};
    std::uint64_t total_reused_{0};
    std::uint64_t total_destroyed_{0};

    std::thread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool stop_sweeper_{false};
};

} // namespace pool
} // namespace warden
