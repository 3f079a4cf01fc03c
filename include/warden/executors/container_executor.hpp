/**
 * @file container_executor.hpp
 * @brief Container backend on top of the warm container pool
 *
 * Each execution borrows a running container from the ContainerPool, runs
 * `/bin/sh -c "<joined command>"` in it through the container runtime and
 * returns the container. A container whose state is suspect afterwards
 * (timeout, cancellation, exec infrastructure error, exit 137) is destroyed
 * instead of being handed to the next tenant.
 *
 * **Policy Mapping**:
 * - resources.memory_limit_bytes → --memory
 * - resources.cpu_quota → --cpus
 * - resources.pids_limit → --pids-limit (default 100)
 * - network.mode → --network (default none)
 * - mounts, user → -v, --user
 * - env, working_dir, stdin → exec -e, -w, -i
 *
 * @date 2025
 */

#pragma once

#include "warden/executors/executor.hpp"
#include "warden/pool/container_pool.hpp"
#include "warden/runtime/container_runtime.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace warden {
namespace executors {

/**
 * @struct ContainerExecutorConfig
 * @brief Container backend settings
 */
struct ContainerExecutorConfig {
    pool::PoolConfig pool;                                    ///< Pool sizing
    std::chrono::milliseconds availability_ttl{5000};         ///< Ping result cache
    std::size_t max_output_bytes{50000};                      ///< Per stream cap
    std::string shell{"/bin/sh"};                             ///< Shell inside the image
    std::filesystem::path container_workdir{"/workspace"};    ///< Working dir of new containers
    int default_pids_limit{100};                              ///< When the policy sets none
};

/**
 * @class ContainerExecutor
 * @brief Executes commands in pooled containers
 */
class ContainerExecutor : public Executor {
public:
    ContainerExecutor(std::shared_ptr<runtime::ContainerRuntime> runtime,
                      const ContainerExecutorConfig& config = ContainerExecutorConfig{});
    ~ContainerExecutor() override;

    SandboxType GetType() const override { return SandboxType::CONTAINER; }

    /**
     * @brief Ping the container runtime
     * @return BACKEND_UNAVAILABLE if the daemon does not answer
     */
    Result<void> Connect() override;

    /// Destroys the pool and every container in it
    Result<void> Disconnect() override;

    /**
     * @brief Cached daemon reachability
     *
     * Pings at most once per availability_ttl. Connectivity errors seen
     * during Execute() invalidate the cache.
     */
    bool IsAvailable() override;

    Result<ExecutionResult> Execute(const ExecutionRequest& request,
                                    const IsolationPolicy& policy,
                                    const CancellationToken& cancel) override;

    /// Creation options a policy maps to
    runtime::ContainerCreateOptions BuildCreateOptions(const IsolationPolicy& policy) const;

    /// Pool counters (all zero before the first execution)
    pool::PoolStats GetPoolStats() const;

private:
    std::shared_ptr<pool::ContainerPool> GetPool();
    void InvalidateAvailability();

    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    ContainerExecutorConfig config_;

    mutable std::mutex pool_mutex_;
    std::shared_ptr<pool::ContainerPool> pool_;  ///< Created on first Execute()

    std::mutex availability_mutex_;
    bool available_{false};
    bool availability_known_{false};
    std::chrono::steady_clock::time_point availability_checked_at_;
};

} // namespace executors
} // namespace warden
