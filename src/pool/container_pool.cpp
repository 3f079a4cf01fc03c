/**
 * @file container_pool.cpp
 * @brief Implementation of the warm container pool
 *
 * **Acquire Decision**:
 * ```
 * idle container in family?      → lend it (reuse)
 * live < max_size?                → reserve slot, create outside lock
 * idle container in other family? → evict LRU, reuse its slot, create
 * otherwise                       → wait (deadline / cancellation bounded)
 * ```
 *
 * Reserved slots (creating_) and containers being removed (removing_) count
 * against max_size so the runtime never holds more than max_size containers.
 *
 * @date 2025
 */

#include "warden/pool/container_pool.hpp"
#include "warden/utils/hash_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace warden {
namespace pool {

namespace {

constexpr std::chrono::milliseconds kWaitTick{50};

} // anonymous namespace

const char* ContainerStateToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED:   return "created";
        case ContainerState::IDLE:      return "idle";
        case ContainerState::IN_USE:    return "in_use";
        case ContainerState::DESTROYED: return "destroyed";
    }
    return "unknown";
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

ContainerPool::ContainerPool(std::shared_ptr<runtime::ContainerRuntime> runtime,
                             const PoolConfig& config)
    : runtime_(std::move(runtime))
    , config_(config) {

    if (!runtime_) {
        throw std::invalid_argument("ContainerPool requires a container runtime");
    }
    if (config_.max_size < 1) {
        throw std::invalid_argument("pool max_size must be at least 1");
    }
    if (config_.idle_timeout.count() < 1) {
        throw std::invalid_argument("pool idle_timeout must be positive");
    }

    spdlog::info("Container pool created (runtime: {}, max: {}, idle timeout: {}ms)",
                 runtime_->GetName(), config_.max_size, config_.idle_timeout.count());

    if (config_.run_sweeper) {
        sweeper_ = std::thread(&ContainerPool::SweeperLoop, this);
    }
}

ContainerPool::~ContainerPool() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        stop_sweeper_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }

    DestroyAll();
}

// ============================================================================
// ACQUIRE / RELEASE
// ============================================================================

Result<PooledContainer> ContainerPool::Acquire(const std::string& image,
                                               const runtime::ContainerCreateOptions& options,
                                               std::chrono::steady_clock::time_point deadline,
                                               const CancellationToken& cancel) {
    runtime::ContainerCreateOptions create_options = options;
    create_options.image = image;
    const std::string family_key = ComputeFamilyKey(create_options);

    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (cancel.IsCancelled()) {
            return Result<PooledContainer>::Failure(ErrorKind::CANCELLED,
                                                    "Cancelled while waiting for a container");
        }

        // 1. Reuse the most recently used idle container of this family
        PooledContainer* reusable = nullptr;
        for (auto& [id, entry] : containers_) {
            if (entry.state == ContainerState::IDLE && entry.family_key == family_key &&
                (!reusable || entry.last_used_at > reusable->last_used_at)) {
                reusable = &entry;
            }
        }
        if (reusable) {
            reusable->state = ContainerState::IN_USE;
            reusable->last_used_at = std::chrono::steady_clock::now();
            total_reused_++;
            spdlog::debug("Reusing container {} for {}", reusable->id, image);
            return Result<PooledContainer>::Success(*reusable);
        }

        // 2. Free capacity
        if (LiveCountLocked() < config_.max_size) {
            creating_++;
            lock.unlock();
            return CreateReserved(create_options, family_key);
        }

        // 3. Evict the least recently used idle container of another family
        auto victim = containers_.end();
        for (auto it = containers_.begin(); it != containers_.end(); ++it) {
            if (it->second.state == ContainerState::IDLE &&
                (victim == containers_.end() ||
                 it->second.last_used_at < victim->second.last_used_at)) {
                victim = it;
            }
        }
        if (victim != containers_.end()) {
            std::string victim_id = victim->first;
            spdlog::info("Pool full, evicting idle container {} ({})",
                         victim_id, victim->second.image);
            containers_.erase(victim);
            creating_++;  // The victim's slot becomes the reservation
            total_destroyed_++;
            lock.unlock();

            auto removed = runtime_->RemoveContainer(victim_id, true);
            if (!removed) {
                spdlog::warn("Failed to remove evicted container {}: {}",
                             victim_id, removed.GetError().message);
            }
            return CreateReserved(create_options, family_key);
        }

        // 4. Wait for a release or removal
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::warn("Container pool exhausted (max: {}) waiting for {}",
                         config_.max_size, image);
            return Result<PooledContainer>::Failure(ErrorKind::POOL_EXHAUSTED,
                "No container available for " + image + " before the deadline (max_size " +
                std::to_string(config_.max_size) + ")");
        }
        slot_changed_.wait_until(lock, std::min(deadline, now + kWaitTick));
    }
}

void ContainerPool::Release(const PooledContainer& container, bool corrupted) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto it = containers_.find(container.id);
    if (it == containers_.end()) {
        spdlog::debug("Release of untracked container {} ignored", container.id);
        return;
    }
    if (it->second.state != ContainerState::IN_USE) {
        spdlog::warn("Release of container {} in state {} ignored", container.id,
                     ContainerStateToString(it->second.state));
        return;
    }

    if (corrupted) {
        spdlog::info("Destroying container {} after unclean execution", container.id);
        containers_.erase(it);
        removing_++;
        lock.unlock();
        RemoveUnlocked({container.id});
        return;
    }

    it->second.state = ContainerState::IDLE;
    it->second.last_used_at = std::chrono::steady_clock::now();
    lock.unlock();
    slot_changed_.notify_all();
}

// ============================================================================
// EVICTION
// ============================================================================

std::size_t ContainerPool::SweepIdle() {
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        for (auto it = containers_.begin(); it != containers_.end();) {
            if (it->second.state == ContainerState::IDLE &&
                now - it->second.last_used_at > config_.idle_timeout) {
                expired.push_back(it->first);
                it = containers_.erase(it);
            } else {
                ++it;
            }
        }
        removing_ += expired.size();
    }

    if (!expired.empty()) {
        spdlog::info("Evicting {} idle container(s)", expired.size());
        RemoveUnlocked(expired);
    }
    return expired.size();
}

void ContainerPool::DestroyAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : containers_) {
            ids.push_back(id);
        }
        containers_.clear();
        removing_ += ids.size();
    }

    if (!ids.empty()) {
        spdlog::info("Destroying {} pooled container(s)", ids.size());
        RemoveUnlocked(ids, true);
    }
}

PoolStats ContainerPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats stats;
    for (const auto& [id, entry] : containers_) {
        if (entry.state == ContainerState::IDLE) {
            stats.idle++;
        } else if (entry.state == ContainerState::IN_USE) {
            stats.in_use++;
        }
    }
    stats.creating = creating_;
    stats.removing = removing_;
    stats.total_created = total_created_;
    stats.total_reused = total_reused_;
    stats.total_destroyed = total_destroyed_;
    return stats;
}

std::string ContainerPool::ComputeFamilyKey(const runtime::ContainerCreateOptions& options) {
    json fingerprint;
    fingerprint["memory"] = options.memory_limit_bytes ? json(*options.memory_limit_bytes) : json();
    fingerprint["cpus"] = options.cpus ? json(*options.cpus) : json();
    fingerprint["pids"] = options.pids_limit;
    fingerprint["network"] = NetworkModeToString(options.network_mode);
    fingerprint["user"] = options.user ? json(*options.user) : json();
    fingerprint["workdir"] = options.working_dir.string();

    fingerprint["mounts"] = json::array();
    for (const auto& mount : options.mounts) {
        fingerprint["mounts"].push_back({
            {"host", mount.host_path.string()},
            {"target", mount.container_path.string()},
            {"ro", mount.read_only}
        });
    }

    // json objects iterate keys in sorted order, so dump() is canonical
    return options.image + "@" + utils::HashUtils::ComputeSHA256(fingerprint.dump()).substr(0, 16);
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

Result<PooledContainer> ContainerPool::CreateReserved(
    const runtime::ContainerCreateOptions& options,
    const std::string& family_key) {

    auto release_reservation = [this]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            creating_--;
        }
        slot_changed_.notify_all();
    };

    auto created = runtime_->CreateContainer(options);
    if (!created) {
        spdlog::error("Failed to create container for {}: {}", options.image,
                      created.GetError().message);
        release_reservation();
        return Result<PooledContainer>::Failure(created.GetError());
    }

    const std::string& id = created.Value();
    auto started = runtime_->StartContainer(id);
    if (!started) {
        spdlog::error("Failed to start container {}: {}", id, started.GetError().message);
        auto removed = runtime_->RemoveContainer(id, true);
        if (!removed) {
            spdlog::warn("Failed to remove unstarted container {}: {}", id,
                         removed.GetError().message);
        }
        release_reservation();
        return Result<PooledContainer>::Failure(started.GetError());
    }

    auto now = std::chrono::steady_clock::now();

    PooledContainer container;
    container.id = id;
    container.image = options.image;
    container.family_key = family_key;
    container.state = ContainerState::IN_USE;
    container.created_at = now;
    container.last_used_at = now;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        creating_--;
        total_created_++;
        containers_[id] = container;
    }

    spdlog::info("Container {} ready for {}", id, options.image);
    return Result<PooledContainer>::Success(container);
}

void ContainerPool::RemoveUnlocked(const std::vector<std::string>& ids, bool stop_first) {
    for (const auto& id : ids) {
        if (stop_first) {
            auto stopped = runtime_->StopContainer(id, config_.stop_grace);
            if (!stopped) {
                spdlog::debug("Failed to stop container {}: {}", id, stopped.GetError().message);
            }
        }
        auto removed = runtime_->RemoveContainer(id, true);
        if (!removed) {
            spdlog::warn("Failed to remove container {}: {}", id, removed.GetError().message);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        removing_ -= ids.size();
        total_destroyed_ += ids.size();
    }
    slot_changed_.notify_all();
}

std::size_t ContainerPool::LiveCountLocked() const {
    return containers_.size() + creating_ + removing_;
}

void ContainerPool::SweeperLoop() {
    auto interval = std::max(config_.idle_timeout / 2, std::chrono::milliseconds(1));

    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!stop_sweeper_) {
        if (sweeper_cv_.wait_for(lock, interval, [this] { return stop_sweeper_; })) {
            break;
        }
        lock.unlock();
        try {
            SweepIdle();
        } catch (const std::exception& e) {
            spdlog::error("Idle sweep failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace pool
} // namespace warden
