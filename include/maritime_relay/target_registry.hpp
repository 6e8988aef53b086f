// === Target Registry =========================================================
//
// Concurrent store of every target (vessel or other participant) the relay
// knows about: its last reported position, the endpoints it advertises, and
// whether it is currently connected.
//
// The registry is split into independently locked shards so that position
// reports for different targets rarely contend. Each target publishes its
// position and endpoint set as one immutable state object swapped atomically,
// so readers never take a lock on the target and never observe a half-applied
// update. Scans copy one shard's membership at a time; they are weakly
// consistent and never stop writers.

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "maritime_relay/id160.hpp"
#include "maritime_relay/logging.hpp"
#include "maritime_relay/position.hpp"
#include "maritime_relay/types.hpp"

namespace maritime_relay {

/** @brief Read-only copy of a target's state at one instant. */
struct TargetSnapshot final {
    Id160 id{};                                /**< Target identifier. */
    std::optional<PositionTime> position{};    /**< Last reported fix, absent until the first report. */
    std::vector<std::string> endpoints{};      /**< Advertised endpoint names, sorted. */
    bool connected{};                          /**< Cached connectivity flag. */
    Timestamp last_activity{};                 /**< Wall-clock time of the last mutation. */
};

/**
 * @brief A tracked participant. Only TargetRegistry mutates targets; everyone
 *        else sees them through const references or snapshots.
 */
class Target final {
  public:
    Target(Id160 id, Timestamp created_at);

    Target(const Target&) = delete;
    Target& operator=(const Target&) = delete;

    [[nodiscard]] const Id160& id() const noexcept { return id_; }
    [[nodiscard]] std::optional<PositionTime> position() const;
    [[nodiscard]] bool has_endpoint(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> endpoints() const;
    [[nodiscard]] bool is_connected() const noexcept;
    [[nodiscard]] Timestamp last_activity() const noexcept;
    [[nodiscard]] TargetSnapshot snapshot() const;

  private:
    friend class TargetRegistry;

    /** @brief Immutable state published as a unit. */
    struct State final {
        std::optional<PositionTime> position{};
        std::unordered_set<std::string> endpoints{};
    };
    using StatePtr = std::shared_ptr<const State>;

    [[nodiscard]] StatePtr load_state() const;
    bool add_endpoint(const std::string& name, Timestamp now);
    bool remove_endpoint(std::string_view name, Timestamp now);
    void update_position(const PositionTime& position, Timestamp now);
    void set_connected(bool connected, Timestamp now);
    void touch(Timestamp now) noexcept;

    const Id160 id_;
    std::mutex writer_mutex_;                  /**< Serializes copy-on-write updates of state_. */
    std::atomic<StatePtr> state_;
    std::atomic<bool> flag_connected_{false};
    std::atomic<std::int64_t> last_activity_millis_;
};

using TargetVisitor = std::function<void(const Target&, const PositionTime&)>;

class TargetRegistry final {
  public:
    static constexpr std::size_t k_default_shard_count{16};

    explicit TargetRegistry(std::size_t shard_count = k_default_shard_count);

    TargetRegistry(const TargetRegistry&) = delete;
    TargetRegistry& operator=(const TargetRegistry&) = delete;

    /** @brief Add @p name to the target's endpoints, creating the target on first contact. Returns false if already present. */
    bool register_endpoint(const Id160& target_id, const std::string& name);
    /** @brief Remove @p name from the target's endpoints. Returns false if it was not registered. */
    bool unregister_endpoint(const Id160& target_id, std::string_view name);
    /** @brief Replace the target's position as one atomic update, creating the target on first contact. */
    void update_position(const Id160& target_id, const PositionTime& position);
    /** @brief Update the cached connectivity flag; connecting creates unknown targets. Returns false for a disconnect of an unknown target. */
    bool set_connected(const Id160& target_id, bool connected);
    /** @brief Purge a target and all its endpoint registrations. */
    bool remove(const Id160& target_id);
    /** @brief Purge disconnected targets idle for longer than @p timeout; returns the number removed. */
    std::size_t remove_inactive(Timestamp now, Duration timeout);

    [[nodiscard]] std::optional<TargetSnapshot> find(const Id160& target_id) const;
    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Visit every target that has reported a position.
     *
     * Weakly consistent: each shard is snapshotted under its own lock, which is
     * released before the visitor runs. Concurrent changes may or may not show.
     */
    void for_each_target(const TargetVisitor& visitor) const;

  private:
    using TargetPtr = std::shared_ptr<Target>;

    struct Shard final {
        mutable std::shared_mutex mutex;
        std::unordered_map<Id160, TargetPtr, Id160Hash> map_targets;
    };

    [[nodiscard]] Shard& shard_for(const Id160& target_id) const;
    [[nodiscard]] TargetPtr find_target(const Id160& target_id) const;
    TargetPtr find_or_create_target(const Id160& target_id);

    std::vector<std::unique_ptr<Shard>> list_shards_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace maritime_relay
