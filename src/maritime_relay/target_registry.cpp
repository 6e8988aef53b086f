#include "maritime_relay/target_registry.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace maritime_relay {

Target::Target(Id160 id, Timestamp created_at)
    : id_(id),
      state_(std::make_shared<const State>()),
      last_activity_millis_(to_epoch_millis(created_at)) {}

Target::StatePtr Target::load_state() const {
    return state_.load(std::memory_order_acquire);
}

std::optional<PositionTime> Target::position() const {
    return load_state()->position;
}

bool Target::has_endpoint(std::string_view name) const {
    const StatePtr state = load_state();
    return state->endpoints.find(std::string{name}) != state->endpoints.end();
}

std::vector<std::string> Target::endpoints() const {
    const StatePtr state = load_state();
    std::vector<std::string> list_endpoints(state->endpoints.begin(), state->endpoints.end());
    std::sort(list_endpoints.begin(), list_endpoints.end());
    return list_endpoints;
}

bool Target::is_connected() const noexcept {
    return flag_connected_.load(std::memory_order_acquire);
}

Timestamp Target::last_activity() const noexcept {
    return timestamp_from_millis(last_activity_millis_.load(std::memory_order_relaxed));
}

TargetSnapshot Target::snapshot() const {
    TargetSnapshot snapshot{};
    snapshot.id = id_;
    snapshot.position = position();
    snapshot.endpoints = endpoints();
    snapshot.connected = is_connected();
    snapshot.last_activity = last_activity();
    return snapshot;
}

bool Target::add_endpoint(const std::string& name, Timestamp now) {
    std::scoped_lock lock(writer_mutex_);
    touch(now);
    const StatePtr current = load_state();
    if (current->endpoints.contains(name)) {
        return false;
    }
    auto next = std::make_shared<State>(*current);
    next->endpoints.insert(name);
    state_.store(std::move(next), std::memory_order_release);
    return true;
}

bool Target::remove_endpoint(std::string_view name, Timestamp now) {
    std::scoped_lock lock(writer_mutex_);
    touch(now);
    const StatePtr current = load_state();
    const std::string key{name};
    if (!current->endpoints.contains(key)) {
        return false;
    }
    auto next = std::make_shared<State>(*current);
    next->endpoints.erase(key);
    state_.store(std::move(next), std::memory_order_release);
    return true;
}

void Target::update_position(const PositionTime& position, Timestamp now) {
    std::scoped_lock lock(writer_mutex_);
    touch(now);
    auto next = std::make_shared<State>(*load_state());
    next->position = position;
    state_.store(std::move(next), std::memory_order_release);
}

void Target::set_connected(bool connected, Timestamp now) {
    touch(now);
    flag_connected_.store(connected, std::memory_order_release);
}

void Target::touch(Timestamp now) noexcept {
    last_activity_millis_.store(to_epoch_millis(now), std::memory_order_relaxed);
}

TargetRegistry::TargetRegistry(std::size_t shard_count)
    : logger_(get_logger()) {
    if (shard_count == 0) {
        throw std::invalid_argument("TargetRegistry requires at least one shard");
    }
    list_shards_.reserve(shard_count);
    for (std::size_t index = 0; index < shard_count; ++index) {
        list_shards_.push_back(std::make_unique<Shard>());
    }
    log_event(*logger_, spdlog::level::info, {{"component", "registry"}, {"event", "initialized"}, {"shards", shard_count}});
}

TargetRegistry::Shard& TargetRegistry::shard_for(const Id160& target_id) const {
    return *list_shards_[Id160Hash{}(target_id) % list_shards_.size()];
}

TargetRegistry::TargetPtr TargetRegistry::find_target(const Id160& target_id) const {
    const Shard& shard = shard_for(target_id);
    std::shared_lock lock(shard.mutex);
    const auto iterator_target = shard.map_targets.find(target_id);
    if (iterator_target == shard.map_targets.end()) {
        return nullptr;
    }
    return iterator_target->second;
}

TargetRegistry::TargetPtr TargetRegistry::find_or_create_target(const Id160& target_id) {
    if (TargetPtr existing = find_target(target_id)) {
        return existing;
    }
    Shard& shard = shard_for(target_id);
    std::unique_lock lock(shard.mutex);
    auto [iterator_target, inserted] = shard.map_targets.try_emplace(target_id, nullptr);
    if (inserted) {
        iterator_target->second = std::make_shared<Target>(target_id, now_timestamp());
        log_event(*logger_, spdlog::level::debug,
                  {{"component", "registry"}, {"event", "target_created"}, {"target", target_id.to_string()}});
    }
    return iterator_target->second;
}

bool TargetRegistry::register_endpoint(const Id160& target_id, const std::string& name) {
    const TargetPtr target = find_or_create_target(target_id);
    return target->add_endpoint(name, now_timestamp());
}

bool TargetRegistry::unregister_endpoint(const Id160& target_id, std::string_view name) {
    const TargetPtr target = find_target(target_id);
    if (target == nullptr) {
        return false;
    }
    return target->remove_endpoint(name, now_timestamp());
}

void TargetRegistry::update_position(const Id160& target_id, const PositionTime& position) {
    const TargetPtr target = find_or_create_target(target_id);
    target->update_position(position, now_timestamp());
}

bool TargetRegistry::set_connected(const Id160& target_id, bool connected) {
    const TargetPtr target = connected ? find_or_create_target(target_id) : find_target(target_id);
    if (target == nullptr) {
        return false;
    }
    target->set_connected(connected, now_timestamp());
    return true;
}

bool TargetRegistry::remove(const Id160& target_id) {
    Shard& shard = shard_for(target_id);
    std::unique_lock lock(shard.mutex);
    const bool removed = shard.map_targets.erase(target_id) > 0;
    if (removed) {
        log_event(*logger_, spdlog::level::debug,
                  {{"component", "registry"}, {"event", "target_removed"}, {"target", target_id.to_string()}});
    }
    return removed;
}

std::size_t TargetRegistry::remove_inactive(Timestamp now, Duration timeout) {
    const auto timeout_millis = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
    std::size_t removed_count = 0;
    for (const auto& shard : list_shards_) {
        std::unique_lock lock(shard->mutex);
        removed_count += std::erase_if(shard->map_targets, [&](const auto& entry) {
            const Target& target = *entry.second;
            return !target.is_connected() && now - target.last_activity() > timeout_millis;
        });
    }
    if (removed_count > 0) {
        log_event(*logger_, spdlog::level::info,
                  {{"component", "registry"}, {"event", "inactive_removed"}, {"count", removed_count}});
    }
    return removed_count;
}

std::optional<TargetSnapshot> TargetRegistry::find(const Id160& target_id) const {
    const TargetPtr target = find_target(target_id);
    if (target == nullptr) {
        return std::nullopt;
    }
    return target->snapshot();
}

std::size_t TargetRegistry::size() const {
    std::size_t total = 0;
    for (const auto& shard : list_shards_) {
        std::shared_lock lock(shard->mutex);
        total += shard->map_targets.size();
    }
    return total;
}

void TargetRegistry::for_each_target(const TargetVisitor& visitor) const {
    std::vector<TargetPtr> list_shard_targets;
    for (const auto& shard : list_shards_) {
        list_shard_targets.clear();
        {
            std::shared_lock lock(shard->mutex);
            list_shard_targets.reserve(shard->map_targets.size());
            for (const auto& [target_id, target] : shard->map_targets) {
                list_shard_targets.push_back(target);
            }
        }
        for (const TargetPtr& target : list_shard_targets) {
            const Target::StatePtr state = target->load_state();
            if (state->position.has_value()) {
                visitor(*target, *state->position);
            }
        }
    }
}

}  // namespace maritime_relay
