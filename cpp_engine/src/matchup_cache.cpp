/**
 * Tail Glow Battle Engine - Matchup Cache Implementation
 */

#include "matchup_cache.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <sstream>

namespace tailglow {

// ============================================================================
// KEY
// ============================================================================

namespace {

inline void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // anonymous namespace

size_t MatchupKeyHash::operator()(const MatchupKey& key) const {
    size_t seed = std::hash<std::string>{}(key.id_a);
    hash_combine(seed, std::hash<std::string>{}(key.id_b));
    hash_combine(seed, std::hash<int>{}(key.hp_bucket_a));
    hash_combine(seed, std::hash<int>{}(key.hp_bucket_b));
    hash_combine(seed, static_cast<size_t>(key.status_a) | (static_cast<size_t>(key.status_b) << 8));
    hash_combine(seed, static_cast<size_t>(key.toxic_stage_a) | (static_cast<size_t>(key.toxic_stage_b) << 8));
    hash_combine(seed, std::hash<uint32_t>{}(key.boosts_a));
    hash_combine(seed, std::hash<uint32_t>{}(key.boosts_b));
    hash_combine(seed, std::hash<uint32_t>{}(key.field));
    return seed;
}

std::string MatchupKey::to_string() const {
    std::ostringstream ss;
    ss << id_a << "@" << hp_bucket_a << "/" << tailglow::to_string(status_a)
       << " vs " << id_b << "@" << hp_bucket_b << "/" << tailglow::to_string(status_b)
       << " field=" << field;
    return ss.str();
}

int hp_bucket(const Combatant& combatant, int bucket_size) {
    if (!combatant.is_alive()) {
        return -1;
    }
    int size = std::max(1, bucket_size);
    double hp = std::min(100.0, combatant.hp_percent);
    return static_cast<int>(std::floor(hp / size));
}

int toxic_stage(const Combatant& combatant) {
    if (combatant.status != Status::TOXIC) {
        return 0;
    }
    return std::min(MAX_TOXIC_STAGE, std::max(0, combatant.toxic_counter) + 1);
}

double bucket_representative(int bucket, int bucket_size) {
    if (bucket < 0) {
        return 0.0;
    }
    int size = std::max(1, bucket_size);
    return std::min(100.0, bucket * size + size / 2.0);
}

MatchupKey make_matchup_key(const Combatant& a, const Combatant& b,
                            const FieldState& field, int bucket_size) {
    MatchupKey key;
    key.id_a = a.id;
    key.id_b = b.id;
    key.hp_bucket_a = hp_bucket(a, bucket_size);
    key.hp_bucket_b = hp_bucket(b, bucket_size);
    key.status_a = a.status;
    key.status_b = b.status;
    key.toxic_stage_a = toxic_stage(a);
    key.toxic_stage_b = toxic_stage(b);
    key.boosts_a = a.boosts.signature();
    key.boosts_b = b.boosts.signature();
    key.field = field.signature();
    return key;
}

// ============================================================================
// CACHE
// ============================================================================

MatchupCache::MatchupCache(std::string battle_id)
    : battle_id_(std::move(battle_id))
{}

uint64_t MatchupCache::generation(const CombatantID& id) const {
    auto it = generations_.find(id);
    return it != generations_.end() ? it->second : 0;
}

std::optional<MatchupOutcome> MatchupCache::get(const MatchupKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return std::nullopt;
    }
    hits_++;
    return it->second;
}

void MatchupCache::put(const MatchupKey& key, MatchupOutcome outcome) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[key] = std::move(outcome);
}

MatchupOutcome MatchupCache::get_or_compute(const MatchupKey& key, const ComputeFn& compute) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            hits_++;
            return it->second;
        }
    }

    std::promise<MatchupOutcome> promise;
    std::shared_future<MatchupOutcome> pending;
    uint64_t token = 0;
    uint64_t gen_a = 0;
    uint64_t gen_b = 0;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            hits_++;
            return it->second;
        }

        auto flight = in_flight_.find(key);
        if (flight != in_flight_.end()) {
            pending = flight->second.future;
        } else {
            token = ++next_token_;
            in_flight_[key] = InFlight{promise.get_future().share(), token};
            gen_a = generation(key.id_a);
            gen_b = generation(key.id_b);
        }
    }

    // Another caller owns this key
    if (token == 0) {
        shared_waits_++;
        return pending.get();
    }

    misses_++;
    MatchupOutcome outcome;
    try {
        outcome = compute();
    } catch (...) {
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto flight = in_flight_.find(key);
            if (flight != in_flight_.end() && flight->second.token == token) {
                in_flight_.erase(flight);
            }
        }
        promise.set_exception(std::current_exception());
        throw;
    }
    computations_++;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto flight = in_flight_.find(key);
        if (flight != in_flight_.end() && flight->second.token == token) {
            in_flight_.erase(flight);
        }
        if (generation(key.id_a) == gen_a && generation(key.id_b) == gen_b) {
            entries_[key] = outcome;
        } else {
            discarded_++;
        }
    }

    promise.set_value(outcome);
    return outcome;
}

size_t MatchupCache::invalidate(const CombatantID& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.involves(id)) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (it->first.involves(id)) {
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }
    generations_[id]++;
    invalidations_++;
    return removed;
}

void MatchupCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}

size_t MatchupCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

CacheStats MatchupCache::stats() const {
    CacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.computations = computations_.load();
    s.shared_waits = shared_waits_.load();
    s.invalidations = invalidations_.load();
    s.discarded = discarded_.load();
    return s;
}

} // namespace tailglow
