/**
 * Tail Glow Battle Engine - Matchup Cache
 *
 * Battle-scoped memo of MatchupOutcome keyed by the relevant state of both
 * combatants. Staleness is handled by key mismatch: any change in HP
 * bucket, status, boosts or field yields a different key, so old entries
 * are simply never looked up again. Toxic stage is part of the key because
 * the simulator escalates toxic damage from it.
 *
 * Thread safety:
 * - The map is guarded by a shared_mutex (many readers, one writer)
 * - get_or_compute() tracks in-flight computations per key; a second
 *   caller for the same key waits on the first caller's result instead of
 *   recomputing it
 * - invalidate() bumps a per-combatant generation so a computation that
 *   started before the invalidation is returned but not inserted
 */

#pragma once

#include "types.hpp"
#include "combatant.hpp"
#include "field_state.hpp"
#include "matchup_simulator.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <shared_mutex>
#include <unordered_map>

namespace tailglow {

// ============================================================================
// KEY
// ============================================================================

struct MatchupKey {
    CombatantID id_a;
    CombatantID id_b;
    int hp_bucket_a = 0;
    int hp_bucket_b = 0;
    Status status_a = Status::NONE;
    Status status_b = Status::NONE;
    int toxic_stage_a = 0;             // 0 unless badly poisoned
    int toxic_stage_b = 0;
    uint32_t boosts_a = 0;
    uint32_t boosts_b = 0;
    uint32_t field = 0;

    bool operator==(const MatchupKey& other) const {
        return id_a == other.id_a && id_b == other.id_b &&
               hp_bucket_a == other.hp_bucket_a && hp_bucket_b == other.hp_bucket_b &&
               status_a == other.status_a && status_b == other.status_b &&
               toxic_stage_a == other.toxic_stage_a && toxic_stage_b == other.toxic_stage_b &&
               boosts_a == other.boosts_a && boosts_b == other.boosts_b &&
               field == other.field;
    }
    bool operator!=(const MatchupKey& other) const { return !(*this == other); }

    bool involves(const CombatantID& id) const { return id_a == id || id_b == id; }

    std::string to_string() const;
};

struct MatchupKeyHash {
    size_t operator()(const MatchupKey& key) const;
};

/**
 * floor(hp_percent / bucket_size); -1 for a fainted combatant.
 */
int hp_bucket(const Combatant& combatant, int bucket_size);

/**
 * Stage the next toxic tick is computed from (1..15), 0 when not badly poisoned.
 */
int toxic_stage(const Combatant& combatant);

/**
 * HP percent that stands for a whole bucket when simulating (bucket midpoint).
 */
double bucket_representative(int bucket, int bucket_size);

MatchupKey make_matchup_key(const Combatant& a, const Combatant& b,
                            const FieldState& field, int bucket_size);

// ============================================================================
// CACHE
// ============================================================================

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t computations = 0;
    uint64_t shared_waits = 0;       // Callers that joined an in-flight computation
    uint64_t invalidations = 0;
    uint64_t discarded = 0;          // Results dropped because of an invalidation
};

class MatchupCache {
public:
    using ComputeFn = std::function<MatchupOutcome()>;

    explicit MatchupCache(std::string battle_id);
    ~MatchupCache() = default;

    MatchupCache(const MatchupCache&) = delete;
    MatchupCache& operator=(const MatchupCache&) = delete;

    std::optional<MatchupOutcome> get(const MatchupKey& key) const;

    /**
     * Insert or overwrite (last writer wins).
     */
    void put(const MatchupKey& key, MatchupOutcome outcome);

    /**
     * Read-through lookup. On a miss, runs compute exactly once per key
     * across concurrent callers. Exceptions from compute propagate to every
     * waiting caller.
     */
    MatchupOutcome get_or_compute(const MatchupKey& key, const ComputeFn& compute);

    /**
     * Drop every entry involving the combatant.
     *
     * @return number of entries removed
     */
    size_t invalidate(const CombatantID& id);

    void clear();
    size_t size() const;
    CacheStats stats() const;
    const std::string& battle_id() const { return battle_id_; }

private:
    struct InFlight {
        std::shared_future<MatchupOutcome> future;
        uint64_t token = 0;
    };

    std::string battle_id_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<MatchupKey, MatchupOutcome, MatchupKeyHash> entries_;
    std::unordered_map<MatchupKey, InFlight, MatchupKeyHash> in_flight_;
    std::unordered_map<CombatantID, uint64_t> generations_;
    uint64_t next_token_ = 0;

    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> computations_{0};
    std::atomic<uint64_t> shared_waits_{0};
    std::atomic<uint64_t> invalidations_{0};
    std::atomic<uint64_t> discarded_{0};

    // Caller must hold mutex_
    uint64_t generation(const CombatantID& id) const;
};

} // namespace tailglow
