/**
 * Tests for the Matchup Cache
 */

#include <atomic>
#include <future>
#include <thread>
#include "test_fixtures.hpp"

using namespace tailglow;
using namespace tailglow::testing;

namespace {

MatchupOutcome sample_outcome(MatchupResult result, int turns) {
    MatchupOutcome out;
    out.result = result;
    out.turns_to_resolve = turns;
    if (result != MatchupResult::DRAW) {
        out.winner_remaining_hp_percent = 42.0;
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// KEY TESTS
// ============================================================================

TEST(MatchupCache, HpBuckets) {
    Combatant mon = fire_defender();
    mon.hp_percent = 57.0;
    TEST_ASSERT_EQ(11, hp_bucket(mon, 5));
    mon.hp_percent = 100.0;
    TEST_ASSERT_EQ(20, hp_bucket(mon, 5));
    mon.hp_percent = 4.9;
    TEST_ASSERT_EQ(0, hp_bucket(mon, 5));
    mon.fainted = true;
    TEST_ASSERT_EQ(-1, hp_bucket(mon, 5));
}

TEST(MatchupCache, BucketRepresentative) {
    TEST_ASSERT_NEAR(57.5, bucket_representative(11, 5), 1e-9);
    TEST_ASSERT_NEAR(100.0, bucket_representative(20, 5), 1e-9);
    TEST_ASSERT_NEAR(2.5, bucket_representative(0, 5), 1e-9);
    TEST_ASSERT_NEAR(0.0, bucket_representative(-1, 5), 1e-9);
}

TEST(MatchupCache, KeyIgnoresHpWithinBucket) {
    FieldState field;
    Combatant a = ground_attacker();
    Combatant b = fire_defender();

    b.hp_percent = 56.0;
    MatchupKey k1 = make_matchup_key(a, b, field, 5);
    b.hp_percent = 59.9;
    MatchupKey k2 = make_matchup_key(a, b, field, 5);
    TEST_ASSERT_TRUE(k1 == k2);
    TEST_ASSERT_EQ(MatchupKeyHash{}(k1), MatchupKeyHash{}(k2));

    b.hp_percent = 60.0;
    TEST_ASSERT_TRUE(make_matchup_key(a, b, field, 5) != k1);
}

TEST(MatchupCache, KeyTracksStatusBoostsAndField) {
    FieldState field;
    Combatant a = ground_attacker();
    Combatant b = fire_defender();
    MatchupKey base = make_matchup_key(a, b, field, 5);

    Combatant burned = a;
    burned.status = Status::BURN;
    TEST_ASSERT_TRUE(make_matchup_key(burned, b, field, 5) != base);

    Combatant boosted = a;
    boosted.boosts.set(Stat::ATK, 1);
    TEST_ASSERT_TRUE(make_matchup_key(boosted, b, field, 5) != base);

    FieldState screened = field;
    screened.side(THEIR_SIDE).reflect_turns = 5;
    TEST_ASSERT_TRUE(make_matchup_key(a, b, screened, 5) != base);

    FieldState room = field;
    room.trick_room_turns = 3;
    TEST_ASSERT_TRUE(make_matchup_key(a, b, room, 5) != base);

    Combatant toxic_fresh = a;
    toxic_fresh.status = Status::TOXIC;
    Combatant toxic_late = toxic_fresh;
    toxic_late.toxic_counter = 8;
    MatchupKey fresh_key = make_matchup_key(toxic_fresh, b, field, 5);
    TEST_ASSERT_EQ(1, fresh_key.toxic_stage_a);
    TEST_ASSERT_EQ(9, make_matchup_key(toxic_late, b, field, 5).toxic_stage_a);
    TEST_ASSERT_TRUE(make_matchup_key(toxic_late, b, field, 5) != fresh_key);

    // Toxic counters past the cap all tick at the same stage
    Combatant toxic_capped = toxic_fresh;
    toxic_capped.toxic_counter = 20;
    toxic_late.toxic_counter = 30;
    TEST_ASSERT_TRUE(make_matchup_key(toxic_capped, b, field, 5) == make_matchup_key(toxic_late, b, field, 5));

    // A leftover counter without toxic does not split entries
    Combatant stale_counter = a;
    stale_counter.toxic_counter = 4;
    TEST_ASSERT_TRUE(make_matchup_key(stale_counter, b, field, 5) == base);

    // Order matters: (a, b) and (b, a) are different matchups
    TEST_ASSERT_TRUE(make_matchup_key(b, a, field, 5) != base);
}

// ============================================================================
// LOOKUP TESTS
// ============================================================================

TEST(MatchupCache, PutAndGet) {
    MatchupCache cache("battle-1");
    FieldState field;
    MatchupKey key = make_matchup_key(ground_attacker(), fire_defender(), field, 5);

    TEST_ASSERT_FALSE(cache.get(key).has_value());
    cache.put(key, sample_outcome(MatchupResult::A_WINS, 2));

    std::optional<MatchupOutcome> hit = cache.get(key);
    TEST_ASSERT_TRUE(hit.has_value());
    TEST_ASSERT_TRUE(hit->result == MatchupResult::A_WINS);
    TEST_ASSERT_EQ(1u, cache.size());

    // Last writer wins
    cache.put(key, sample_outcome(MatchupResult::DRAW, 4));
    TEST_ASSERT_TRUE(cache.get(key)->result == MatchupResult::DRAW);
    TEST_ASSERT_EQ(1u, cache.size());

    CacheStats stats = cache.stats();
    TEST_ASSERT_EQ(1u, stats.misses);
    TEST_ASSERT_EQ(2u, stats.hits);
    TEST_ASSERT_EQ(std::string("battle-1"), cache.battle_id());
}

TEST(MatchupCache, GetOrComputeRunsOnce) {
    MatchupCache cache("battle-2");
    FieldState field;
    MatchupKey key = make_matchup_key(ground_attacker(), fire_defender(), field, 5);

    int calls = 0;
    auto compute = [&calls]() {
        calls++;
        return sample_outcome(MatchupResult::B_WINS, 3);
    };

    MatchupOutcome first = cache.get_or_compute(key, compute);
    MatchupOutcome second = cache.get_or_compute(key, compute);
    TEST_ASSERT_EQ(1, calls);
    TEST_ASSERT_TRUE(first.result == second.result);
    TEST_ASSERT_EQ(3, second.turns_to_resolve);

    CacheStats stats = cache.stats();
    TEST_ASSERT_EQ(1u, stats.computations);
    TEST_ASSERT_EQ(1u, stats.hits);
}

TEST(MatchupCache, ConcurrentCallersShareOneComputation) {
    MatchupCache cache("battle-3");
    FieldState field;
    MatchupKey key = make_matchup_key(ground_attacker(), fire_defender(), field, 5);

    std::atomic<int> calls{0};
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    auto compute = [&calls, gate]() {
        calls++;
        gate.wait();
        return sample_outcome(MatchupResult::A_WINS, 2);
    };

    const int thread_count = 8;
    std::vector<std::future<MatchupOutcome>> results;
    for (int i = 0; i < thread_count; i++) {
        results.push_back(std::async(std::launch::async, [&cache, &key, &compute]() {
            return cache.get_or_compute(key, compute);
        }));
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    release.set_value();

    for (auto& f : results) {
        MatchupOutcome out = f.get();
        TEST_ASSERT_TRUE(out.result == MatchupResult::A_WINS);
    }

    TEST_ASSERT_EQ(1, calls.load());
    CacheStats stats = cache.stats();
    TEST_ASSERT_EQ(1u, stats.computations);
    TEST_ASSERT_EQ(static_cast<uint64_t>(thread_count - 1), stats.shared_waits + stats.hits);
    TEST_ASSERT_EQ(1u, cache.size());
}

TEST(MatchupCache, ComputeExceptionPropagates) {
    MatchupCache cache("battle-4");
    FieldState field;
    MatchupKey key = make_matchup_key(ground_attacker(), fire_defender(), field, 5);

    bool threw = false;
    try {
        cache.get_or_compute(key, []() -> MatchupOutcome {
            throw std::runtime_error("simulation failed");
        });
    } catch (const std::runtime_error&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_EQ(0u, cache.size());

    // The key is free again for the next caller
    MatchupOutcome out = cache.get_or_compute(key, []() {
        return MatchupOutcome();
    });
    TEST_ASSERT_TRUE(out.result == MatchupResult::UNDETERMINED);
    TEST_ASSERT_EQ(1u, cache.size());
}

// ============================================================================
// INVALIDATION TESTS
// ============================================================================

TEST(MatchupCache, InvalidateRemovesInvolvedEntries) {
    MatchupCache cache("battle-5");
    FieldState field;

    Combatant ours = ground_attacker();
    Combatant foe = fire_defender();
    Combatant other = make_wall("Bystander", THEIR_SIDE, 50);

    cache.put(make_matchup_key(ours, foe, field, 5), sample_outcome(MatchupResult::A_WINS, 2));
    cache.put(make_matchup_key(foe, ours, field, 5), sample_outcome(MatchupResult::B_WINS, 2));
    cache.put(make_matchup_key(ours, other, field, 5), sample_outcome(MatchupResult::DRAW, 1));
    TEST_ASSERT_EQ(3u, cache.size());

    TEST_ASSERT_EQ(2u, cache.invalidate(foe.id));
    TEST_ASSERT_EQ(1u, cache.size());
    TEST_ASSERT_TRUE(cache.get(make_matchup_key(ours, other, field, 5)).has_value());

    TEST_ASSERT_EQ(0u, cache.invalidate("nobody"));
    TEST_ASSERT_EQ(2u, cache.stats().invalidations);
}

TEST(MatchupCache, StaleComputationIsNotStored) {
    MatchupCache cache("battle-6");
    FieldState field;
    Combatant ours = ground_attacker();
    Combatant foe = fire_defender();
    MatchupKey key = make_matchup_key(ours, foe, field, 5);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    std::future<MatchupOutcome> pending = std::async(std::launch::async, [&]() {
        return cache.get_or_compute(key, [&started, gate]() {
            started.set_value();
            gate.wait();
            return sample_outcome(MatchupResult::A_WINS, 2);
        });
    });

    started.get_future().wait();
    cache.invalidate(foe.id);
    release.set_value();

    MatchupOutcome out = pending.get();
    TEST_ASSERT_TRUE(out.result == MatchupResult::A_WINS);
    TEST_ASSERT_EQ(0u, cache.size());
    TEST_ASSERT_EQ(1u, cache.stats().discarded);
}

TEST(MatchupCache, ClearEmptiesCache) {
    MatchupCache cache("battle-7");
    FieldState field;
    cache.put(make_matchup_key(ground_attacker(), fire_defender(), field, 5),
              sample_outcome(MatchupResult::A_WINS, 1));
    cache.clear();
    TEST_ASSERT_EQ(0u, cache.size());
}
