#include "internal/pair/streak_engine.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using streak::db::memory::MemoryRepository;
using streak::model::PairState;
using streak::model::PairStreak;
using streak::pair::PairStreakStore;
using streak::pair::StreakEngine;
using streak::util::ManualClock;
using streak::util::TimePoint;

const TimePoint kT0 = streak::util::FromUnixMillis(1'700'000'000'000ULL);

struct Fixture {
  std::shared_ptr<MemoryRepository> repo   = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock  = std::make_shared<ManualClock>(kT0);
  std::shared_ptr<StreakEngine>     engine = std::make_shared<StreakEngine>(std::make_shared<PairStreakStore>(repo), clock);
};

void TestEndToEndScenario() {
  Fixture f;

  auto first = f.engine->RecordAction("alice", "bob", kT0);
  assert(!first.increased);
  assert(first.current_streak == 0);

  auto reply = f.engine->RecordAction("bob", "alice", kT0 + 1h);
  assert(reply.increased);
  assert(reply.current_streak == 1);
  assert(reply.longest_streak == 1);

  auto stored = f.engine->GetPairStreak("alice", "bob");
  assert(stored.has_value());
  assert(!stored->last_action_a.has_value());
  assert(!stored->last_action_b.has_value());
  assert(stored->streak_started_at == kT0 + 1h);
  assert(stored->streak_expires_at == kT0 + 25h);

  auto late = f.engine->RecordAction("alice", "bob", kT0 + 26h);
  assert(!late.increased);
  assert(late.current_streak == 0);
  assert(late.longest_streak == 1);

  stored = f.engine->GetPairStreak("bob", "alice");
  assert(stored.has_value());
  assert(!stored->streak_started_at.has_value());
  assert(stored->last_action_a == kT0 + 26h);
  assert(!stored->last_action_b.has_value());
  assert(stored->streak_expires_at == kT0 + 50h);
}

void TestStreakGrowsAcrossCycles() {
  Fixture f;
  auto    now = kT0;

  for (uint32_t cycle = 1; cycle <= 5; ++cycle) {
    auto a = f.engine->RecordAction("alice", "bob", now);
    assert(a.longest_streak >= a.current_streak);
    auto b = f.engine->RecordAction("bob", "alice", now + 2h);
    assert(b.increased);
    assert(b.current_streak == cycle);
    assert(b.longest_streak >= b.current_streak);
    now += 20h;
  }

  auto stored = f.engine->GetPairStreak("alice", "bob");
  assert(stored->streak_started_at == kT0 + 2h);
}

void TestRepeatedSameSideActionDoesNotIncrement() {
  Fixture f;

  f.engine->RecordAction("alice", "bob", kT0);
  auto again = f.engine->RecordAction("alice", "bob", kT0 + 3h);
  assert(!again.increased);
  assert(again.current_streak == 0);

  auto stored = f.engine->GetPairStreak("alice", "bob");
  assert(stored->last_action_a == kT0 + 3h);
  assert(stored->streak_expires_at == kT0 + 27h);
}

void TestOtherSideOutsideWindowDoesNotCount() {
  PairStreak current;
  current.id_a              = "alice";
  current.id_b              = "bob";
  current.current_streak    = 3;
  current.longest_streak    = 4;
  current.last_action_a     = kT0;
  current.streak_expires_at = kT0 + 48h;
  current.version           = 7;

  const auto t = StreakEngine::Apply(current, false, kT0 + 25h, 24h);
  assert(t.state == PairState::kOneSided);
  assert(!t.increased);
  assert(t.next.current_streak == 3);
  assert(t.next.last_action_b == kT0 + 25h);
  assert(t.next.version == 7);
}

void TestOtherSideWindowRule() {
  using streak::model::OtherSideCounts;

  assert(!OtherSideCounts(std::nullopt, kT0, 24h));
  assert(OtherSideCounts(kT0 - 24h, kT0, 24h));
  assert(!OtherSideCounts(kT0 - 24h - 1ms, kT0, 24h));
  // stamped after `now` by a concurrent caller
  assert(OtherSideCounts(kT0 + 5ms, kT0, 24h));

  PairStreak current;
  current.id_a              = "alice";
  current.id_b              = "bob";
  current.last_action_a     = kT0 + 5ms;
  current.streak_expires_at = kT0 + 24h;

  const auto t = StreakEngine::Apply(current, false, kT0, 24h);
  assert(t.increased);
  assert(t.state == PairState::kBothActed);
  assert(t.next.current_streak == 1);
  assert(!t.next.last_action_a.has_value());
  assert(!t.next.last_action_b.has_value());
}

void TestExpiryBoundaryIsStrict() {
  PairStreak current;
  current.id_a              = "alice";
  current.id_b              = "bob";
  current.current_streak    = 2;
  current.longest_streak    = 2;
  current.last_action_a     = kT0;
  current.streak_expires_at = kT0 + 24h;

  // exactly at expiry: still in time
  const auto on_time = StreakEngine::Apply(current, false, kT0 + 24h, 24h);
  assert(on_time.increased);
  assert(on_time.next.current_streak == 3);

  const auto late = StreakEngine::Apply(current, false, kT0 + 24h + 1ms, 24h);
  assert(late.state == PairState::kExpired);
  assert(late.next.current_streak == 0);
  assert(late.next.longest_streak == 2);
  assert(!late.next.last_action_a.has_value());
  assert(late.next.last_action_b == kT0 + 24h + 1ms);

  assert(streak::model::Classify(current, kT0 + 1h) == PairState::kOneSided);
  assert(streak::model::Classify(current, kT0 + 25h) == PairState::kExpired);
}

void TestListPairStreaksView() {
  Fixture f;

  // carol: one increment with alice
  f.engine->RecordAction("alice", "carol", kT0);
  f.engine->RecordAction("carol", "alice", kT0 + 1h);

  // bob acted, alice has not
  f.engine->RecordAction("bob", "alice", kT0 + 2h);

  // dave: alice acted long ago, now expired
  f.engine->RecordAction("alice", "dave", kT0 - 48h);

  const auto views = f.engine->ListPairStreaks("alice", kT0 + 3h);
  assert(views.size() == 3);

  assert(views[0].friend_id == "carol");
  assert(views[0].current_streak == 1);
  assert(views[0].is_active);
  assert(!views[0].needs_my_action && !views[0].needs_friend_action);

  assert(views[1].friend_id == "bob");
  assert(views[1].needs_my_action);
  assert(!views[1].needs_friend_action);
  assert(views[1].friend_last_action == kT0 + 2h);

  assert(views[2].friend_id == "dave");
  assert(views[2].expired);
  assert(!views[2].needs_friend_action);

  const auto bobs = f.engine->ListPairStreaks("bob", kT0 + 3h);
  assert(bobs.size() == 1);
  assert(bobs[0].friend_id == "alice");
  assert(bobs[0].needs_friend_action);
}

void TestClockOverloadUsesInjectedClock() {
  Fixture f;
  f.engine->RecordAction("alice", "bob");
  f.clock->Advance(30min);
  auto reply = f.engine->RecordAction("bob", "alice");
  assert(reply.increased);

  auto stored = f.engine->GetPairStreak("alice", "bob");
  assert(stored->streak_expires_at == kT0 + 30min + 24h);
}

void TestInvalidPairIsRejectedBeforeStorage() {
  Fixture f;

  bool threw = false;
  try {
    f.engine->RecordAction("alice", "alice", kT0);
  } catch (const streak::util::InvalidPair&) {
    threw = true;
  }
  assert(threw);
  assert(f.engine->ListPairStreaks("alice", kT0).empty());
  assert(!f.engine->GetPairStreak("alice", "bob").has_value());
}

} // namespace

int main() {
  TestEndToEndScenario();
  TestStreakGrowsAcrossCycles();
  TestRepeatedSameSideActionDoesNotIncrement();
  TestOtherSideOutsideWindowDoesNotCount();
  TestOtherSideWindowRule();
  TestExpiryBoundaryIsStrict();
  TestListPairStreaksView();
  TestClockOverloadUsesInjectedClock();
  TestInvalidPairIsRejectedBeforeStorage();

  std::cout << "streak_engine_unit_streak_engine: pass\n";
  return 0;
}
