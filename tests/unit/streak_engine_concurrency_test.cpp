#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "hooked_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/pair/streak_engine.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using streak::db::memory::MemoryRepository;
using streak::pair::EngineOptions;
using streak::pair::PairStreakStore;
using streak::pair::StreakEngine;
using streak::testing::HookedRepository;
using streak::util::Deadline;
using streak::util::ManualClock;
using streak::util::TimePoint;

const TimePoint kT0 = streak::util::FromUnixMillis(1'700'000'000'000ULL);

StreakEngine MakeEngine(std::shared_ptr<streak::db::Repository> repo, EngineOptions options = {}) {
  return StreakEngine(std::make_shared<PairStreakStore>(std::move(repo)), std::make_shared<ManualClock>(kT0), options);
}

void TestOppositeActionsIncrementExactlyOnce() {
  constexpr int kPairs = 64;

  auto repo   = std::make_shared<MemoryRepository>();
  auto engine = MakeEngine(repo);

  for (int i = 0; i < kPairs; ++i) {
    const auto a = "a" + std::to_string(i);
    const auto b = "b" + std::to_string(i);

    std::atomic<bool> go{false};
    std::atomic<int>  increments{0};

    // both stamped inside the window, microseconds apart
    std::thread forward([&] {
      while (!go) std::this_thread::yield();
      if (engine.RecordAction(a, b, kT0).increased) ++increments;
    });
    std::thread backward([&] {
      while (!go) std::this_thread::yield();
      if (engine.RecordAction(b, a, kT0 + std::chrono::microseconds(i)).increased) ++increments;
    });

    go = true;
    forward.join();
    backward.join();

    assert(increments == 1);

    auto stored = engine.GetPairStreak(a, b);
    assert(stored.has_value());
    assert(stored->current_streak == 1);
    assert(stored->longest_streak == 1);
    assert(!stored->last_action_a.has_value());
    assert(!stored->last_action_b.has_value());
  }
}

void TestManyConcurrentSendersKeepInvariant() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto engine = MakeEngine(repo, EngineOptions{.pair_window = 24h, .max_attempts = 1000});

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&engine, t] {
      const bool forward = t % 2 == 0;
      for (int i = 0; i < 20; ++i) {
        const auto now    = kT0 + std::chrono::minutes(t * 20 + i);
        const auto result = forward ? engine.RecordAction("x", "y", now) : engine.RecordAction("y", "x", now);
        assert(result.longest_streak >= result.current_streak);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  auto stored = engine.GetPairStreak("x", "y");
  assert(stored.has_value());
  assert(stored->longest_streak >= stored->current_streak);
  assert(stored->current_streak >= 1);
  // every successful write bumps the version once: 1 + 160 actions
  assert(stored->version == 161);
}

void TestInjectedConflictsAreRetried() {
  auto repo   = std::make_shared<HookedRepository>();
  auto engine = MakeEngine(repo, EngineOptions{.pair_window = 24h, .max_attempts = 5});

  repo->FailPairCas(4);
  auto result = engine.RecordAction("alice", "bob", kT0);
  assert(!result.increased);
  assert(repo->PairCasCalls() == 5);

  auto stored = engine.GetPairStreak("alice", "bob");
  assert(stored->version == 2);
  assert(stored->last_action_a == kT0);
}

void TestExhaustedRetriesRaiseConflict() {
  auto repo   = std::make_shared<HookedRepository>();
  auto engine = MakeEngine(repo, EngineOptions{.pair_window = 24h, .max_attempts = 3});

  repo->FailPairCas(-1);
  bool threw = false;
  try {
    engine.RecordAction("alice", "bob", kT0);
  } catch (const streak::util::ConcurrentUpdateConflict&) {
    threw = true;
  }
  assert(threw);
  assert(repo->PairCasCalls() == 3);

  // the zero row exists, the action did not land
  auto stored = engine.GetPairStreak("alice", "bob");
  assert(stored.has_value());
  assert(stored->version == 1);
  assert(!stored->last_action_a.has_value());
}

void TestExpiredDeadlineRaisesTimeout() {
  auto repo   = std::make_shared<HookedRepository>();
  auto engine = MakeEngine(repo);

  bool threw = false;
  try {
    engine.RecordAction("alice", "bob", kT0, Deadline::At(Deadline::SteadyClock::now() - 1ms));
  } catch (const streak::util::Timeout&) {
    threw = true;
  }
  assert(threw);
  assert(repo->PairCasCalls() == 0);
}

void TestDeadlineStopsRetryLoop() {
  auto repo   = std::make_shared<HookedRepository>();
  auto engine = MakeEngine(repo, EngineOptions{.pair_window = 24h, .max_attempts = 1000});

  repo->FailPairCas(-1);
  repo->DelayPairCas(10ms);

  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    engine.RecordAction("alice", "bob", kT0, Deadline::After(50ms));
  } catch (const streak::util::Timeout&) {
    threw = true;
  }
  assert(threw);
  assert(repo->PairCasCalls() < 1000);
  assert(std::chrono::steady_clock::now() - started < 5s);
}

void TestInvalidPairIsNotRetried() {
  auto repo   = std::make_shared<HookedRepository>();
  auto engine = MakeEngine(repo);

  bool threw = false;
  try {
    engine.RecordAction("", "bob", kT0);
  } catch (const streak::util::InvalidPair&) {
    threw = true;
  }
  assert(threw);
  assert(repo->PairCasCalls() == 0);
}

} // namespace

int main() {
  TestOppositeActionsIncrementExactlyOnce();
  TestManyConcurrentSendersKeepInvariant();
  TestInjectedConflictsAreRetried();
  TestExhaustedRetriesRaiseConflict();
  TestExpiredDeadlineRaisesTimeout();
  TestDeadlineStopsRetryLoop();
  TestInvalidPairIsNotRetried();

  std::cout << "streak_engine_unit_concurrency: pass\n";
  return 0;
}
