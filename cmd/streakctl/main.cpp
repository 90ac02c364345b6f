#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using streak::factory::Runtime;
namespace util  = streak::util;
namespace model = streak::model;

static void Usage() {
  std::cout << "Usage:\n"
            << "  streakctl <config.yaml> record-action <sender> <receiver> [unix_ms]\n"
            << "  streakctl <config.yaml> approve <user> <habit> <YYYY-MM-DD>\n"
            << "  streakctl <config.yaml> miss <user> <habit> <YYYY-MM-DD>\n"
            << "  streakctl <config.yaml> sweep [as_of=YYYY-MM-DD]\n"
            << "  streakctl <config.yaml> show-pair <user_a> <user_b>\n"
            << "  streakctl <config.yaml> show-profile <user>\n"
            << "  streakctl <config.yaml> list-pairs <user>\n"
            << "  streakctl <config.yaml> stats <user> [as_of=YYYY-MM-DD]\n"
            << "  streakctl <config.yaml> register-user <user>\n"
            << "  streakctl <config.yaml> register-habit <user> <habit> [created_on=YYYY-MM-DD]\n"
            << "  streakctl <config.yaml> deactivate-habit <habit>\n"
            << "  streakctl <config.yaml> record-sends <user> [count]\n";
}

static std::string OrDash(const std::optional<util::TimePoint>& tp) {
  return tp ? util::FormatTimestamp(*tp) : "-";
}

static void PrintProfile(const model::UserScoreProfile& profile) {
  std::cout << "user_id:        " << profile.user_id << "\n"
            << "score:          " << profile.score << "\n"
            << "current_streak: " << profile.current_streak << "\n"
            << "longest_streak: " << profile.longest_streak << "\n";
}

static void PrintDelta(const model::ScoreDelta& delta) {
  std::cout << "points:     " << delta.points << "\n"
            << "new_score:  " << delta.new_score << "\n"
            << "new_streak: " << delta.new_streak << "\n";
}

static int Dispatch(Runtime& rt, const std::string& cmd, int argc, char** argv) {
  const auto today = util::DateOf(rt.clock->Now());

  // ------------------------------------------------------------

  if (cmd == "record-action") {
    if (argc < 5) return 1;
    const auto now    = argc >= 6 ? util::FromUnixMillis(std::stoull(argv[5])) : rt.clock->Now();
    const auto result = rt.streak_engine->RecordAction(argv[3], argv[4], now);

    std::cout << "current_streak: " << result.current_streak << "\n"
              << "longest_streak: " << result.longest_streak << "\n"
              << "increased:      " << (result.increased ? "true" : "false") << "\n";
    return 0;
  }

  if (cmd == "approve") {
    if (argc < 6) return 1;
    PrintDelta(rt.scoring->OnApproval(argv[3], argv[4], util::ParseDate(argv[5])));
    return 0;
  }

  if (cmd == "miss") {
    if (argc < 6) return 1;
    PrintDelta(rt.scoring->OnMiss(argv[3], argv[4], util::ParseDate(argv[5])));
    return 0;
  }

  if (cmd == "sweep") {
    const auto as_of  = argc >= 4 ? util::ParseDate(argv[3]) : today;
    const auto report = rt.sweep->Run(as_of);

    std::cout << "swept_date: " << util::FormatDate(report.swept_date) << "\n"
              << "processed:  " << report.habits_processed << "\n"
              << "penalized:  " << report.penalized << "\n"
              << "skipped:    " << report.skipped << "\n"
              << "failed:     " << report.failed << "\n";
    return report.failed == 0 ? 0 : 2;
  }

  if (cmd == "show-pair") {
    if (argc < 5) return 1;
    auto pair = rt.streak_engine->GetPairStreak(argv[3], argv[4]);
    if (!pair) {
      std::cerr << "no streak between " << argv[3] << " and " << argv[4] << "\n";
      return 3;
    }

    std::cout << "pair:           " << pair->id_a << " / " << pair->id_b << "\n"
              << "current_streak: " << pair->current_streak << "\n"
              << "longest_streak: " << pair->longest_streak << "\n"
              << "last_action_a:  " << OrDash(pair->last_action_a) << "\n"
              << "last_action_b:  " << OrDash(pair->last_action_b) << "\n"
              << "started_at:     " << OrDash(pair->streak_started_at) << "\n"
              << "expires_at:     " << OrDash(pair->streak_expires_at) << "\n"
              << "version:        " << pair->version << "\n";
    return 0;
  }

  if (cmd == "show-profile") {
    if (argc < 4) return 1;
    PrintProfile(rt.scoring->GetUserScoreProfile(argv[3]));
    return 0;
  }

  if (cmd == "list-pairs") {
    if (argc < 4) return 1;
    for (const auto& view : rt.streak_engine->ListPairStreaks(argv[3])) {
      std::cout << view.friend_id << "\tcurrent=" << view.current_streak << "\tlongest=" << view.longest_streak
                << "\texpires=" << OrDash(view.streak_expires_at);
      if (view.expired) std::cout << "\texpired";
      if (view.needs_my_action) std::cout << "\tneeds-my-action";
      if (view.needs_friend_action) std::cout << "\tneeds-friend-action";
      std::cout << "\n";
    }
    return 0;
  }

  if (cmd == "stats") {
    if (argc < 4) return 1;
    const auto as_of = argc >= 5 ? util::ParseDate(argv[4]) : today;
    const auto stats = rt.scoring->GetScoringStats(argv[3], as_of);

    std::cout << "score:          " << stats.score << "\n"
              << "current_streak: " << stats.current_streak << "\n"
              << "longest_streak: " << stats.longest_streak << "\n"
              << "completed_days: " << stats.completed_days << "/" << stats.total_days << "\n"
              << "success_rate:   " << stats.success_rate << "%\n";
    for (const auto& day : stats.recent_days) {
      std::cout << "  " << util::FormatDate(day.date) << " " << day.habit_id << " "
                << (day.completed ? "completed" : "missed") << "\n";
    }
    return 0;
  }

  if (cmd == "register-user") {
    if (argc < 4) return 1;
    PrintProfile(rt.scoring->EnsureProfile(argv[3]));
    return 0;
  }

  if (cmd == "register-habit") {
    if (argc < 5) return 1;
    model::Habit habit;
    habit.user_id    = argv[3];
    habit.habit_id   = argv[4];
    habit.active     = true;
    habit.created_on = argc >= 6 ? util::ParseDate(argv[5]) : today;
    rt.catalog->Register(habit);
    rt.scoring->EnsureProfile(habit.user_id);
    std::cout << "registered " << habit.habit_id << " for " << habit.user_id << "\n";
    return 0;
  }

  if (cmd == "deactivate-habit") {
    if (argc < 4) return 1;
    rt.catalog->SetActive(argv[3], false);
    std::cout << "deactivated " << argv[3] << "\n";
    return 0;
  }

  if (cmd == "record-sends") {
    if (argc < 4) return 1;
    const uint64_t count = argc >= 5 ? std::stoull(argv[4]) : 1;
    std::cout << "snaps_sent: " << rt.tally->RecordSnapsSent(argv[3], count) << "\n";
    return 0;
  }

  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = streak::config::ConfigLoader::LoadFromYaml(config_path);
    streak::observability::InitializeLogging(config);

    auto runtime = streak::factory::BuildRuntime(config);

    const int rc = Dispatch(runtime, cmd, argc, argv);
    if (rc == 1) Usage();
    streak::observability::ShutdownLogging();
    return rc;
  } catch (const streak::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
