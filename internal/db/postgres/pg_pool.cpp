#include "pg_pool.hpp"

namespace streak::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // pair streaks

  conn.prepare("insert_pair_streak",
               "INSERT INTO pair_streaks(id_a,id_b,current_streak,longest_streak,last_action_a_ms,last_action_b_ms,"
               "started_at_ms,expires_at_ms,version) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) "
               "ON CONFLICT(id_a,id_b) DO NOTHING");

  conn.prepare("get_pair_streak",
               "SELECT id_a,id_b,current_streak,longest_streak,last_action_a_ms,last_action_b_ms,"
               "started_at_ms,expires_at_ms,version "
               "FROM pair_streaks WHERE id_a=$1 AND id_b=$2");

  conn.prepare("cas_pair_streak",
               "UPDATE pair_streaks SET current_streak=$1,longest_streak=$2,last_action_a_ms=$3,last_action_b_ms=$4,"
               "started_at_ms=$5,expires_at_ms=$6,version=version+1 "
               "WHERE id_a=$7 AND id_b=$8 AND version=$9");

  conn.prepare("list_pair_streaks_for_user",
               "SELECT id_a,id_b,current_streak,longest_streak,last_action_a_ms,last_action_b_ms,"
               "started_at_ms,expires_at_ms,version "
               "FROM pair_streaks WHERE id_a=$1 OR id_b=$1 ORDER BY id_a,id_b");

  // habit ledger

  conn.prepare("upsert_completion",
               "INSERT INTO habit_days(user_id,habit_id,day,completed,snap_count,penalty_applied) "
               "VALUES($1,$2,$3,TRUE,1,0) "
               "ON CONFLICT(user_id,habit_id,day) DO UPDATE SET completed=TRUE,snap_count=habit_days.snap_count+1");

  conn.prepare("insert_miss",
               "INSERT INTO habit_days(user_id,habit_id,day,completed,snap_count,penalty_applied) "
               "VALUES($1,$2,$3,FALSE,0,0) "
               "ON CONFLICT(user_id,habit_id,day) DO NOTHING");

  conn.prepare("get_habit_day",
               "SELECT user_id,habit_id,day,completed,snap_count,penalty_applied "
               "FROM habit_days WHERE user_id=$1 AND habit_id=$2 AND day=$3");

  conn.prepare("list_habit_days",
               "SELECT user_id,habit_id,day,completed,snap_count,penalty_applied "
               "FROM habit_days WHERE user_id=$1 AND habit_id=$2 AND day>=$3 AND day<=$4 ORDER BY day DESC");

  conn.prepare("list_user_habit_days",
               "SELECT user_id,habit_id,day,completed,snap_count,penalty_applied "
               "FROM habit_days WHERE user_id=$1 AND day>=$2 AND day<=$3 ORDER BY day DESC, habit_id");

  conn.prepare("claim_penalty",
               "UPDATE habit_days SET penalty_applied=$1 "
               "WHERE user_id=$2 AND habit_id=$3 AND day=$4 AND completed=FALSE AND penalty_applied=0");

  // profiles

  conn.prepare("insert_profile",
               "INSERT INTO user_profiles(user_id,score,current_streak,longest_streak,version) "
               "VALUES($1,$2,$3,$4,$5) ON CONFLICT(user_id) DO NOTHING");

  conn.prepare("get_profile",
               "SELECT user_id,score,current_streak,longest_streak,version FROM user_profiles WHERE user_id=$1");

  conn.prepare("cas_profile",
               "UPDATE user_profiles SET score=$1,current_streak=$2,longest_streak=$3,version=version+1 "
               "WHERE user_id=$4 AND version=$5");

  // habits

  conn.prepare("upsert_habit",
               "INSERT INTO habits(habit_id,user_id,active,created_on) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(habit_id) DO UPDATE SET user_id=EXCLUDED.user_id,active=EXCLUDED.active,"
               "created_on=EXCLUDED.created_on");

  conn.prepare("get_habit", "SELECT habit_id,user_id,active,created_on FROM habits WHERE habit_id=$1");

  conn.prepare("list_active_habits",
               "SELECT habit_id,user_id,active,created_on FROM habits WHERE active ORDER BY user_id,habit_id");

  // send tally

  conn.prepare("add_snaps_sent",
               "INSERT INTO send_tally(user_id,snaps_sent) VALUES($1,$2) "
               "ON CONFLICT(user_id) DO UPDATE SET snaps_sent=send_tally.snaps_sent+EXCLUDED.snaps_sent");

  conn.prepare("get_snaps_sent", "SELECT snaps_sent FROM send_tally WHERE user_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace streak::db::postgres
