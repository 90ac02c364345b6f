#pragma once

namespace streak::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Postgres prepares the same statements with $n placeholders
  (see pg_pool.cpp); keep the column order in sync.
*/

// pair streaks

static constexpr const char* INSERT_PAIR_STREAK =
    "INSERT INTO pair_streaks(id_a,id_b,current_streak,longest_streak,last_action_a_ms,last_action_b_ms,"
    "started_at_ms,expires_at_ms,version)"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id_a,id_b) DO NOTHING;";

static constexpr const char* SELECT_PAIR_STREAK =
    "SELECT id_a,id_b,current_streak,longest_streak,last_action_a_ms,last_action_b_ms,"
    "started_at_ms,expires_at_ms,version"
    " FROM pair_streaks WHERE id_a=? AND id_b=?;";

static constexpr const char* CAS_PAIR_STREAK =
    "UPDATE pair_streaks SET current_streak=?,longest_streak=?,last_action_a_ms=?,last_action_b_ms=?,"
    "started_at_ms=?,expires_at_ms=?,version=version+1"
    " WHERE id_a=? AND id_b=? AND version=?;";

static constexpr const char* SELECT_PAIR_STREAKS_FOR_USER =
    "SELECT id_a,id_b,current_streak,longest_streak,last_action_a_ms,last_action_b_ms,"
    "started_at_ms,expires_at_ms,version"
    " FROM pair_streaks WHERE id_a=? OR id_b=? ORDER BY id_a,id_b;";

// habit ledger

static constexpr const char* UPSERT_COMPLETION =
    "INSERT INTO habit_days(user_id,habit_id,day,completed,snap_count,penalty_applied)"
    " VALUES(?,?,?,1,1,0)"
    " ON CONFLICT(user_id,habit_id,day) DO UPDATE SET"
    " completed=1,"
    " snap_count=habit_days.snap_count+1;";

static constexpr const char* INSERT_MISS =
    "INSERT INTO habit_days(user_id,habit_id,day,completed,snap_count,penalty_applied)"
    " VALUES(?,?,?,0,0,0)"
    " ON CONFLICT(user_id,habit_id,day) DO NOTHING;";

static constexpr const char* SELECT_HABIT_DAY =
    "SELECT user_id,habit_id,day,completed,snap_count,penalty_applied"
    " FROM habit_days WHERE user_id=? AND habit_id=? AND day=?;";

static constexpr const char* SELECT_HABIT_DAYS =
    "SELECT user_id,habit_id,day,completed,snap_count,penalty_applied"
    " FROM habit_days WHERE user_id=? AND habit_id=? AND day>=? AND day<=?"
    " ORDER BY day DESC;";

static constexpr const char* SELECT_USER_HABIT_DAYS =
    "SELECT user_id,habit_id,day,completed,snap_count,penalty_applied"
    " FROM habit_days WHERE user_id=? AND day>=? AND day<=?"
    " ORDER BY day DESC, habit_id;";

static constexpr const char* CLAIM_PENALTY =
    "UPDATE habit_days SET penalty_applied=?"
    " WHERE user_id=? AND habit_id=? AND day=? AND completed=0 AND penalty_applied=0;";

// profiles

static constexpr const char* INSERT_PROFILE =
    "INSERT INTO user_profiles(user_id,score,current_streak,longest_streak,version)"
    " VALUES(?,?,?,?,?)"
    " ON CONFLICT(user_id) DO NOTHING;";

static constexpr const char* SELECT_PROFILE =
    "SELECT user_id,score,current_streak,longest_streak,version"
    " FROM user_profiles WHERE user_id=?;";

static constexpr const char* CAS_PROFILE =
    "UPDATE user_profiles SET score=?,current_streak=?,longest_streak=?,version=version+1"
    " WHERE user_id=? AND version=?;";

// habits

static constexpr const char* UPSERT_HABIT =
    "INSERT INTO habits(habit_id,user_id,active,created_on)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(habit_id) DO UPDATE SET"
    " user_id=excluded.user_id,"
    " active=excluded.active,"
    " created_on=excluded.created_on;";

static constexpr const char* SELECT_HABIT =
    "SELECT habit_id,user_id,active,created_on FROM habits WHERE habit_id=?;";

static constexpr const char* SELECT_ACTIVE_HABITS =
    "SELECT habit_id,user_id,active,created_on FROM habits WHERE active=1"
    " ORDER BY user_id,habit_id;";

// send tally

static constexpr const char* ADD_SNAPS_SENT =
    "INSERT INTO send_tally(user_id,snaps_sent) VALUES(?,?)"
    " ON CONFLICT(user_id) DO UPDATE SET snaps_sent=send_tally.snaps_sent+excluded.snaps_sent;";

static constexpr const char* SELECT_SNAPS_SENT =
    "SELECT snaps_sent FROM send_tally WHERE user_id=?;";

} // namespace streak::db::sql
