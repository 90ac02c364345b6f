#pragma once

#include <array>

namespace streak::db::sql {

/*
  Bootstrap DDL, applied with CREATE ... IF NOT EXISTS at startup.

  The CHECK on pair_streaks mirrors the canonicalization done before any
  storage access; it only fires on a programming error.
*/

inline constexpr std::array<const char*, 5> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS pair_streaks ("
    " id_a TEXT NOT NULL, id_b TEXT NOT NULL,"
    " current_streak INTEGER NOT NULL DEFAULT 0, longest_streak INTEGER NOT NULL DEFAULT 0,"
    " last_action_a_ms INTEGER NOT NULL DEFAULT 0, last_action_b_ms INTEGER NOT NULL DEFAULT 0,"
    " started_at_ms INTEGER NOT NULL DEFAULT 0, expires_at_ms INTEGER NOT NULL DEFAULT 0,"
    " version INTEGER NOT NULL DEFAULT 0,"
    " PRIMARY KEY (id_a, id_b), CHECK (id_a < id_b), CHECK (longest_streak >= current_streak));",

    "CREATE TABLE IF NOT EXISTS habit_days ("
    " user_id TEXT NOT NULL, habit_id TEXT NOT NULL, day TEXT NOT NULL,"
    " completed INTEGER NOT NULL DEFAULT 0, snap_count INTEGER NOT NULL DEFAULT 0,"
    " penalty_applied INTEGER NOT NULL DEFAULT 0 CHECK (penalty_applied BETWEEN 0 AND 3),"
    " PRIMARY KEY (user_id, habit_id, day));",

    "CREATE TABLE IF NOT EXISTS user_profiles ("
    " user_id TEXT PRIMARY KEY, score INTEGER NOT NULL DEFAULT 0 CHECK (score >= 0),"
    " current_streak INTEGER NOT NULL DEFAULT 0, longest_streak INTEGER NOT NULL DEFAULT 0,"
    " version INTEGER NOT NULL DEFAULT 0);",

    "CREATE TABLE IF NOT EXISTS habits ("
    " habit_id TEXT PRIMARY KEY, user_id TEXT NOT NULL, active INTEGER NOT NULL DEFAULT 1,"
    " created_on TEXT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS send_tally ("
    " user_id TEXT PRIMARY KEY, snaps_sent INTEGER NOT NULL DEFAULT 0);"};

inline constexpr std::array<const char*, 5> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS pair_streaks ("
    " id_a TEXT NOT NULL, id_b TEXT NOT NULL,"
    " current_streak INTEGER NOT NULL DEFAULT 0, longest_streak INTEGER NOT NULL DEFAULT 0,"
    " last_action_a_ms BIGINT NOT NULL DEFAULT 0, last_action_b_ms BIGINT NOT NULL DEFAULT 0,"
    " started_at_ms BIGINT NOT NULL DEFAULT 0, expires_at_ms BIGINT NOT NULL DEFAULT 0,"
    " version BIGINT NOT NULL DEFAULT 0,"
    " PRIMARY KEY (id_a, id_b), CHECK (id_a < id_b), CHECK (longest_streak >= current_streak));",

    "CREATE TABLE IF NOT EXISTS habit_days ("
    " user_id TEXT NOT NULL, habit_id TEXT NOT NULL, day TEXT NOT NULL,"
    " completed BOOLEAN NOT NULL DEFAULT FALSE, snap_count INTEGER NOT NULL DEFAULT 0,"
    " penalty_applied SMALLINT NOT NULL DEFAULT 0 CHECK (penalty_applied BETWEEN 0 AND 3),"
    " PRIMARY KEY (user_id, habit_id, day));",

    "CREATE TABLE IF NOT EXISTS user_profiles ("
    " user_id TEXT PRIMARY KEY, score BIGINT NOT NULL DEFAULT 0 CHECK (score >= 0),"
    " current_streak INTEGER NOT NULL DEFAULT 0, longest_streak INTEGER NOT NULL DEFAULT 0,"
    " version BIGINT NOT NULL DEFAULT 0);",

    "CREATE TABLE IF NOT EXISTS habits ("
    " habit_id TEXT PRIMARY KEY, user_id TEXT NOT NULL, active BOOLEAN NOT NULL DEFAULT TRUE,"
    " created_on TEXT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS send_tally ("
    " user_id TEXT PRIMARY KEY, snaps_sent BIGINT NOT NULL DEFAULT 0);"};

} // namespace streak::db::sql
