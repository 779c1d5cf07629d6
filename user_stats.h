/*
 * FILE: user_stats.h
 *
 * WHAT:
 * Per-user game statistics: counters plus a bounded history of finished
 * games, optionally persisted to a JSON file.
 *
 * WHY:
 * Players are identified by an opaque id chosen by the client; the engine
 * never authenticates it. Stats are a convenience, so a missing or damaged
 * stats file degrades to an empty table instead of stopping the server.
 */

#pragma once
#ifndef USER_STATS_H
#define USER_STATS_H
#include "semantle_types.h"
#include "engine_errors.h"

/*
 * CONSTANTS: History Limits
 *
 * - MAX_GAMES_HISTORY: records kept per user; the oldest are dropped.
 * - RECENT_GAMES_REPORTED: records returned by `user_stats_get`.
 * - MAX_USER_ID_LENGTH: longest accepted user id.
 */
const int MAX_GAMES_HISTORY = 100;
const int RECENT_GAMES_REPORTED = 20;
const int MAX_USER_ID_LENGTH = 128;

/*
 * STRUCT: game_record_t
 *
 * WHAT:
 * One finished (or abandoned) game as reported by the client.
 * `date` is the UTC time the record was saved, "YYYY-MM-DDTHH:MM:SSZ".
 */
typedef struct _game_record
{
    char session_id[SESSION_ID_LENGTH + 1];
    char target_word[MAX_WORD_LENGTH + 1];
    int attempts;
    bool completed;
    bool daily_word;
    char date[ISO_TIMESTAMP_LENGTH + 1];
} game_record_t;

/*
 * STRUCT: user_stats_entry_t
 *
 * FIELD DOMAIN VALUES:
 * - total_games: every recorded game.
 * - completed_games / total_attempts: completed games only, so that
 *   total_attempts / completed_games is the average solve length.
 * - p_history: oldest first, at most MAX_GAMES_HISTORY records.
 */
typedef struct _user_stats_entry
{
    char user_id[MAX_USER_ID_LENGTH + 1];
    int total_games;
    int completed_games;
    int total_attempts;
    game_record_t* p_history;
    int history_count;
} user_stats_entry_t;

/*
 * STRUCT: user_stats_store_t
 *
 * Users are few compared to guesses, so a linear table under one lock is
 * enough. `path` is empty when stats are kept in memory only.
 */
typedef struct _user_stats_store
{
    user_stats_entry_t* p_users;
    int user_count;
    int user_capacity;
    char path[MAX_PATH_LENGTH + 1];
    omp_lock_t lock;
    bool is_open;
} user_stats_store_t;

/*
 * STRUCT: user_stats_summary_t
 *
 * WHAT:
 * What a client sees for one user.
 * - average_attempts: rounded to 2 decimals, 0 without completed games.
 * - best_score: fewest attempts among completed games in the history, 0 if none.
 * - p_recent: the last RECENT_GAMES_REPORTED records, oldest first.
 */
typedef struct _user_stats_summary
{
    int total_games;
    int completed_games;
    double average_attempts;
    int best_score;
    game_record_t* p_recent;
    int recent_count;
} user_stats_summary_t;

/*
 * FUNCTION: user_stats_init
 *
 * WHAT:
 * Creates the table and, if `path` is non-empty and exists, loads it.
 * An unreadable or malformed file is reported on stderr and ignored.
 *
 * RETURNS:
 * - false only if memory allocation fails.
 */
bool user_stats_init(user_stats_store_t* p_stats, const char* path);

void user_stats_destroy(user_stats_store_t* p_stats);

/*
 * FUNCTION: user_stats_record_game
 *
 * WHAT:
 * Adds `p_record` to the user's history and counters, then rewrites the
 * stats file when one is configured (a write failure is logged; the
 * in-memory table stays authoritative).
 *
 * RETURNS:
 * - ENGINE_ERROR_BAD_REQUEST for an empty or over-long user id.
 */
engine_error_t user_stats_record_game(user_stats_store_t* p_stats, const char* user_id, const game_record_t* p_record);

/*
 * FUNCTION: user_stats_get
 *
 * Fills `p_summary`; unknown users get all zeros and no records.
 * Free with `free_user_stats_summary`.
 */
engine_error_t user_stats_get(user_stats_store_t* p_stats, const char* user_id, user_stats_summary_t* p_summary);

void free_user_stats_summary(user_stats_summary_t* p_summary);

#endif
