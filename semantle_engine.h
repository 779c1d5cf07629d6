/*
 * FILE: semantle_engine.h
 *
 * WHAT:
 * The engine facade: one struct owning the vocabulary, the embedding
 * provider, the session store and the user statistics, plus the operations
 * the request layer calls.
 *
 * CONTROL FLOW:
 * new game  -> resolve pending embeddings -> pick target -> create session
 * guess     -> guess evaluator (vocabulary + ranking + session store)
 *
 * CONCURRENCY:
 * Every operation may be called from several threads at once after
 * `semantle_engine_init` returned ENGINE_OK.
 */

#pragma once
#ifndef SEMANTLE_ENGINE_H
#define SEMANTLE_ENGINE_H
#include "semantle_types.h"
#include "engine_errors.h"
#include "engine_config.h"
#include "embedding_provider.h"
#include "session_store.h"
#include "user_stats.h"

typedef struct _semantle_engine
{
    engine_config_t config;
    vocabulary_store_t vocabulary;
    embedding_provider_t provider;
    bool has_provider;
    session_store_t sessions;
    user_stats_store_t stats;
} semantle_engine_t;

/*
 * FUNCTION: semantle_engine_init
 *
 * WHAT:
 * 1. Builds the OpenAI provider if an API key is configured.
 * 2. Loads the vocabulary and the optional target list.
 * 3. Creates the session store and loads the stats file.
 *
 * RETURNS:
 * - ENGINE_ERROR_LOAD if a file is missing or malformed, or if the
 *   vocabulary has pending vectors and no provider is configured.
 */
engine_error_t semantle_engine_init(semantle_engine_t* p_engine, const engine_config_t* p_config);

/*
 * FUNCTION: semantle_engine_init_from_json
 *
 * WHAT:
 * Same as `semantle_engine_init`, but the vocabulary comes from a JSON
 * string and the provider (may be NULL) is supplied by the caller. The
 * engine takes ownership of the provider and destroys it with itself.
 */
engine_error_t semantle_engine_init_from_json(semantle_engine_t* p_engine, const engine_config_t* p_config,
    const char* p_vocabulary_json, const embedding_provider_t* p_provider);

void semantle_engine_destroy(semantle_engine_t* p_engine);

/*
 * FUNCTION: semantle_new_game
 *
 * WHAT:
 * Starts a session. With `daily` the target is the daily word for the UTC
 * date of `now`; otherwise it is drawn at random.
 *
 * RETURNS:
 * - ENGINE_ERROR_PROVIDER if pending vectors could not be fetched. No
 *   session is stored in that case.
 * - ENGINE_ERROR_CAPACITY if the session store is full.
 */
engine_error_t semantle_new_game(semantle_engine_t* p_engine, bool daily, time_t now, char* p_out_session_id);

engine_error_t semantle_submit_guess(semantle_engine_t* p_engine, const char* session_id, const char* raw_word,
    time_t now, attempt_result_t* p_result);

engine_error_t semantle_get_session(semantle_engine_t* p_engine, const char* session_id, time_t now,
    game_session_view_t* p_view);

/*
 * FUNCTION: semantle_validate_word
 *
 * Case-insensitive vocabulary membership.
 */
bool semantle_validate_word(const semantle_engine_t* p_engine, const char* raw_word);

/*
 * FUNCTION: semantle_save_user_stats
 *
 * Records the current state of `session_id` (attempt count, completion,
 * daily flag) as a game of `user_id`.
 */
engine_error_t semantle_save_user_stats(semantle_engine_t* p_engine, const char* user_id, const char* session_id,
    time_t now);

engine_error_t semantle_get_user_stats(semantle_engine_t* p_engine, const char* user_id,
    user_stats_summary_t* p_summary);

/*
 * FUNCTION: semantle_sweep_expired
 *
 * Evicts idle sessions; returns how many were removed.
 */
int semantle_sweep_expired(semantle_engine_t* p_engine, time_t now);

#endif
