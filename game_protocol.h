/*
 * FILE: game_protocol.h
 *
 * WHAT:
 * The JSON boundary of the engine: explicit request structs parsed and
 * validated from request bodies, and the builders that turn engine results
 * into response bodies.
 *
 * WHY:
 * Request bodies come from untrusted clients. Each one is checked against a
 * fixed schema (known fields, correct types, bounded lengths) before any
 * engine call, so the engine itself only ever sees well-formed input.
 */

#pragma once
#ifndef GAME_PROTOCOL_H
#define GAME_PROTOCOL_H
#include "semantle_types.h"
#include "engine_errors.h"
#include "session_store.h"
#include "user_stats.h"
#include <json/json.h>
#include <string>

/*
 * CONSTANT: MAX_RAW_WORD_LENGTH
 *
 * Longest guess accepted before normalization (surrounding whitespace
 * included). Longer input cannot be a vocabulary word.
 */
const int MAX_RAW_WORD_LENGTH = 256;

/*
 * STRUCT: new_game_request_t
 *
 * Body of POST /api/game/new: `{"daily": bool}`. An empty body means
 * `daily = false`.
 */
typedef struct _new_game_request
{
    bool daily;
} new_game_request_t;

/*
 * STRUCT: guess_request_t
 *
 * Body of POST /api/game/guess: `{"session_id": string, "word": string}`.
 */
typedef struct _guess_request
{
    char session_id[SESSION_ID_LENGTH + 1];
    char word[MAX_RAW_WORD_LENGTH + 1];
} guess_request_t;

/*
 * STRUCT: save_stats_request_t
 *
 * Body of POST /api/stats: `{"user_id": string, "session_id": string}`.
 */
typedef struct _save_stats_request
{
    char user_id[MAX_USER_ID_LENGTH + 1];
    char session_id[SESSION_ID_LENGTH + 1];
} save_stats_request_t;

// --- Requests ---

/*
 * FUNCTION: parse_new_game_request
 *
 * RETURNS:
 * - ENGINE_ERROR_BAD_REQUEST for malformed JSON, unknown fields or a
 *   non-boolean `daily`.
 */
engine_error_t parse_new_game_request(const char* p_body, new_game_request_t* p_request);

/*
 * FUNCTION: parse_guess_request
 *
 * RETURNS:
 * - ENGINE_ERROR_BAD_REQUEST for malformed JSON, unknown fields, a missing
 *   or non-string field.
 * - ENGINE_ERROR_INVALID_WORD for a word longer than MAX_RAW_WORD_LENGTH.
 * - ENGINE_ERROR_SESSION_NOT_FOUND for a session id longer than any
 *   issued id.
 */
engine_error_t parse_guess_request(const char* p_body, guess_request_t* p_request);

/*
 * FUNCTION: parse_save_stats_request
 *
 * Same rules as `parse_guess_request`; an over-long user id is
 * ENGINE_ERROR_BAD_REQUEST.
 */
engine_error_t parse_save_stats_request(const char* p_body, save_stats_request_t* p_request);

// --- Responses ---

/*
 * FUNCTION: session_view_to_json
 *
 * WHAT:
 * `{session_id, target_word?, attempts: [...], is_completed, daily_word, created_at}`.
 * `target_word` is only present when `expose_target` is set (debug).
 */
Json::Value session_view_to_json(const game_session_view_t* p_view, bool expose_target);

/*
 * FUNCTION: guess_result_to_json
 *
 * `{similarity, rank, is_correct, session_id, attempts}`; similarity is
 * rounded to 6 decimals.
 */
Json::Value guess_result_to_json(const attempt_result_t* p_result, const char* session_id);

Json::Value user_stats_to_json(const user_stats_summary_t* p_summary);
Json::Value validate_word_to_json(bool valid, const char* word);

/*
 * FUNCTION: error_to_json
 *
 * `{error: <code>, message: <fixed text>, retryable: bool}`.
 */
Json::Value error_to_json(engine_error_t error);

/*
 * FUNCTION: api_info_to_json
 *
 * The endpoint listing served at GET /api.
 */
Json::Value api_info_to_json();

/*
 * FUNCTION: write_compact_json
 *
 * Single-line serialization (the driver prints one response per line).
 */
std::string write_compact_json(const Json::Value& value);

#endif
