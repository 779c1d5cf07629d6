/*
 * FILE: engine_errors.h
 *
 * WHAT:
 * The error taxonomy of the engine. Every operation that can fail returns an
 * `engine_error_t`; ENGINE_OK means success and no other value leaves state
 * partially modified.
 *
 * WHY:
 * The request layer must translate failures into stable codes and HTTP-like
 * statuses. Keeping the mapping in one place means a new error cannot be
 * added without deciding how clients see it.
 */

#pragma once
#ifndef ENGINE_ERRORS_H
#define ENGINE_ERRORS_H

/*
 * ENUM: engine_error_t
 *
 * DOMAIN VALUES:
 * - ENGINE_ERROR_LOAD                      : Malformed vocabulary/targets (fatal at startup).
 * - ENGINE_ERROR_INVALID_WORD              : Guess not in the vocabulary (400).
 * - ENGINE_ERROR_SESSION_NOT_FOUND         : Unknown or expired session id (404).
 * - ENGINE_ERROR_SESSION_ALREADY_COMPLETED : Guess against a solved session (409).
 * - ENGINE_ERROR_DUPLICATE_GUESS           : Repeated word with reject_duplicates on (409).
 * - ENGINE_ERROR_PROVIDER                  : Embedding fetch failed or timed out (503, retryable).
 * - ENGINE_ERROR_BAD_REQUEST               : Request body does not match its schema (400).
 * - ENGINE_ERROR_NOT_FOUND                 : Unknown route (404).
 * - ENGINE_ERROR_CAPACITY                  : Session store full (503, retryable).
 * - ENGINE_ERROR_INTERNAL                  : Allocation or entropy source failure (500).
 */
typedef enum _engine_error
{
    ENGINE_OK = 0,
    ENGINE_ERROR_LOAD,
    ENGINE_ERROR_INVALID_WORD,
    ENGINE_ERROR_SESSION_NOT_FOUND,
    ENGINE_ERROR_SESSION_ALREADY_COMPLETED,
    ENGINE_ERROR_DUPLICATE_GUESS,
    ENGINE_ERROR_PROVIDER,
    ENGINE_ERROR_BAD_REQUEST,
    ENGINE_ERROR_NOT_FOUND,
    ENGINE_ERROR_CAPACITY,
    ENGINE_ERROR_INTERNAL
} engine_error_t;

/*
 * FUNCTION: engine_error_code
 *
 * Returns the stable code string clients key on (e.g. "InvalidWord").
 */
const char* engine_error_code(engine_error_t error);

/*
 * FUNCTION: engine_error_message
 *
 * Returns a human readable description. Messages are fixed strings, so they
 * can never leak a session's target word.
 */
const char* engine_error_message(engine_error_t error);

/*
 * FUNCTION: engine_error_http_status
 *
 * Maps an error onto the status code the HTTP layer answers with.
 * ENGINE_OK maps to 200.
 */
int engine_error_http_status(engine_error_t error);

/*
 * FUNCTION: engine_error_is_retryable
 *
 * true for transient failures (provider, capacity) the client may retry as-is.
 */
bool engine_error_is_retryable(engine_error_t error);

#endif
