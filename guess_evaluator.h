/*
 * FILE: guess_evaluator.h
 *
 * WHAT:
 * Defines the per-guess transaction of the game.
 * This module is responsible for:
 * 1. Enforcing the session state machine (Active -> Completed).
 * 2. Validating the guessed word against the vocabulary.
 * 3. Scoring the guess (similarity and rank) with the session's ranking.
 * 4. Recording the attempt and detecting completion.
 *
 * WHY:
 * Separation of concerns. The request layer handles the flow, but this
 * module owns the rules. All checks run before anything is written, so a
 * rejected guess never leaves a trace in the session.
 */

#pragma once
#ifndef GUESS_EVALUATOR_H
#define GUESS_EVALUATOR_H
#include "semantle_types.h"
#include "engine_errors.h"
#include "session_store.h"

/*
 * FUNCTION: submit_guess
 *
 * WHAT:
 * Runs the whole transaction under the session's lock:
 * 1. SessionAlreadyCompleted if the session is completed.
 * 2. Normalizes the word (trim, lower-case); InvalidWord if it is not in
 *    the vocabulary.
 * 3. DuplicateGuess if `reject_duplicates` and the word was already guessed.
 * 4. Builds the session's ranking on its first guess.
 * 5. Appends the attempt; a correct guess sets is_completed in the same step.
 *
 * PARAMETERS:
 * - p_result: Output. Similarity, rank, correctness and the attempt count
 *   after this guess.
 *
 * RETURNS:
 * - ENGINE_ERROR_SESSION_NOT_FOUND for unknown or expired ids.
 * - Any error above; the session is unchanged whenever the result is not
 *   ENGINE_OK.
 */
engine_error_t submit_guess(session_store_t* p_sessions, const vocabulary_store_t* p_vocabulary,
    const char* session_id, const char* raw_word, bool reject_duplicates, time_t now, attempt_result_t* p_result);

#endif
