/*
 * FILE: target_selector.h
 *
 * WHAT:
 * Chooses the hidden target word of a new session, either uniformly at random
 * or deterministically from the UTC calendar date ("daily" mode).
 *
 * WHY:
 * The daily word must be the same for every player, on every server instance,
 * across restarts. So it is a pure function of (date, candidate list): no
 * seed, no counter, nothing established at boot.
 */

#pragma once
#ifndef TARGET_SELECTOR_H
#define TARGET_SELECTOR_H
#include "semantle_types.h"
#include "engine_errors.h"

/*
 * FUNCTION: format_utc_date
 *
 * Writes `now` as "YYYY-MM-DD" (UTC) into `p_out`, which must hold
 * ISO_DATE_LENGTH + 1 bytes.
 */
bool format_utc_date(time_t now, char* p_out);

/*
 * FUNCTION: format_utc_timestamp
 *
 * Writes `now` as "YYYY-MM-DDTHH:MM:SSZ" into `p_out`, which must hold
 * ISO_TIMESTAMP_LENGTH + 1 bytes.
 */
bool format_utc_timestamp(time_t now, char* p_out);

/*
 * FUNCTION: select_random_target
 *
 * WHAT:
 * Uniform pick over the target candidates. Randomness comes from OpenSSL's
 * CSPRNG and is reduced with rejection sampling (no modulo bias).
 *
 * RETURNS:
 * - ENGINE_ERROR_INTERNAL if the store has no candidates or the random
 *   source fails.
 */
engine_error_t select_random_target(const vocabulary_store_t* p_store, const vocabulary_entry_t** pp_target);

/*
 * FUNCTION: daily_target_index
 *
 * WHAT:
 * The daily pick itself: SHA-256 of the ISO date string, first 8 bytes read
 * big-endian, modulo `candidate_count`.
 *
 * RETURNS:
 * - -1 if the date is not "YYYY-MM-DD" or candidate_count <= 0.
 */
int daily_target_index(const char* iso_date, int candidate_count);

/*
 * FUNCTION: select_daily_target
 *
 * WHAT:
 * Indexes `daily_target_index(iso_date, candidate_count)` into the
 * alphabetical candidate View, so the result depends only on the date and
 * the set of candidates (not on file order).
 *
 * RETURNS:
 * - ENGINE_ERROR_BAD_REQUEST for a malformed date.
 * - ENGINE_ERROR_INTERNAL if the store has no candidates.
 */
engine_error_t select_daily_target(const vocabulary_store_t* p_store, const char* iso_date,
    const vocabulary_entry_t** pp_target);

#endif
