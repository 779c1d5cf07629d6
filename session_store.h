/*
 * FILE: session_store.h
 *
 * WHAT:
 * Defines the store of live game sessions: creation with a fresh random id,
 * lookup, atomic updates and inactivity expiry.
 *
 * CONCURRENCY:
 * 1. Index lock (`index_lock`): guards the id -> session table, the
 *    reference counts and activity times. Held only for O(1) table work,
 *    never while a session is being mutated.
 * 2. Session lock (`game_session_t::lock`): one per session, held around
 *    every read-modify-write of its attempts and completion flag. Guesses on
 *    the same session are serialized; guesses on different sessions never
 *    wait for each other.
 * 3. Reference count: a session handed out by `session_store_acquire`
 *    cannot be freed (by expiry or removal) until it is released.
 *
 * Lock order is always index lock -> nothing, or session lock -> nothing;
 * the two are never held together.
 */

#pragma once
#ifndef SESSION_STORE_H
#define SESSION_STORE_H
#include "semantle_types.h"
#include "engine_errors.h"
#include "similarity_ranker.h"

/*
 * STRUCT: game_session_t
 *
 * WHAT:
 * The server-side record of one game.
 *
 * FIELD DOMAIN VALUES:
 *
 * 1. p_target (const vocabulary_entry_t*):
 * - The hidden word. Points into the shared vocabulary; never changes.
 *
 * 2. p_attempts / attempt_count:
 * - Accepted guesses in submission order. Only appended, never edited.
 *
 * 3. is_completed (bool):
 * - false : Active, guesses are scored.
 * - true  : Completed (terminal). Set in the same locked transition that
 *           appends the correct guess.
 *
 * 4. p_ranking (similarity_ranking_t*):
 * - NULL until the first guess, then the full ranking for this target,
 *   owned by the session and reused for every later guess.
 *
 * 5. ref_count / is_unlinked / last_active_at:
 * - Guarded by the store's index lock, not by `lock`.
 */
typedef struct _game_session
{
    char session_id[SESSION_ID_LENGTH + 1];
    const vocabulary_entry_t* p_target;
    bool is_daily;
    time_t created_at;
    time_t last_active_at;

    attempt_t* p_attempts;
    int attempt_count;
    int attempt_capacity;
    bool is_completed;
    similarity_ranking_t* p_ranking;

    omp_lock_t lock;
    int ref_count;
    bool is_unlinked;
} game_session_t;

/*
 * STRUCT: game_session_view_t
 *
 * WHAT:
 * A consistent snapshot of a session (attempts are copied), safe to read
 * after the session lock is released. Free with `free_session_view`.
 */
typedef struct _game_session_view
{
    char session_id[SESSION_ID_LENGTH + 1];
    char target_word[MAX_WORD_LENGTH + 1];
    bool is_daily;
    time_t created_at;
    attempt_t* p_attempts;
    int attempt_count;
    bool is_completed;
} game_session_view_t;

/*
 * STRUCT: session_store_t
 *
 * WHAT:
 * Open addressing hash table of session pointers keyed by id.
 * `slot_capacity` is a power of two, at least twice `max_sessions`.
 */
typedef struct _session_store
{
    game_session_t** pp_slots;
    int slot_capacity;
    int session_count;
    int tombstone_count;
    int max_sessions;
    int ttl_seconds;          // <= 0 disables expiry
    omp_lock_t index_lock;
} session_store_t;

/*
 * TYPE: session_mutator_fn
 *
 * WHAT:
 * A state transition applied by `session_store_update` while the session
 * lock is held. Must either apply all of its changes and return ENGINE_OK,
 * or change nothing and return an error.
 */
typedef engine_error_t (*session_mutator_fn)(game_session_t* p_session, void* p_context);

bool session_store_init(session_store_t* p_store, int max_sessions, int ttl_seconds);
void session_store_destroy(session_store_t* p_store);

/*
 * FUNCTION: session_store_create
 *
 * WHAT:
 * Allocates a session with a fresh random UUIDv4 id, no attempts and
 * is_completed = false, and publishes it.
 *
 * RETURNS:
 * - ENGINE_ERROR_CAPACITY if `max_sessions` are live even after expired
 *   sessions were evicted.
 * - ENGINE_ERROR_INTERNAL if memory or the random source fails.
 */
engine_error_t session_store_create(session_store_t* p_store, const vocabulary_entry_t* p_target, bool is_daily,
    time_t now, char* p_out_session_id);

/*
 * FUNCTION: session_store_acquire
 *
 * WHAT:
 * Looks up a session, refreshes its activity time and takes a reference.
 * A session idle for longer than the TTL is evicted here and reported as
 * not found, so expiry is observable even between sweeps.
 *
 * RETURNS:
 * - ENGINE_ERROR_SESSION_NOT_FOUND for unknown or expired ids.
 */
engine_error_t session_store_acquire(session_store_t* p_store, const char* session_id, time_t now,
    game_session_t** pp_session);

/*
 * FUNCTION: session_store_release
 *
 * Drops a reference taken by `session_store_acquire`. Frees the session if
 * it was removed from the table meanwhile and this was the last reference.
 */
void session_store_release(session_store_t* p_store, game_session_t* p_session);

/*
 * FUNCTION: session_store_get
 *
 * Copies a consistent snapshot of the session into `p_view`.
 */
engine_error_t session_store_get(session_store_t* p_store, const char* session_id, time_t now,
    game_session_view_t* p_view);

/*
 * FUNCTION: session_store_update
 *
 * WHAT:
 * Acquires the session, runs `mutator` under the session lock and releases
 * it. Returns the mutator's result.
 */
engine_error_t session_store_update(session_store_t* p_store, const char* session_id, time_t now,
    session_mutator_fn mutator, void* p_context);

/*
 * FUNCTION: session_store_evict_expired
 *
 * Removes every unreferenced session idle for longer than the TTL.
 * Returns the number evicted.
 */
int session_store_evict_expired(session_store_t* p_store, time_t now);

/*
 * FUNCTION: session_store_remove
 *
 * Unlinks a session immediately. Returns false if the id is unknown.
 */
bool session_store_remove(session_store_t* p_store, const char* session_id);

int session_store_count(session_store_t* p_store);

void free_session_view(game_session_view_t* p_view);

#endif
