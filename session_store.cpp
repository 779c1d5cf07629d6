/*
 * FILE: session_store.cpp
 *
 * WHAT:
 * Implements the session table (open addressing with linear probing and
 * tombstones), UUID generation and the TTL policy.
 *
 * WHY:
 * A process-wide map guarded by one mutex would serialize every player.
 * Here the table lock only covers pointer lookups; everything that touches a
 * session's game state runs under that session's own lock.
 */

#include "session_store.h"
#include <openssl/rand.h>
#include <stdio.h>
#include <stdint.h>
#include <string.h>

// Marks a slot whose session was removed; probing continues past it.
static game_session_t g_tombstone_slot;
#define TOMBSTONE (&g_tombstone_slot)

static uint32_t hash_session_id(const char* session_id)
{
    // FNV-1a; the ids are random already, so anything that mixes all bytes will do.
    uint32_t hash = 2166136261u;
    for (const char* p = session_id; *p != '\0'; p++)
    {
        hash ^= (unsigned char)*p;
        hash *= 16777619u;
    }
    return hash;
}

/*
 * FUNCTION: generate_session_id
 *
 * WHAT:
 * Formats 16 random bytes as a version 4 UUID
 * ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx").
 */
static bool generate_session_id(char* p_out)
{
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) return false;

    bytes[6] = (unsigned char)((bytes[6] & 0x0f) | 0x40); // version 4
    bytes[8] = (unsigned char)((bytes[8] & 0x3f) | 0x80); // RFC 4122 variant

    snprintf(p_out, SESSION_ID_LENGTH + 1,
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
        bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return true;
}

static void free_session(game_session_t* p_session)
{
    omp_destroy_lock(&p_session->lock);
    free_similarity_ranking(p_session->p_ranking);
    free(p_session->p_attempts);
    free(p_session);
}

// --- Table primitives (index lock held) ---

static int find_slot(const session_store_t* p_store, const char* session_id)
{
    int mask = p_store->slot_capacity - 1;
    int slot = (int)(hash_session_id(session_id) & (uint32_t)mask);
    for (int probes = 0; probes < p_store->slot_capacity; probes++)
    {
        game_session_t* p_session = p_store->pp_slots[slot];
        if (p_session == NULL) return -1;
        if (p_session != TOMBSTONE && strcmp(p_session->session_id, session_id) == 0) return slot;
        slot = (slot + 1) & mask;
    }
    return -1;
}

static void place_in_table(game_session_t** pp_slots, int slot_capacity, game_session_t* p_session)
{
    int mask = slot_capacity - 1;
    int slot = (int)(hash_session_id(p_session->session_id) & (uint32_t)mask);
    while (pp_slots[slot] != NULL && pp_slots[slot] != TOMBSTONE)
    {
        slot = (slot + 1) & mask;
    }
    pp_slots[slot] = p_session;
}

/*
 * FUNCTION: purge_tombstones
 *
 * Re-inserts every live session into a fresh array once tombstones make
 * probe chains long.
 */
static bool purge_tombstones(session_store_t* p_store)
{
    game_session_t** pp_slots = (game_session_t**)calloc(p_store->slot_capacity, sizeof(game_session_t*));
    if (pp_slots == NULL) return false;

    for (int i = 0; i < p_store->slot_capacity; i++)
    {
        game_session_t* p_session = p_store->pp_slots[i];
        if (p_session != NULL && p_session != TOMBSTONE)
        {
            place_in_table(pp_slots, p_store->slot_capacity, p_session);
        }
    }
    free(p_store->pp_slots);
    p_store->pp_slots = pp_slots;
    p_store->tombstone_count = 0;
    return true;
}

/*
 * FUNCTION: unlink_slot
 *
 * Removes the session at `slot` from the table. It is freed now if nobody
 * holds a reference, otherwise by the last `session_store_release`.
 */
static void unlink_slot(session_store_t* p_store, int slot)
{
    game_session_t* p_session = p_store->pp_slots[slot];
    p_store->pp_slots[slot] = TOMBSTONE;
    p_store->session_count--;
    p_store->tombstone_count++;

    p_session->is_unlinked = true;
    if (p_session->ref_count == 0) free_session(p_session);
}

static bool is_expired(const session_store_t* p_store, const game_session_t* p_session, time_t now)
{
    return p_store->ttl_seconds > 0 && now - p_session->last_active_at > (time_t)p_store->ttl_seconds;
}

static int evict_expired_locked(session_store_t* p_store, time_t now)
{
    int evicted = 0;
    for (int i = 0; i < p_store->slot_capacity; i++)
    {
        game_session_t* p_session = p_store->pp_slots[i];
        if (p_session == NULL || p_session == TOMBSTONE) continue;
        if (p_session->ref_count == 0 && is_expired(p_store, p_session, now))
        {
            unlink_slot(p_store, i);
            evicted++;
        }
    }
    return evicted;
}

// --- Public API ---

bool session_store_init(session_store_t* p_store, int max_sessions, int ttl_seconds)
{
    if (p_store == NULL || max_sessions <= 0) return false;
    memset(p_store, 0, sizeof(session_store_t));

    int capacity = 16;
    while (capacity < max_sessions * 2) capacity <<= 1;

    p_store->pp_slots = (game_session_t**)calloc(capacity, sizeof(game_session_t*));
    if (p_store->pp_slots == NULL)
    {
        fprintf(stderr, "Out of memory allocating session table!\n");
        return false;
    }
    p_store->slot_capacity = capacity;
    p_store->max_sessions = max_sessions;
    p_store->ttl_seconds = ttl_seconds;
    omp_init_lock(&p_store->index_lock);
    return true;
}

void session_store_destroy(session_store_t* p_store)
{
    if (p_store == NULL || p_store->pp_slots == NULL) return;

    for (int i = 0; i < p_store->slot_capacity; i++)
    {
        game_session_t* p_session = p_store->pp_slots[i];
        if (p_session != NULL && p_session != TOMBSTONE) free_session(p_session);
    }
    free(p_store->pp_slots);
    omp_destroy_lock(&p_store->index_lock);
    memset(p_store, 0, sizeof(session_store_t));
}

engine_error_t session_store_create(session_store_t* p_store, const vocabulary_entry_t* p_target, bool is_daily,
    time_t now, char* p_out_session_id)
{
    if (p_store == NULL || p_target == NULL || p_out_session_id == NULL) return ENGINE_ERROR_INTERNAL;

    // Build the record before taking the index lock.
    game_session_t* p_session = (game_session_t*)calloc(1, sizeof(game_session_t));
    if (p_session == NULL)
    {
        fprintf(stderr, "Out of memory allocating session!\n");
        return ENGINE_ERROR_INTERNAL;
    }
    p_session->p_target = p_target;
    p_session->is_daily = is_daily;
    p_session->created_at = now;
    p_session->last_active_at = now;
    omp_init_lock(&p_session->lock);

    omp_set_lock(&p_store->index_lock);

    if (p_store->session_count >= p_store->max_sessions)
    {
        int evicted = evict_expired_locked(p_store, now);
        if (evicted > 0) fprintf(stderr, "Evicted %d expired sessions to make room.\n", evicted);
    }
    if (p_store->session_count >= p_store->max_sessions)
    {
        omp_unset_lock(&p_store->index_lock);
        free_session(p_session);
        fprintf(stderr, "Session store is full (%d sessions).\n", p_store->max_sessions);
        return ENGINE_ERROR_CAPACITY;
    }

    // Retry on an id collision (122 random bits; practically never).
    bool unique = false;
    for (int attempt = 0; attempt < 4 && !unique; attempt++)
    {
        if (!generate_session_id(p_session->session_id)) break;
        unique = (find_slot(p_store, p_session->session_id) < 0);
    }
    if (!unique)
    {
        omp_unset_lock(&p_store->index_lock);
        free_session(p_session);
        fprintf(stderr, "Could not generate a session id.\n");
        return ENGINE_ERROR_INTERNAL;
    }

    if ((p_store->session_count + p_store->tombstone_count + 1) * 4 > p_store->slot_capacity * 3)
    {
        if (!purge_tombstones(p_store))
        {
            omp_unset_lock(&p_store->index_lock);
            free_session(p_session);
            return ENGINE_ERROR_INTERNAL;
        }
    }

    place_in_table(p_store->pp_slots, p_store->slot_capacity, p_session);
    p_store->session_count++;
    memcpy(p_out_session_id, p_session->session_id, SESSION_ID_LENGTH + 1);

    omp_unset_lock(&p_store->index_lock);
    return ENGINE_OK;
}

engine_error_t session_store_acquire(session_store_t* p_store, const char* session_id, time_t now,
    game_session_t** pp_session)
{
    if (p_store == NULL || session_id == NULL || pp_session == NULL) return ENGINE_ERROR_SESSION_NOT_FOUND;

    omp_set_lock(&p_store->index_lock);

    int slot = find_slot(p_store, session_id);
    if (slot < 0)
    {
        omp_unset_lock(&p_store->index_lock);
        return ENGINE_ERROR_SESSION_NOT_FOUND;
    }

    game_session_t* p_session = p_store->pp_slots[slot];
    if (p_session->ref_count == 0 && is_expired(p_store, p_session, now))
    {
        unlink_slot(p_store, slot);
        omp_unset_lock(&p_store->index_lock);
        return ENGINE_ERROR_SESSION_NOT_FOUND;
    }

    if (now > p_session->last_active_at) p_session->last_active_at = now;
    p_session->ref_count++;
    omp_unset_lock(&p_store->index_lock);

    *pp_session = p_session;
    return ENGINE_OK;
}

void session_store_release(session_store_t* p_store, game_session_t* p_session)
{
    if (p_store == NULL || p_session == NULL) return;

    omp_set_lock(&p_store->index_lock);
    p_session->ref_count--;
    bool should_free = (p_session->ref_count == 0 && p_session->is_unlinked);
    omp_unset_lock(&p_store->index_lock);

    if (should_free) free_session(p_session);
}

engine_error_t session_store_get(session_store_t* p_store, const char* session_id, time_t now,
    game_session_view_t* p_view)
{
    game_session_t* p_session = NULL;
    engine_error_t result = session_store_acquire(p_store, session_id, now, &p_session);
    if (result != ENGINE_OK) return result;

    memset(p_view, 0, sizeof(game_session_view_t));

    omp_set_lock(&p_session->lock);
    memcpy(p_view->session_id, p_session->session_id, sizeof(p_view->session_id));
    snprintf(p_view->target_word, sizeof(p_view->target_word), "%s", p_session->p_target->word);
    p_view->is_daily = p_session->is_daily;
    p_view->created_at = p_session->created_at;
    p_view->is_completed = p_session->is_completed;
    if (p_session->attempt_count > 0)
    {
        p_view->p_attempts = (attempt_t*)malloc(sizeof(attempt_t) * p_session->attempt_count);
        if (p_view->p_attempts == NULL)
        {
            result = ENGINE_ERROR_INTERNAL;
        }
        else
        {
            memcpy(p_view->p_attempts, p_session->p_attempts, sizeof(attempt_t) * p_session->attempt_count);
            p_view->attempt_count = p_session->attempt_count;
        }
    }
    omp_unset_lock(&p_session->lock);

    session_store_release(p_store, p_session);
    return result;
}

engine_error_t session_store_update(session_store_t* p_store, const char* session_id, time_t now,
    session_mutator_fn mutator, void* p_context)
{
    if (mutator == NULL) return ENGINE_ERROR_INTERNAL;

    game_session_t* p_session = NULL;
    engine_error_t result = session_store_acquire(p_store, session_id, now, &p_session);
    if (result != ENGINE_OK) return result;

    omp_set_lock(&p_session->lock);
    result = mutator(p_session, p_context);
    omp_unset_lock(&p_session->lock);

    session_store_release(p_store, p_session);
    return result;
}

int session_store_evict_expired(session_store_t* p_store, time_t now)
{
    if (p_store == NULL || p_store->pp_slots == NULL) return 0;

    omp_set_lock(&p_store->index_lock);
    int evicted = evict_expired_locked(p_store, now);
    if (evicted > 0 && p_store->tombstone_count * 4 > p_store->slot_capacity)
    {
        // Failure only leaves the tombstones in place; lookups stay correct.
        if (!purge_tombstones(p_store)) fprintf(stderr, "Warning: could not compact session table.\n");
    }
    omp_unset_lock(&p_store->index_lock);
    return evicted;
}

bool session_store_remove(session_store_t* p_store, const char* session_id)
{
    if (p_store == NULL || session_id == NULL) return false;

    omp_set_lock(&p_store->index_lock);
    int slot = find_slot(p_store, session_id);
    if (slot >= 0) unlink_slot(p_store, slot);
    omp_unset_lock(&p_store->index_lock);
    return slot >= 0;
}

int session_store_count(session_store_t* p_store)
{
    omp_set_lock(&p_store->index_lock);
    int count = p_store->session_count;
    omp_unset_lock(&p_store->index_lock);
    return count;
}

void free_session_view(game_session_view_t* p_view)
{
    if (p_view == NULL) return;
    free(p_view->p_attempts);
    p_view->p_attempts = NULL;
    p_view->attempt_count = 0;
}
