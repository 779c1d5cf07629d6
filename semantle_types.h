/*
 * FILE: semantle_types.h
 *
 * WHAT:
 * Defines the core data structures and constants shared by every layer of the
 * engine: vocabulary entries, the vocabulary store, attempts and the pointer
 * "View" type used for sorted lookups.
 *
 * WHY:
 * A centralized type definition keeps the Data layer (vocabulary loading),
 * the Logic layer (similarity ranking, guess evaluation) and the Session layer
 * consistent about buffer sizes and field meanings.
 */

#pragma once
#ifndef SEMANTLE_TYPES_H
#define SEMANTLE_TYPES_H

#include <stdlib.h>
#include <stdbool.h>
#include <time.h>
#include <omp.h>

/*
 * CONSTANTS: Engine Limits
 *
 * WHAT:
 * Fixed buffer sizes used throughout the engine.
 *
 * - MAX_WORD_LENGTH: longest accepted word (after trimming), in bytes.
 * - SESSION_ID_LENGTH: a textual UUID ("8-4-4-4-12" hex groups).
 * - ISO_DATE_LENGTH: "YYYY-MM-DD".
 * - MAX_PATH_LENGTH: file paths and URLs held in configuration.
 */
const int MAX_WORD_LENGTH = 64;
const int SESSION_ID_LENGTH = 36;
const int ISO_DATE_LENGTH = 10;
const int ISO_TIMESTAMP_LENGTH = 20;
const int MAX_PATH_LENGTH = 1024;

/*
 * STRUCT: vocabulary_entry_t
 *
 * WHAT:
 * One word of the vocabulary together with its embedding.
 *
 * FIELD DOMAIN VALUES:
 *
 * 1. index (int):
 * - Position of the word in the vocabulary iteration order (0-based).
 * - This is the tie-break key when two words score the same similarity.
 *
 * 2. p_embedding (float*):
 * - Points into the store's contiguous vector block (`dimension` floats).
 * - Only meaningful when has_embedding is true.
 *
 * 3. norm (double):
 * - Euclidean length of the embedding, cached at load/resolve time.
 * - 0.0 marks a degenerate vector; its similarity with anything is 0.
 *
 * 4. has_embedding (bool):
 * - false : the word was listed without a vector ("pending") and must be
 *           resolved through the embedding provider before any ranking.
 *
 * 5. is_target_candidate (bool):
 * - true  : the word may be chosen as a session target.
 */
typedef struct _vocabulary_entry
{
    char word[MAX_WORD_LENGTH + 1];     /* Lower-case, trimmed word             */
    int index;                          /* Position in vocabulary order         */
    float* p_embedding;                 /* Vector (dimension floats)            */
    double norm;                        /* Cached Euclidean norm                */
    bool has_embedding;                 /* false while pending                  */
    bool is_target_candidate;           /* true if usable as a session target   */
} vocabulary_entry_t;

/*
 * TYPE: vocabulary_pointer_array_t
 *
 * WHAT:
 * An array of pointers to vocabulary entries (a "View").
 *
 * WHY:
 * The store needs the same entries ordered in different ways (iteration
 * order, alphabetical for binary search, alphabetical candidates for the
 * daily pick) without copying the entries or their vectors.
 */
typedef vocabulary_entry_t** vocabulary_pointer_array_t;

/*
 * STRUCT: vocabulary_store_t
 *
 * WHAT:
 * The process-wide vocabulary: the master entry array, the vector block and
 * the sorted views built over them.
 *
 * CONCURRENCY:
 * Words, views and candidate flags never change after loading. Pending
 * vectors are filled once under `embedding_lock` (see load_vocabulary.h);
 * after `pending_count` reaches zero the store is read-only.
 */
typedef struct _vocabulary_store
{
    vocabulary_entry_t* p_entries;               /* Master copy, iteration order  */
    int entry_count;
    int dimension;                               /* 0 until any vector is known   */
    float* p_vectors;                            /* entry_count * dimension       */
    vocabulary_pointer_array_t p_alpha_view;     /* Sorted A-Z for lookups        */
    vocabulary_pointer_array_t p_candidate_view; /* Target candidates, A-Z        */
    int candidate_count;
    int pending_count;                           /* Entries without a vector      */
    omp_lock_t embedding_lock;
} vocabulary_store_t;

/*
 * STRUCT: ranked_entry_t
 *
 * WHAT:
 * Sorting record used while building a ranking: a similarity score and the
 * vocabulary index it belongs to.
 *
 * WHY:
 * Sorting these small records (16 bytes) instead of the entries themselves
 * keeps the O(V log V) sort cache-friendly; the index is also the tie-breaker.
 */
typedef struct _ranked_entry
{
    double similarity;
    int index;
    bool is_target;
} ranked_entry_t;

/*
 * STRUCT: attempt_t
 *
 * WHAT:
 * One accepted guess, appended to a session in submission order and never
 * modified afterwards.
 *
 * FIELDS:
 * - similarity: cosine similarity with the target, in [-1, 1].
 * - rank: 1-based position of the word in the full-vocabulary ranking.
 * - is_correct: the guess is the target word.
 */
typedef struct _attempt
{
    char word[MAX_WORD_LENGTH + 1];
    double similarity;
    int rank;
    bool is_correct;
    time_t submitted_at;
} attempt_t;

/*
 * STRUCT: attempt_result_t
 *
 * WHAT:
 * The answer to a single guess, as returned to the caller.
 * `attempt_count` is the number of attempts recorded after this guess.
 */
typedef struct _attempt_result
{
    double similarity;
    int rank;
    bool is_correct;
    int attempt_count;
} attempt_result_t;

#endif
