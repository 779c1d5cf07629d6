/*
 * FILE: load_vocabulary.h
 *
 * WHAT:
 * Defines the interface for the Vocabulary Store: loading the canonical word
 * list with its embeddings, answering membership and vector lookups, and
 * filling "pending" vectors through the embedding provider.
 *
 * WHY:
 * Separating I/O and validation from the ranking and session logic means the
 * rest of the engine can assume clean data: unique lower-case words, one
 * vector dimension, finite values.
 *
 * FILE FORMATS:
 * 1. JSON (`.json` extension): a single object mapping word -> array of
 *    numbers, or word -> null for a pending vector.
 *    `{"cat": [1, 0], "dog": [0.9, 0.1], "car": null}`
 *    JSON objects carry no order; iteration order is the sorted key order.
 * 2. Text (any other extension, GloVe/word2vec style): one entry per line,
 *    `word v1 v2 ... vN`. A line holding only a word is pending. Blank lines
 *    and lines starting with '#' are skipped. An optional word2vec header
 *    line `<count> <dimension>` is ignored. Iteration order is file order.
 */

#pragma once
#ifndef LOAD_VOCABULARY_H
#define LOAD_VOCABULARY_H
#include "semantle_types.h"
#include "engine_errors.h"
#include "embedding_provider.h"

/*
 * FUNCTION: normalize_word
 *
 * WHAT:
 * Trims surrounding whitespace and lower-cases (ASCII) `raw` into `p_out`.
 *
 * RETURNS:
 * - false if the result is empty or longer than MAX_WORD_LENGTH / out_size - 1.
 */
bool normalize_word(const char* raw, char* p_out, size_t out_size);

/*
 * FUNCTION: build_vocabulary
 *
 * WHAT:
 * Creates a store from parallel arrays. This is the single place where
 * vocabulary invariants are enforced; both file loaders end up here.
 * 1. Normalizes every word (trim, lower-case).
 * 2. Copies vectors into one contiguous block and caches their norms.
 * 3. Builds the alphabetical View and rejects duplicate words.
 * 4. Marks every word as a target candidate.
 *
 * PARAMETERS:
 * - pp_words: word_count raw words.
 * - p_vectors: word_count * dimension floats (row i for word i). May be NULL
 *   when dimension is 0 (every word pending).
 * - p_has_vector: per word, false for pending. NULL means all present.
 *
 * RETURNS:
 * - ENGINE_ERROR_LOAD on an empty list, an invalid or duplicate word, or a
 *   non-finite value (the reason is printed to stderr); p_store is untouched.
 */
engine_error_t build_vocabulary(const char* const* pp_words, const float* p_vectors, const bool* p_has_vector,
    int word_count, int dimension, vocabulary_store_t* p_store);

/*
 * FUNCTION: load_vocabulary_from_json
 *
 * Parses the JSON format from memory (see FILE FORMATS) and builds the store.
 * Duplicate keys and rows of differing length are ENGINE_ERROR_LOAD.
 */
engine_error_t load_vocabulary_from_json(const char* p_json_text, vocabulary_store_t* p_store);

/*
 * FUNCTION: load_vocabulary
 *
 * WHAT:
 * The primary bootstrap function for data initialization. Reads `path` in
 * the format chosen by its extension and builds the store.
 *
 * RETURNS:
 * - ENGINE_ERROR_LOAD if the file cannot be read or violates an invariant.
 */
engine_error_t load_vocabulary(const char* path, vocabulary_store_t* p_store);

/*
 * FUNCTION: set_target_candidates
 *
 * WHAT:
 * Restricts target selection to the listed words. Words missing from the
 * vocabulary are skipped with a warning.
 *
 * RETURNS:
 * - ENGINE_ERROR_LOAD if no listed word is in the vocabulary (the previous
 *   candidate set is kept).
 *
 * WHY:
 * Guessable words and good target words are different sets: a target should
 * be a common word, while guesses may be anything the embedding model knows.
 * Must be called before the store is shared between threads.
 */
engine_error_t set_target_candidates(vocabulary_store_t* p_store, const char* const* pp_words, int word_count);

/*
 * FUNCTION: load_target_candidates
 *
 * Reads a JSON file `{"words": ["...", ...]}` and applies it with
 * `set_target_candidates`.
 */
engine_error_t load_target_candidates(vocabulary_store_t* p_store, const char* path);

/*
 * FUNCTION: vocabulary_find_entry
 *
 * Binary search for an already normalized word. Returns NULL if absent.
 */
const vocabulary_entry_t* vocabulary_find_entry(const vocabulary_store_t* p_store, const char* normalized_word);

/*
 * FUNCTION: vocabulary_contains
 *
 * Case-insensitive membership test on a raw word (normalizes first).
 */
bool vocabulary_contains(const vocabulary_store_t* p_store, const char* raw_word);

/*
 * FUNCTION: vocabulary_vector_of
 *
 * Returns the embedding of a raw word, or NULL if the word is not in the
 * vocabulary or its vector is still pending. `p_dimension` may be NULL.
 */
const float* vocabulary_vector_of(const vocabulary_store_t* p_store, const char* raw_word, int* p_dimension);

/*
 * FUNCTION: vocabulary_all_words
 *
 * Returns the master entry array in iteration order (the ranking
 * tie-break order) and writes its length to `p_count`.
 */
const vocabulary_entry_t* vocabulary_all_words(const vocabulary_store_t* p_store, int* p_count);

/*
 * FUNCTION: resolve_pending_embeddings
 *
 * WHAT:
 * Fetches every pending vector through the provider in batches of
 * EMBEDDING_BATCH_SIZE, then commits them all at once. A no-op (ENGINE_OK)
 * once nothing is pending.
 *
 * RETURNS:
 * - ENGINE_ERROR_PROVIDER if no provider is given, a batch fails, or the
 *   provider's dimension differs from the store's. Nothing is committed.
 *
 * CONCURRENCY:
 * Serialized by `embedding_lock`; concurrent callers wait and then see the
 * committed result. Vectors must only be read after this returned ENGINE_OK
 * (or when `pending_count` was 0 at load).
 */
engine_error_t resolve_pending_embeddings(vocabulary_store_t* p_store, const embedding_provider_t* p_provider);

/*
 * FUNCTION: free_vocabulary
 *
 * Releases everything owned by the store and zeroes it.
 */
void free_vocabulary(vocabulary_store_t* p_store);

#endif
