/*
 * FILE: similarity_ranker.h
 *
 * WHAT:
 * Defines the interface for the mathematical engine of the game.
 * This module handles cosine similarity between embeddings and the
 * full-vocabulary ranking of every word against a target.
 *
 * WHY:
 * This is the "Calculator" component. It doesn't know about sessions or
 * requests; it simply crunches numbers. The raw similarity scale differs from
 * one embedding model to another, so the rank (position among all words) is
 * what tells a player how close a guess really is.
 */

#pragma once
#ifndef SIMILARITY_RANKER_H
#define SIMILARITY_RANKER_H
#include "semantle_types.h"
#include "engine_errors.h"

/*
 * STRUCT: similarity_ranking_t
 *
 * WHAT:
 * The complete ordering of the vocabulary by similarity to one target.
 * Built once per session (on the first guess) and read for every guess after.
 *
 * FIELD DOMAIN VALUES:
 *
 * 1. p_similarity (double*):
 * - Indexed by vocabulary index. Values in [-1, 1].
 * - The target's own slot is exactly 1.0.
 *
 * 2. p_rank (int*):
 * - Indexed by vocabulary index. 1-based; the target is always 1.
 *
 * 3. p_order (int*):
 * - Indexed by (rank - 1). Holds the vocabulary index at that position.
 */
typedef struct _similarity_ranking
{
    int entry_count;
    int target_index;
    double* p_similarity;
    int* p_rank;
    int* p_order;
} similarity_ranking_t;

/*
 * FUNCTION: vector_norm
 *
 * Euclidean length of a vector, accumulated in double precision.
 */
double vector_norm(const float* p_vector, int dimension);

/*
 * FUNCTION: cosine_similarity
 *
 * WHAT:
 * dot(a, b) / (|a| * |b|), clamped to [-1, 1].
 * Defined as 0 when either vector has zero norm.
 */
double cosine_similarity(const float* p_a, const float* p_b, int dimension);

/*
 * FUNCTION: cosine_similarity_with_norms
 *
 * Same as `cosine_similarity` with both norms supplied by the caller
 * (the store caches them), so only the dot product is computed.
 */
double cosine_similarity_with_norms(const float* p_a, double norm_a, const float* p_b, double norm_b, int dimension);

/*
 * FUNCTION: build_similarity_ranking
 *
 * WHAT:
 * 1. Scores every vocabulary word against the target (OpenMP parallel loop).
 * 2. Sorts the scores: target first, similarity descending, vocabulary
 *    index ascending on ties.
 * 3. Records each word's rank.
 *
 * PARAMETERS:
 * - p_store: a store with no pending vectors.
 * - p_target: an entry of p_store.
 * - pp_ranking: Output. Allocated ranking; release with `free_similarity_ranking`.
 *
 * RETURNS:
 * - ENGINE_ERROR_INTERNAL if vectors are still pending or memory runs out.
 *
 * PERFORMANCE:
 * O(V * D) for the scores and O(V log V) for the sort. Callers keep the
 * result for the lifetime of the session instead of rebuilding per guess.
 */
engine_error_t build_similarity_ranking(const vocabulary_store_t* p_store, const vocabulary_entry_t* p_target,
    similarity_ranking_t** pp_ranking);

/*
 * FUNCTION: similarity_rank_of
 *
 * Rank (1-based) of the word at `vocabulary_index`, or -1 if out of range.
 */
int similarity_rank_of(const similarity_ranking_t* p_ranking, int vocabulary_index);

/*
 * FUNCTION: similarity_score_of
 *
 * Similarity to the target of the word at `vocabulary_index`
 * (0.0 if out of range).
 */
double similarity_score_of(const similarity_ranking_t* p_ranking, int vocabulary_index);

/*
 * FUNCTION: similarity_index_at_rank
 *
 * Vocabulary index of the word holding `rank`, or -1 if out of range.
 */
int similarity_index_at_rank(const similarity_ranking_t* p_ranking, int rank);

void free_similarity_ranking(similarity_ranking_t* p_ranking);

#endif
