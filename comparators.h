/*
 * FILE: comparators.h
 *
 * WHAT:
 * Defines the comparison functions used with the C standard library `qsort`
 * and `bsearch`. These comparators dictate the order of every vocabulary View
 * and of the similarity ranking.
 *
 * WHY:
 * Ranking is "sort the vocabulary and read off positions", so the comparator
 * IS the ranking contract: descending similarity, target first, and a stable
 * tie-break on vocabulary order so that the same target always produces the
 * same ranking.
 */

#pragma once
#ifndef COMPARATORS_H
#define COMPARATORS_H
#include "semantle_types.h"

/*
 * FUNCTION: compare_vocabulary_entries_alpha
 *
 * WHAT:
 * Sorts a list of pointers to vocabulary entries by word, A-Z (byte order).
 *
 * WHY:
 * Used to build the alphabetical View that `bsearch` runs over for
 * membership tests, and the candidate View the daily pick indexes into.
 */
int compare_vocabulary_entries_alpha(const void* p1, const void* p2);

/*
 * FUNCTION: compare_word_to_vocabulary_entry
 *
 * WHAT:
 * `bsearch` comparator: the key is a normalized `const char*` word, the
 * element is a pointer to a vocabulary entry in the alphabetical View.
 */
int compare_word_to_vocabulary_entry(const void* p_key, const void* p_element);

/*
 * FUNCTION: compare_ranked_entries_by_similarity_desc
 *
 * WHAT:
 * Sorts `ranked_entry_t` records based on:
 * 1. Target: the target word always comes first.
 * 2. Similarity: higher values come first.
 * 3. Tie-Breaker: lower vocabulary index first.
 *
 * WHY:
 * Guarantees rank 1 for the target even if another word's vector is
 * parallel to it, and a total order (indices are unique) so `qsort`'s
 * instability can never change the result.
 */
int compare_ranked_entries_by_similarity_desc(const void* p1, const void* p2);

#endif
