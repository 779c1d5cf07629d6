/*
 * FILE: vocabulary_views.h
 *
 * WHAT:
 * Defines the interface for creating "Views" of the vocabulary.
 * A "View" is a lightweight array of pointers into the master entry array,
 * sorted by some comparator.
 *
 * WHY:
 * The store needs the entries alphabetically (membership tests via
 * `bsearch`) and the target candidates alphabetically (the daily pick),
 * while the master array keeps iteration order for rank tie-breaking.
 * Duplicating entries (and their vectors) for each order would be wasteful.
 */

#pragma once
#ifndef VOCABULARY_VIEWS_H
#define VOCABULARY_VIEWS_H
#include "semantle_types.h"

/*
 * FUNCTION: duplicate_vocabulary_pointers
 *
 * WHAT:
 * Allocates a new array of pointers (`vocabulary_entry_t*`) pointing
 * sequentially at `p_source_entries`, then sorts it with `compare_func`.
 *
 * RETURNS:
 * - true if allocation and sorting succeeded.
 * - false if inputs were invalid or memory allocation failed.
 */
bool duplicate_vocabulary_pointers(const vocabulary_entry_t* p_source_entries,
    int source_entry_count,
    vocabulary_pointer_array_t* pp_target_pointer_array,
    int (*compare_func)(const void*, const void*));

/*
 * FUNCTION: build_candidate_view
 *
 * WHAT:
 * Like `duplicate_vocabulary_pointers`, but keeps only the entries whose
 * `is_target_candidate` flag is set. The number kept is written to
 * `p_candidate_count`.
 *
 * RETURNS:
 * - false if memory allocation failed or no entry is a candidate.
 */
bool build_candidate_view(const vocabulary_entry_t* p_source_entries,
    int source_entry_count,
    vocabulary_pointer_array_t* pp_target_pointer_array,
    int* p_candidate_count,
    int (*compare_func)(const void*, const void*));

#endif
