/*
 * FILE: vocabulary_views.cpp
 *
 * WHAT:
 * Implements the logic for creating "Views" of the vocabulary: sorted arrays
 * of pointers that reference the master entries without copying them.
 *
 * WHY:
 * A `vocabulary_entry_t` is about 100 bytes plus a vector that may be
 * thousands of floats. A pointer is 8 bytes. Sorting pointers moves
 * significantly less memory than sorting entries.
 */

#include "vocabulary_views.h"
#include <stdlib.h>

/*
 * HELPER: build_view
 *
 * Collects pointers to the entries accepted by `keep` (all entries if NULL),
 * in master order, then sorts them. Fails on an empty result.
 */
static bool build_view(const vocabulary_entry_t* p_entries, int entry_count,
    bool (*keep)(const vocabulary_entry_t*),
    int (*compare_func)(const void*, const void*),
    vocabulary_pointer_array_t* pp_view, int* p_view_count)
{
    if (p_entries == NULL || entry_count <= 0 || pp_view == NULL || compare_func == NULL) return false;

    int kept = 0;
    for (int i = 0; i < entry_count; i++)
    {
        if (keep == NULL || keep(&p_entries[i])) kept++;
    }
    if (kept == 0) return false;

    vocabulary_entry_t** p_view = (vocabulary_entry_t**)malloc(sizeof(vocabulary_entry_t*) * kept);
    if (p_view == NULL) return false;

    // The View is mutable only so it can be handed to qsort; entries are never written through it.
    int slot = 0;
    for (int i = 0; i < entry_count; i++)
    {
        if (keep == NULL || keep(&p_entries[i])) p_view[slot++] = (vocabulary_entry_t*)&p_entries[i];
    }

    qsort(p_view, kept, sizeof(vocabulary_entry_t*), compare_func);

    *pp_view = p_view;
    if (p_view_count != NULL) *p_view_count = kept;
    return true;
}

static bool is_candidate(const vocabulary_entry_t* pEntry)
{
    return pEntry->is_target_candidate;
}

bool duplicate_vocabulary_pointers(const vocabulary_entry_t* p_source_entries,
    int source_entry_count,
    vocabulary_pointer_array_t* pp_target_pointer_array,
    int (*compare_func)(const void*, const void*))
{
    return build_view(p_source_entries, source_entry_count, NULL, compare_func, pp_target_pointer_array, NULL);
}

bool build_candidate_view(const vocabulary_entry_t* p_source_entries,
    int source_entry_count,
    vocabulary_pointer_array_t* pp_target_pointer_array,
    int* p_candidate_count,
    int (*compare_func)(const void*, const void*))
{
    if (p_candidate_count == NULL) return false;
    return build_view(p_source_entries, source_entry_count, is_candidate, compare_func,
        pp_target_pointer_array, p_candidate_count);
}
