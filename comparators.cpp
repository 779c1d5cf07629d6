/*
 * FILE: comparators.cpp
 *
 * WHAT:
 * Implements the comparison logic used by `qsort` and `bsearch`.
 *
 * TIE-BREAKING:
 * A critical aspect here is Determinism. Two words can have exactly the same
 * similarity to a target (identical or parallel vectors). We fall back to the
 * vocabulary index, which is fixed at load time, so the ranking is identical
 * run-to-run and call-to-call.
 */

#include "comparators.h"
#include <string.h>

 // --- Internal Helper Functions ---
 // Positive result = Entry 1 sorts after Entry 2.

/*
 * HELPER: similarity_diff
 *
 * Note: Returns 1 if S1 < S2 because we want DESCENDING order.
 */
static int similarity_diff(const ranked_entry_t* entry1, const ranked_entry_t* entry2)
{
    if (entry1->similarity < entry2->similarity) return 1;
    else if (entry1->similarity > entry2->similarity) return -1;
    else return 0;
}

static int target_diff(const ranked_entry_t* entry1, const ranked_entry_t* entry2)
{
    if (entry1->is_target && !entry2->is_target) return -1;
    if (!entry1->is_target && entry2->is_target) return 1;
    return 0;
}

static int index_diff(const ranked_entry_t* entry1, const ranked_entry_t* entry2)
{
    if (entry1->index < entry2->index) return -1;
    else if (entry1->index > entry2->index) return 1;
    else return 0;
}

// --- EXPORTED COMPARATORS ---

int compare_vocabulary_entries_alpha(const void* p1, const void* p2)
{
    const vocabulary_entry_t* entry1 = *(const vocabulary_entry_t* const*)p1;
    const vocabulary_entry_t* entry2 = *(const vocabulary_entry_t* const*)p2;
    return strcmp(entry1->word, entry2->word);
}

int compare_word_to_vocabulary_entry(const void* p_key, const void* p_element)
{
    const char* word = (const char*)p_key;
    const vocabulary_entry_t* entry = *(const vocabulary_entry_t* const*)p_element;
    return strcmp(word, entry->word);
}

int compare_ranked_entries_by_similarity_desc(const void* p1, const void* p2)
{
    const ranked_entry_t* entry1 = (const ranked_entry_t*)p1;
    const ranked_entry_t* entry2 = (const ranked_entry_t*)p2;

    int result = target_diff(entry1, entry2);
    if (result != 0) return result;
    result = similarity_diff(entry1, entry2);
    if (result != 0) return result;
    return index_diff(entry1, entry2);
}
