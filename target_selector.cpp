/*
 * FILE: target_selector.cpp
 *
 * WHAT:
 * Random and daily target selection over the candidate View.
 */

#include "target_selector.h"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <stdio.h>
#include <stdint.h>
#include <ctype.h>
#include <string.h>

bool format_utc_date(time_t now, char* p_out)
{
    struct tm utc;
    if (gmtime_r(&now, &utc) == NULL) return false;
    return strftime(p_out, ISO_DATE_LENGTH + 1, "%Y-%m-%d", &utc) == (size_t)ISO_DATE_LENGTH;
}

bool format_utc_timestamp(time_t now, char* p_out)
{
    struct tm utc;
    if (gmtime_r(&now, &utc) == NULL) return false;
    return strftime(p_out, ISO_TIMESTAMP_LENGTH + 1, "%Y-%m-%dT%H:%M:%SZ", &utc) == (size_t)ISO_TIMESTAMP_LENGTH;
}

static bool is_iso_date(const char* text)
{
    if (text == NULL || strlen(text) != (size_t)ISO_DATE_LENGTH) return false;
    for (int i = 0; i < ISO_DATE_LENGTH; i++)
    {
        if (i == 4 || i == 7)
        {
            if (text[i] != '-') return false;
        }
        else if (!isdigit((unsigned char)text[i]))
        {
            return false;
        }
    }
    return true;
}

/*
 * FUNCTION: random_below
 *
 * WHAT:
 * Uniform integer in [0, bound) from RAND_bytes.
 *
 * WHY:
 * `r % bound` favours small values unless bound divides 2^64. Draws at or
 * above the largest multiple of bound are thrown away and redrawn; with
 * bound far below 2^64 a redraw is practically never needed.
 */
static bool random_below(uint64_t bound, uint64_t* p_value)
{
    const uint64_t limit = (UINT64_MAX / bound) * bound;
    for (;;)
    {
        unsigned char bytes[8];
        if (RAND_bytes(bytes, sizeof(bytes)) != 1) return false;

        uint64_t r = 0;
        for (int i = 0; i < 8; i++) r = (r << 8) | bytes[i];

        if (r < limit)
        {
            *p_value = r % bound;
            return true;
        }
    }
}

engine_error_t select_random_target(const vocabulary_store_t* p_store, const vocabulary_entry_t** pp_target)
{
    if (p_store == NULL || p_store->candidate_count <= 0 || p_store->p_candidate_view == NULL)
    {
        fprintf(stderr, "No target candidates available.\n");
        return ENGINE_ERROR_INTERNAL;
    }

    uint64_t pick = 0;
    if (!random_below((uint64_t)p_store->candidate_count, &pick))
    {
        fprintf(stderr, "RAND_bytes failed while picking a target.\n");
        return ENGINE_ERROR_INTERNAL;
    }

    *pp_target = p_store->p_candidate_view[pick];
    return ENGINE_OK;
}

int daily_target_index(const char* iso_date, int candidate_count)
{
    if (candidate_count <= 0 || !is_iso_date(iso_date)) return -1;

    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char*)iso_date, strlen(iso_date), digest);

    uint64_t value = 0;
    for (int i = 0; i < 8; i++) value = (value << 8) | digest[i];

    return (int)(value % (uint64_t)candidate_count);
}

engine_error_t select_daily_target(const vocabulary_store_t* p_store, const char* iso_date,
    const vocabulary_entry_t** pp_target)
{
    if (!is_iso_date(iso_date)) return ENGINE_ERROR_BAD_REQUEST;
    if (p_store == NULL || p_store->candidate_count <= 0 || p_store->p_candidate_view == NULL)
    {
        fprintf(stderr, "No target candidates available.\n");
        return ENGINE_ERROR_INTERNAL;
    }

    int index = daily_target_index(iso_date, p_store->candidate_count);
    *pp_target = p_store->p_candidate_view[index];
    return ENGINE_OK;
}
