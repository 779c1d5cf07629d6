/*
 * FILE: guess_evaluator.cpp
 *
 * WHAT:
 * The guess transaction, expressed as a session mutator so the session
 * store can run it under the session lock.
 */

#include "guess_evaluator.h"
#include "load_vocabulary.h"
#include "similarity_ranker.h"
#include <stdio.h>
#include <string.h>

/*
 * STRUCT: guess_context_t
 *
 * Inputs and output of one `apply_guess` call.
 */
typedef struct _guess_context
{
    const vocabulary_store_t* p_vocabulary;
    const char* raw_word;
    bool reject_duplicates;
    time_t now;
    attempt_result_t result;
} guess_context_t;

static bool was_already_guessed(const game_session_t* p_session, const char* word)
{
    for (int i = 0; i < p_session->attempt_count; i++)
    {
        if (strcmp(p_session->p_attempts[i].word, word) == 0) return true;
    }
    return false;
}

static bool reserve_attempt_slot(game_session_t* p_session)
{
    if (p_session->attempt_count < p_session->attempt_capacity) return true;

    int new_capacity = (p_session->attempt_capacity == 0) ? 16 : p_session->attempt_capacity * 2;
    attempt_t* ptr = (attempt_t*)realloc(p_session->p_attempts, sizeof(attempt_t) * new_capacity);
    if (ptr == NULL) return false;

    p_session->p_attempts = ptr;
    p_session->attempt_capacity = new_capacity;
    return true;
}

static engine_error_t apply_guess(game_session_t* p_session, void* p_context)
{
    guess_context_t* p_guess = (guess_context_t*)p_context;

    // 1. Terminal state
    if (p_session->is_completed) return ENGINE_ERROR_SESSION_ALREADY_COMPLETED;

    // 2. Validation
    char word[MAX_WORD_LENGTH + 1];
    if (!normalize_word(p_guess->raw_word, word, sizeof(word))) return ENGINE_ERROR_INVALID_WORD;

    const vocabulary_entry_t* pEntry = vocabulary_find_entry(p_guess->p_vocabulary, word);
    if (pEntry == NULL) return ENGINE_ERROR_INVALID_WORD;

    if (p_guess->reject_duplicates && was_already_guessed(p_session, pEntry->word))
    {
        return ENGINE_ERROR_DUPLICATE_GUESS;
    }

    // 3. Ranking (lazily, once per session)
    if (p_session->p_ranking == NULL)
    {
        engine_error_t result = build_similarity_ranking(p_guess->p_vocabulary, p_session->p_target, &p_session->p_ranking);
        if (result != ENGINE_OK) return result;
    }

    // Grow before writing anything, so a failed allocation changes nothing.
    if (!reserve_attempt_slot(p_session))
    {
        fprintf(stderr, "Out of memory recording an attempt!\n");
        return ENGINE_ERROR_INTERNAL;
    }

    // 4. Commit
    attempt_t* pAttempt = &p_session->p_attempts[p_session->attempt_count];
    memcpy(pAttempt->word, pEntry->word, sizeof(pAttempt->word));
    pAttempt->similarity = similarity_score_of(p_session->p_ranking, pEntry->index);
    pAttempt->rank = similarity_rank_of(p_session->p_ranking, pEntry->index);
    pAttempt->is_correct = (pEntry == p_session->p_target);
    pAttempt->submitted_at = p_guess->now;

    p_session->attempt_count++;
    if (pAttempt->is_correct) p_session->is_completed = true;

    p_guess->result.similarity = pAttempt->similarity;
    p_guess->result.rank = pAttempt->rank;
    p_guess->result.is_correct = pAttempt->is_correct;
    p_guess->result.attempt_count = p_session->attempt_count;
    return ENGINE_OK;
}

engine_error_t submit_guess(session_store_t* p_sessions, const vocabulary_store_t* p_vocabulary,
    const char* session_id, const char* raw_word, bool reject_duplicates, time_t now, attempt_result_t* p_result)
{
    if (p_sessions == NULL || p_vocabulary == NULL || p_result == NULL) return ENGINE_ERROR_INTERNAL;

    guess_context_t context;
    memset(&context, 0, sizeof(context));
    context.p_vocabulary = p_vocabulary;
    context.raw_word = raw_word;
    context.reject_duplicates = reject_duplicates;
    context.now = now;

    engine_error_t result = session_store_update(p_sessions, session_id, now, apply_guess, &context);
    if (result != ENGINE_OK) return result;

    *p_result = context.result;
    if (context.result.is_correct)
    {
        fprintf(stderr, "Session %s completed in %d attempts.\n", session_id, context.result.attempt_count);
    }
    return ENGINE_OK;
}
