/*
 * FILE: semantle_engine.cpp
 *
 * WHAT:
 * Wires the modules together and owns their lifetimes.
 */

#include "semantle_engine.h"
#include "load_vocabulary.h"
#include "target_selector.h"
#include "guess_evaluator.h"
#include <stdio.h>
#include <string.h>

/*
 * FUNCTION: finish_engine_init
 *
 * WHAT:
 * Everything after the vocabulary is loaded: target list, pending-vector
 * check, session store, stats. Frees the vocabulary on failure.
 */
static engine_error_t finish_engine_init(semantle_engine_t* p_engine)
{
    const engine_config_t* p_config = &p_engine->config;

    if (p_config->targets_path[0] != '\0')
    {
        engine_error_t result = load_target_candidates(&p_engine->vocabulary, p_config->targets_path);
        if (result != ENGINE_OK)
        {
            free_vocabulary(&p_engine->vocabulary);
            return result;
        }
    }

    if (p_engine->vocabulary.pending_count > 0 && !p_engine->has_provider)
    {
        fprintf(stderr, "%d words have no vector and no embedding provider is configured (set OPENAI_API_KEY).\n",
            p_engine->vocabulary.pending_count);
        free_vocabulary(&p_engine->vocabulary);
        return ENGINE_ERROR_LOAD;
    }

    if (!session_store_init(&p_engine->sessions, p_config->max_sessions, p_config->session_ttl_seconds))
    {
        free_vocabulary(&p_engine->vocabulary);
        return ENGINE_ERROR_INTERNAL;
    }
    if (!user_stats_init(&p_engine->stats, p_config->stats_path))
    {
        session_store_destroy(&p_engine->sessions);
        free_vocabulary(&p_engine->vocabulary);
        return ENGINE_ERROR_INTERNAL;
    }

    printf("Engine ready: %d words, %d target candidates, dimension %d, %d pending, provider %s.\n",
        p_engine->vocabulary.entry_count,
        p_engine->vocabulary.candidate_count,
        p_engine->vocabulary.dimension,
        p_engine->vocabulary.pending_count,
        p_engine->has_provider ? p_engine->provider.name : "none");
    return ENGINE_OK;
}

engine_error_t semantle_engine_init(semantle_engine_t* p_engine, const engine_config_t* p_config)
{
    memset(p_engine, 0, sizeof(semantle_engine_t));
    p_engine->config = *p_config;

    p_engine->has_provider = init_openai_embedding_provider(p_config, &p_engine->provider);

    engine_error_t result = load_vocabulary(p_config->vocabulary_path, &p_engine->vocabulary);
    if (result == ENGINE_OK) result = finish_engine_init(p_engine);

    if (result != ENGINE_OK && p_engine->has_provider)
    {
        destroy_embedding_provider(&p_engine->provider);
        p_engine->has_provider = false;
    }
    return result;
}

engine_error_t semantle_engine_init_from_json(semantle_engine_t* p_engine, const engine_config_t* p_config,
    const char* p_vocabulary_json, const embedding_provider_t* p_provider)
{
    memset(p_engine, 0, sizeof(semantle_engine_t));
    p_engine->config = *p_config;
    if (p_provider != NULL)
    {
        p_engine->provider = *p_provider;
        p_engine->has_provider = true;
    }

    engine_error_t result = load_vocabulary_from_json(p_vocabulary_json, &p_engine->vocabulary);
    if (result == ENGINE_OK) result = finish_engine_init(p_engine);

    if (result != ENGINE_OK && p_engine->has_provider)
    {
        destroy_embedding_provider(&p_engine->provider);
        p_engine->has_provider = false;
    }
    return result;
}

void semantle_engine_destroy(semantle_engine_t* p_engine)
{
    if (p_engine == NULL) return;
    user_stats_destroy(&p_engine->stats);
    session_store_destroy(&p_engine->sessions);
    free_vocabulary(&p_engine->vocabulary);
    if (p_engine->has_provider) destroy_embedding_provider(&p_engine->provider);
    p_engine->has_provider = false;
}

engine_error_t semantle_new_game(semantle_engine_t* p_engine, bool daily, time_t now, char* p_out_session_id)
{
    // 1. Warm up: every vector must be known before a ranking can be built.
    engine_error_t result = resolve_pending_embeddings(&p_engine->vocabulary,
        p_engine->has_provider ? &p_engine->provider : NULL);
    if (result != ENGINE_OK) return result;

    // 2. Target
    const vocabulary_entry_t* p_target = NULL;
    if (daily)
    {
        char today[ISO_DATE_LENGTH + 1];
        if (!format_utc_date(now, today)) return ENGINE_ERROR_INTERNAL;
        result = select_daily_target(&p_engine->vocabulary, today, &p_target);
    }
    else
    {
        result = select_random_target(&p_engine->vocabulary, &p_target);
    }
    if (result != ENGINE_OK) return result;

    // 3. Session
    result = session_store_create(&p_engine->sessions, p_target, daily, now, p_out_session_id);
    if (result != ENGINE_OK) return result;

    if (p_engine->config.debug)
    {
        fprintf(stderr, "New %s session %s (target '%s').\n", daily ? "daily" : "random", p_out_session_id, p_target->word);
    }
    else
    {
        fprintf(stderr, "New %s session %s.\n", daily ? "daily" : "random", p_out_session_id);
    }
    return ENGINE_OK;
}

engine_error_t semantle_submit_guess(semantle_engine_t* p_engine, const char* session_id, const char* raw_word,
    time_t now, attempt_result_t* p_result)
{
    return submit_guess(&p_engine->sessions, &p_engine->vocabulary, session_id, raw_word,
        p_engine->config.reject_duplicates, now, p_result);
}

engine_error_t semantle_get_session(semantle_engine_t* p_engine, const char* session_id, time_t now,
    game_session_view_t* p_view)
{
    return session_store_get(&p_engine->sessions, session_id, now, p_view);
}

bool semantle_validate_word(const semantle_engine_t* p_engine, const char* raw_word)
{
    return vocabulary_contains(&p_engine->vocabulary, raw_word);
}

engine_error_t semantle_save_user_stats(semantle_engine_t* p_engine, const char* user_id, const char* session_id,
    time_t now)
{
    game_session_view_t view;
    engine_error_t result = semantle_get_session(p_engine, session_id, now, &view);
    if (result != ENGINE_OK) return result;

    game_record_t record;
    memset(&record, 0, sizeof(record));
    memcpy(record.session_id, view.session_id, sizeof(record.session_id));
    memcpy(record.target_word, view.target_word, sizeof(record.target_word));
    record.attempts = view.attempt_count;
    record.completed = view.is_completed;
    record.daily_word = view.is_daily;
    free_session_view(&view);

    if (!format_utc_timestamp(now, record.date)) return ENGINE_ERROR_INTERNAL;
    return user_stats_record_game(&p_engine->stats, user_id, &record);
}

engine_error_t semantle_get_user_stats(semantle_engine_t* p_engine, const char* user_id,
    user_stats_summary_t* p_summary)
{
    return user_stats_get(&p_engine->stats, user_id, p_summary);
}

int semantle_sweep_expired(semantle_engine_t* p_engine, time_t now)
{
    int evicted = session_store_evict_expired(&p_engine->sessions, now);
    if (evicted > 0) fprintf(stderr, "Evicted %d expired sessions.\n", evicted);
    return evicted;
}
