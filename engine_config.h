/*
 * FILE: engine_config.h
 *
 * WHAT:
 * Defines the configuration structure of the engine and the functions that
 * fill it from compiled defaults, the environment and the command line.
 *
 * WHY:
 * Hardcoding paths and limits makes testing difficult. By collecting every
 * tunable in one data structure, tests can build an engine with a tiny TTL or
 * with duplicate rejection switched on, and deployments can change the
 * provider endpoint without recompiling.
 */

#pragma once
#ifndef ENGINE_CONFIG_H
#define ENGINE_CONFIG_H

#include "semantle_types.h"

/*
 * STRUCT: engine_config_t
 *
 * WHAT:
 * The master configuration object for a single engine instance.
 * Passed into `semantle_engine_init`.
 */
typedef struct _engine_config
{
    // --- Data Files ---

    // 1. Vocabulary file (JSON object or whitespace separated text, see load_vocabulary.h).
    // Env: SEMANTLE_VOCABULARY   Flag: --vocabulary
    char vocabulary_path[MAX_PATH_LENGTH + 1];

    // 2. Optional target list, JSON {"words": [...]}. Empty = every word is a candidate.
    // Env: SEMANTLE_TARGETS      Flag: --targets
    char targets_path[MAX_PATH_LENGTH + 1];

    // 3. Optional user statistics file. Empty = statistics are kept in memory only.
    // Env: SEMANTLE_STATS_FILE   Flag: --stats
    char stats_path[MAX_PATH_LENGTH + 1];

    // --- Sessions ---

    // 4. Inactivity TTL in seconds after which a session is evicted. 0 = never.
    // Env: SEMANTLE_SESSION_TTL  Flag: --session-ttl
    int session_ttl_seconds;

    // 5. Upper bound on live sessions held by the store.
    // Env: SEMANTLE_MAX_SESSIONS Flag: --max-sessions
    int max_sessions;

    // 6. If true, guessing a word already present in the session fails with
    // ENGINE_ERROR_DUPLICATE_GUESS instead of being re-scored.
    // Env: SEMANTLE_REJECT_DUPLICATES  Flag: --reject-duplicates
    bool reject_duplicates;

    // 7. If true, responses expose target words even without ?debug=true,
    // and logs print target words.
    // Env: SEMANTLE_DEBUG        Flag: --debug
    bool debug;

    // --- Embedding Provider ---

    // 8. Base URL of an OpenAI compatible API; "/embeddings" is appended.
    // Env: SEMANTLE_EMBEDDING_URL
    char embedding_url[MAX_PATH_LENGTH + 1];

    // 9. Model name sent with each request.
    // Env: SEMANTLE_EMBEDDING_MODEL
    char embedding_model[128];

    // 10. Bearer token. Empty = no provider (pending vectors are a load error).
    // Env: OPENAI_API_KEY
    char api_key[256];

    // 11. Upper bound on one provider call, in milliseconds.
    // Env: SEMANTLE_PROVIDER_TIMEOUT_MS
    long provider_timeout_ms;

} engine_config_t;

// --- DEFAULTS ---
extern const int DEFAULT_SESSION_TTL_SECONDS;
extern const int DEFAULT_MAX_SESSIONS;
extern const long DEFAULT_PROVIDER_TIMEOUT_MS;
extern const char* DEFAULT_EMBEDDING_URL;
extern const char* DEFAULT_EMBEDDING_MODEL;

/*
 * FUNCTION: init_default_engine_config
 *
 * Fills every field with its compiled default. Paths and the API key are empty.
 */
void init_default_engine_config(engine_config_t* p_config);

/*
 * FUNCTION: apply_environment_to_engine_config
 *
 * WHAT:
 * Overrides fields from the environment variables listed above.
 *
 * RETURNS:
 * - false if a numeric or boolean variable could not be parsed (the message is
 *   printed to stderr and the field keeps its previous value).
 */
bool apply_environment_to_engine_config(engine_config_t* p_config);

/*
 * FUNCTION: apply_arguments_to_engine_config
 *
 * WHAT:
 * Overrides fields from `--flag value` pairs (booleans take no value).
 *
 * RETURNS:
 * - false on an unknown flag, a missing value or an unparsable number.
 */
bool apply_arguments_to_engine_config(engine_config_t* p_config, int argc, char* argv[]);

/*
 * FUNCTION: print_engine_config
 *
 * Writes the effective configuration to stderr. The API key is never printed.
 */
void print_engine_config(const engine_config_t* p_config);

#endif
