/*
 * PROJECT: Semantle Guess Ranking & Session Engine
 *
 * ARCHITECTURE OVERVIEW:
 * The engine behind a semantic word-guessing game. A player submits guesses;
 * each guess is scored by cosine similarity to a hidden target word and by
 * its rank among the whole vocabulary, until the player finds the target.
 *
 * 1. Data Layer: the vocabulary (words + embedding vectors), loaded once and
 * shared read-only, plus the embedding provider that fills in vectors the
 * vocabulary file does not carry.
 * 2. Logic Layer: the similarity ranker (cosine + full-vocabulary ranking)
 * and the target selector (random, or a pure function of the UTC date for
 * the daily challenge).
 * 3. Session Layer: the session store (per-session locks, TTL expiry) and
 * the guess evaluator that runs each guess as one atomic transition.
 *
 * THIS DRIVER:
 * Reads one request per line from stdin and writes one response per line:
 *
 *   > POST /api/game/new {"daily": true}
 *   < 200 {"attempts":[],"created_at":"...","daily_word":true,...}
 *   > POST /api/game/guess {"session_id": "...", "word": "dog"}
 *   < 200 {"attempts":1,"is_correct":false,"rank":2,...}
 *
 * Startup messages precede the first response; "quit" or EOF stops.
 */

#include "engine_config.h"
#include "semantle_engine.h"
#include "request_router.h"
#include "game_protocol.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

static void print_usage(const char* program)
{
    fprintf(stderr,
        "Usage: %s --vocabulary <file> [--targets <file>] [--stats <file>]\n"
        "          [--session-ttl <seconds>] [--max-sessions <n>] [--reject-duplicates] [--debug]\n"
        "Environment: SEMANTLE_VOCABULARY, SEMANTLE_TARGETS, SEMANTLE_STATS_FILE, SEMANTLE_SESSION_TTL,\n"
        "             SEMANTLE_MAX_SESSIONS, SEMANTLE_REJECT_DUPLICATES, SEMANTLE_DEBUG, OPENAI_API_KEY,\n"
        "             SEMANTLE_EMBEDDING_URL, SEMANTLE_EMBEDDING_MODEL, SEMANTLE_PROVIDER_TIMEOUT_MS\n",
        program);
}

static bool is_quit_command(const char* line)
{
    return strncmp(line, "quit", 4) == 0 || strncmp(line, "exit", 4) == 0;
}

int main(int argc, char* argv[])
{
    // 1. Configuration: defaults, then environment, then flags.
    engine_config_t config;
    init_default_engine_config(&config);
    if (!apply_environment_to_engine_config(&config) || !apply_arguments_to_engine_config(&config, argc, argv))
    {
        print_usage(argv[0]);
        return 1;
    }
    if (config.vocabulary_path[0] == '\0')
    {
        fprintf(stderr, "No vocabulary file given.\n");
        print_usage(argv[0]);
        return 1;
    }
    print_engine_config(&config);

    // 2. Engine
    semantle_engine_t engine;
    engine_error_t result = semantle_engine_init(&engine, &config);
    if (result != ENGINE_OK)
    {
        fprintf(stderr, "Startup failed: %s (%s)\n", engine_error_code(result), engine_error_message(result));
        return 1;
    }
    printf("Ready. Enter requests as: METHOD PATH [JSON]\n");
    fflush(stdout);

    // 3. Request loop
    char* line = NULL;
    size_t line_capacity = 0;
    while (getline(&line, &line_capacity, stdin) != -1)
    {
        if (is_quit_command(line)) break;

        char* method = NULL;
        char* target = NULL;
        char* body = NULL;
        if (!parse_request_line(line, &method, &target, &body))
        {
            if (line[0] != '\0')
            {
                printf("%d %s\n", engine_error_http_status(ENGINE_ERROR_BAD_REQUEST),
                    write_compact_json(error_to_json(ENGINE_ERROR_BAD_REQUEST)).c_str());
            }
            fflush(stdout);
            continue;
        }

        time_t now = time(NULL);
        semantle_sweep_expired(&engine, now);

        route_response_t response;
        route_request(&engine, method, target, body, now, &response);
        printf("%d %s\n", response.status, response.body.c_str());
        fflush(stdout);
    }
    free(line);

    semantle_engine_destroy(&engine);
    return 0;
}
