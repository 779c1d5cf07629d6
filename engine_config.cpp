/*
 * FILE: engine_config.cpp
 *
 * WHAT:
 * Compiled defaults and the parsers that layer environment variables and
 * command-line flags on top of them.
 *
 * PRECEDENCE:
 * defaults < environment < command line. `main` applies them in that order.
 */

#include "engine_config.h"
#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <ctype.h>
#include <errno.h>
#include <limits.h>

const int DEFAULT_SESSION_TTL_SECONDS = 3600;
const int DEFAULT_MAX_SESSIONS = 4096;
const long DEFAULT_PROVIDER_TIMEOUT_MS = 10000;
const char* DEFAULT_EMBEDDING_URL = "https://api.openai.com/v1";
const char* DEFAULT_EMBEDDING_MODEL = "text-embedding-3-large";

/*
 * HELPER: copy_bounded
 *
 * Copies `value` into a fixed buffer, refusing (rather than truncating)
 * values that do not fit.
 */
static bool copy_bounded(char* p_target, size_t target_size, const char* value, const char* name)
{
    size_t len = strlen(value);
    if (len >= target_size)
    {
        fprintf(stderr, "Config: value for %s is too long (%zu bytes, limit %zu).\n", name, len, target_size - 1);
        return false;
    }
    memcpy(p_target, value, len + 1);
    return true;
}

/*
 * HELPER: parse_bounded_long
 *
 * Strict integer parse: the whole string must be digits and the result must
 * lie in [min_value, max_value].
 */
static bool parse_bounded_long(const char* text, long min_value, long max_value, long* p_value)
{
    if (text == NULL || *text == '\0') return false;

    char* p_end = NULL;
    errno = 0;
    long value = strtol(text, &p_end, 10);
    if (errno != 0 || p_end == text || *p_end != '\0') return false;
    if (value < min_value || value > max_value) return false;

    *p_value = value;
    return true;
}

static bool parse_bool(const char* text, bool* p_value)
{
    char lowered[8];
    size_t len = strlen(text);
    if (len == 0 || len >= sizeof(lowered)) return false;
    for (size_t i = 0; i <= len; i++) lowered[i] = (char)tolower((unsigned char)text[i]);

    if (strcmp(lowered, "1") == 0 || strcmp(lowered, "true") == 0 || strcmp(lowered, "yes") == 0 || strcmp(lowered, "on") == 0)
    {
        *p_value = true;
        return true;
    }
    if (strcmp(lowered, "0") == 0 || strcmp(lowered, "false") == 0 || strcmp(lowered, "no") == 0 || strcmp(lowered, "off") == 0)
    {
        *p_value = false;
        return true;
    }
    return false;
}

void init_default_engine_config(engine_config_t* p_config)
{
    memset(p_config, 0, sizeof(engine_config_t));
    p_config->session_ttl_seconds = DEFAULT_SESSION_TTL_SECONDS;
    p_config->max_sessions = DEFAULT_MAX_SESSIONS;
    p_config->reject_duplicates = false;
    p_config->debug = false;
    p_config->provider_timeout_ms = DEFAULT_PROVIDER_TIMEOUT_MS;
    snprintf(p_config->embedding_url, sizeof(p_config->embedding_url), "%s", DEFAULT_EMBEDDING_URL);
    snprintf(p_config->embedding_model, sizeof(p_config->embedding_model), "%s", DEFAULT_EMBEDDING_MODEL);
}

bool apply_environment_to_engine_config(engine_config_t* p_config)
{
    bool ok = true;
    const char* value;
    long number;

    if ((value = getenv("SEMANTLE_VOCABULARY")) != NULL)
        ok = copy_bounded(p_config->vocabulary_path, sizeof(p_config->vocabulary_path), value, "SEMANTLE_VOCABULARY") && ok;
    if ((value = getenv("SEMANTLE_TARGETS")) != NULL)
        ok = copy_bounded(p_config->targets_path, sizeof(p_config->targets_path), value, "SEMANTLE_TARGETS") && ok;
    if ((value = getenv("SEMANTLE_STATS_FILE")) != NULL)
        ok = copy_bounded(p_config->stats_path, sizeof(p_config->stats_path), value, "SEMANTLE_STATS_FILE") && ok;
    if ((value = getenv("SEMANTLE_EMBEDDING_URL")) != NULL)
        ok = copy_bounded(p_config->embedding_url, sizeof(p_config->embedding_url), value, "SEMANTLE_EMBEDDING_URL") && ok;
    if ((value = getenv("SEMANTLE_EMBEDDING_MODEL")) != NULL)
        ok = copy_bounded(p_config->embedding_model, sizeof(p_config->embedding_model), value, "SEMANTLE_EMBEDDING_MODEL") && ok;
    if ((value = getenv("OPENAI_API_KEY")) != NULL)
        ok = copy_bounded(p_config->api_key, sizeof(p_config->api_key), value, "OPENAI_API_KEY") && ok;

    if ((value = getenv("SEMANTLE_SESSION_TTL")) != NULL)
    {
        if (parse_bounded_long(value, 0, INT_MAX, &number)) p_config->session_ttl_seconds = (int)number;
        else { fprintf(stderr, "Config: SEMANTLE_SESSION_TTL must be a non-negative integer, got '%s'.\n", value); ok = false; }
    }
    if ((value = getenv("SEMANTLE_MAX_SESSIONS")) != NULL)
    {
        if (parse_bounded_long(value, 1, 1 << 24, &number)) p_config->max_sessions = (int)number;
        else { fprintf(stderr, "Config: SEMANTLE_MAX_SESSIONS must be a positive integer, got '%s'.\n", value); ok = false; }
    }
    if ((value = getenv("SEMANTLE_PROVIDER_TIMEOUT_MS")) != NULL)
    {
        if (parse_bounded_long(value, 1, LONG_MAX, &number)) p_config->provider_timeout_ms = number;
        else { fprintf(stderr, "Config: SEMANTLE_PROVIDER_TIMEOUT_MS must be a positive integer, got '%s'.\n", value); ok = false; }
    }
    if ((value = getenv("SEMANTLE_REJECT_DUPLICATES")) != NULL)
    {
        if (!parse_bool(value, &p_config->reject_duplicates))
        {
            fprintf(stderr, "Config: SEMANTLE_REJECT_DUPLICATES must be a boolean, got '%s'.\n", value);
            ok = false;
        }
    }
    if ((value = getenv("SEMANTLE_DEBUG")) != NULL)
    {
        if (!parse_bool(value, &p_config->debug))
        {
            fprintf(stderr, "Config: SEMANTLE_DEBUG must be a boolean, got '%s'.\n", value);
            ok = false;
        }
    }
    return ok;
}

bool apply_arguments_to_engine_config(engine_config_t* p_config, int argc, char* argv[])
{
    for (int i = 1; i < argc; i++)
    {
        const char* flag = argv[i];

        // Boolean switches
        if (strcmp(flag, "--reject-duplicates") == 0) { p_config->reject_duplicates = true; continue; }
        if (strcmp(flag, "--debug") == 0) { p_config->debug = true; continue; }

        // Everything else takes a value
        if (i + 1 >= argc)
        {
            fprintf(stderr, "Missing value for %s\n", flag);
            return false;
        }
        const char* value = argv[++i];
        long number;

        if (strcmp(flag, "--vocabulary") == 0)
        {
            if (!copy_bounded(p_config->vocabulary_path, sizeof(p_config->vocabulary_path), value, flag)) return false;
        }
        else if (strcmp(flag, "--targets") == 0)
        {
            if (!copy_bounded(p_config->targets_path, sizeof(p_config->targets_path), value, flag)) return false;
        }
        else if (strcmp(flag, "--stats") == 0)
        {
            if (!copy_bounded(p_config->stats_path, sizeof(p_config->stats_path), value, flag)) return false;
        }
        else if (strcmp(flag, "--session-ttl") == 0)
        {
            if (!parse_bounded_long(value, 0, INT_MAX, &number)) { fprintf(stderr, "Invalid %s '%s'\n", flag, value); return false; }
            p_config->session_ttl_seconds = (int)number;
        }
        else if (strcmp(flag, "--max-sessions") == 0)
        {
            if (!parse_bounded_long(value, 1, 1 << 24, &number)) { fprintf(stderr, "Invalid %s '%s'\n", flag, value); return false; }
            p_config->max_sessions = (int)number;
        }
        else
        {
            fprintf(stderr, "Unknown option %s\n", flag);
            return false;
        }
    }
    return true;
}

void print_engine_config(const engine_config_t* p_config)
{
    fprintf(stderr, "Configuration:\n");
    fprintf(stderr, "  vocabulary        : %s\n", p_config->vocabulary_path[0] ? p_config->vocabulary_path : "(none)");
    fprintf(stderr, "  targets           : %s\n", p_config->targets_path[0] ? p_config->targets_path : "(all words)");
    fprintf(stderr, "  stats file        : %s\n", p_config->stats_path[0] ? p_config->stats_path : "(memory only)");
    fprintf(stderr, "  session ttl       : %d s\n", p_config->session_ttl_seconds);
    fprintf(stderr, "  max sessions      : %d\n", p_config->max_sessions);
    fprintf(stderr, "  reject duplicates : %s\n", p_config->reject_duplicates ? "yes" : "no");
    fprintf(stderr, "  debug             : %s\n", p_config->debug ? "yes" : "no");
    fprintf(stderr, "  embedding url     : %s\n", p_config->embedding_url);
    fprintf(stderr, "  embedding model   : %s\n", p_config->embedding_model);
    fprintf(stderr, "  provider          : %s\n", p_config->api_key[0] ? "enabled" : "disabled");
    fprintf(stderr, "  provider timeout  : %ld ms\n", p_config->provider_timeout_ms);
}
