/*
 * FILE: request_router.cpp
 *
 * WHAT:
 * Path matching, query flags and the glue between request schemas, engine
 * operations and response builders.
 */

#include "request_router.h"
#include "game_protocol.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>

const int MAX_TARGET_LENGTH = 2048;

static void respond_json(route_response_t* p_response, int status, const Json::Value& body)
{
    p_response->status = status;
    p_response->body = write_compact_json(body);
}

static void respond_error(route_response_t* p_response, engine_error_t error)
{
    respond_json(p_response, engine_error_http_status(error), error_to_json(error));
}

static int hex_value(char ch)
{
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

bool percent_decode(const char* p_in, size_t in_length, char* p_out, size_t out_size)
{
    size_t used = 0;
    for (size_t i = 0; i < in_length; i++)
    {
        char ch = p_in[i];
        if (ch == '%')
        {
            if (i + 2 >= in_length) return false;
            int high = hex_value(p_in[i + 1]);
            int low = hex_value(p_in[i + 2]);
            // %00 would silently truncate the segment.
            if (high < 0 || low < 0 || (high == 0 && low == 0)) return false;
            ch = (char)(high * 16 + low);
            i += 2;
        }
        if (used + 1 >= out_size) return false;
        p_out[used++] = ch;
    }
    p_out[used] = '\0';
    return true;
}

/*
 * FUNCTION: query_flag_is_set
 *
 * true if the query string holds `name=true` or `name=1`.
 */
static bool query_flag_is_set(const char* query, const char* name)
{
    if (query == NULL) return false;
    size_t name_length = strlen(name);

    const char* p = query;
    while (*p != '\0')
    {
        const char* p_end = strchr(p, '&');
        size_t length = (p_end != NULL) ? (size_t)(p_end - p) : strlen(p);

        if (length > name_length && strncmp(p, name, name_length) == 0 && p[name_length] == '=')
        {
            const char* value = p + name_length + 1;
            size_t value_length = length - name_length - 1;
            if ((value_length == 4 && strncmp(value, "true", 4) == 0) || (value_length == 1 && value[0] == '1'))
            {
                return true;
            }
        }

        if (p_end == NULL) break;
        p = p_end + 1;
    }
    return false;
}

/*
 * FUNCTION: match_segment
 *
 * WHAT:
 * If `path` is `prefix` followed by exactly one non-empty segment, decodes
 * that segment into `p_out`.
 *
 * RETURNS:
 * - 1 on a match, 0 if the path does not have this shape,
 *   -1 if it does but the segment is malformed or too long.
 */
static int match_segment(const char* path, const char* prefix, char* p_out, size_t out_size)
{
    size_t prefix_length = strlen(prefix);
    if (strncmp(path, prefix, prefix_length) != 0) return 0;

    const char* segment = path + prefix_length;
    size_t length = strlen(segment);
    if (length == 0 || memchr(segment, '/', length) != NULL) return 0;

    return percent_decode(segment, length, p_out, out_size) ? 1 : -1;
}

static void send_session_view(semantle_engine_t* p_engine, const char* session_id, bool expose_target, time_t now,
    route_response_t* p_response)
{
    game_session_view_t view;
    engine_error_t result = semantle_get_session(p_engine, session_id, now, &view);
    if (result != ENGINE_OK)
    {
        respond_error(p_response, result);
        return;
    }
    respond_json(p_response, 200, session_view_to_json(&view, expose_target));
    free_session_view(&view);
}

static void handle_new_game(semantle_engine_t* p_engine, const char* body, bool expose_target, time_t now,
    route_response_t* p_response)
{
    new_game_request_t request;
    engine_error_t result = parse_new_game_request(body, &request);
    if (result != ENGINE_OK)
    {
        respond_error(p_response, result);
        return;
    }

    char session_id[SESSION_ID_LENGTH + 1];
    result = semantle_new_game(p_engine, request.daily, now, session_id);
    if (result != ENGINE_OK)
    {
        respond_error(p_response, result);
        return;
    }
    send_session_view(p_engine, session_id, expose_target, now, p_response);
}

static void handle_guess(semantle_engine_t* p_engine, const char* body, time_t now, route_response_t* p_response)
{
    guess_request_t request;
    engine_error_t result = parse_guess_request(body, &request);
    if (result != ENGINE_OK)
    {
        respond_error(p_response, result);
        return;
    }

    attempt_result_t attempt;
    result = semantle_submit_guess(p_engine, request.session_id, request.word, now, &attempt);
    if (result != ENGINE_OK)
    {
        respond_error(p_response, result);
        return;
    }
    respond_json(p_response, 200, guess_result_to_json(&attempt, request.session_id));
}

static void send_user_stats(semantle_engine_t* p_engine, const char* user_id, route_response_t* p_response)
{
    user_stats_summary_t summary;
    engine_error_t result = semantle_get_user_stats(p_engine, user_id, &summary);
    if (result != ENGINE_OK)
    {
        respond_error(p_response, result);
        return;
    }
    respond_json(p_response, 200, user_stats_to_json(&summary));
    free_user_stats_summary(&summary);
}

static void handle_save_stats(semantle_engine_t* p_engine, const char* body, time_t now, route_response_t* p_response)
{
    save_stats_request_t request;
    engine_error_t result = parse_save_stats_request(body, &request);
    if (result == ENGINE_OK) result = semantle_save_user_stats(p_engine, request.user_id, request.session_id, now);
    if (result != ENGINE_OK)
    {
        respond_error(p_response, result);
        return;
    }
    send_user_stats(p_engine, request.user_id, p_response);
}

void route_request(semantle_engine_t* p_engine, const char* method, const char* target, const char* body,
    time_t now, route_response_t* p_response)
{
    if (method == NULL || target == NULL || strlen(target) > (size_t)MAX_TARGET_LENGTH)
    {
        respond_error(p_response, ENGINE_ERROR_BAD_REQUEST);
        return;
    }

    // 1. Split path and query; ignore one trailing slash.
    char path[MAX_TARGET_LENGTH + 1];
    snprintf(path, sizeof(path), "%s", target);
    const char* query = NULL;
    char* p_question = strchr(path, '?');
    if (p_question != NULL)
    {
        *p_question = '\0';
        query = p_question + 1;
    }
    size_t path_length = strlen(path);
    if (path_length > 1 && path[path_length - 1] == '/') path[path_length - 1] = '\0';

    bool is_get = (strcmp(method, "GET") == 0);
    bool is_post = (strcmp(method, "POST") == 0);
    bool expose_target = p_engine->config.debug || query_flag_is_set(query, "debug");

    // 2. Fixed routes
    if (is_get && strcmp(path, "/") == 0)
    {
        Json::Value root(Json::objectValue);
        root["message"] = "Semantle API is running";
        respond_json(p_response, 200, root);
        return;
    }
    if (is_get && strcmp(path, "/api") == 0)
    {
        respond_json(p_response, 200, api_info_to_json());
        return;
    }
    if (is_post && strcmp(path, "/api/game/new") == 0)
    {
        handle_new_game(p_engine, body, expose_target, now, p_response);
        return;
    }
    if (is_post && strcmp(path, "/api/game/guess") == 0)
    {
        handle_guess(p_engine, body, now, p_response);
        return;
    }
    if (is_post && strcmp(path, "/api/stats") == 0)
    {
        handle_save_stats(p_engine, body, now, p_response);
        return;
    }

    // 3. Routes with a path parameter
    if (is_get)
    {
        char session_id[SESSION_ID_LENGTH + 1];
        int matched = match_segment(path, "/api/game/", session_id, sizeof(session_id));
        if (matched != 0)
        {
            // An id that does not even fit cannot name a session.
            if (matched < 0) respond_error(p_response, ENGINE_ERROR_SESSION_NOT_FOUND);
            else send_session_view(p_engine, session_id, expose_target, now, p_response);
            return;
        }

        char word[MAX_RAW_WORD_LENGTH + 1];
        matched = match_segment(path, "/api/words/validate/", word, sizeof(word));
        if (matched != 0)
        {
            if (matched < 0) respond_json(p_response, 200, validate_word_to_json(false, ""));
            else respond_json(p_response, 200, validate_word_to_json(semantle_validate_word(p_engine, word), word));
            return;
        }

        char user_id[MAX_USER_ID_LENGTH + 1];
        matched = match_segment(path, "/api/stats/", user_id, sizeof(user_id));
        if (matched != 0)
        {
            if (matched < 0) respond_error(p_response, ENGINE_ERROR_BAD_REQUEST);
            else send_user_stats(p_engine, user_id, p_response);
            return;
        }
    }

    respond_error(p_response, ENGINE_ERROR_NOT_FOUND);
}

bool parse_request_line(char* line, char** pp_method, char** pp_target, char** pp_body)
{
    // Strip the line terminator.
    size_t length = strlen(line);
    while (length > 0 && (line[length - 1] == '\n' || line[length - 1] == '\r')) line[--length] = '\0';

    char* p = line;
    while (*p == ' ' || *p == '\t') p++;
    if (*p == '\0') return false;
    *pp_method = p;
    while (*p != '\0' && *p != ' ' && *p != '\t') p++;
    if (*p == '\0') return false;
    *p++ = '\0';

    while (*p == ' ' || *p == '\t') p++;
    if (*p == '\0') return false;
    *pp_target = p;
    while (*p != '\0' && *p != ' ' && *p != '\t') p++;
    if (*p != '\0') *p++ = '\0';

    while (*p == ' ' || *p == '\t') p++;
    *pp_body = p;
    return true;
}
