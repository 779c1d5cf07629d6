/*
 * FILE: game_protocol.cpp
 *
 * WHAT:
 * Schema checks for request bodies and the JSON shapes of every response.
 */

#include "game_protocol.h"
#include "target_selector.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>
#include <math.h>
#include <memory>
#include <vector>

static bool is_blank(const char* text)
{
    if (text == NULL) return true;
    while (*text != '\0')
    {
        if (!isspace((unsigned char)*text)) return false;
        text++;
    }
    return true;
}

/*
 * FUNCTION: parse_object_body
 *
 * WHAT:
 * Parses `p_body` strictly (no comments, no trailing data, no duplicate
 * keys) and requires a JSON object whose member names all appear in
 * `allowed_fields`.
 */
static bool parse_object_body(const char* p_body, const char* const* allowed_fields, int allowed_count, Json::Value* p_root)
{
    if (p_body == NULL) return false;

    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(p_body, p_body + strlen(p_body), p_root, &errors) || !p_root->isObject()) return false;

    std::vector<std::string> names = p_root->getMemberNames();
    for (size_t i = 0; i < names.size(); i++)
    {
        bool known = false;
        for (int k = 0; k < allowed_count && !known; k++) known = (names[i] == allowed_fields[k]);
        if (!known) return false;
    }
    return true;
}

/*
 * FUNCTION: copy_string_field
 *
 * RETURNS:
 * - 0 on success, -1 if the field is missing or not a string,
 *   1 if it does not fit in `out_size` bytes.
 */
static int copy_string_field(const Json::Value& root, const char* name, char* p_out, size_t out_size)
{
    const Json::Value& value = root[name];
    if (!value.isString()) return -1;

    std::string text = value.asString();
    if (text.size() >= out_size) return 1;
    memcpy(p_out, text.c_str(), text.size() + 1);
    return 0;
}

engine_error_t parse_new_game_request(const char* p_body, new_game_request_t* p_request)
{
    p_request->daily = false;
    if (is_blank(p_body)) return ENGINE_OK;

    static const char* const fields[] = { "daily" };
    Json::Value root;
    if (!parse_object_body(p_body, fields, 1, &root)) return ENGINE_ERROR_BAD_REQUEST;

    if (root.isMember("daily"))
    {
        if (!root["daily"].isBool()) return ENGINE_ERROR_BAD_REQUEST;
        p_request->daily = root["daily"].asBool();
    }
    return ENGINE_OK;
}

engine_error_t parse_guess_request(const char* p_body, guess_request_t* p_request)
{
    memset(p_request, 0, sizeof(guess_request_t));

    static const char* const fields[] = { "session_id", "word" };
    Json::Value root;
    if (!parse_object_body(p_body, fields, 2, &root)) return ENGINE_ERROR_BAD_REQUEST;

    int status = copy_string_field(root, "session_id", p_request->session_id, sizeof(p_request->session_id));
    if (status < 0 || (status == 0 && p_request->session_id[0] == '\0')) return ENGINE_ERROR_BAD_REQUEST;
    if (status > 0) return ENGINE_ERROR_SESSION_NOT_FOUND;

    status = copy_string_field(root, "word", p_request->word, sizeof(p_request->word));
    if (status < 0) return ENGINE_ERROR_BAD_REQUEST;
    if (status > 0) return ENGINE_ERROR_INVALID_WORD;
    return ENGINE_OK;
}

engine_error_t parse_save_stats_request(const char* p_body, save_stats_request_t* p_request)
{
    memset(p_request, 0, sizeof(save_stats_request_t));

    static const char* const fields[] = { "user_id", "session_id" };
    Json::Value root;
    if (!parse_object_body(p_body, fields, 2, &root)) return ENGINE_ERROR_BAD_REQUEST;

    int status = copy_string_field(root, "user_id", p_request->user_id, sizeof(p_request->user_id));
    if (status != 0 || p_request->user_id[0] == '\0') return ENGINE_ERROR_BAD_REQUEST;

    status = copy_string_field(root, "session_id", p_request->session_id, sizeof(p_request->session_id));
    if (status < 0 || (status == 0 && p_request->session_id[0] == '\0')) return ENGINE_ERROR_BAD_REQUEST;
    if (status > 0) return ENGINE_ERROR_SESSION_NOT_FOUND;
    return ENGINE_OK;
}

static double round_to(double value, double scale)
{
    return round(value * scale) / scale;
}

static std::string timestamp_string(time_t when)
{
    char text[ISO_TIMESTAMP_LENGTH + 1];
    if (!format_utc_timestamp(when, text)) return std::string();
    return std::string(text);
}

Json::Value session_view_to_json(const game_session_view_t* p_view, bool expose_target)
{
    Json::Value root(Json::objectValue);
    root["session_id"] = p_view->session_id;
    if (expose_target) root["target_word"] = p_view->target_word;

    Json::Value attempts(Json::arrayValue);
    for (int i = 0; i < p_view->attempt_count; i++)
    {
        const attempt_t* pAttempt = &p_view->p_attempts[i];
        Json::Value attempt(Json::objectValue);
        attempt["word"] = pAttempt->word;
        attempt["similarity"] = round_to(pAttempt->similarity, 1e6);
        attempt["rank"] = pAttempt->rank;
        attempt["is_correct"] = pAttempt->is_correct;
        attempt["timestamp"] = timestamp_string(pAttempt->submitted_at);
        attempts.append(attempt);
    }
    root["attempts"] = attempts;
    root["is_completed"] = p_view->is_completed;
    root["daily_word"] = p_view->is_daily;
    root["created_at"] = timestamp_string(p_view->created_at);
    return root;
}

Json::Value guess_result_to_json(const attempt_result_t* p_result, const char* session_id)
{
    Json::Value root(Json::objectValue);
    root["similarity"] = round_to(p_result->similarity, 1e6);
    root["rank"] = p_result->rank;
    root["is_correct"] = p_result->is_correct;
    root["session_id"] = session_id;
    root["attempts"] = p_result->attempt_count;
    return root;
}

Json::Value user_stats_to_json(const user_stats_summary_t* p_summary)
{
    Json::Value root(Json::objectValue);
    root["total_games"] = p_summary->total_games;
    root["completed_games"] = p_summary->completed_games;
    root["average_attempts"] = p_summary->average_attempts;
    root["best_score"] = p_summary->best_score;

    Json::Value history(Json::arrayValue);
    for (int i = 0; i < p_summary->recent_count; i++)
    {
        const game_record_t* pRecord = &p_summary->p_recent[i];
        Json::Value record(Json::objectValue);
        record["session_id"] = pRecord->session_id;
        record["target_word"] = pRecord->target_word;
        record["attempts"] = pRecord->attempts;
        record["completed"] = pRecord->completed;
        record["daily_word"] = pRecord->daily_word;
        record["date"] = pRecord->date;
        history.append(record);
    }
    root["games_history"] = history;
    return root;
}

Json::Value validate_word_to_json(bool valid, const char* word)
{
    Json::Value root(Json::objectValue);
    root["valid"] = valid;
    root["word"] = word;
    return root;
}

Json::Value error_to_json(engine_error_t error)
{
    Json::Value root(Json::objectValue);
    root["error"] = engine_error_code(error);
    root["message"] = engine_error_message(error);
    root["retryable"] = engine_error_is_retryable(error);
    return root;
}

Json::Value api_info_to_json()
{
    Json::Value game(Json::objectValue);
    game["new"] = "POST /api/game/new";
    game["guess"] = "POST /api/game/guess";
    game["session"] = "GET /api/game/{session_id}";

    Json::Value stats(Json::objectValue);
    stats["get"] = "GET /api/stats/{user_id}";
    stats["save"] = "POST /api/stats";

    Json::Value endpoints(Json::objectValue);
    endpoints["game"] = game;
    endpoints["stats"] = stats;
    endpoints["words"] = "GET /api/words/validate/{word}";

    Json::Value root(Json::objectValue);
    root["message"] = "Semantle API";
    root["version"] = "1.0.0";
    root["endpoints"] = endpoints;
    return root;
}

std::string write_compact_json(const Json::Value& value)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    // Values are pre-rounded; 15 significant digits prints them without float noise.
    writer["precision"] = 15;
    return Json::writeString(writer, value);
}
