/*
 * FILE: user_stats.cpp
 *
 * WHAT:
 * Implements the statistics table and its JSON file format:
 * { "<user_id>": { "total_games": n, "completed_games": n, "total_attempts": n,
 *                  "games_history": [ {session_id, target_word, attempts,
 *                                      completed, daily_word, date}, ... ] } }
 */

#include "user_stats.h"
#include <json/json.h>
#include <stdio.h>
#include <string.h>
#include <math.h>
#include <memory>
#include <string>
#include <vector>

static bool is_valid_user_id(const char* user_id)
{
    if (user_id == NULL) return false;
    size_t length = strlen(user_id);
    return length > 0 && length <= (size_t)MAX_USER_ID_LENGTH;
}

// --- Table (lock held) ---

static user_stats_entry_t* find_user(user_stats_store_t* p_stats, const char* user_id)
{
    for (int i = 0; i < p_stats->user_count; i++)
    {
        if (strcmp(p_stats->p_users[i].user_id, user_id) == 0) return &p_stats->p_users[i];
    }
    return NULL;
}

static user_stats_entry_t* add_user(user_stats_store_t* p_stats, const char* user_id)
{
    if (p_stats->user_count == p_stats->user_capacity)
    {
        int new_capacity = (p_stats->user_capacity == 0) ? 16 : p_stats->user_capacity * 2;
        user_stats_entry_t* ptr = (user_stats_entry_t*)realloc(p_stats->p_users, sizeof(user_stats_entry_t) * new_capacity);
        if (ptr == NULL) return NULL;
        p_stats->p_users = ptr;
        p_stats->user_capacity = new_capacity;
    }

    game_record_t* p_history = (game_record_t*)calloc(MAX_GAMES_HISTORY, sizeof(game_record_t));
    if (p_history == NULL) return NULL;

    user_stats_entry_t* pUser = &p_stats->p_users[p_stats->user_count++];
    memset(pUser, 0, sizeof(user_stats_entry_t));
    snprintf(pUser->user_id, sizeof(pUser->user_id), "%s", user_id);
    pUser->p_history = p_history;
    return pUser;
}

/*
 * FUNCTION: append_history
 *
 * Appends a record, dropping the oldest once MAX_GAMES_HISTORY are held.
 */
static void append_history(user_stats_entry_t* pUser, const game_record_t* p_record)
{
    if (pUser->history_count == MAX_GAMES_HISTORY)
    {
        memmove(pUser->p_history, pUser->p_history + 1, sizeof(game_record_t) * (MAX_GAMES_HISTORY - 1));
        pUser->history_count--;
    }
    pUser->p_history[pUser->history_count++] = *p_record;
}

// --- Persistence ---

static Json::Value record_to_json(const game_record_t* p_record)
{
    Json::Value record(Json::objectValue);
    record["session_id"] = p_record->session_id;
    record["target_word"] = p_record->target_word;
    record["attempts"] = p_record->attempts;
    record["completed"] = p_record->completed;
    record["daily_word"] = p_record->daily_word;
    record["date"] = p_record->date;
    return record;
}

static bool optional_bool(const Json::Value& value, const char* name, bool* p_out)
{
    const Json::Value& field = value[name];
    if (field.isNull()) { *p_out = false; return true; }
    if (!field.isBool()) return false;
    *p_out = field.asBool();
    return true;
}

static bool optional_string(const Json::Value& value, const char* name, char* p_out, size_t out_size)
{
    const Json::Value& field = value[name];
    if (field.isNull()) { p_out[0] = '\0'; return true; }
    if (!field.isString()) return false;
    snprintf(p_out, out_size, "%s", field.asCString());
    return true;
}

static bool record_from_json(const Json::Value& value, game_record_t* p_record)
{
    if (!value.isObject()) return false;
    memset(p_record, 0, sizeof(game_record_t));

    const Json::Value& attempts = value["attempts"];
    if (!attempts.isInt()) return false;
    p_record->attempts = attempts.asInt();
    return optional_bool(value, "completed", &p_record->completed)
        && optional_bool(value, "daily_word", &p_record->daily_word)
        && optional_string(value, "session_id", p_record->session_id, sizeof(p_record->session_id))
        && optional_string(value, "target_word", p_record->target_word, sizeof(p_record->target_word))
        && optional_string(value, "date", p_record->date, sizeof(p_record->date));
}

// Missing counters read as 0; anything present must be a non-negative int.
static bool optional_count(const Json::Value& user, const char* name, int* p_out)
{
    const Json::Value& field = user[name];
    if (field.isNull()) { *p_out = 0; return true; }
    if (!field.isInt() || field.asInt() < 0) return false;
    *p_out = field.asInt();
    return true;
}

/*
 * FUNCTION: save_stats_file
 *
 * WHAT:
 * Serializes the table and replaces the stats file via a temporary file and
 * `rename`, so a crash mid-write never leaves a truncated file.
 */
static bool save_stats_file(const user_stats_store_t* p_stats)
{
    Json::Value root(Json::objectValue);
    for (int i = 0; i < p_stats->user_count; i++)
    {
        const user_stats_entry_t* pUser = &p_stats->p_users[i];
        Json::Value user(Json::objectValue);
        user["total_games"] = pUser->total_games;
        user["completed_games"] = pUser->completed_games;
        user["total_attempts"] = pUser->total_attempts;
        Json::Value history(Json::arrayValue);
        for (int k = 0; k < pUser->history_count; k++) history.append(record_to_json(&pUser->p_history[k]));
        user["games_history"] = history;
        root[pUser->user_id] = user;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    std::string text = Json::writeString(writer, root);

    char temp_path[MAX_PATH_LENGTH + 8];
    snprintf(temp_path, sizeof(temp_path), "%s.tmp", p_stats->path);

    FILE* fpOut = fopen(temp_path, "w");
    if (fpOut == NULL) return false;
    bool ok = fwrite(text.data(), 1, text.size(), fpOut) == text.size();
    ok = (fclose(fpOut) == 0) && ok;
    if (!ok || rename(temp_path, p_stats->path) != 0)
    {
        remove(temp_path);
        return false;
    }
    return true;
}

static void load_stats_file(user_stats_store_t* p_stats)
{
    FILE* fpIn = fopen(p_stats->path, "rb");
    if (fpIn == NULL) return; // First run: nothing saved yet.

    std::string text;
    char chunk[8192];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), fpIn)) > 0) text.append(chunk, n);
    fclose(fpIn);

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors) || !root.isObject())
    {
        fprintf(stderr, "Warning: stats file '%s' is unreadable; starting with empty stats. %s\n",
            p_stats->path, errors.c_str());
        return;
    }

    std::vector<std::string> user_ids = root.getMemberNames();
    int skipped = 0;
    int skipped_records = 0;
    for (size_t i = 0; i < user_ids.size(); i++)
    {
        const Json::Value& user = root[user_ids[i]];
        int total_games, completed_games, total_attempts;
        if (!is_valid_user_id(user_ids[i].c_str()) || !user.isObject()
            || !optional_count(user, "total_games", &total_games)
            || !optional_count(user, "completed_games", &completed_games)
            || !optional_count(user, "total_attempts", &total_attempts))
        {
            skipped++;
            continue;
        }

        user_stats_entry_t* pUser = add_user(p_stats, user_ids[i].c_str());
        if (pUser == NULL)
        {
            fprintf(stderr, "Out of memory loading stats!\n");
            return;
        }
        pUser->total_games = total_games;
        pUser->completed_games = completed_games;
        pUser->total_attempts = total_attempts;

        const Json::Value& history = user["games_history"];
        if (!history.isArray()) continue;
        for (Json::ArrayIndex k = 0; k < history.size(); k++)
        {
            game_record_t record;
            if (record_from_json(history[k], &record)) append_history(pUser, &record);
            else skipped_records++;
        }
    }

    if (skipped > 0) fprintf(stderr, "Warning: skipped %d malformed users in '%s'.\n", skipped, p_stats->path);
    if (skipped_records > 0)
        fprintf(stderr, "Warning: skipped %d malformed game records in '%s'.\n", skipped_records, p_stats->path);
    printf("Loaded stats for %d users from '%s'.\n", p_stats->user_count, p_stats->path);
}

// --- Public API ---

bool user_stats_init(user_stats_store_t* p_stats, const char* path)
{
    if (p_stats == NULL) return false;
    memset(p_stats, 0, sizeof(user_stats_store_t));
    if (path != NULL) snprintf(p_stats->path, sizeof(p_stats->path), "%s", path);
    omp_init_lock(&p_stats->lock);
    p_stats->is_open = true;

    if (p_stats->path[0] != '\0') load_stats_file(p_stats);
    return true;
}

void user_stats_destroy(user_stats_store_t* p_stats)
{
    if (p_stats == NULL || !p_stats->is_open) return;
    for (int i = 0; i < p_stats->user_count; i++) free(p_stats->p_users[i].p_history);
    free(p_stats->p_users);
    omp_destroy_lock(&p_stats->lock);
    memset(p_stats, 0, sizeof(user_stats_store_t));
}

engine_error_t user_stats_record_game(user_stats_store_t* p_stats, const char* user_id, const game_record_t* p_record)
{
    if (!is_valid_user_id(user_id)) return ENGINE_ERROR_BAD_REQUEST;
    if (p_stats == NULL || p_record == NULL) return ENGINE_ERROR_INTERNAL;

    omp_set_lock(&p_stats->lock);

    user_stats_entry_t* pUser = find_user(p_stats, user_id);
    if (pUser == NULL) pUser = add_user(p_stats, user_id);
    if (pUser == NULL)
    {
        omp_unset_lock(&p_stats->lock);
        fprintf(stderr, "Out of memory recording stats!\n");
        return ENGINE_ERROR_INTERNAL;
    }

    pUser->total_games++;
    if (p_record->completed)
    {
        pUser->completed_games++;
        pUser->total_attempts += p_record->attempts;
    }
    append_history(pUser, p_record);

    if (p_stats->path[0] != '\0' && !save_stats_file(p_stats))
    {
        fprintf(stderr, "Warning: could not write stats file '%s'.\n", p_stats->path);
    }

    omp_unset_lock(&p_stats->lock);
    return ENGINE_OK;
}

engine_error_t user_stats_get(user_stats_store_t* p_stats, const char* user_id, user_stats_summary_t* p_summary)
{
    if (!is_valid_user_id(user_id)) return ENGINE_ERROR_BAD_REQUEST;
    if (p_stats == NULL || p_summary == NULL) return ENGINE_ERROR_INTERNAL;

    memset(p_summary, 0, sizeof(user_stats_summary_t));

    omp_set_lock(&p_stats->lock);
    const user_stats_entry_t* pUser = find_user(p_stats, user_id);
    if (pUser == NULL)
    {
        omp_unset_lock(&p_stats->lock);
        return ENGINE_OK;
    }

    p_summary->total_games = pUser->total_games;
    p_summary->completed_games = pUser->completed_games;
    if (pUser->completed_games > 0)
    {
        double average = (double)pUser->total_attempts / pUser->completed_games;
        p_summary->average_attempts = round(average * 100.0) / 100.0;
    }

    for (int i = 0; i < pUser->history_count; i++)
    {
        const game_record_t* pRecord = &pUser->p_history[i];
        if (pRecord->completed && (p_summary->best_score == 0 || pRecord->attempts < p_summary->best_score))
        {
            p_summary->best_score = pRecord->attempts;
        }
    }

    int recent = pUser->history_count < RECENT_GAMES_REPORTED ? pUser->history_count : RECENT_GAMES_REPORTED;
    engine_error_t result = ENGINE_OK;
    if (recent > 0)
    {
        p_summary->p_recent = (game_record_t*)malloc(sizeof(game_record_t) * recent);
        if (p_summary->p_recent == NULL)
        {
            result = ENGINE_ERROR_INTERNAL;
        }
        else
        {
            memcpy(p_summary->p_recent, pUser->p_history + (pUser->history_count - recent), sizeof(game_record_t) * recent);
            p_summary->recent_count = recent;
        }
    }
    omp_unset_lock(&p_stats->lock);
    return result;
}

void free_user_stats_summary(user_stats_summary_t* p_summary)
{
    if (p_summary == NULL) return;
    free(p_summary->p_recent);
    p_summary->p_recent = NULL;
    p_summary->recent_count = 0;
}
