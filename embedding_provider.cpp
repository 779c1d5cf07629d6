/*
 * FILE: embedding_provider.cpp
 *
 * WHAT:
 * Implements the default embedding backend. It uses libcurl to POST a batch
 * of words to an OpenAI compatible `/embeddings` endpoint and jsoncpp to
 * build the request and parse the vectors out of the response.
 *
 * FAILURE MODEL:
 * Every failure (transport error, timeout, non-2xx status, malformed body)
 * is reported as ENGINE_ERROR_PROVIDER and leaves the caller's outputs
 * untouched, so the caller can retry without cleaning up partial state.
 */

#include "embedding_provider.h"
#include <curl/curl.h>
#include <json/json.h>
#include <string.h>
#include <stdlib.h>
#include <stdio.h>
#include <math.h>
#include <memory>
#include <string>

/*
 * STRUCT: openai_provider_context_t
 *
 * Backend state copied out of the configuration at init time, so the
 * provider does not depend on the config outliving it.
 */
typedef struct _openai_provider_context
{
    char endpoint[MAX_PATH_LENGTH + 32];
    char model[128];
    char authorization[300];
    long timeout_ms;
} openai_provider_context_t;

/*
 * STRUCT: response_buffer_t
 *
 * Growable receive buffer for the response body.
 */
typedef struct _response_buffer
{
    char* p_data;
    size_t size;
} response_buffer_t;

/*
 * FUNCTION: write_callback
 *
 * WHAT:
 * A standard cURL callback handling received data chunks. It grows the
 * buffer with `realloc` and keeps it null terminated.
 *
 * WHY:
 * A 3072-dimension vector is ~60KB of JSON per word; the body size is not
 * known up front.
 */
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t realsize = size * nmemb;
    response_buffer_t* p_buffer = (response_buffer_t*)userp;

    char* ptr = (char*)realloc(p_buffer->p_data, p_buffer->size + realsize + 1);
    if (ptr == NULL) return 0; // Signal error to cURL (abort transfer)

    p_buffer->p_data = ptr;
    memcpy(&(p_buffer->p_data[p_buffer->size]), contents, realsize);
    p_buffer->size += realsize;
    p_buffer->p_data[p_buffer->size] = '\0';
    return realsize;
}

static std::string build_request_body(const char* model, const char* const* pp_words, int word_count)
{
    Json::Value root(Json::objectValue);
    root["model"] = model;
    root["encoding_format"] = "float";
    Json::Value input(Json::arrayValue);
    for (int i = 0; i < word_count; i++) input.append(pp_words[i]);
    root["input"] = input;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}

engine_error_t parse_embedding_response(const char* p_body, int expected_count, float** pp_vectors, int* p_dimension)
{
    if (p_body == NULL || expected_count <= 0) return ENGINE_ERROR_PROVIDER;

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(p_body, p_body + strlen(p_body), &root, &errors))
    {
        fprintf(stderr, "Embedding provider: response is not valid JSON: %s\n", errors.c_str());
        return ENGINE_ERROR_PROVIDER;
    }

    if (!root.isObject() || !root["data"].isArray() || (int)root["data"].size() != expected_count)
    {
        fprintf(stderr, "Embedding provider: expected %d embeddings in 'data'.\n", expected_count);
        return ENGINE_ERROR_PROVIDER;
    }

    const Json::Value& data = root["data"];
    for (Json::ArrayIndex i = 0; i < data.size(); i++)
    {
        if (!data[i].isObject())
        {
            fprintf(stderr, "Embedding provider: row %u of 'data' is not an object.\n", (unsigned)i);
            return ENGINE_ERROR_PROVIDER;
        }
    }

    const Json::Value& first = data[0]["embedding"];
    if (!first.isArray() || first.size() == 0)
    {
        fprintf(stderr, "Embedding provider: first row has no embedding.\n");
        return ENGINE_ERROR_PROVIDER;
    }
    int dimension = (int)first.size();

    float* p_vectors = (float*)malloc(sizeof(float) * (size_t)expected_count * dimension);
    bool* p_seen = (bool*)calloc(expected_count, sizeof(bool));
    if (p_vectors == NULL || p_seen == NULL)
    {
        free(p_vectors);
        free(p_seen);
        return ENGINE_ERROR_PROVIDER;
    }

    bool ok = true;
    for (Json::ArrayIndex i = 0; i < data.size() && ok; i++)
    {
        const Json::Value& row = data[i];
        // Rows may arrive out of order; "index" says which input they belong to.
        int row_index = (int)i;
        if (row.isMember("index"))
        {
            if (!row["index"].isInt()) { ok = false; break; }
            row_index = row["index"].asInt();
        }
        const Json::Value& embedding = row["embedding"];

        if (row_index < 0 || row_index >= expected_count || p_seen[row_index]
            || !embedding.isArray() || (int)embedding.size() != dimension)
        {
            ok = false;
            break;
        }
        p_seen[row_index] = true;

        float* p_row = p_vectors + (size_t)row_index * dimension;
        for (int d = 0; d < dimension; d++)
        {
            const Json::Value& value = embedding[d];
            if (!value.isNumeric() || !isfinite(value.asDouble())) { ok = false; break; }
            p_row[d] = (float)value.asDouble();
        }
    }
    free(p_seen);

    if (!ok)
    {
        fprintf(stderr, "Embedding provider: malformed embedding rows in response.\n");
        free(p_vectors);
        return ENGINE_ERROR_PROVIDER;
    }

    *pp_vectors = p_vectors;
    *p_dimension = dimension;
    return ENGINE_OK;
}

/*
 * FUNCTION: openai_embed_batch
 *
 * WHAT:
 * Establishes the connection, sends one batch and hands the body to
 * `parse_embedding_response`.
 *
 * WHY:
 * A fresh easy handle per call keeps the function safe to call from several
 * threads at once (libcurl easy handles must not be shared).
 * CURLOPT_TIMEOUT_MS bounds the whole transfer so a slow provider fails the
 * request instead of stalling it.
 */
static engine_error_t openai_embed_batch(void* p_context, const char* const* pp_words, int word_count,
    float** pp_vectors, int* p_dimension)
{
    const openai_provider_context_t* p_ctx = (const openai_provider_context_t*)p_context;
    if (word_count <= 0) return ENGINE_ERROR_PROVIDER;

    std::string body = build_request_body(p_ctx->model, pp_words, word_count);
    response_buffer_t response = { NULL, 0 };
    engine_error_t result = ENGINE_ERROR_PROVIDER;

    CURL* curl = curl_easy_init();
    if (curl == NULL)
    {
        fprintf(stderr, "Embedding provider: curl_easy_init failed.\n");
        return ENGINE_ERROR_PROVIDER;
    }

    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, p_ctx->authorization);

    curl_easy_setopt(curl, CURLOPT_URL, p_ctx->endpoint);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, (void*)&response);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, p_ctx->timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, p_ctx->timeout_ms);
    // Timeouts are delivered by signal otherwise, which is unsafe with threads.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
    {
        fprintf(stderr, "Embedding provider: cURL failed: %s\n", curl_easy_strerror(res));
    }
    else
    {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (status < 200 || status >= 300)
        {
            fprintf(stderr, "Embedding provider: HTTP %ld: %.200s\n", status, response.p_data ? response.p_data : "");
        }
        else if (response.p_data == NULL)
        {
            fprintf(stderr, "Embedding provider: empty response body.\n");
        }
        else
        {
            result = parse_embedding_response(response.p_data, word_count, pp_vectors, p_dimension);
        }
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    free(response.p_data);
    return result;
}

static void destroy_openai_context(void* p_context)
{
    free(p_context);
    curl_global_cleanup();
}

bool init_openai_embedding_provider(const engine_config_t* p_config, embedding_provider_t* p_provider)
{
    memset(p_provider, 0, sizeof(embedding_provider_t));
    if (p_config->api_key[0] == '\0') return false;

    openai_provider_context_t* p_ctx = (openai_provider_context_t*)calloc(1, sizeof(openai_provider_context_t));
    if (p_ctx == NULL) return false;

    // Tolerate a trailing slash in the configured base URL.
    size_t url_len = strlen(p_config->embedding_url);
    const char* separator = (url_len > 0 && p_config->embedding_url[url_len - 1] == '/') ? "" : "/";
    snprintf(p_ctx->endpoint, sizeof(p_ctx->endpoint), "%s%sembeddings", p_config->embedding_url, separator);
    snprintf(p_ctx->model, sizeof(p_ctx->model), "%s", p_config->embedding_model);
    snprintf(p_ctx->authorization, sizeof(p_ctx->authorization), "Authorization: Bearer %s", p_config->api_key);
    p_ctx->timeout_ms = p_config->provider_timeout_ms;

    // Must run before any other thread exists; main builds the provider at startup.
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        fprintf(stderr, "Embedding provider: curl_global_init failed.\n");
        free(p_ctx);
        return false;
    }

    p_provider->name = "openai";
    p_provider->embed_batch = openai_embed_batch;
    p_provider->p_context = p_ctx;
    p_provider->destroy_context = destroy_openai_context;
    return true;
}

void destroy_embedding_provider(embedding_provider_t* p_provider)
{
    if (p_provider == NULL) return;
    if (p_provider->destroy_context != NULL) p_provider->destroy_context(p_provider->p_context);
    memset(p_provider, 0, sizeof(embedding_provider_t));
}

engine_error_t embed_word(const embedding_provider_t* p_provider, const char* word, float** pp_vector, int* p_dimension)
{
    if (p_provider == NULL || p_provider->embed_batch == NULL) return ENGINE_ERROR_PROVIDER;
    const char* words[1] = { word };
    return p_provider->embed_batch(p_provider->p_context, words, 1, pp_vector, p_dimension);
}
