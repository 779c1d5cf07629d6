/*
 * FILE: embedding_provider.h
 *
 * WHAT:
 * Defines the interface for the "Live Data" subsystem: turning words into
 * embedding vectors on demand when the vocabulary file does not carry them.
 *
 * WHY:
 * The engine treats embedding generation as a capability
 * (`embed(words) -> vectors`, fails with ProviderError). Keeping it behind a
 * function pointer lets the default libcurl backend be swapped for a local
 * model, a cache, or a fake in tests, without touching the vocabulary code.
 */

#pragma once
#ifndef EMBEDDING_PROVIDER_H
#define EMBEDDING_PROVIDER_H
#include "semantle_types.h"
#include "engine_errors.h"
#include "engine_config.h"

/*
 * CONSTANT: EMBEDDING_BATCH_SIZE
 *
 * Maximum number of words sent in one provider call.
 */
const int EMBEDDING_BATCH_SIZE = 256;

/*
 * TYPE: embed_batch_fn
 *
 * WHAT:
 * Produces one vector per word.
 *
 * PARAMETERS:
 * - p_context: backend state (`embedding_provider_t::p_context`).
 * - pp_words / word_count: the words to embed (normalized, non-empty).
 * - pp_vectors: Output. A malloc'd block of word_count * dimension floats,
 *   row i belonging to pp_words[i]. The caller frees it.
 * - p_dimension: Output. The vector length.
 *
 * RETURNS:
 * - ENGINE_OK, or ENGINE_ERROR_PROVIDER on any failure (outputs untouched).
 */
typedef engine_error_t (*embed_batch_fn)(void* p_context, const char* const* pp_words, int word_count,
    float** pp_vectors, int* p_dimension);

/*
 * STRUCT: embedding_provider_t
 *
 * WHAT:
 * A provider capability: a name for logs, the batch function and its
 * context, and an optional destructor for the context.
 */
typedef struct _embedding_provider
{
    const char* name;
    embed_batch_fn embed_batch;
    void* p_context;
    void (*destroy_context)(void* p_context);
} embedding_provider_t;

/*
 * FUNCTION: init_openai_embedding_provider
 *
 * WHAT:
 * Builds the default backend: an OpenAI compatible `POST {url}/embeddings`
 * call through libcurl, with the model, bearer key and timeout taken from
 * the configuration.
 *
 * RETURNS:
 * - false if the configuration has no API key or libcurl cannot initialize.
 */
bool init_openai_embedding_provider(const engine_config_t* p_config, embedding_provider_t* p_provider);

/*
 * FUNCTION: destroy_embedding_provider
 *
 * Releases the backend context (if any) and clears the struct.
 */
void destroy_embedding_provider(embedding_provider_t* p_provider);

/*
 * FUNCTION: embed_word
 *
 * Convenience wrapper that embeds a single word.
 */
engine_error_t embed_word(const embedding_provider_t* p_provider, const char* word, float** pp_vector, int* p_dimension);

/*
 * FUNCTION: parse_embedding_response
 *
 * WHAT:
 * Parses an OpenAI style response body
 * `{"data": [{"index": i, "embedding": [...]}, ...]}` into a dense block,
 * placing each row by its "index" field.
 *
 * RETURNS:
 * - ENGINE_ERROR_PROVIDER if the JSON is malformed, rows are missing or
 *   duplicated, dimensions disagree or a value is not a finite number.
 *
 * WHY:
 * Exposed separately from the network call so the parsing rules can be
 * tested without a server.
 */
engine_error_t parse_embedding_response(const char* p_body, int expected_count, float** pp_vectors, int* p_dimension);

#endif
