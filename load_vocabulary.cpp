/*
 * FILE: load_vocabulary.cpp
 *
 * WHAT:
 * Implements the data ingestion pipeline for the vocabulary.
 * This module reads the raw JSON or text file, validates every word and
 * vector, and populates the in-memory store and its Views.
 *
 * CRITICAL DEPENDENCIES:
 * - similarity_ranker: norms are cached at load time so scoring a guess is a
 *   single dot product later on.
 * - embedding_provider: words listed without a vector are filled in through
 *   the provider before the first session is created.
 *
 * WHY:
 * A robust loader is essential for stability. This file handles the dirty work
 * of file I/O, string trimming, and error checking so the rest of the engine
 * can assume clean, valid data.
 */

#include "load_vocabulary.h"
#include "vocabulary_views.h"
#include "comparators.h"
#include "similarity_ranker.h"
#include <json/json.h>
#include <stdio.h>
#include <string.h>
#include <ctype.h>
#include <math.h>
#include <memory>
#include <string>
#include <vector>

bool normalize_word(const char* raw, char* p_out, size_t out_size)
{
    if (raw == NULL || p_out == NULL || out_size == 0) return false;

    const char* p_start = raw;
    while (*p_start != '\0' && isspace((unsigned char)*p_start)) p_start++;

    const char* p_end = p_start + strlen(p_start);
    while (p_end > p_start && isspace((unsigned char)*(p_end - 1))) p_end--;

    size_t length = (size_t)(p_end - p_start);
    if (length == 0 || length > (size_t)MAX_WORD_LENGTH || length >= out_size) return false;

    for (size_t i = 0; i < length; i++)
    {
        p_out[i] = (char)tolower((unsigned char)p_start[i]);
    }
    p_out[length] = '\0';
    return true;
}

/*
 * FUNCTION: read_whole_file
 *
 * Reads a file into a malloc'd, null terminated buffer.
 */
static char* read_whole_file(const char* path)
{
    FILE* fpIn = fopen(path, "rb");
    if (fpIn == NULL) return NULL;

    char* p_data = NULL;
    size_t size = 0;
    char chunk[8192];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), fpIn)) > 0)
    {
        char* ptr = (char*)realloc(p_data, size + n + 1);
        if (ptr == NULL)
        {
            free(p_data);
            fclose(fpIn);
            return NULL;
        }
        p_data = ptr;
        memcpy(p_data + size, chunk, n);
        size += n;
    }
    fclose(fpIn);

    if (p_data == NULL)
    {
        // Empty file: hand back an empty string so the parser reports it.
        p_data = (char*)calloc(1, 1);
    }
    else
    {
        p_data[size] = '\0';
    }
    return p_data;
}

static bool has_extension(const char* path, const char* extension)
{
    size_t path_len = strlen(path);
    size_t ext_len = strlen(extension);
    if (path_len < ext_len) return false;
    const char* p_tail = path + path_len - ext_len;
    for (size_t i = 0; i < ext_len; i++)
    {
        if (tolower((unsigned char)p_tail[i]) != extension[i]) return false;
    }
    return true;
}

engine_error_t build_vocabulary(const char* const* pp_words, const float* p_vectors, const bool* p_has_vector,
    int word_count, int dimension, vocabulary_store_t* p_store)
{
    if (pp_words == NULL || p_store == NULL || word_count <= 0 || dimension < 0)
    {
        fprintf(stderr, "Vocabulary is empty.\n");
        return ENGINE_ERROR_LOAD;
    }
    if (dimension > 0 && p_vectors == NULL)
    {
        fprintf(stderr, "Vocabulary has a dimension but no vectors.\n");
        return ENGINE_ERROR_LOAD;
    }

    // 1. Allocate the master array and the contiguous vector block.
    vocabulary_entry_t* p_entries = (vocabulary_entry_t*)calloc(word_count, sizeof(vocabulary_entry_t));
    float* p_block = NULL;
    if (dimension > 0)
    {
        p_block = (float*)malloc(sizeof(float) * (size_t)word_count * dimension);
    }
    if (p_entries == NULL || (dimension > 0 && p_block == NULL))
    {
        fprintf(stderr, "Out of memory allocating vocabulary!\n");
        free(p_entries);
        free(p_block);
        return ENGINE_ERROR_LOAD;
    }

    // 2. Populate entries
    int pending_count = 0;
    for (int i = 0; i < word_count; i++)
    {
        vocabulary_entry_t* pEntry = &p_entries[i];
        bool has_vector = (p_has_vector == NULL) ? true : p_has_vector[i];

        if (!normalize_word(pp_words[i], pEntry->word, sizeof(pEntry->word)))
        {
            fprintf(stderr, "Vocabulary entry %d is empty or longer than %d characters.\n", i, MAX_WORD_LENGTH);
            free(p_entries);
            free(p_block);
            return ENGINE_ERROR_LOAD;
        }
        if (has_vector && dimension == 0)
        {
            fprintf(stderr, "Vocabulary entry '%s' has a zero-length vector.\n", pEntry->word);
            free(p_entries);
            free(p_block);
            return ENGINE_ERROR_LOAD;
        }

        pEntry->index = i;
        pEntry->is_target_candidate = true;
        pEntry->has_embedding = has_vector;
        pEntry->p_embedding = (p_block != NULL) ? p_block + (size_t)i * dimension : NULL;

        if (has_vector)
        {
            const float* p_source = p_vectors + (size_t)i * dimension;
            for (int d = 0; d < dimension; d++)
            {
                if (!isfinite(p_source[d]))
                {
                    fprintf(stderr, "Vocabulary entry '%s' has a non-finite value.\n", pEntry->word);
                    free(p_entries);
                    free(p_block);
                    return ENGINE_ERROR_LOAD;
                }
                pEntry->p_embedding[d] = p_source[d];
            }
            pEntry->norm = vector_norm(pEntry->p_embedding, dimension);
        }
        else
        {
            pending_count++;
        }
    }

    // 3. Build the alphabetical View; equal neighbours are duplicates.
    vocabulary_pointer_array_t p_alpha_view = NULL;
    vocabulary_pointer_array_t p_candidate_view = NULL;
    int candidate_count = 0;
    if (!duplicate_vocabulary_pointers(p_entries, word_count, &p_alpha_view, compare_vocabulary_entries_alpha)
        || !build_candidate_view(p_entries, word_count, &p_candidate_view, &candidate_count, compare_vocabulary_entries_alpha))
    {
        fprintf(stderr, "Out of memory building vocabulary views!\n");
        free(p_alpha_view);
        free(p_entries);
        free(p_block);
        return ENGINE_ERROR_LOAD;
    }

    for (int i = 1; i < word_count; i++)
    {
        if (strcmp(p_alpha_view[i - 1]->word, p_alpha_view[i]->word) == 0)
        {
            fprintf(stderr, "Vocabulary contains the word '%s' more than once.\n", p_alpha_view[i]->word);
            free(p_alpha_view);
            free(p_candidate_view);
            free(p_entries);
            free(p_block);
            return ENGINE_ERROR_LOAD;
        }
    }

    // 4. Publish
    memset(p_store, 0, sizeof(vocabulary_store_t));
    p_store->p_entries = p_entries;
    p_store->entry_count = word_count;
    p_store->dimension = dimension;
    p_store->p_vectors = p_block;
    p_store->p_alpha_view = p_alpha_view;
    p_store->p_candidate_view = p_candidate_view;
    p_store->candidate_count = candidate_count;
    p_store->pending_count = pending_count;
    omp_init_lock(&p_store->embedding_lock);
    return ENGINE_OK;
}

engine_error_t load_vocabulary_from_json(const char* p_json_text, vocabulary_store_t* p_store)
{
    if (p_json_text == NULL) return ENGINE_ERROR_LOAD;

    Json::CharReaderBuilder builder;
    builder["rejectDupKeys"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(p_json_text, p_json_text + strlen(p_json_text), &root, &errors))
    {
        fprintf(stderr, "Vocabulary JSON is malformed: %s\n", errors.c_str());
        return ENGINE_ERROR_LOAD;
    }
    if (!root.isObject() || root.size() == 0)
    {
        fprintf(stderr, "Vocabulary JSON must be a non-empty object of word -> vector.\n");
        return ENGINE_ERROR_LOAD;
    }

    std::vector<std::string> names = root.getMemberNames();
    int word_count = (int)names.size();

    // The first present vector fixes the dimension for the whole file.
    int dimension = 0;
    for (int i = 0; i < word_count; i++)
    {
        const Json::Value& value = root[names[i]];
        if (value.isArray())
        {
            dimension = (int)value.size();
            break;
        }
    }

    const char** pp_words = (const char**)malloc(sizeof(const char*) * word_count);
    bool* p_has_vector = (bool*)calloc(word_count, sizeof(bool));
    float* p_vectors = (dimension > 0) ? (float*)calloc((size_t)word_count * dimension, sizeof(float)) : NULL;
    if (pp_words == NULL || p_has_vector == NULL || (dimension > 0 && p_vectors == NULL))
    {
        fprintf(stderr, "Out of memory parsing vocabulary!\n");
        free(pp_words);
        free(p_has_vector);
        free(p_vectors);
        return ENGINE_ERROR_LOAD;
    }

    engine_error_t result = ENGINE_OK;
    for (int i = 0; i < word_count && result == ENGINE_OK; i++)
    {
        const Json::Value& value = root[names[i]];
        pp_words[i] = names[i].c_str();

        if (value.isNull())
        {
            p_has_vector[i] = false;
            continue;
        }
        if (!value.isArray())
        {
            fprintf(stderr, "Vocabulary entry '%s' must be an array of numbers or null.\n", names[i].c_str());
            result = ENGINE_ERROR_LOAD;
            break;
        }
        if ((int)value.size() != dimension)
        {
            fprintf(stderr, "Vocabulary entry '%s' has dimension %u, expected %d.\n",
                names[i].c_str(), value.size(), dimension);
            result = ENGINE_ERROR_LOAD;
            break;
        }

        float* p_row = p_vectors + (size_t)i * dimension;
        for (int d = 0; d < dimension; d++)
        {
            const Json::Value& component = value[d];
            if (!component.isNumeric())
            {
                fprintf(stderr, "Vocabulary entry '%s' has a non-numeric component.\n", names[i].c_str());
                result = ENGINE_ERROR_LOAD;
                break;
            }
            p_row[d] = (float)component.asDouble();
        }
        p_has_vector[i] = true;
    }

    if (result == ENGINE_OK)
    {
        result = build_vocabulary(pp_words, p_vectors, p_has_vector, word_count, dimension, p_store);
    }

    free(pp_words);
    free(p_has_vector);
    free(p_vectors);
    return result;
}

/*
 * STRUCT: text_vocabulary_t
 *
 * Growable parallel arrays collected while scanning a text file.
 */
typedef struct _text_vocabulary
{
    char** pp_words;
    bool* p_has_vector;
    float* p_vectors;
    int count;
    int capacity;
    int dimension;
} text_vocabulary_t;

static void free_text_vocabulary(text_vocabulary_t* p_text)
{
    for (int i = 0; i < p_text->count; i++) free(p_text->pp_words[i]);
    free(p_text->pp_words);
    free(p_text->p_has_vector);
    free(p_text->p_vectors);
}

static bool grow_text_vocabulary(text_vocabulary_t* p_text)
{
    if (p_text->count < p_text->capacity) return true;

    int new_capacity = (p_text->capacity == 0) ? 1024 : p_text->capacity * 2;
    char** pp_words = (char**)realloc(p_text->pp_words, sizeof(char*) * new_capacity);
    if (pp_words == NULL) return false;
    p_text->pp_words = pp_words;

    bool* p_has_vector = (bool*)realloc(p_text->p_has_vector, sizeof(bool) * new_capacity);
    if (p_has_vector == NULL) return false;
    p_text->p_has_vector = p_has_vector;

    if (p_text->dimension > 0)
    {
        float* p_vectors = (float*)realloc(p_text->p_vectors, sizeof(float) * (size_t)new_capacity * p_text->dimension);
        if (p_vectors == NULL) return false;
        p_text->p_vectors = p_vectors;
    }
    p_text->capacity = new_capacity;
    return true;
}

static bool is_integer_token(const char* token)
{
    if (*token == '\0') return false;
    char* p_end = NULL;
    strtol(token, &p_end, 10);
    return *p_end == '\0';
}

/*
 * FUNCTION: parse_text_line
 *
 * WHAT:
 * Parses `word v1 ... vN` (already known not to be blank or a comment) and
 * appends it. The first line carrying a vector fixes the dimension; the
 * vector storage is allocated then.
 */
static engine_error_t parse_text_line(text_vocabulary_t* p_text, char* line, int line_number)
{
    char* save = NULL;
    char* word = strtok_r(line, " \t\r\n", &save);
    if (word == NULL) return ENGINE_OK;

    // Collect the components into a scratch row first; the dimension may not be known yet.
    int component_count = 0;
    int component_capacity = (p_text->dimension > 0) ? p_text->dimension : 64;
    float* p_row = (float*)malloc(sizeof(float) * component_capacity);
    if (p_row == NULL) return ENGINE_ERROR_LOAD;

    char* token;
    while ((token = strtok_r(NULL, " \t\r\n", &save)) != NULL)
    {
        char* p_end = NULL;
        float value = strtof(token, &p_end);
        if (*p_end != '\0' || !isfinite(value))
        {
            fprintf(stderr, "Vocabulary line %d: '%s' is not a finite number.\n", line_number, token);
            free(p_row);
            return ENGINE_ERROR_LOAD;
        }
        if (component_count == component_capacity)
        {
            component_capacity *= 2;
            float* ptr = (float*)realloc(p_row, sizeof(float) * component_capacity);
            if (ptr == NULL)
            {
                free(p_row);
                return ENGINE_ERROR_LOAD;
            }
            p_row = ptr;
        }
        p_row[component_count++] = value;
    }

    if (component_count > 0 && p_text->dimension == 0)
    {
        // First vector seen: allocate storage for every word collected so far.
        p_text->dimension = component_count;
        if (p_text->capacity > 0)
        {
            p_text->p_vectors = (float*)calloc((size_t)p_text->capacity * component_count, sizeof(float));
            if (p_text->p_vectors == NULL)
            {
                free(p_row);
                return ENGINE_ERROR_LOAD;
            }
        }
    }
    else if (component_count > 0 && component_count != p_text->dimension)
    {
        fprintf(stderr, "Vocabulary line %d: '%s' has dimension %d, expected %d.\n",
            line_number, word, component_count, p_text->dimension);
        free(p_row);
        return ENGINE_ERROR_LOAD;
    }

    if (!grow_text_vocabulary(p_text))
    {
        free(p_row);
        return ENGINE_ERROR_LOAD;
    }

    char* p_copy = strdup(word);
    if (p_copy == NULL)
    {
        free(p_row);
        return ENGINE_ERROR_LOAD;
    }

    int slot = p_text->count;
    p_text->pp_words[slot] = p_copy;
    p_text->p_has_vector[slot] = (component_count > 0);
    if (component_count > 0)
    {
        memcpy(p_text->p_vectors + (size_t)slot * p_text->dimension, p_row, sizeof(float) * component_count);
    }
    else if (p_text->dimension > 0)
    {
        memset(p_text->p_vectors + (size_t)slot * p_text->dimension, 0, sizeof(float) * p_text->dimension);
    }
    p_text->count++;

    free(p_row);
    return ENGINE_OK;
}

static engine_error_t load_vocabulary_text(const char* path, vocabulary_store_t* p_store)
{
    FILE* fpIn = fopen(path, "r");
    if (fpIn == NULL)
    {
        fprintf(stderr, "Could not open vocabulary file '%s'!\n", path);
        return ENGINE_ERROR_LOAD;
    }

    text_vocabulary_t text;
    memset(&text, 0, sizeof(text));

    // Lines hold whole vectors (tens of kilobytes), so read them with getline.
    char* line = NULL;
    size_t line_capacity = 0;
    int line_number = 0;
    bool seen_data_line = false;
    engine_error_t result = ENGINE_OK;

    while (result == ENGINE_OK && getline(&line, &line_capacity, fpIn) != -1)
    {
        line_number++;

        const char* p = line;
        while (*p != '\0' && isspace((unsigned char)*p)) p++;
        if (*p == '\0' || *p == '#') continue;

        if (!seen_data_line)
        {
            seen_data_line = true;

            // word2vec text files open with "<count> <dimension>".
            char header[128];
            snprintf(header, sizeof(header), "%s", p);
            char* save = NULL;
            char* first = strtok_r(header, " \t\r\n", &save);
            char* second = strtok_r(NULL, " \t\r\n", &save);
            char* third = strtok_r(NULL, " \t\r\n", &save);
            if (first != NULL && second != NULL && third == NULL && is_integer_token(first) && is_integer_token(second))
            {
                continue;
            }
        }

        result = parse_text_line(&text, line, line_number);
    }
    free(line);
    fclose(fpIn);

    if (result == ENGINE_OK)
    {
        if (text.count == 0)
        {
            fprintf(stderr, "Vocabulary file '%s' has no words.\n", path);
            result = ENGINE_ERROR_LOAD;
        }
        else
        {
            result = build_vocabulary((const char* const*)text.pp_words, text.p_vectors, text.p_has_vector,
                text.count, text.dimension, p_store);
        }
    }

    free_text_vocabulary(&text);
    return result;
}

engine_error_t load_vocabulary(const char* path, vocabulary_store_t* p_store)
{
    if (path == NULL || path[0] == '\0')
    {
        fprintf(stderr, "No vocabulary file configured.\n");
        return ENGINE_ERROR_LOAD;
    }

    engine_error_t result;
    if (has_extension(path, ".json"))
    {
        char* p_text = read_whole_file(path);
        if (p_text == NULL)
        {
            fprintf(stderr, "Could not read vocabulary file '%s'!\n", path);
            return ENGINE_ERROR_LOAD;
        }
        result = load_vocabulary_from_json(p_text, p_store);
        free(p_text);
    }
    else
    {
        result = load_vocabulary_text(path, p_store);
    }

    if (result == ENGINE_OK)
    {
        printf("Loaded %d words (dimension %d, %d pending) from '%s'.\n",
            p_store->entry_count, p_store->dimension, p_store->pending_count, path);
    }
    return result;
}

engine_error_t set_target_candidates(vocabulary_store_t* p_store, const char* const* pp_words, int word_count)
{
    if (p_store == NULL || p_store->p_entries == NULL) return ENGINE_ERROR_LOAD;

    bool* p_selected = (bool*)calloc(p_store->entry_count, sizeof(bool));
    if (p_selected == NULL) return ENGINE_ERROR_LOAD;

    int selected_count = 0;
    int skipped_count = 0;
    for (int i = 0; i < word_count; i++)
    {
        char normalized[MAX_WORD_LENGTH + 1];
        const vocabulary_entry_t* pEntry = NULL;
        if (pp_words[i] != NULL && normalize_word(pp_words[i], normalized, sizeof(normalized)))
        {
            pEntry = vocabulary_find_entry(p_store, normalized);
        }
        if (pEntry == NULL)
        {
            skipped_count++;
            fprintf(stderr, "Warning: target word '%s' is not in the vocabulary; skipped.\n",
                pp_words[i] != NULL ? pp_words[i] : "");
            continue;
        }
        if (!p_selected[pEntry->index])
        {
            p_selected[pEntry->index] = true;
            selected_count++;
        }
    }

    if (selected_count == 0)
    {
        fprintf(stderr, "None of the %d target words is in the vocabulary.\n", word_count);
        free(p_selected);
        return ENGINE_ERROR_LOAD;
    }

    for (int i = 0; i < p_store->entry_count; i++)
    {
        p_store->p_entries[i].is_target_candidate = p_selected[i];
    }
    free(p_selected);

    vocabulary_pointer_array_t p_view = NULL;
    int candidate_count = 0;
    if (!build_candidate_view(p_store->p_entries, p_store->entry_count, &p_view, &candidate_count,
        compare_vocabulary_entries_alpha))
    {
        fprintf(stderr, "Out of memory building the candidate view!\n");
        return ENGINE_ERROR_LOAD;
    }
    free(p_store->p_candidate_view);
    p_store->p_candidate_view = p_view;
    p_store->candidate_count = candidate_count;

    if (skipped_count > 0)
    {
        fprintf(stderr, "Warning: skipped %d target words not in the vocabulary.\n", skipped_count);
    }
    return ENGINE_OK;
}

engine_error_t load_target_candidates(vocabulary_store_t* p_store, const char* path)
{
    char* p_text = read_whole_file(path);
    if (p_text == NULL)
    {
        fprintf(stderr, "Could not read target list '%s'!\n", path);
        return ENGINE_ERROR_LOAD;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    bool parsed = reader->parse(p_text, p_text + strlen(p_text), &root, &errors);
    free(p_text);

    if (!parsed || !root.isObject() || !root["words"].isArray())
    {
        fprintf(stderr, "Target list '%s' must be an object with a \"words\" array. %s\n", path, errors.c_str());
        return ENGINE_ERROR_LOAD;
    }

    const Json::Value& words = root["words"];
    std::vector<std::string> storage;
    storage.reserve(words.size());
    for (Json::ArrayIndex i = 0; i < words.size(); i++)
    {
        if (!words[i].isString())
        {
            fprintf(stderr, "Target list '%s' entry %u is not a string.\n", path, i);
            return ENGINE_ERROR_LOAD;
        }
        storage.push_back(words[i].asString());
    }

    std::vector<const char*> pointers;
    pointers.reserve(storage.size());
    for (size_t i = 0; i < storage.size(); i++) pointers.push_back(storage[i].c_str());

    engine_error_t result = set_target_candidates(p_store, pointers.empty() ? NULL : &pointers[0], (int)pointers.size());
    if (result == ENGINE_OK)
    {
        printf("Loaded %d target candidates from '%s'.\n", p_store->candidate_count, path);
    }
    return result;
}

const vocabulary_entry_t* vocabulary_find_entry(const vocabulary_store_t* p_store, const char* normalized_word)
{
    if (p_store == NULL || p_store->p_alpha_view == NULL || normalized_word == NULL) return NULL;

    vocabulary_entry_t** pp_found = (vocabulary_entry_t**)bsearch(normalized_word,
        p_store->p_alpha_view,
        p_store->entry_count,
        sizeof(vocabulary_entry_t*),
        compare_word_to_vocabulary_entry);

    return (pp_found != NULL) ? *pp_found : NULL;
}

bool vocabulary_contains(const vocabulary_store_t* p_store, const char* raw_word)
{
    char normalized[MAX_WORD_LENGTH + 1];
    if (!normalize_word(raw_word, normalized, sizeof(normalized))) return false;
    return vocabulary_find_entry(p_store, normalized) != NULL;
}

const float* vocabulary_vector_of(const vocabulary_store_t* p_store, const char* raw_word, int* p_dimension)
{
    char normalized[MAX_WORD_LENGTH + 1];
    if (!normalize_word(raw_word, normalized, sizeof(normalized))) return NULL;

    const vocabulary_entry_t* pEntry = vocabulary_find_entry(p_store, normalized);
    if (pEntry == NULL || !pEntry->has_embedding) return NULL;

    if (p_dimension != NULL) *p_dimension = p_store->dimension;
    return pEntry->p_embedding;
}

const vocabulary_entry_t* vocabulary_all_words(const vocabulary_store_t* p_store, int* p_count)
{
    if (p_store == NULL)
    {
        if (p_count != NULL) *p_count = 0;
        return NULL;
    }
    if (p_count != NULL) *p_count = p_store->entry_count;
    return p_store->p_entries;
}

engine_error_t resolve_pending_embeddings(vocabulary_store_t* p_store, const embedding_provider_t* p_provider)
{
    if (p_store == NULL || p_store->p_entries == NULL) return ENGINE_ERROR_INTERNAL;

    omp_set_lock(&p_store->embedding_lock);

    if (p_store->pending_count == 0)
    {
        omp_unset_lock(&p_store->embedding_lock);
        return ENGINE_OK;
    }
    if (p_provider == NULL || p_provider->embed_batch == NULL)
    {
        fprintf(stderr, "%d words have no embedding and no provider is configured.\n", p_store->pending_count);
        omp_unset_lock(&p_store->embedding_lock);
        return ENGINE_ERROR_PROVIDER;
    }

    // 1. Gather the pending entries.
    const int pending_count = p_store->pending_count;
    int* p_pending = (int*)malloc(sizeof(int) * pending_count);
    const char** pp_words = (const char**)malloc(sizeof(const char*) * pending_count);
    if (p_pending == NULL || pp_words == NULL)
    {
        free(p_pending);
        free(pp_words);
        omp_unset_lock(&p_store->embedding_lock);
        return ENGINE_ERROR_INTERNAL;
    }
    int gathered = 0;
    for (int i = 0; i < p_store->entry_count && gathered < pending_count; i++)
    {
        if (!p_store->p_entries[i].has_embedding)
        {
            p_pending[gathered] = i;
            pp_words[gathered] = p_store->p_entries[i].word;
            gathered++;
        }
    }

    // 2. Fetch every batch before touching the store, so a failure commits nothing.
    int dimension = p_store->dimension;
    float* p_fetched = NULL;
    engine_error_t result = ENGINE_OK;

    for (int start = 0; start < gathered && result == ENGINE_OK; start += EMBEDDING_BATCH_SIZE)
    {
        int batch_count = gathered - start;
        if (batch_count > EMBEDDING_BATCH_SIZE) batch_count = EMBEDDING_BATCH_SIZE;

        float* p_batch = NULL;
        int batch_dimension = 0;
        result = p_provider->embed_batch(p_provider->p_context, pp_words + start, batch_count, &p_batch, &batch_dimension);
        if (result != ENGINE_OK)
        {
            fprintf(stderr, "Embedding provider '%s' failed for %d words.\n",
                p_provider->name != NULL ? p_provider->name : "?", batch_count);
            result = ENGINE_ERROR_PROVIDER;
            break;
        }

        if (dimension == 0) dimension = batch_dimension;
        if (batch_dimension != dimension || batch_dimension <= 0)
        {
            fprintf(stderr, "Embedding provider returned dimension %d, expected %d.\n", batch_dimension, dimension);
            free(p_batch);
            result = ENGINE_ERROR_PROVIDER;
            break;
        }

        if (p_fetched == NULL)
        {
            p_fetched = (float*)malloc(sizeof(float) * (size_t)gathered * dimension);
            if (p_fetched == NULL)
            {
                free(p_batch);
                result = ENGINE_ERROR_INTERNAL;
                break;
            }
        }
        memcpy(p_fetched + (size_t)start * dimension, p_batch, sizeof(float) * (size_t)batch_count * dimension);
        free(p_batch);
    }

    // 3. Commit
    if (result == ENGINE_OK && p_store->p_vectors == NULL)
    {
        // Every word was pending: the store has no vector block yet.
        p_store->p_vectors = (float*)calloc((size_t)p_store->entry_count * dimension, sizeof(float));
        if (p_store->p_vectors == NULL)
        {
            result = ENGINE_ERROR_INTERNAL;
        }
        else
        {
            for (int i = 0; i < p_store->entry_count; i++)
            {
                p_store->p_entries[i].p_embedding = p_store->p_vectors + (size_t)i * dimension;
            }
            p_store->dimension = dimension;
        }
    }

    if (result == ENGINE_OK)
    {
        for (int k = 0; k < gathered; k++)
        {
            vocabulary_entry_t* pEntry = &p_store->p_entries[p_pending[k]];
            memcpy(pEntry->p_embedding, p_fetched + (size_t)k * dimension, sizeof(float) * dimension);
            pEntry->norm = vector_norm(pEntry->p_embedding, dimension);
            pEntry->has_embedding = true;
        }
        p_store->pending_count = 0;
        printf("Resolved %d pending embeddings (dimension %d).\n", gathered, dimension);
    }

    free(p_fetched);
    free(p_pending);
    free(pp_words);
    omp_unset_lock(&p_store->embedding_lock);
    return result;
}

void free_vocabulary(vocabulary_store_t* p_store)
{
    if (p_store == NULL || p_store->p_entries == NULL) return;

    omp_destroy_lock(&p_store->embedding_lock);
    free(p_store->p_alpha_view);
    free(p_store->p_candidate_view);
    free(p_store->p_vectors);
    free(p_store->p_entries);
    memset(p_store, 0, sizeof(vocabulary_store_t));
}
