#include <gtest/gtest.h>
#include "load_vocabulary.h"
#include "test_helpers.h"

TEST(NormalizeWord, TrimsAndLowerCases)
{
    char out[MAX_WORD_LENGTH + 1];
    ASSERT_TRUE(normalize_word("  Cat \n", out, sizeof(out)));
    EXPECT_STREQ("cat", out);
    ASSERT_TRUE(normalize_word("DOG", out, sizeof(out)));
    EXPECT_STREQ("dog", out);
}

TEST(NormalizeWord, RejectsEmptyAndOverlong)
{
    char out[MAX_WORD_LENGTH + 1];
    EXPECT_FALSE(normalize_word("", out, sizeof(out)));
    EXPECT_FALSE(normalize_word(" \t ", out, sizeof(out)));
    EXPECT_FALSE(normalize_word(NULL, out, sizeof(out)));

    std::string longest(MAX_WORD_LENGTH, 'a');
    EXPECT_TRUE(normalize_word(longest.c_str(), out, sizeof(out)));
    std::string too_long(MAX_WORD_LENGTH + 1, 'a');
    EXPECT_FALSE(normalize_word(too_long.c_str(), out, sizeof(out)));
}

TEST(VocabularyJson, LoadsWordsAndVectors)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(CAT_DOG_CAR_JSON, &store));

    EXPECT_EQ(3, store.entry_count);
    EXPECT_EQ(2, store.dimension);
    EXPECT_EQ(0, store.pending_count);
    EXPECT_EQ(3, store.candidate_count);

    EXPECT_TRUE(vocabulary_contains(&store, "cat"));
    EXPECT_TRUE(vocabulary_contains(&store, "CAT"));
    EXPECT_TRUE(vocabulary_contains(&store, "  Dog "));
    EXPECT_FALSE(vocabulary_contains(&store, "cow"));
    EXPECT_FALSE(vocabulary_contains(&store, ""));

    int dimension = 0;
    const float* p_dog = vocabulary_vector_of(&store, "dog", &dimension);
    ASSERT_TRUE(p_dog != NULL);
    EXPECT_EQ(2, dimension);
    EXPECT_FLOAT_EQ(0.9f, p_dog[0]);
    EXPECT_FLOAT_EQ(0.1f, p_dog[1]);
    EXPECT_TRUE(vocabulary_vector_of(&store, "cow", NULL) == NULL);

    free_vocabulary(&store);
}

TEST(VocabularyJson, IterationOrderIsSortedKeyOrder)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(CAT_DOG_CAR_JSON, &store));

    int count = 0;
    const vocabulary_entry_t* p_entries = vocabulary_all_words(&store, &count);
    ASSERT_EQ(3, count);
    EXPECT_STREQ("car", p_entries[0].word);
    EXPECT_STREQ("cat", p_entries[1].word);
    EXPECT_STREQ("dog", p_entries[2].word);
    for (int i = 0; i < count; i++) EXPECT_EQ(i, p_entries[i].index);

    free_vocabulary(&store);
}

TEST(VocabularyJson, RejectsDuplicatesAfterNormalization)
{
    vocabulary_store_t store;
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("{\"Cat\": [1, 0], \"cat\": [0, 1]}", &store));
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("{\"cat\": [1, 0], \" cat\": [0, 1]}", &store));
}

TEST(VocabularyJson, RejectsDuplicateKeys)
{
    vocabulary_store_t store;
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("{\"cat\": [1, 0], \"cat\": [0, 1]}", &store));
}

TEST(VocabularyJson, RejectsDimensionMismatch)
{
    vocabulary_store_t store;
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("{\"a\": [1, 0], \"b\": [1, 0, 0]}", &store));
}

TEST(VocabularyJson, RejectsMalformedInput)
{
    vocabulary_store_t store;
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("{\"a\": [1, 0]", &store));
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("[1, 2, 3]", &store));
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("{}", &store));
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("{\"a\": [1, \"x\"]}", &store));
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("{\"a\": 3}", &store));
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("{\"a\": []}", &store));
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary_from_json("{\"\": [1, 0]}", &store));
}

TEST(VocabularyJson, NullVectorsArePending)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json("{\"a\": [1, 0], \"b\": null}", &store));
    EXPECT_EQ(1, store.pending_count);
    EXPECT_TRUE(vocabulary_contains(&store, "b"));
    EXPECT_TRUE(vocabulary_vector_of(&store, "b", NULL) == NULL);
    EXPECT_TRUE(vocabulary_vector_of(&store, "a", NULL) != NULL);
    free_vocabulary(&store);
}

TEST(VocabularyFile, LoadsTextFormatInFileOrder)
{
    std::string path = make_temp_file("# test vocabulary\n3 2\ncat 1 0\n\nDog 0.9 0.1\ncar 0 1\n", ".txt");
    ASSERT_FALSE(path.empty());

    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary(path.c_str(), &store));
    EXPECT_EQ(3, store.entry_count);
    EXPECT_EQ(2, store.dimension);
    EXPECT_STREQ("cat", store.p_entries[0].word);
    EXPECT_STREQ("dog", store.p_entries[1].word);
    EXPECT_STREQ("car", store.p_entries[2].word);

    free_vocabulary(&store);
    unlink(path.c_str());
}

TEST(VocabularyFile, TextWordWithoutVectorIsPending)
{
    std::string path = make_temp_file("cow\ncat 1 0\n", ".txt");
    ASSERT_FALSE(path.empty());

    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary(path.c_str(), &store));
    EXPECT_EQ(2, store.entry_count);
    EXPECT_EQ(1, store.pending_count);
    EXPECT_TRUE(vocabulary_vector_of(&store, "cow", NULL) == NULL);

    free_vocabulary(&store);
    unlink(path.c_str());
}

TEST(VocabularyFile, TextDimensionMismatchFails)
{
    std::string path = make_temp_file("cat 1 0\ndog 1 0 0\n", ".txt");
    ASSERT_FALSE(path.empty());

    vocabulary_store_t store;
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary(path.c_str(), &store));
    unlink(path.c_str());
}

TEST(VocabularyFile, TextNonNumericComponentFails)
{
    std::string path = make_temp_file("cat 1 zero\n", ".txt");
    ASSERT_FALSE(path.empty());

    vocabulary_store_t store;
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary(path.c_str(), &store));
    unlink(path.c_str());
}

TEST(VocabularyFile, JsonExtensionUsesJsonFormat)
{
    std::string path = make_temp_file(CAT_DOG_CAR_JSON, ".json");
    ASSERT_FALSE(path.empty());

    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary(path.c_str(), &store));
    EXPECT_EQ(3, store.entry_count);
    free_vocabulary(&store);
    unlink(path.c_str());
}

TEST(VocabularyFile, MissingFileFails)
{
    vocabulary_store_t store;
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary("/nonexistent/vocabulary.json", &store));
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_vocabulary("", &store));
}

TEST(TargetCandidates, RestrictsToKnownWords)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(CAT_DOG_CAR_JSON, &store));

    const char* words[] = { "Cat", "unicorn" };
    ASSERT_EQ(ENGINE_OK, set_target_candidates(&store, words, 2));
    EXPECT_EQ(1, store.candidate_count);
    EXPECT_STREQ("cat", store.p_candidate_view[0]->word);
    EXPECT_TRUE(vocabulary_find_entry(&store, "cat")->is_target_candidate);
    EXPECT_FALSE(vocabulary_find_entry(&store, "dog")->is_target_candidate);

    // Non-candidates stay guessable.
    EXPECT_TRUE(vocabulary_contains(&store, "dog"));
    free_vocabulary(&store);
}

TEST(TargetCandidates, NoKnownWordKeepsPreviousSet)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(CAT_DOG_CAR_JSON, &store));

    const char* words[] = { "unicorn", "dragon" };
    EXPECT_EQ(ENGINE_ERROR_LOAD, set_target_candidates(&store, words, 2));
    EXPECT_EQ(3, store.candidate_count);
    free_vocabulary(&store);
}

TEST(TargetCandidates, LoadsFromJsonFile)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(CAT_DOG_CAR_JSON, &store));

    std::string path = make_temp_file("{\"words\": [\"dog\", \"car\", \"zebra\"]}", ".json");
    ASSERT_FALSE(path.empty());
    ASSERT_EQ(ENGINE_OK, load_target_candidates(&store, path.c_str()));
    EXPECT_EQ(2, store.candidate_count);
    EXPECT_STREQ("car", store.p_candidate_view[0]->word);
    EXPECT_STREQ("dog", store.p_candidate_view[1]->word);
    unlink(path.c_str());

    std::string bad = make_temp_file("{\"targets\": []}", ".json");
    ASSERT_FALSE(bad.empty());
    EXPECT_EQ(ENGINE_ERROR_LOAD, load_target_candidates(&store, bad.c_str()));
    unlink(bad.c_str());

    free_vocabulary(&store);
}

TEST(PendingEmbeddings, ResolvedOnceThroughProvider)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json("{\"a\": [1, 0], \"b\": null, \"c\": null}", &store));

    fake_provider_state_t state = { 2, false, 0, 0 };
    embedding_provider_t provider = make_fake_provider(&state);

    ASSERT_EQ(ENGINE_OK, resolve_pending_embeddings(&store, &provider));
    EXPECT_EQ(0, store.pending_count);
    EXPECT_EQ(1, state.call_count);
    EXPECT_EQ(2, state.word_count);
    EXPECT_TRUE(vocabulary_vector_of(&store, "b", NULL) != NULL);
    EXPECT_GT(vocabulary_find_entry(&store, "c")->norm, 0.0);

    // Nothing pending any more: no provider call.
    ASSERT_EQ(ENGINE_OK, resolve_pending_embeddings(&store, &provider));
    EXPECT_EQ(1, state.call_count);

    free_vocabulary(&store);
}

TEST(PendingEmbeddings, AllPendingTakesProviderDimension)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json("{\"a\": null, \"b\": null}", &store));
    EXPECT_EQ(0, store.dimension);

    fake_provider_state_t state = { 5, false, 0, 0 };
    embedding_provider_t provider = make_fake_provider(&state);
    ASSERT_EQ(ENGINE_OK, resolve_pending_embeddings(&store, &provider));
    EXPECT_EQ(5, store.dimension);
    EXPECT_TRUE(vocabulary_vector_of(&store, "a", NULL) != NULL);

    free_vocabulary(&store);
}

TEST(PendingEmbeddings, FailureCommitsNothing)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json("{\"a\": [1, 0], \"b\": null}", &store));

    fake_provider_state_t state = { 2, true, 0, 0 };
    embedding_provider_t provider = make_fake_provider(&state);
    EXPECT_EQ(ENGINE_ERROR_PROVIDER, resolve_pending_embeddings(&store, &provider));
    EXPECT_EQ(1, store.pending_count);
    EXPECT_FALSE(vocabulary_find_entry(&store, "b")->has_embedding);

    // Wrong dimension from the provider is a provider failure too.
    fake_provider_state_t wide = { 3, false, 0, 0 };
    embedding_provider_t wide_provider = make_fake_provider(&wide);
    EXPECT_EQ(ENGINE_ERROR_PROVIDER, resolve_pending_embeddings(&store, &wide_provider));
    EXPECT_EQ(1, store.pending_count);

    EXPECT_EQ(ENGINE_ERROR_PROVIDER, resolve_pending_embeddings(&store, NULL));

    // A retry after the provider recovers succeeds.
    state.fail = false;
    EXPECT_EQ(ENGINE_OK, resolve_pending_embeddings(&store, &provider));
    EXPECT_EQ(0, store.pending_count);

    free_vocabulary(&store);
}

TEST(PendingEmbeddings, LargeSetIsBatched)
{
    std::string json = make_generated_vocabulary_json(600, 1);
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(json.c_str(), &store));
    EXPECT_EQ(600, store.pending_count);

    fake_provider_state_t state = { 4, false, 0, 0 };
    embedding_provider_t provider = make_fake_provider(&state);
    ASSERT_EQ(ENGINE_OK, resolve_pending_embeddings(&store, &provider));
    EXPECT_EQ(3, state.call_count); // 256 + 256 + 88
    EXPECT_EQ(600, state.word_count);

    free_vocabulary(&store);
}
