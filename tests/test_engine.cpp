#include <gtest/gtest.h>
#include "semantle_engine.h"
#include "load_vocabulary.h"
#include "target_selector.h"
#include "test_helpers.h"

class EngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config = make_test_config();
        ASSERT_EQ(ENGINE_OK, semantle_engine_init_from_json(&engine, &config, CAT_DOG_CAR_JSON, NULL));
    }

    void TearDown() override
    {
        semantle_engine_destroy(&engine);
    }

    engine_config_t config;
    semantle_engine_t engine;
};

TEST_F(EngineTest, NewRandomGameStartsEmpty)
{
    char session_id[SESSION_ID_LENGTH + 1];
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, false, 1000, session_id));

    game_session_view_t view;
    ASSERT_EQ(ENGINE_OK, semantle_get_session(&engine, session_id, 1000, &view));
    EXPECT_FALSE(view.is_daily);
    EXPECT_FALSE(view.is_completed);
    EXPECT_EQ(0, view.attempt_count);
    EXPECT_TRUE(semantle_validate_word(&engine, view.target_word));
    free_session_view(&view);
}

TEST_F(EngineTest, DailyGamesShareTheDaysTarget)
{
    const time_t noon = 1710504000; // 2024-03-15T12:00:00Z
    char first_id[SESSION_ID_LENGTH + 1];
    char second_id[SESSION_ID_LENGTH + 1];
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, true, noon, first_id));
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, true, noon + 3600, second_id));
    EXPECT_STRNE(first_id, second_id);

    game_session_view_t first;
    game_session_view_t second;
    ASSERT_EQ(ENGINE_OK, semantle_get_session(&engine, first_id, noon + 3600, &first));
    ASSERT_EQ(ENGINE_OK, semantle_get_session(&engine, second_id, noon + 3600, &second));
    EXPECT_TRUE(first.is_daily);
    EXPECT_STREQ(first.target_word, second.target_word);

    const vocabulary_entry_t* p_expected = NULL;
    ASSERT_EQ(ENGINE_OK, select_daily_target(&engine.vocabulary, "2024-03-15", &p_expected));
    EXPECT_STREQ(p_expected->word, first.target_word);

    free_session_view(&first);
    free_session_view(&second);
}

TEST_F(EngineTest, PlaysAGameToCompletion)
{
    const char* words[] = { "cat" };
    ASSERT_EQ(ENGINE_OK, set_target_candidates(&engine.vocabulary, words, 1));

    char session_id[SESSION_ID_LENGTH + 1];
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, false, 1000, session_id));

    attempt_result_t result;
    ASSERT_EQ(ENGINE_OK, semantle_submit_guess(&engine, session_id, "dog", 1001, &result));
    EXPECT_EQ(2, result.rank);
    ASSERT_EQ(ENGINE_OK, semantle_submit_guess(&engine, session_id, "CAT", 1002, &result));
    EXPECT_TRUE(result.is_correct);
    EXPECT_EQ(ENGINE_ERROR_SESSION_ALREADY_COMPLETED, semantle_submit_guess(&engine, session_id, "car", 1003, &result));
}

TEST_F(EngineTest, WrongSessionIdIsNotFound)
{
    char session_id[SESSION_ID_LENGTH + 1];
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, false, 1000, session_id));

    char other_id[SESSION_ID_LENGTH + 1];
    memcpy(other_id, session_id, sizeof(other_id));
    other_id[0] = (other_id[0] == 'a') ? 'b' : 'a';

    game_session_view_t view;
    EXPECT_EQ(ENGINE_ERROR_SESSION_NOT_FOUND, semantle_get_session(&engine, other_id, 1000, &view));
}

TEST_F(EngineTest, ValidatesWords)
{
    EXPECT_TRUE(semantle_validate_word(&engine, "cat"));
    EXPECT_TRUE(semantle_validate_word(&engine, " Car "));
    EXPECT_FALSE(semantle_validate_word(&engine, "cow"));
    EXPECT_FALSE(semantle_validate_word(&engine, ""));
}

TEST_F(EngineTest, SavesStatsFromSession)
{
    const char* words[] = { "cat" };
    ASSERT_EQ(ENGINE_OK, set_target_candidates(&engine.vocabulary, words, 1));

    char session_id[SESSION_ID_LENGTH + 1];
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, false, 1000, session_id));
    attempt_result_t result;
    ASSERT_EQ(ENGINE_OK, semantle_submit_guess(&engine, session_id, "dog", 1001, &result));
    ASSERT_EQ(ENGINE_OK, semantle_submit_guess(&engine, session_id, "cat", 1002, &result));

    ASSERT_EQ(ENGINE_OK, semantle_save_user_stats(&engine, "alice", session_id, 86399));

    user_stats_summary_t summary;
    ASSERT_EQ(ENGINE_OK, semantle_get_user_stats(&engine, "alice", &summary));
    EXPECT_EQ(1, summary.total_games);
    EXPECT_EQ(1, summary.completed_games);
    EXPECT_EQ(2, summary.best_score);
    EXPECT_DOUBLE_EQ(2.0, summary.average_attempts);
    ASSERT_EQ(1, summary.recent_count);
    EXPECT_STREQ(session_id, summary.p_recent[0].session_id);
    EXPECT_STREQ("cat", summary.p_recent[0].target_word);
    EXPECT_STREQ("1970-01-01T23:59:59Z", summary.p_recent[0].date);
    free_user_stats_summary(&summary);
}

TEST_F(EngineTest, SavingStatsForUnknownSessionFails)
{
    EXPECT_EQ(ENGINE_ERROR_SESSION_NOT_FOUND,
        semantle_save_user_stats(&engine, "alice", "00000000-0000-4000-8000-000000000000", 1000));
}

TEST_F(EngineTest, SweepRemovesIdleSessions)
{
    char session_id[SESSION_ID_LENGTH + 1];
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, false, 1000, session_id));
    EXPECT_EQ(0, semantle_sweep_expired(&engine, 1000 + config.session_ttl_seconds));
    EXPECT_EQ(1, semantle_sweep_expired(&engine, 1001 + config.session_ttl_seconds));

    game_session_view_t view;
    EXPECT_EQ(ENGINE_ERROR_SESSION_NOT_FOUND, semantle_get_session(&engine, session_id, 1002 + config.session_ttl_seconds, &view));
}

TEST(EngineSetup, CapacityIsReported)
{
    engine_config_t config = make_test_config();
    config.max_sessions = 2;
    semantle_engine_t engine;
    ASSERT_EQ(ENGINE_OK, semantle_engine_init_from_json(&engine, &config, CAT_DOG_CAR_JSON, NULL));

    char session_id[SESSION_ID_LENGTH + 1];
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, false, 1000, session_id));
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, false, 1000, session_id));
    EXPECT_EQ(ENGINE_ERROR_CAPACITY, semantle_new_game(&engine, false, 1000, session_id));

    semantle_engine_destroy(&engine);
}

TEST(EngineSetup, PendingVectorsWithoutProviderFailToLoad)
{
    engine_config_t config = make_test_config();
    semantle_engine_t engine;
    EXPECT_EQ(ENGINE_ERROR_LOAD,
        semantle_engine_init_from_json(&engine, &config, "{\"cat\": [1, 0], \"dog\": null}", NULL));
    semantle_engine_destroy(&engine);
}

TEST(EngineSetup, MalformedVocabularyFailsToLoad)
{
    engine_config_t config = make_test_config();
    semantle_engine_t engine;
    EXPECT_EQ(ENGINE_ERROR_LOAD, semantle_engine_init_from_json(&engine, &config, "{\"cat\": [1, 0", NULL));
    semantle_engine_destroy(&engine);
}

TEST(EngineSetup, MissingVocabularyFileFailsToLoad)
{
    engine_config_t config = make_test_config();
    snprintf(config.vocabulary_path, sizeof(config.vocabulary_path), "%s", "/nonexistent/vocabulary.json");
    semantle_engine_t engine;
    EXPECT_EQ(ENGINE_ERROR_LOAD, semantle_engine_init(&engine, &config));
    semantle_engine_destroy(&engine);
}

TEST(EngineSetup, LoadsVocabularyAndTargetsFromFiles)
{
    std::string vocabulary_path = make_temp_file(CAT_DOG_CAR_JSON, ".json");
    std::string targets_path = make_temp_file("{\"words\": [\"dog\"]}", ".json");
    ASSERT_FALSE(vocabulary_path.empty());
    ASSERT_FALSE(targets_path.empty());

    engine_config_t config = make_test_config();
    snprintf(config.vocabulary_path, sizeof(config.vocabulary_path), "%s", vocabulary_path.c_str());
    snprintf(config.targets_path, sizeof(config.targets_path), "%s", targets_path.c_str());

    semantle_engine_t engine;
    ASSERT_EQ(ENGINE_OK, semantle_engine_init(&engine, &config));
    EXPECT_EQ(3, engine.vocabulary.entry_count);
    EXPECT_EQ(1, engine.vocabulary.candidate_count);

    char session_id[SESSION_ID_LENGTH + 1];
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, true, 1000, session_id));
    game_session_view_t view;
    ASSERT_EQ(ENGINE_OK, semantle_get_session(&engine, session_id, 1000, &view));
    EXPECT_STREQ("dog", view.target_word);
    free_session_view(&view);

    semantle_engine_destroy(&engine);
    unlink(vocabulary_path.c_str());
    unlink(targets_path.c_str());
}

TEST(EngineSetup, ProviderFailureCreatesNoSession)
{
    fake_provider_state_t state = { 2, true, 0, 0 };
    embedding_provider_t provider = make_fake_provider(&state);

    engine_config_t config = make_test_config();
    semantle_engine_t engine;
    ASSERT_EQ(ENGINE_OK, semantle_engine_init_from_json(&engine, &config, "{\"cat\": [1, 0], \"dog\": null}", &provider));

    char session_id[SESSION_ID_LENGTH + 1];
    EXPECT_EQ(ENGINE_ERROR_PROVIDER, semantle_new_game(&engine, false, 1000, session_id));
    EXPECT_EQ(0, session_store_count(&engine.sessions));
    EXPECT_TRUE(engine_error_is_retryable(ENGINE_ERROR_PROVIDER));

    // Recovered provider: the retry resolves the pending word and succeeds.
    state.fail = false;
    ASSERT_EQ(ENGINE_OK, semantle_new_game(&engine, false, 1001, session_id));
    EXPECT_EQ(0, engine.vocabulary.pending_count);
    EXPECT_EQ(1, session_store_count(&engine.sessions));

    attempt_result_t result;
    ASSERT_EQ(ENGINE_OK, semantle_submit_guess(&engine, session_id, "dog", 1002, &result));
    EXPECT_GE(result.rank, 1);
    EXPECT_LE(result.rank, 2);

    semantle_engine_destroy(&engine);
}
