#include <gtest/gtest.h>
#include "guess_evaluator.h"
#include "load_vocabulary.h"
#include "test_helpers.h"
#include <omp.h>

class GuessEvaluatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(CAT_DOG_CAR_JSON, &vocabulary));
        ASSERT_TRUE(session_store_init(&sessions, 16, 600));
        ASSERT_EQ(ENGINE_OK, session_store_create(&sessions, vocabulary_find_entry(&vocabulary, "cat"), false, 1000, session_id));
    }

    void TearDown() override
    {
        session_store_destroy(&sessions);
        free_vocabulary(&vocabulary);
    }

    engine_error_t guess(const char* word, attempt_result_t* p_result, bool reject_duplicates = false)
    {
        return submit_guess(&sessions, &vocabulary, session_id, word, reject_duplicates, 1001, p_result);
    }

    vocabulary_store_t vocabulary;
    session_store_t sessions;
    char session_id[SESSION_ID_LENGTH + 1];
};

TEST_F(GuessEvaluatorTest, ScoresGuessesAgainstTarget)
{
    attempt_result_t result;

    ASSERT_EQ(ENGINE_OK, guess("dog", &result));
    EXPECT_NEAR(0.994, result.similarity, 1e-3);
    EXPECT_EQ(2, result.rank);
    EXPECT_FALSE(result.is_correct);
    EXPECT_EQ(1, result.attempt_count);

    ASSERT_EQ(ENGINE_OK, guess("car", &result));
    EXPECT_NEAR(0.0, result.similarity, 1e-12);
    EXPECT_EQ(3, result.rank);
    EXPECT_FALSE(result.is_correct);
    EXPECT_EQ(2, result.attempt_count);

    ASSERT_EQ(ENGINE_OK, guess("cat", &result));
    EXPECT_EQ(1.0, result.similarity);
    EXPECT_EQ(1, result.rank);
    EXPECT_TRUE(result.is_correct);
    EXPECT_EQ(3, result.attempt_count);

    game_session_view_t view;
    ASSERT_EQ(ENGINE_OK, session_store_get(&sessions, session_id, 1002, &view));
    EXPECT_TRUE(view.is_completed);
    ASSERT_EQ(3, view.attempt_count);
    EXPECT_STREQ("dog", view.p_attempts[0].word);
    EXPECT_STREQ("car", view.p_attempts[1].word);
    EXPECT_STREQ("cat", view.p_attempts[2].word);
    EXPECT_EQ((time_t)1001, view.p_attempts[0].submitted_at);
    free_session_view(&view);
}

TEST_F(GuessEvaluatorTest, CompletedSessionRejectsGuesses)
{
    attempt_result_t result;
    ASSERT_EQ(ENGINE_OK, guess("cat", &result));
    EXPECT_EQ(ENGINE_ERROR_SESSION_ALREADY_COMPLETED, guess("dog", &result));
    EXPECT_EQ(ENGINE_ERROR_SESSION_ALREADY_COMPLETED, guess("unicorn", &result));

    game_session_view_t view;
    ASSERT_EQ(ENGINE_OK, session_store_get(&sessions, session_id, 1002, &view));
    EXPECT_EQ(1, view.attempt_count);
    free_session_view(&view);
}

TEST_F(GuessEvaluatorTest, UnknownWordLeavesSessionUnchanged)
{
    attempt_result_t result;
    EXPECT_EQ(ENGINE_ERROR_INVALID_WORD, guess("unicorn", &result));
    EXPECT_EQ(ENGINE_ERROR_INVALID_WORD, guess("", &result));
    EXPECT_EQ(ENGINE_ERROR_INVALID_WORD, guess("   ", &result));

    game_session_view_t view;
    ASSERT_EQ(ENGINE_OK, session_store_get(&sessions, session_id, 1002, &view));
    EXPECT_EQ(0, view.attempt_count);
    EXPECT_FALSE(view.is_completed);
    free_session_view(&view);
}

TEST_F(GuessEvaluatorTest, GuessIsNormalized)
{
    attempt_result_t result;
    ASSERT_EQ(ENGINE_OK, guess("  DOG ", &result));
    EXPECT_EQ(2, result.rank);

    game_session_view_t view;
    ASSERT_EQ(ENGINE_OK, session_store_get(&sessions, session_id, 1002, &view));
    ASSERT_EQ(1, view.attempt_count);
    EXPECT_STREQ("dog", view.p_attempts[0].word);
    free_session_view(&view);
}

TEST_F(GuessEvaluatorTest, UnknownSessionIsNotFound)
{
    attempt_result_t result;
    EXPECT_EQ(ENGINE_ERROR_SESSION_NOT_FOUND,
        submit_guess(&sessions, &vocabulary, "00000000-0000-4000-8000-000000000000", "dog", false, 1001, &result));
}

TEST_F(GuessEvaluatorTest, DuplicatesAreRescoredByDefault)
{
    attempt_result_t first;
    attempt_result_t second;
    ASSERT_EQ(ENGINE_OK, guess("dog", &first));
    ASSERT_EQ(ENGINE_OK, guess("dog", &second));
    EXPECT_EQ(first.rank, second.rank);
    EXPECT_EQ(first.similarity, second.similarity);
    EXPECT_EQ(2, second.attempt_count);
}

TEST_F(GuessEvaluatorTest, DuplicatesCanBeRejected)
{
    attempt_result_t result;
    ASSERT_EQ(ENGINE_OK, guess("dog", &result, true));
    EXPECT_EQ(ENGINE_ERROR_DUPLICATE_GUESS, guess("Dog", &result, true));

    game_session_view_t view;
    ASSERT_EQ(ENGINE_OK, session_store_get(&sessions, session_id, 1002, &view));
    EXPECT_EQ(1, view.attempt_count);
    free_session_view(&view);
}

TEST_F(GuessEvaluatorTest, RankingIsBuiltOncePerSession)
{
    attempt_result_t result;
    ASSERT_EQ(ENGINE_OK, guess("dog", &result));

    game_session_t* p_session = NULL;
    ASSERT_EQ(ENGINE_OK, session_store_acquire(&sessions, session_id, 1002, &p_session));
    const similarity_ranking_t* p_ranking = p_session->p_ranking;
    ASSERT_TRUE(p_ranking != NULL);
    session_store_release(&sessions, p_session);

    ASSERT_EQ(ENGINE_OK, guess("car", &result));
    ASSERT_EQ(ENGINE_OK, session_store_acquire(&sessions, session_id, 1003, &p_session));
    EXPECT_EQ(p_ranking, p_session->p_ranking);
    session_store_release(&sessions, p_session);
}

TEST_F(GuessEvaluatorTest, ConcurrentGuessesOnOneSessionSerialize)
{
    const int count = 64;
    int accepted = 0;
    int refused = 0;

#pragma omp parallel for schedule(dynamic) reduction(+:accepted, refused)
    for (int i = 0; i < count; i++)
    {
        attempt_result_t result;
        engine_error_t error = submit_guess(&sessions, &vocabulary, session_id, (i == 40) ? "cat" : "dog",
            false, 1001, &result);
        if (error == ENGINE_OK) accepted++;
        else if (error == ENGINE_ERROR_SESSION_ALREADY_COMPLETED) refused++;
    }

    EXPECT_EQ(count, accepted + refused);

    game_session_view_t view;
    ASSERT_EQ(ENGINE_OK, session_store_get(&sessions, session_id, 1002, &view));
    EXPECT_EQ(accepted, view.attempt_count);
    EXPECT_TRUE(view.is_completed);

    int correct = 0;
    for (int i = 0; i < view.attempt_count; i++)
    {
        if (view.p_attempts[i].is_correct) correct++;
    }
    EXPECT_EQ(1, correct);
    ASSERT_GT(view.attempt_count, 0);
    EXPECT_TRUE(view.p_attempts[view.attempt_count - 1].is_correct);
    free_session_view(&view);
}
