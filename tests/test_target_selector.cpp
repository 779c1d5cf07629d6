#include <gtest/gtest.h>
#include "target_selector.h"
#include "load_vocabulary.h"
#include "test_helpers.h"
#include <set>

TEST(UtcFormatting, DateAndTimestamp)
{
    char date[ISO_DATE_LENGTH + 1];
    char timestamp[ISO_TIMESTAMP_LENGTH + 1];

    ASSERT_TRUE(format_utc_date(0, date));
    EXPECT_STREQ("1970-01-01", date);
    ASSERT_TRUE(format_utc_timestamp(86399, timestamp));
    EXPECT_STREQ("1970-01-01T23:59:59Z", timestamp);

    ASSERT_TRUE(format_utc_date(86400, date));
    EXPECT_STREQ("1970-01-02", date);
}

TEST(DailyTarget, SameDateSameIndex)
{
    int first = daily_target_index("2024-03-15", 1000);
    ASSERT_GE(first, 0);
    ASSERT_LT(first, 1000);
    EXPECT_EQ(first, daily_target_index("2024-03-15", 1000));
}

TEST(DailyTarget, RejectsMalformedDates)
{
    EXPECT_EQ(-1, daily_target_index("2024-3-15", 10));
    EXPECT_EQ(-1, daily_target_index("2024/03/15", 10));
    EXPECT_EQ(-1, daily_target_index("", 10));
    EXPECT_EQ(-1, daily_target_index(NULL, 10));
    EXPECT_EQ(-1, daily_target_index("2024-03-15", 0));

    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(CAT_DOG_CAR_JSON, &store));
    const vocabulary_entry_t* p_target = NULL;
    EXPECT_EQ(ENGINE_ERROR_BAD_REQUEST, select_daily_target(&store, "yesterday", &p_target));
    free_vocabulary(&store);
}

TEST(DailyTarget, VariesAcrossDates)
{
    std::string json = make_generated_vocabulary_json(50, 0);
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(json.c_str(), &store));

    std::set<std::string> picked;
    for (int day = 1; day <= 30; day++)
    {
        char date[ISO_DATE_LENGTH + 1];
        snprintf(date, sizeof(date), "2024-04-%02d", day);
        const vocabulary_entry_t* p_target = NULL;
        ASSERT_EQ(ENGINE_OK, select_daily_target(&store, date, &p_target));
        ASSERT_TRUE(p_target->is_target_candidate);
        picked.insert(p_target->word);
    }
    EXPECT_GE(picked.size(), 2u);

    free_vocabulary(&store);
}

TEST(DailyTarget, IndependentOfVocabularyFileOrder)
{
    const char* forward[] = { "alpha", "bravo", "charlie", "delta", "echo" };
    const char* backward[] = { "echo", "delta", "charlie", "bravo", "alpha" };
    const float vectors[] = { 1, 0, 0, 1, 1, 1, 2, 1, 1, 2 };

    vocabulary_store_t first;
    vocabulary_store_t second;
    ASSERT_EQ(ENGINE_OK, build_vocabulary(forward, vectors, NULL, 5, 2, &first));
    ASSERT_EQ(ENGINE_OK, build_vocabulary(backward, vectors, NULL, 5, 2, &second));

    const char* dates[] = { "2024-01-01", "2024-06-30", "2025-12-31" };
    for (int i = 0; i < 3; i++)
    {
        const vocabulary_entry_t* p_first = NULL;
        const vocabulary_entry_t* p_second = NULL;
        ASSERT_EQ(ENGINE_OK, select_daily_target(&first, dates[i], &p_first));
        ASSERT_EQ(ENGINE_OK, select_daily_target(&second, dates[i], &p_second));
        EXPECT_STREQ(p_first->word, p_second->word);
    }

    free_vocabulary(&first);
    free_vocabulary(&second);
}

TEST(RandomTarget, OnlyPicksCandidates)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(CAT_DOG_CAR_JSON, &store));
    const char* words[] = { "dog" };
    ASSERT_EQ(ENGINE_OK, set_target_candidates(&store, words, 1));

    for (int i = 0; i < 50; i++)
    {
        const vocabulary_entry_t* p_target = NULL;
        ASSERT_EQ(ENGINE_OK, select_random_target(&store, &p_target));
        EXPECT_STREQ("dog", p_target->word);
    }
    free_vocabulary(&store);
}

TEST(RandomTarget, CoversEveryCandidate)
{
    vocabulary_store_t store;
    ASSERT_EQ(ENGINE_OK, load_vocabulary_from_json(CAT_DOG_CAR_JSON, &store));

    std::set<std::string> picked;
    for (int i = 0; i < 300; i++)
    {
        const vocabulary_entry_t* p_target = NULL;
        ASSERT_EQ(ENGINE_OK, select_random_target(&store, &p_target));
        picked.insert(p_target->word);
    }
    EXPECT_EQ(3u, picked.size());
    free_vocabulary(&store);
}

TEST(RandomTarget, FailsWithoutCandidates)
{
    vocabulary_store_t store;
    memset(&store, 0, sizeof(store));
    const vocabulary_entry_t* p_target = NULL;
    EXPECT_EQ(ENGINE_ERROR_INTERNAL, select_random_target(&store, &p_target));
}
