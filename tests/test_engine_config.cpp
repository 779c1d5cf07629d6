#include <gtest/gtest.h>
#include "engine_config.h"
#include <stdlib.h>
#include <string.h>

static const char* const CONFIG_ENV_VARS[] = {
    "OPENAI_API_KEY", "SEMANTLE_VOCABULARY", "SEMANTLE_TARGETS", "SEMANTLE_STATS_FILE",
    "SEMANTLE_SESSION_TTL", "SEMANTLE_MAX_SESSIONS", "SEMANTLE_REJECT_DUPLICATES", "SEMANTLE_DEBUG",
    "SEMANTLE_EMBEDDING_URL", "SEMANTLE_EMBEDDING_MODEL", "SEMANTLE_PROVIDER_TIMEOUT_MS"
};

class EngineConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        clear_environment();
        init_default_engine_config(&config);
    }

    void TearDown() override
    {
        clear_environment();
    }

    static void clear_environment()
    {
        for (size_t i = 0; i < sizeof(CONFIG_ENV_VARS) / sizeof(CONFIG_ENV_VARS[0]); i++) unsetenv(CONFIG_ENV_VARS[i]);
    }

    engine_config_t config;
};

TEST_F(EngineConfigTest, Defaults)
{
    EXPECT_STREQ("", config.vocabulary_path);
    EXPECT_STREQ("", config.targets_path);
    EXPECT_STREQ("", config.stats_path);
    EXPECT_EQ(DEFAULT_SESSION_TTL_SECONDS, config.session_ttl_seconds);
    EXPECT_EQ(DEFAULT_MAX_SESSIONS, config.max_sessions);
    EXPECT_FALSE(config.reject_duplicates);
    EXPECT_FALSE(config.debug);
    EXPECT_STREQ(DEFAULT_EMBEDDING_URL, config.embedding_url);
    EXPECT_STREQ(DEFAULT_EMBEDDING_MODEL, config.embedding_model);
    EXPECT_STREQ("", config.api_key);
    EXPECT_EQ(DEFAULT_PROVIDER_TIMEOUT_MS, config.provider_timeout_ms);
}

TEST_F(EngineConfigTest, ArgumentsOverrideDefaults)
{
    const char* args[] = { "semantle_server", "--vocabulary", "words.json", "--targets", "targets.json",
        "--stats", "stats.json", "--session-ttl", "120", "--max-sessions", "10", "--reject-duplicates", "--debug" };
    int argc = (int)(sizeof(args) / sizeof(args[0]));

    ASSERT_TRUE(apply_arguments_to_engine_config(&config, argc, (char**)args));
    EXPECT_STREQ("words.json", config.vocabulary_path);
    EXPECT_STREQ("targets.json", config.targets_path);
    EXPECT_STREQ("stats.json", config.stats_path);
    EXPECT_EQ(120, config.session_ttl_seconds);
    EXPECT_EQ(10, config.max_sessions);
    EXPECT_TRUE(config.reject_duplicates);
    EXPECT_TRUE(config.debug);
}

TEST_F(EngineConfigTest, RejectsUnknownOrIncompleteArguments)
{
    const char* unknown[] = { "semantle_server", "--colour", "blue" };
    EXPECT_FALSE(apply_arguments_to_engine_config(&config, 3, (char**)unknown));

    const char* missing[] = { "semantle_server", "--vocabulary" };
    EXPECT_FALSE(apply_arguments_to_engine_config(&config, 2, (char**)missing));

    const char* bad_number[] = { "semantle_server", "--session-ttl", "soon" };
    EXPECT_FALSE(apply_arguments_to_engine_config(&config, 3, (char**)bad_number));

    const char* zero[] = { "semantle_server", "--max-sessions", "0" };
    EXPECT_FALSE(apply_arguments_to_engine_config(&config, 3, (char**)zero));
}

TEST_F(EngineConfigTest, EnvironmentOverridesDefaults)
{
    setenv("SEMANTLE_VOCABULARY", "/data/words.txt", 1);
    setenv("SEMANTLE_SESSION_TTL", "90", 1);
    setenv("SEMANTLE_MAX_SESSIONS", "7", 1);
    setenv("SEMANTLE_REJECT_DUPLICATES", "yes", 1);
    setenv("SEMANTLE_DEBUG", "ON", 1);
    setenv("OPENAI_API_KEY", "sk-test", 1);
    setenv("SEMANTLE_EMBEDDING_MODEL", "text-embedding-3-small", 1);
    setenv("SEMANTLE_PROVIDER_TIMEOUT_MS", "2500", 1);

    ASSERT_TRUE(apply_environment_to_engine_config(&config));
    EXPECT_STREQ("/data/words.txt", config.vocabulary_path);
    EXPECT_EQ(90, config.session_ttl_seconds);
    EXPECT_EQ(7, config.max_sessions);
    EXPECT_TRUE(config.reject_duplicates);
    EXPECT_TRUE(config.debug);
    EXPECT_STREQ("sk-test", config.api_key);
    EXPECT_STREQ("text-embedding-3-small", config.embedding_model);
    EXPECT_EQ(2500L, config.provider_timeout_ms);
}

TEST_F(EngineConfigTest, ArgumentsWinOverEnvironment)
{
    setenv("SEMANTLE_SESSION_TTL", "90", 1);
    ASSERT_TRUE(apply_environment_to_engine_config(&config));

    const char* args[] = { "semantle_server", "--session-ttl", "30" };
    ASSERT_TRUE(apply_arguments_to_engine_config(&config, 3, (char**)args));
    EXPECT_EQ(30, config.session_ttl_seconds);
}

TEST_F(EngineConfigTest, ZeroTtlDisablesExpiry)
{
    setenv("SEMANTLE_SESSION_TTL", "0", 1);
    ASSERT_TRUE(apply_environment_to_engine_config(&config));
    EXPECT_EQ(0, config.session_ttl_seconds);

    config.session_ttl_seconds = DEFAULT_SESSION_TTL_SECONDS;
    const char* args[] = { "semantle_server", "--session-ttl", "0" };
    ASSERT_TRUE(apply_arguments_to_engine_config(&config, 3, (char**)args));
    EXPECT_EQ(0, config.session_ttl_seconds);

    const char* negative[] = { "semantle_server", "--session-ttl", "-1" };
    EXPECT_FALSE(apply_arguments_to_engine_config(&config, 3, (char**)negative));
}

TEST_F(EngineConfigTest, InvalidEnvironmentValuesAreReported)
{
    setenv("SEMANTLE_SESSION_TTL", "-5", 1);
    EXPECT_FALSE(apply_environment_to_engine_config(&config));
    EXPECT_EQ(DEFAULT_SESSION_TTL_SECONDS, config.session_ttl_seconds);
    unsetenv("SEMANTLE_SESSION_TTL");

    setenv("SEMANTLE_DEBUG", "maybe", 1);
    EXPECT_FALSE(apply_environment_to_engine_config(&config));
    EXPECT_FALSE(config.debug);
}
