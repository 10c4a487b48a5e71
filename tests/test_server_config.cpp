#include <gtest/gtest.h>
#include "server_config.hpp"
#include <cstdlib>
#include <stdexcept>

using namespace fairdraw;

TEST(ServerConfigTest, DefaultValues) {
    ServerConfig config;
    EXPECT_EQ(config.address, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_FALSE(config.enable_tls);
    EXPECT_EQ(config.storage, StorageBackend::REDIS);
    EXPECT_EQ(config.disclosure, DisclosureMode::FULL);
    EXPECT_EQ(config.max_request_size, 8u * 1024 * 1024);
    EXPECT_EQ(config.secret_salt, DEFAULT_SECRET_SALT);
    EXPECT_TRUE(config.admin_token.empty());
}

TEST(ServerConfigTest, EnvironmentOverrides) {
    setenv("FAIRDRAW_PORT", "9191", 1);
    setenv("FAIRDRAW_STORAGE", "memory", 1);
    setenv("FAIRDRAW_DISCLOSURE", "winner_only", 1);
    setenv("FAIRDRAW_ALLOWED_ORIGINS", "https://a.example,https://b.example", 1);
    setenv("FAIRDRAW_MAX_ENTRIES", "500", 1);

    ServerConfig config;
    apply_env_overrides(config);

    unsetenv("FAIRDRAW_PORT");
    unsetenv("FAIRDRAW_STORAGE");
    unsetenv("FAIRDRAW_DISCLOSURE");
    unsetenv("FAIRDRAW_ALLOWED_ORIGINS");
    unsetenv("FAIRDRAW_MAX_ENTRIES");

    EXPECT_EQ(config.port, 9191);
    EXPECT_EQ(config.storage, StorageBackend::MEMORY);
    EXPECT_EQ(config.disclosure, DisclosureMode::WINNER_ONLY);
    ASSERT_EQ(config.allowed_origins.size(), 2u);
    EXPECT_EQ(config.allowed_origins[1], "https://b.example");
    EXPECT_EQ(config.max_entries_per_draw, 500u);
}

TEST(ServerConfigTest, UnknownPolicyValuesRejected) {
    EXPECT_THROW(parse_disclosure_mode("partial"), std::invalid_argument);
    EXPECT_THROW(parse_storage_backend("postgres"), std::invalid_argument);

    setenv("FAIRDRAW_DISCLOSURE", "everything", 1);
    ServerConfig config;
    EXPECT_THROW(apply_env_overrides(config), std::invalid_argument);
    unsetenv("FAIRDRAW_DISCLOSURE");
}
