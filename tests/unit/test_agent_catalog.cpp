/**
 * @file test_agent_catalog.cpp
 * @brief Unit tests for agent id validation and the agent catalogs.
 */

#include "sandbox/agent_catalog.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace sandbox_orchestrator;

TEST(AgentIdTest, Validation) {
    EXPECT_TRUE(is_valid_agent_id("agent-01"));
    EXPECT_TRUE(is_valid_agent_id("My_Agent"));
    EXPECT_TRUE(is_valid_agent_id(std::string(128, 'a')));

    EXPECT_FALSE(is_valid_agent_id(""));
    EXPECT_FALSE(is_valid_agent_id(std::string(129, 'a')));
    EXPECT_FALSE(is_valid_agent_id("../etc"));
    EXPECT_FALSE(is_valid_agent_id("a/b"));
    EXPECT_FALSE(is_valid_agent_id("has space"));
}

class DirectoryAgentCatalogTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "so_test_agents";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_ / "echo");
        std::ofstream(dir_ / "echo" / "main.py") << "print('{}')\n";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(DirectoryAgentCatalogTest, LoadsEntryFile) {
    DirectoryAgentCatalog catalog(dir_, "main.py");
    auto code = catalog.lookup("echo");
    ASSERT_TRUE(code.has_value()) << code.error().message;
    EXPECT_EQ(code->agent_id, "echo");
    EXPECT_EQ(code->source, "print('{}')\n");
}

TEST_F(DirectoryAgentCatalogTest, UnknownAgentIsNotFound) {
    DirectoryAgentCatalog catalog(dir_, "main.py");
    auto code = catalog.lookup("missing");
    ASSERT_FALSE(code.has_value());
    EXPECT_EQ(code.error().code, ErrorCode::NotFound);
    EXPECT_EQ(code.error().message, "Agent not found: missing");
}

TEST_F(DirectoryAgentCatalogTest, TraversalRejected) {
    DirectoryAgentCatalog catalog(dir_, "main.py");
    auto code = catalog.lookup("../echo");
    ASSERT_FALSE(code.has_value());
    EXPECT_EQ(code.error().code, ErrorCode::InvalidArgument);
}

TEST(InMemoryAgentCatalogTest, PutLookupRemove) {
    InMemoryAgentCatalog catalog;
    catalog.put("a1", "echo hi");

    auto code = catalog.lookup("a1");
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(code->source, "echo hi");

    EXPECT_TRUE(catalog.remove("a1"));
    EXPECT_FALSE(catalog.remove("a1"));
    EXPECT_EQ(catalog.lookup("a1").error().code, ErrorCode::NotFound);
}
