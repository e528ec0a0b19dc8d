#include <gtest/gtest.h>

#include <fstream>

#include "infra/config/config.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "test_helpers.hpp"

using cverify::infra::Config;

class ConfigTest : public cverify::test::TempDirTest {
protected:
    auto write_yaml(const std::string& text) -> std::filesystem::path {
        auto p = path("config.yaml");
        std::ofstream(p) << text;
        return p;
    }
};

TEST_F(ConfigTest, LoadsAllKeys)
{
    auto p = write_yaml(
        "threads: 4\n"
        "buffer_size: 1048576\n"
        "verify: false\n"
        "preserve_metadata: false\n"
        "progress: false\n"
        "quiet: true\n"
        "log_level: debug\n");

    auto cfg = cverify::infra::load_config_from_path(p);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(*cfg->threads, 4u);
    EXPECT_EQ(*cfg->buffer_size, 1048576u);
    EXPECT_FALSE(cfg->verify);
    EXPECT_FALSE(cfg->preserve_metadata);
    EXPECT_FALSE(cfg->progress);
    EXPECT_TRUE(cfg->quiet);
    EXPECT_EQ(*cfg->log_level, "debug");
}

TEST_F(ConfigTest, MissingKeysKeepDefaults)
{
    auto cfg = cverify::infra::load_config_from_path(write_yaml("threads: 2\n"));
    ASSERT_TRUE(cfg.has_value());
    EXPECT_TRUE(cfg->verify);
    EXPECT_TRUE(cfg->preserve_metadata);
    EXPECT_FALSE(cfg->buffer_size.has_value());
}

TEST_F(ConfigTest, RejectsZeroThreads)
{
    auto cfg = cverify::infra::load_config_from_path(write_yaml("threads: 0\n"));
    EXPECT_FALSE(cfg.has_value());
}

TEST_F(ConfigTest, RejectsMalformedYaml)
{
    auto cfg = cverify::infra::load_config_from_path(write_yaml("threads: [1, 2\n"));
    EXPECT_FALSE(cfg.has_value());

    auto wrong_type = cverify::infra::load_config_from_path(write_yaml("verify: maybe\n"));
    EXPECT_FALSE(wrong_type.has_value());
}

TEST(ConfigMergeTest, CliOverridesFile)
{
    Config file{};
    file.threads = 8;
    file.buffer_size = 4096;
    file.log_level = "warn";

    cverify::args_parser::CLIArgs args{};
    args.threads = 2;
    args.no_verify = true;
    args.verbose = true;

    file.merge_with(cverify::infra::config_from_cli(args));
    EXPECT_EQ(*file.threads, 2u);
    EXPECT_EQ(*file.buffer_size, 4096u);  // в CLI не задан
    EXPECT_FALSE(file.verify);
    EXPECT_TRUE(file.preserve_metadata);
    EXPECT_EQ(*file.log_level, "debug");
}

TEST(ConfigMergeTest, CliCannotReenableWhatFileDisabled)
{
    Config file{};
    file.verify = false;
    file.quiet = true;

    file.merge_with(cverify::infra::config_from_cli(cverify::args_parser::CLIArgs{}));
    EXPECT_FALSE(file.verify);
    EXPECT_TRUE(file.quiet);
}
