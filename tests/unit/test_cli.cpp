#include <gtest/gtest.h>
#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/command_registry.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/utils.hpp"
#include <filesystem>
#include <fstream>

using namespace peerdrop::core;

namespace {
    // argv as main() would receive it.
    class Args {
    public:
        Args(std::initializer_list<std::string> args) : storage_(args) {
            for (auto& arg : storage_) {
                pointers_.push_back(arg.data());
            }
        }
        
        int argc() const { return static_cast<int>(pointers_.size()); }
        char** argv() { return pointers_.data(); }
        
    private:
        std::vector<std::string> storage_;
        std::vector<char*> pointers_;
    };
}

TEST(CommandLineParserTest, PositionalArgumentsAndFlags) {
    CommandLineParser parser("peerdrop");
    Args args{"peerdrop", "--verbose", "send", "photo.png", "copy.png"};
    
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    
    EXPECT_TRUE(parser.has_option("verbose"));
    EXPECT_FALSE(parser.has_option("help"));
    EXPECT_EQ(parser.get_positional_args(), (std::vector<std::string>{"send", "photo.png", "copy.png"}));
}

TEST(CommandLineParserTest, LongOptionValues) {
    CommandLineParser parser("peerdrop");
    Args args{"peerdrop", "--config=custom.conf", "--chunk-size", "4096", "chunks", "a.bin"};
    
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    
    EXPECT_EQ(parser.get_option("config"), "custom.conf");
    EXPECT_EQ(parser.get_chunk_size(), 4096u);
    EXPECT_EQ(parser.get_positional_args().size(), 2u);
}

TEST(CommandLineParserTest, ShortOptions) {
    CommandLineParser parser("peerdrop");
    Args args{"peerdrop", "-s8192", "-c", "other.conf", "-h"};
    
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    
    EXPECT_EQ(parser.get_chunk_size(), 8192u);
    EXPECT_EQ(parser.get_option("config"), "other.conf");
    EXPECT_TRUE(parser.has_option("help"));
}

TEST(CommandLineParserTest, DefaultsApplyWhenAbsent) {
    CommandLineParser parser("peerdrop");
    Args args{"peerdrop"};
    
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    
    EXPECT_FALSE(parser.has_option("config"));
    EXPECT_EQ(parser.get_option("config"), "peerdrop.conf");
    EXPECT_FALSE(parser.get_chunk_size().has_value());
    EXPECT_TRUE(parser.get_positional_args().empty());
}

TEST(CommandLineParserTest, OptionsStopAtCommandWord) {
    CommandLineParser parser("peerdrop");
    Args args{"peerdrop", "send", "-notes.txt", "--verbose"};
    
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    
    EXPECT_FALSE(parser.has_option("verbose"));
    EXPECT_EQ(parser.get_positional_args(), (std::vector<std::string>{"send", "-notes.txt", "--verbose"}));
}

TEST(CommandLineParserTest, ChunkSizeCheckedWhileParsing) {
    for (std::string bad : {"-1", "0", "lots", "12k", "16777217", "18446744073709551616"}) {
        CommandLineParser parser("peerdrop");
        Args args{"peerdrop", "--chunk-size", bad, "chunks", "a.bin"};
        
        EXPECT_FALSE(parser.parse(args.argc(), args.argv())) << bad;
        EXPECT_EQ(parser.get_error(), "--chunk-size must be between 1 and 16777216, got '" + bad + "'");
    }
    
    CommandLineParser parser("peerdrop");
    Args args{"peerdrop", "-s16777216"};
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_EQ(parser.get_chunk_size(), 16777216u);
}

TEST(CommandLineParserTest, ApplyOverridesConfiguredChunkSize) {
    Config config;
    config.set_defaults();
    
    CommandLineParser parser("peerdrop");
    Args without{"peerdrop", "chunks", "a.bin"};
    ASSERT_TRUE(parser.parse(without.argc(), without.argv()));
    parser.apply_to(config);
    EXPECT_EQ(config.get_uint64("transfer.chunk_size"), 16384u);
    
    Args with{"peerdrop", "--chunk-size=1000", "chunks", "a.bin"};
    ASSERT_TRUE(parser.parse(with.argc(), with.argv()));
    parser.apply_to(config);
    EXPECT_EQ(config.get_uint64("transfer.chunk_size"), 1000u);
}

TEST(CommandLineParserTest, UnknownOptionFails) {
    CommandLineParser parser("peerdrop");
    Args args{"peerdrop", "--bogus"};
    
    EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    EXPECT_EQ(parser.get_error(), "Unknown option: --bogus");
    
    Args short_args{"peerdrop", "-x"};
    EXPECT_FALSE(parser.parse(short_args.argc(), short_args.argv()));
    EXPECT_EQ(parser.get_error(), "Unknown option: -x");
}

TEST(CommandLineParserTest, MissingValueFails) {
    CommandLineParser parser("peerdrop");
    Args args{"peerdrop", "--config"};
    
    EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    EXPECT_EQ(parser.get_error(), "Option --config requires a value");
}

TEST(CommandLineParserTest, FlagRejectsValue) {
    CommandLineParser parser("peerdrop");
    Args args{"peerdrop", "--verbose=yes"};
    
    EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    EXPECT_EQ(parser.get_error(), "Option --verbose does not take a value");
}

TEST(CommandLineParserTest, HelpListsOptionsAndCommands) {
    CommandLineParser parser("peerdrop");
    CommandRegistry registry;
    
    testing::internal::CaptureStdout();
    parser.print_help(registry);
    auto output = testing::internal::GetCapturedStdout();
    
    EXPECT_NE(output.find("-s, --chunk-size <bytes>"), std::string::npos);
    EXPECT_NE(output.find("-c, --config <path>"), std::string::npos);
    EXPECT_NE(output.find("(default: peerdrop.conf)"), std::string::npos);
    EXPECT_NE(output.find("peerdrop send <file> [output]"), std::string::npos);
    EXPECT_NE(output.find("peerdrop chunks <file>"), std::string::npos);
    EXPECT_NE(output.find("peerdrop config [output]"), std::string::npos);
}

class CommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& config = Config::instance();
        config.clear();
        config.set_defaults();
        config.set("transfer.backoff_ms", "5");
        
        dir_ = std::filesystem::temp_directory_path() / "peerdrop_command_test";
        std::filesystem::create_directories(dir_);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(dir_);
        Config::instance().clear();
    }
    
    std::filesystem::path write_file(const std::string& name, std::size_t size) {
        auto path = dir_ / name;
        std::ofstream file(path, std::ios::binary);
        for (std::size_t i = 0; i < size; ++i) {
            file.put(static_cast<char>(i % 251));
        }
        return path;
    }
    
    std::filesystem::path dir_;
    CommandRegistry registry_;
};

TEST_F(CommandTest, KnowsItsCommands) {
    EXPECT_TRUE(registry_.has_command("send"));
    EXPECT_TRUE(registry_.has_command("chunks"));
    EXPECT_TRUE(registry_.has_command("config"));
    EXPECT_FALSE(registry_.has_command("share"));
    
    auto result = registry_.execute_command("share", {"share"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Unknown command: share");
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(CommandTest, SendDeliversIdenticalCopy) {
    auto input = write_file("input.bin", 50000);
    auto output = dir_ / "output.bin";
    
    auto result = registry_.execute_command("send", {"send", input.string(), output.string()});
    
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.exit_code, 0);
    
    auto sent = utils::FileUtils::read_binary(input);
    auto received = utils::FileUtils::read_binary(output);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, *sent);
}

TEST_F(CommandTest, SendEmptyFile) {
    auto input = write_file("empty.bin", 0);
    
    auto result = registry_.execute_command("send", {"send", input.string()});
    
    EXPECT_TRUE(result.success) << result.message;
}

TEST_F(CommandTest, SendRejectsMissingFile) {
    auto result = registry_.execute_command("send", {"send", (dir_ / "absent.bin").string()});
    
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("File does not exist"), std::string::npos);
}

TEST_F(CommandTest, SendRejectsOversizedFile) {
    Config::instance().set("transfer.max_file_size", "100");
    auto input = write_file("big.bin", 101);
    
    auto result = registry_.execute_command("send", {"send", input.string()});
    
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("max_file_size"), std::string::npos);
}

TEST_F(CommandTest, SendNeedsAFile) {
    auto result = registry_.execute_command("send", {"send"});
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Usage: peerdrop send <file> [output]");
}

TEST_F(CommandTest, ChunksReportsFraming) {
    auto input = write_file("chunks.bin", 1000);
    Config::instance().set("transfer.chunk_size", "300");
    
    testing::internal::CaptureStdout();
    auto result = registry_.execute_command("chunks", {"chunks", input.string()});
    auto output = testing::internal::GetCapturedStdout();
    
    ASSERT_TRUE(result.success);
    EXPECT_NE(output.find(R"({"type":"metadata","fileName":"chunks.bin","fileSize":1000)"), std::string::npos);
    EXPECT_NE(output.find("chunk 3: 100 bytes"), std::string::npos);
    EXPECT_NE(output.find(R"({"type":"end"})"), std::string::npos);
    EXPECT_NE(output.find("4 chunks of at most 300 bytes"), std::string::npos);
}

TEST_F(CommandTest, ChunksRejectsNegativeChunkSize) {
    auto input = write_file("negative.bin", 1000);
    Config::instance().set("transfer.chunk_size", "-1");
    
    auto result = registry_.execute_command("chunks", {"chunks", input.string()});
    
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("transfer.chunk_size"), std::string::npos);
}

TEST_F(CommandTest, ConfigWritesLoadableFile) {
    auto path = dir_ / "written.conf";
    
    auto result = registry_.execute_command("config", {"config", path.string()});
    ASSERT_TRUE(result.success);
    
    auto& config = Config::instance();
    config.clear();
    ASSERT_TRUE(config.load_from_file(path.string()));
    EXPECT_EQ(config.get_int("transfer.chunk_size"), 16384);
    EXPECT_EQ(config.get_string("log.level"), "info");
}

TEST_F(CommandTest, ConfigFlagsInvalidTransferSettings) {
    Config::instance().set("transfer.chunk_size", "0");
    
    testing::internal::CaptureStdout();
    auto result = registry_.execute_command("config", {"config"});
    auto output = testing::internal::GetCapturedStdout();
    
    EXPECT_FALSE(result.success);
    EXPECT_NE(output.find("transfer.chunk_size = 0"), std::string::npos);
}
