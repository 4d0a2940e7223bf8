#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "humidor/apps/cli_support.h"

namespace humidor::apps {
namespace {

CommandLine Parse(std::vector<std::string> tokens) {
    std::vector<char*> argv;
    for (auto& token : tokens) {
        argv.push_back(token.data());
    }
    return ParseCommandLine(static_cast<int>(argv.size()), argv.data());
}

TEST(CliSupportTest, ParsesCommandAndArgumentForms) {
    const auto parsed = Parse({"humidor_cli",
                               "sell",
                               "--lot",
                               "lot-000001",
                               "--quantity=3",
                               "--dry-run",
                               "--data-dir",
                               "/tmp/h"});
    EXPECT_EQ(parsed.command, "sell");
    EXPECT_EQ(GetArg(parsed.args, "lot"), "lot-000001");
    EXPECT_EQ(GetArg(parsed.args, "quantity"), "3");
    EXPECT_EQ(GetArg(parsed.args, "dry-run"), "true");
    EXPECT_EQ(GetArg(parsed.args, "data-dir"), "/tmp/h");
    EXPECT_TRUE(HasArg(parsed.args, "dry-run"));
    EXPECT_FALSE(HasArg(parsed.args, "output"));
    EXPECT_EQ(GetArg(parsed.args, "output", "-"), "-");
}

TEST(CliSupportTest, OnlyFirstBareTokenIsTheCommand) {
    const auto parsed = Parse({"humidor_cli", "summary", "extra"});
    EXPECT_EQ(parsed.command, "summary");
    EXPECT_TRUE(parsed.args.empty());
    EXPECT_TRUE(Parse({"humidor_cli"}).command.empty());
}

TEST(CliSupportTest, CountArgumentsAreValidated) {
    const auto parsed = Parse({"humidor_cli", "sell", "--quantity", "2.5", "--count", "4"});
    std::int32_t value = 0;
    std::string error;
    EXPECT_TRUE(GetCountArg(parsed.args, "count", &value, &error));
    EXPECT_EQ(value, 4);
    EXPECT_FALSE(GetCountArg(parsed.args, "quantity", &value, &error));
    EXPECT_EQ(error.rfind("--quantity: ", 0), 0U);
    EXPECT_FALSE(GetCountArg(parsed.args, "lot", &value, &error));
    EXPECT_EQ(error, "missing --lot");
}

TEST(CliSupportTest, DecimalArgumentsFallBackWhenAbsent) {
    const auto parsed = Parse({"humidor_cli", "resupply", "--shipping", "$12.50", "--tax", "x"});
    double value = 0.0;
    std::string error;
    EXPECT_TRUE(GetDecimalArg(parsed.args, "shipping", 0.0, &value, &error));
    EXPECT_DOUBLE_EQ(value, 12.5);
    EXPECT_TRUE(GetDecimalArg(parsed.args, "price", 7.0, &value, &error));
    EXPECT_DOUBLE_EQ(value, 7.0);
    EXPECT_FALSE(GetDecimalArg(parsed.args, "tax", 0.0, &value, &error));
    EXPECT_EQ(error.rfind("--tax: ", 0), 0U);
}

TEST(CliSupportTest, WriteTextFileCreatesParentDirectories) {
    const auto token = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    const auto dir =
        std::filesystem::temp_directory_path() / ("humidor_cli_support_test_" + token);
    const auto path = dir / "out" / "summary.json";

    std::string error;
    ASSERT_TRUE(WriteTextFile(path.string(), "{}\n", &error)) << error;
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    EXPECT_EQ(buffer.str(), "{}\n");
    EXPECT_TRUE(WriteTextFile("", "ignored", &error));
    std::filesystem::remove_all(dir);
}

}  // namespace
}  // namespace humidor::apps
