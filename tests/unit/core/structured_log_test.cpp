#include <gtest/gtest.h>

#include <string>

#include "humidor/core/structured_log.h"

namespace humidor {

TEST(StructuredLogTest, NormalizesLevelsAndRanks) {
    EXPECT_EQ(NormalizeLogLevel("WARNING"), "warn");
    EXPECT_EQ(NormalizeLogLevel("Error"), "error");
    EXPECT_LT(LogLevelRank("debug"), LogLevelRank("info"));
    EXPECT_LT(LogLevelRank("info"), LogLevelRank("warn"));
    EXPECT_LT(LogLevelRank("warn"), LogLevelRank("error"));
    EXPECT_EQ(LogLevelRank("unknown"), LogLevelRank("info"));
}

TEST(StructuredLogTest, EscapesQuotesBackslashesAndNewlines) {
    EXPECT_EQ(EscapeLogValue("say \"hi\"\\\nbye"), "say \\\"hi\\\"\\\\\\nbye");
}

TEST(StructuredLogTest, EmitsKeyValueLineToStderr) {
    EngineConfig config;
    testing::internal::CaptureStderr();
    EmitStructuredLog(&config,
                      "humidor_engine",
                      "info",
                      "sale_recorded",
                      {{"transaction_id", "S-20240301123005-0002"}, {"units", "3"}});
    const auto output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(output.rfind("ts_ns=", 0), 0U);
    EXPECT_NE(output.find(" level=info app=humidor_engine event=sale_recorded"),
              std::string::npos);
    EXPECT_NE(output.find(" transaction_id=\"S-20240301123005-0002\" units=\"3\"\n"),
              std::string::npos);
}

TEST(StructuredLogTest, DropsEventsBelowConfiguredLevel) {
    EngineConfig config;
    config.log_level = "warn";
    testing::internal::CaptureStderr();
    EmitStructuredLog(&config, "humidor_engine", "info", "lot_added");
    EmitStructuredLog(&config, "humidor_engine", "error", "persist_failed");
    const auto output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(output.find("lot_added"), std::string::npos);
    EXPECT_NE(output.find("event=persist_failed"), std::string::npos);
}

TEST(StructuredLogTest, StdoutSinkWritesToStdout) {
    EngineConfig config;
    config.log_sink = "stdout";
    testing::internal::CaptureStdout();
    EmitStructuredLog(&config, "humidor_cli", "warn", "item_rejected");
    const auto output = testing::internal::GetCapturedStdout();
    EXPECT_NE(output.find("level=warn app=humidor_cli event=item_rejected"), std::string::npos);
}

}  // namespace humidor
