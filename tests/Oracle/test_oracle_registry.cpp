/**
 * @file test_oracle_registry.cpp
 * @brief Unit tests for oracle registration, dispatch and finding collection
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/FindingSink.hpp>
#include <Vigil/Oracle/OracleFactory.hpp>
#include <Vigil/Oracle/OracleRegistry.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace Vigil;
using namespace Vigil::Oracle;

namespace {

/// Emits one finding per hook call and records the call order
class StubOracle : public Vigil::Oracle::Oracle {
public:
    StubOracle(std::string name, std::vector<std::string>& calls,
               Severity severity = Severity::Minor)
        : name_(std::move(name)), calls_(calls), severity_(severity) {}

    const char* name() const noexcept override { return name_.c_str(); }

    VoidResult preExecution(HarnessState&) override {
        calls_.push_back(name_ + ".pre");
        return VoidResult::Success();
    }

    Result<FindingList> doneExecution(const Trace::ExecutionEffects&, HarnessState&) override {
        calls_.push_back(name_ + ".done");
        OracleFinding finding;
        finding.oracle = name_;
        finding.severity = severity_;
        finding.extra = findingContext(name_, nullptr, std::nullopt);
        return FindingList{std::move(finding)};
    }

    void reset() override { calls_.push_back(name_ + ".reset"); }

private:
    std::string name_;
    std::vector<std::string>& calls_;
    Severity severity_;
};

class FailingOracle : public Vigil::Oracle::Oracle {
public:
    const char* name() const noexcept override { return "FailingOracle"; }

    Result<FindingList> doneExecution(const Trace::ExecutionEffects&, HarnessState&) override {
        return ErrorCode::OracleFailed;
    }
};

OracleFinding makeFinding(const std::string& oracle, Severity severity) {
    OracleFinding finding;
    finding.oracle = oracle;
    finding.severity = severity;
    finding.extra = findingContext(oracle, nullptr, ProgramCounter{4});
    return finding;
}

} // namespace

// ============================================================================
// OracleRegistry
// ============================================================================

// Test 1: Findings come back in registration order
TEST(OracleRegistryTest, RegistrationOrder) {
    std::vector<std::string> calls;
    OracleRegistry registry;
    registry.registerOracle(std::make_unique<StubOracle>("B", calls));
    registry.registerOracle(std::make_unique<StubOracle>("A", calls));
    registry.registerOracle(std::make_unique<StubOracle>("C", calls));

    HarnessState harness;
    ASSERT_TRUE(registry.preExecution(harness).isSuccess());
    auto result = registry.doneExecution(Trace::ExecutionEffects{}, harness);
    ASSERT_TRUE(result.isSuccess());

    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_EQ(result.value()[0].oracle, "B");
    EXPECT_EQ(result.value()[1].oracle, "A");
    EXPECT_EQ(result.value()[2].oracle, "C");
    EXPECT_EQ(calls, (std::vector<std::string>{"B.pre", "A.pre", "C.pre", "B.done", "A.done", "C.done"}));
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"B", "A", "C"}));
}

// Test 2: Disabled entries never run
TEST(OracleRegistryTest, DisabledEntriesSkipped) {
    std::vector<std::string> calls;
    OracleRegistry registry;
    registry.registerOracle(std::make_unique<StubOracle>("A", calls));
    registry.registerOracle(std::make_unique<StubOracle>("B", calls), false);

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.enabledCount(), 1u);
    EXPECT_FALSE(registry.isEnabled("B"));

    HarnessState harness;
    auto result = registry.doneExecution(Trace::ExecutionEffects{}, harness);
    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].oracle, "A");

    EXPECT_TRUE(registry.setEnabled("B", true));
    EXPECT_FALSE(registry.setEnabled("Missing", true));
    EXPECT_EQ(registry.enabledCount(), 2u);
}

// Test 3: An oracle error aborts the hook
TEST(OracleRegistryTest, FailurePropagates) {
    std::vector<std::string> calls;
    OracleRegistry registry;
    registry.registerOracle(std::make_unique<StubOracle>("A", calls));
    registry.registerOracle(std::make_unique<FailingOracle>());
    registry.registerOracle(std::make_unique<StubOracle>("C", calls));

    HarnessState harness;
    auto result = registry.doneExecution(Trace::ExecutionEffects{}, harness);
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::OracleFailed);
    EXPECT_EQ(calls, (std::vector<std::string>{"A.done"}));
}

TEST(OracleRegistryTest, ResetReachesEveryEntry) {
    std::vector<std::string> calls;
    OracleRegistry registry;
    registry.registerOracle(std::make_unique<StubOracle>("A", calls));
    registry.registerOracle(std::make_unique<StubOracle>("B", calls), false);
    registry.registerOracle(nullptr);

    EXPECT_EQ(registry.size(), 2u);
    registry.resetAll();
    EXPECT_EQ(calls, (std::vector<std::string>{"A.reset", "B.reset"}));
}

// ============================================================================
// Oracle factory
// ============================================================================

// Test 4: Default registry holds all six oracles in fixed order
TEST(OracleFactoryTest, DefaultOrder) {
    auto registry = buildOracleRegistry(Config::OracleConfig{});
    ASSERT_NE(registry, nullptr);
    EXPECT_EQ(registry->names(), (std::vector<std::string>{
        "BoolJudgementOracle", "InfiniteLoopOracle", "PrecisionLossOracle",
        "TypeConversionOracle", "OverflowOracle", "TypedBugOracle"}));
    EXPECT_EQ(registry->enabledCount(), 6u);
}

// Test 5: Flags disable entries without changing positions
TEST(OracleFactoryTest, FlagsAndDisableDefects) {
    Config::OracleConfig config;
    config.precisionLoss = false;
    config.typedBug = false;

    auto registry = buildOracleRegistry(config);
    EXPECT_EQ(registry->size(), 6u);
    EXPECT_EQ(registry->enabledCount(), 4u);
    EXPECT_FALSE(registry->isEnabled("PrecisionLossOracle"));
    EXPECT_FALSE(registry->isEnabled("TypedBugOracle"));
    EXPECT_TRUE(registry->isEnabled("OverflowOracle"));

    config.disableDefects = true;
    auto none = buildOracleRegistry(config);
    EXPECT_EQ(none->size(), 6u);
    EXPECT_EQ(none->enabledCount(), 0u);
}

// ============================================================================
// FindingSink
// ============================================================================

// Test 6: Counters by severity and oracle
TEST(FindingSinkTest, Counters) {
    FindingSink sink;
    EXPECT_TRUE(sink.empty());
    EXPECT_FALSE(sink.maxSeverity().has_value());

    sink.add(makeFinding("OverflowOracle", Severity::Medium));
    sink.addAll({makeFinding("OverflowOracle", Severity::Medium),
                 makeFinding("InfiniteLoopOracle", Severity::Major)});

    EXPECT_EQ(sink.size(), 3u);
    EXPECT_EQ(sink.countBySeverity(Severity::Medium), 2u);
    EXPECT_EQ(sink.countBySeverity(Severity::Critical), 0u);
    EXPECT_EQ(sink.countByOracle("OverflowOracle"), 2u);
    EXPECT_EQ(sink.countByOracle("TypedBugOracle"), 0u);
    EXPECT_EQ(sink.oracleCounts().size(), 2u);
    EXPECT_EQ(sink.maxSeverity(), std::optional<Severity>(Severity::Major));

    nlohmann::json array = sink.toJson();
    ASSERT_TRUE(array.is_array());
    ASSERT_EQ(array.size(), 3u);
    EXPECT_EQ(array[2]["oracle"], "InfiniteLoopOracle");
    EXPECT_EQ(array[2]["severity"], "Major");
    EXPECT_EQ(array[2]["extra"]["pc"], 4);
    EXPECT_TRUE(array[2]["extra"]["function"].is_null());

    sink.clear();
    EXPECT_TRUE(sink.empty());
    EXPECT_EQ(sink.countBySeverity(Severity::Medium), 0u);
    EXPECT_EQ(sink.countByOracle("OverflowOracle"), 0u);
}

// Test 7: JSON lines are appended to the findings file
TEST(FindingSinkTest, WriteJsonLines) {
    auto path = (std::filesystem::temp_directory_path() / "vigil_test_findings.jsonl").string();
    std::filesystem::remove(path);

    FindingSink sink;
    sink.add(makeFinding("TypedBugOracle", Severity::Critical));
    ASSERT_TRUE(sink.writeJsonLines(path).isSuccess());
    ASSERT_TRUE(sink.writeJsonLines(path).isSuccess());

    std::ifstream in(path);
    std::string line;
    size_t lines = 0;
    while (std::getline(in, line)) {
        auto parsed = nlohmann::json::parse(line);
        EXPECT_EQ(parsed["severity"], "Critical");
        ++lines;
    }
    EXPECT_EQ(lines, 2u);
    std::filesystem::remove(path);
}

// Test 8: Event payloads holding raw bytes are written with replacement characters
TEST(FindingSinkTest, WriteJsonLinesInvalidUtf8) {
    auto path = (std::filesystem::temp_directory_path() / "vigil_test_findings_raw.jsonl").string();
    std::filesystem::remove(path);

    FindingSink sink;
    OracleFinding finding = makeFinding("TypedBugOracle", Severity::Critical);
    finding.extra["event"] = nlohmann::json{{"payload", {{"s", "\xff"}}}};
    sink.add(finding);
    ASSERT_TRUE(sink.writeJsonLines(path).isSuccess());

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    auto parsed = nlohmann::json::parse(line);
    EXPECT_EQ(parsed["extra"]["event"]["payload"]["s"], "\xEF\xBF\xBD");
    std::filesystem::remove(path);
}

TEST(FindingSinkTest, UnwritablePath) {
    FindingSink sink;
    sink.add(makeFinding("OverflowOracle", Severity::Medium));
    auto result = sink.writeJsonLines("/nonexistent-dir/vigil/findings.jsonl");
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::FileWriteError);
}
