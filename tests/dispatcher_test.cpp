// labsim headers
#include "core/Errors.hpp"
#include "core/ProtocolDispatcher.hpp"
#include "core/RunLogFormatter.hpp"
#include "protocols/ProtocolParser.hpp"

// labsim fakes
#include "FakeEngines.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace labsim::test {

  using core::ConfigurationError;
  using core::EngineVariant;
  using core::ExecutionError;
  using core::FeatureFlags;
  using core::ProtocolDispatcher;
  using core::Severity;
  using core::SimulateOptions;
  using protocols::ProtocolDescriptor;
  using protocols::ProtocolKind;

  namespace {

    const char* kV1Source = "metadata = {'apiLevel': '1'}\ndef run(ctx):\n    pass\n";
    const char* kV2Source = "metadata = {'apiLevel': '2'}\ndef run(ctx):\n    pass\n";
    const char* kJson = R"({"schemaVersion": 3, "commands": []})";

    protocols::LabwareDefinition labwareDef(const std::string& loadName) {
      protocols::LabwareDefinition def = protocols::LabwareDefinition::object();
      def["namespace"] = "custom_beta";
      def["version"] = 1;
      def["parameters"] = protocols::LabwareDefinition::object();
      def["parameters"]["loadName"] = loadName;
      return def;
    }

    constexpr FeatureFlags kV2{ true, false };
    constexpr FeatureFlags kV2Backcompat{ true, true };
    constexpr FeatureFlags kLegacy{ false, false };

  } // namespace

  class ProtocolDispatcherTest : public ::testing::Test {
  protected:
    void SetUp() override {
      monitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
      dispatcher = std::make_unique<ProtocolDispatcher>(
          current, legacy, std::static_pointer_cast<core::ErrorMonitor>(monitor));
    }

    FakeProtocolEngine current;
    FakeLegacyEngine legacy;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> monitor;
    std::unique_ptr<ProtocolDispatcher> dispatcher;
    core::Logger logger;
    SimulateOptions options;
  };

  //---decision table-------------------------------------------------------

  TEST_F(ProtocolDispatcherTest, selectEngine_FollowsTheDecisionTable) {
    const auto v1 = protocols::parseProtocol(kV1Source, "v1.py");
    const auto v2 = protocols::parseProtocol(kV2Source, "v2.py");
    const auto json = protocols::parseProtocol(kJson, "p.json");

    EXPECT_THROW(ProtocolDispatcher::selectEngine(v1, kV2), ConfigurationError);
    EXPECT_EQ(ProtocolDispatcher::selectEngine(v1, kV2Backcompat), EngineVariant::Current);
    EXPECT_EQ(ProtocolDispatcher::selectEngine(v2, kV2), EngineVariant::Current);
    EXPECT_EQ(ProtocolDispatcher::selectEngine(json, kV2), EngineVariant::Current);
    EXPECT_EQ(ProtocolDispatcher::selectEngine(v1, kLegacy), EngineVariant::Legacy);
    EXPECT_EQ(ProtocolDispatcher::selectEngine(v2, kLegacy), EngineVariant::Legacy);
  }

  TEST_F(ProtocolDispatcherTest, v1UnderV2WithoutBackcompat_FailsBeforeAnythingRuns) {
    const auto v1 = protocols::parseProtocol(kV1Source, "v1.py");
    EXPECT_CALL(*monitor, notifyFailure(testing::HasSubstr("Protocol API V1"))).Times(1);

    EXPECT_THROW(dispatcher->simulate(v1, kV2, options, logger), ConfigurationError);
    EXPECT_EQ(current.runs, 0);
    EXPECT_EQ(legacy.sourceRuns, 0);
    EXPECT_EQ(logger.sinkCount(), 0u);
  }

  TEST_F(ProtocolDispatcherTest, v1UnderV2WithBackcompat_RunsOnTheCurrentEngine) {
    const auto v1 = protocols::parseProtocol(kV1Source, "v1.py");
    current.script = [](const ProtocolDescriptor&, protocols::ExecutionContext& ctx) {
      flatTipCycle(ctx.bus());
    };

    auto result = dispatcher->simulate(v1, kV2Backcompat, options, logger);
    EXPECT_EQ(result.engine, EngineVariant::Current);
    EXPECT_EQ(current.runs, 1);
    EXPECT_EQ(result.runLog.size(), 4u);
  }

  //---current engine-------------------------------------------------------

  TEST_F(ProtocolDispatcherTest, currentEngine_GetsAHomedContextAndTracedRun) {
    const auto v2 = protocols::parseProtocol(kV2Source, "v2.py");
    current.script = [](const ProtocolDescriptor&, protocols::ExecutionContext& ctx) {
      transfer(ctx.bus(), 1.0);
    };

    auto result = dispatcher->simulate(v2, kV2, options, logger);
    EXPECT_TRUE(current.sawHomedContext);
    ASSERT_EQ(result.runLog.size(), 5u);
    EXPECT_EQ(result.runLog[0].level, 0u);
    EXPECT_EQ(result.runLog[1].level, 1u);
    EXPECT_EQ(logger.sinkCount(), 0u);
  }

  TEST_F(ProtocolDispatcherTest, unbundledPythonOnCurrentEngine_IsBundled) {
    auto v2 = protocols::parseProtocol(kV2Source, "v2.py");
    v2.extraLabware.emplace("custom_beta/plate/1", labwareDef("plate"));
    current.script = [](const ProtocolDescriptor&, protocols::ExecutionContext& ctx) {
      ctx.loadLabware("custom_beta/plate/1", "1");
      ctx.loadLabware("custom_beta/plate/1", "2");
      flatTipCycle(ctx.bus());
    };

    auto result = dispatcher->simulate(v2, kV2, options, logger);
    ASSERT_TRUE(result.bundle);
    EXPECT_EQ(result.bundle->protocolSourceText, kV2Source);
    EXPECT_EQ(result.bundle->bundledLabware.size(), 1u);
  }

  TEST_F(ProtocolDispatcherTest, jsonOnCurrentEngine_IsNotBundled) {
    const auto json = protocols::parseProtocol(kJson, "simple.json");
    auto result = dispatcher->simulate(json, kV2, options, logger);
    EXPECT_EQ(result.engine, EngineVariant::Current);
    EXPECT_FALSE(result.bundle);
  }

  TEST_F(ProtocolDispatcherTest, alreadyBundledProtocol_IsNotBundledAgain) {
    protocols::BundleContents contents;
    contents.protocolSourceText = kV2Source;
    contents.bundledLabware.emplace("custom_beta/fake/1", labwareDef("fake"));
    const auto bundled = protocols::parseBundle(contents, "simple_bundle.zip");

    auto result = dispatcher->simulate(bundled, kV2, options, logger);
    EXPECT_EQ(current.runs, 1);
    EXPECT_FALSE(result.bundle);
  }

  TEST_F(ProtocolDispatcherTest, repeatedRuns_ProduceIdenticalBundles) {
    auto v2 = protocols::parseProtocol(kV2Source, "v2.py");
    v2.extraLabware.emplace("custom_beta/plate/1", labwareDef("plate"));
    v2.extraLabware.emplace("custom_beta/rack/1", labwareDef("rack"));
    current.script = [](const ProtocolDescriptor&, protocols::ExecutionContext& ctx) {
      ctx.loadLabware("custom_beta/rack/1", "1");
      ctx.loadLabware("custom_beta/plate/1", "2");
    };

    auto first = dispatcher->simulate(v2, kV2, options, logger);
    auto second = dispatcher->simulate(v2, kV2, options, logger);
    ASSERT_TRUE(first.bundle && second.bundle);
    EXPECT_EQ(*first.bundle, *second.bundle);
  }

  //---legacy engine--------------------------------------------------------

  TEST_F(ProtocolDispatcherTest, legacyJson_UsesTheInstructionInterpreter) {
    const auto json = protocols::parseProtocol(kJson, "simple.json");
    legacy.script = [](protocols::LegacyContext& ctx) { flatTipCycle(ctx.bus()); };

    auto result = dispatcher->simulate(json, kLegacy, options, logger);
    EXPECT_EQ(result.engine, EngineVariant::Legacy);
    EXPECT_EQ(legacy.instructionRuns, 1);
    EXPECT_EQ(legacy.sourceRuns, 0);
    EXPECT_FALSE(legacy.sawConnected);
    EXPECT_EQ(result.runLog.size(), 4u);
    EXPECT_FALSE(result.bundle);
  }

  TEST_F(ProtocolDispatcherTest, legacySource_IsEvaluatedDirectlyAndNeverBundled) {
    const auto v2 = protocols::parseProtocol(kV2Source, "v2.py");
    auto result = dispatcher->simulate(v2, kLegacy, options, logger);
    EXPECT_EQ(legacy.sourceRuns, 1);
    EXPECT_EQ(current.runs, 0);
    EXPECT_FALSE(result.bundle);
  }

  //---failures, logging, teardown------------------------------------------

  TEST_F(ProtocolDispatcherTest, engineFailure_KeepsPartialRunLogIncludingOpenSpan) {
    const auto v2 = protocols::parseProtocol(kV2Source, "v2.py");
    current.script = [](const ProtocolDescriptor&, protocols::ExecutionContext& ctx) {
      pickUpTip(ctx.bus(), "A1");
      CommandScope aspirating(ctx.bus(), CommandKind::Aspirate,
                              { { "volume", 500 }, { "location", "A1" }, { "rate", 1.0 } });
      throw ExecutionError("volume exceeds pipette capacity");
    };
    EXPECT_CALL(*monitor, notifyFailure(testing::HasSubstr("capacity"))).Times(1);

    try {
      dispatcher->simulate(v2, kV2, options, logger);
      FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
      const auto& partial = e.partialRunLog();
      ASSERT_EQ(partial.size(), 2u);
      EXPECT_EQ(partial[1].payload["volume"], 500);
      EXPECT_EQ(partial[1].level, 0u);
    }
    EXPECT_EQ(logger.sinkCount(), 0u);
  }

  TEST_F(ProtocolDispatcherTest, foreignEngineException_IsWrappedAsExecutionError) {
    const auto json = protocols::parseProtocol(kJson, "simple.json");
    legacy.script = [](protocols::LegacyContext& ctx) {
      dropTip(ctx.bus(), "A1 of Trash on 12");
      throw std::runtime_error("serial port vanished");
    };

    try {
      dispatcher->simulate(json, kLegacy, options, logger);
      FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
      EXPECT_THAT(e.what(), testing::HasSubstr("serial port vanished"));
      EXPECT_EQ(e.partialRunLog().size(), 1u);
    }
  }

  TEST_F(ProtocolDispatcherTest, logLevelOption_ControlsWhatLandsInSpans) {
    const auto v2 = protocols::parseProtocol(kV2Source, "v2.py");
    current.script = [](const ProtocolDescriptor&, protocols::ExecutionContext& ctx) {
      CommandScope cmd(ctx.bus(), CommandKind::Comment, { { "msg", "hello" } });
      ctx.logger().log(Severity::Info, "engine", "info line");
      ctx.logger().log(Severity::Warning, "engine", "warning line");
    };

    auto defaults = dispatcher->simulate(v2, kV2, options, logger);
    ASSERT_EQ(defaults.runLog[0].logs.size(), 1u);
    EXPECT_EQ(defaults.runLog[0].logs[0].message, "warning line");

    options.logLevel = "debug";
    auto chatty = dispatcher->simulate(v2, kV2, options, logger);
    EXPECT_EQ(chatty.runLog[0].logs.size(), 2u);

    options.logLevel = "none";
    auto silent = dispatcher->simulate(v2, kV2, options, logger);
    EXPECT_TRUE(silent.runLog[0].logs.empty());
  }

  TEST_F(ProtocolDispatcherTest, propagateOption_IsAppliedToTheLogger) {
    const auto json = protocols::parseProtocol(kJson, "simple.json");
    options.propagateLogs = true;
    dispatcher->simulate(json, kV2, options, logger);
    EXPECT_TRUE(logger.propagate());
    EXPECT_EQ(logger.level(), Severity::Warning);

    options.logLevel = "info";
    dispatcher->simulate(json, kV2, options, logger);
    EXPECT_EQ(logger.level(), Severity::Info);
  }

  TEST_F(ProtocolDispatcherTest, simulateFile_ParseErrorIsReportedAndNothingRuns) {
    EXPECT_CALL(*monitor, notifyFailure(testing::_)).Times(1);
    EXPECT_THROW(dispatcher->simulateFile("{oops", "bad.json", {}, {}, kV2, options, logger),
                 core::ParseError);
    EXPECT_EQ(current.runs, 0);
  }

  TEST_F(ProtocolDispatcherTest, simulateFile_OverlongApiLevelIsReportedParseError) {
    EXPECT_CALL(*monitor, notifyFailure(testing::HasSubstr("2.99999999999"))).Times(1);
    EXPECT_THROW(dispatcher->simulateFile("metadata = {'apiLevel': '2.99999999999'}\n"
                                          "def run(ctx):\n    pass\n",
                                          "v2.py", {}, {}, kV2, options, logger),
                 core::ParseError);
    EXPECT_EQ(current.runs, 0);
  }

  TEST_F(ProtocolDispatcherTest, simulateFile_MissingResourcePathIsResourceError) {
    EXPECT_THROW(dispatcher->simulateFile(kV2Source, "v2.py", { "/definitely/not/here" }, {}, kV2,
                                          options, logger),
                 core::ResourceError);
    EXPECT_EQ(current.runs, 0);
  }

  TEST_F(ProtocolDispatcherTest, simulateFile_DataFilesReachTheContextAndTheBundle) {
    const auto dir = std::filesystem::temp_directory_path() / "labsim_dispatcher_data";
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "volumes.csv") << "10,20";

    current.script = [](const ProtocolDescriptor&, protocols::ExecutionContext& ctx) {
      ASSERT_EQ(ctx.bundledData().count("volumes.csv"), 1u);
    };
    auto result =
        dispatcher->simulateFile(kV2Source, "v2.py", {}, { dir.string() }, kV2, options, logger);
    std::filesystem::remove_all(dir);

    ASSERT_TRUE(result.bundle);
    EXPECT_EQ(result.bundle->bundledData.count("volumes.csv"), 1u);
  }

  TEST_F(ProtocolDispatcherTest, flatScenario_RendersFourTopLevelLines) {
    const auto v2 = protocols::parseProtocol(kV2Source, "v2.py");
    current.script = [](const ProtocolDescriptor&, protocols::ExecutionContext& ctx) {
      flatTipCycle(ctx.bus());
    };

    auto result = dispatcher->simulate(v2, kV2, options, logger);
    EXPECT_EQ(core::formatRunLog(result.runLog), "Picking up tip A1 of Tip Rack on 1\n"
                                                 "Aspirating 10.0 uL from A1 of Plate on 2 at 1.0 speed\n"
                                                 "Dispensing 10.0 uL into B1 of Plate on 2\n"
                                                 "Dropping tip A1 of Trash on 12");
  }

} // namespace labsim::test
