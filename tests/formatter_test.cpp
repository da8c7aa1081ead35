// labsim headers
#include "core/Errors.hpp"
#include "core/RunLogFormatter.hpp"
#include "core/SpanTracer.hpp"

// labsim fakes
#include "FakeEngines.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace labsim::test {

  using core::FormatError;
  using core::formatRunLog;
  using core::renderTemplate;
  using core::RunLog;
  using core::Severity;
  using core::Span;
  using core::Value;

  namespace {

    Span span(std::size_t level, Value payload, std::vector<core::LogRecord> logs = {}) {
      return Span{ level, std::move(payload), std::move(logs) };
    }

    Value textPayload(const std::string& text) {
      Value payload = Value::object();
      payload["text"] = text;
      return payload;
    }

  } // namespace

  TEST(RenderTemplate, substitutesFlatKeysFromThePayload) {
    Value payload = Value::object();
    payload["text"] = "Aspirating {volume} uL from {location} at {rate} speed";
    payload["volume"] = 10.5;
    payload["location"] = "A1 of Plate on 2";
    payload["rate"] = 1;

    EXPECT_EQ(renderTemplate(payload["text"].get<std::string>(), payload),
              "Aspirating 10.5 uL from A1 of Plate on 2 at 1 speed");
  }

  TEST(RenderTemplate, unknownKey_IsAFormatError) {
    Value payload = textPayload("Delaying for {minutes}m");
    EXPECT_THROW(renderTemplate("Delaying for {minutes}m", payload), FormatError);
  }

  TEST(RenderTemplate, doubledBracesAreLiterals) {
    Value payload = Value::object();
    payload["n"] = 3;
    EXPECT_EQ(renderTemplate("{{n}} is {n}", payload), "{n} is 3");
  }

  TEST(RenderTemplate, malformedTemplates_AreFormatErrors) {
    const Value payload = textPayload("x");
    EXPECT_THROW(renderTemplate("open {text", payload), FormatError);
    EXPECT_THROW(renderTemplate("empty {}", payload), FormatError);
    EXPECT_THROW(renderTemplate("stray } brace", payload), FormatError);
  }

  TEST(TemplateKeys, listsPlaceholdersInOrder) {
    EXPECT_EQ(core::templateKeys("{a} and {{b}} then {c}"), (std::vector<std::string>{ "a", "c" }));
  }

  TEST(FormatRunLog, indentsOneTabPerLevel) {
    RunLog log;
    log.push_back(span(0, textPayload("Transferring")));
    log.push_back(span(1, textPayload("Picking up tip")));
    log.push_back(span(2, textPayload("Deep")));

    EXPECT_EQ(formatRunLog(log), "Transferring\n\tPicking up tip\n\t\tDeep");
  }

  TEST(FormatRunLog, appendsLogHeaderAndOneLinePerRecord) {
    RunLog log;
    log.push_back(span(1, textPayload("Aspirating"),
                       { { Severity::Warning, "pipette", "only {} uL left", { Value(3) } },
                         { Severity::Error, "deck", "slot {} blocked", { Value("7") } } }));

    EXPECT_EQ(formatRunLog(log), "\tAspirating\n"
                                 "\tLogs from this command:\n"
                                 "\tWARNING (pipette): only 3 uL left\n"
                                 "\tERROR (deck): slot 7 blocked");
  }

  TEST(FormatRunLog, payloadWithoutText_RendersEmptyLine) {
    RunLog log;
    log.push_back(span(0, Value::object()));
    log.push_back(span(0, textPayload("next")));
    EXPECT_EQ(formatRunLog(log), "\nnext");
  }

  TEST(FormatRunLog, emptyRunLog_RendersEmptyText) { EXPECT_EQ(formatRunLog({}), ""); }

  TEST(FormatRunLog, missingPlaceholder_IsAFormatErrorAndLeavesRunLogIntact) {
    RunLog log;
    log.push_back(span(0, textPayload("Mixing {repetitions} times")));
    const RunLog before = log;

    EXPECT_THROW(formatRunLog(log), FormatError);
    ASSERT_EQ(log.size(), before.size());
    EXPECT_EQ(log[0].payload, before[0].payload);
  }

  TEST(FormatRunLog, badLogArgs_IsAFormatError) {
    RunLog log;
    log.push_back(span(0, textPayload("cmd"), { { Severity::Info, "m", "needs {} {}", { Value(1) } } }));
    EXPECT_THROW(formatRunLog(log), FormatError);
  }

  TEST(FormatRunLog, tracedTransfer_RendersNestedTextDeterministically) {
    core::EventBus bus;
    core::Logger logger;
    core::SpanTracer tracer(bus, core::kCommandTopic, logger, Severity::Warning);
    transfer(bus, 10.0);
    const RunLog log = tracer.takeRunLog();

    const std::string expected = "Transferring 10.0 from A1 of Plate on 2 to B1 of Plate on 2\n"
                                 "\tPicking up tip A1 of Tip Rack on 1\n"
                                 "\tAspirating 10.0 uL from A1 of Plate on 2 at 1.0 speed\n"
                                 "\tDispensing 10.0 uL into B1 of Plate on 2\n"
                                 "\tDropping tip A1 of Trash on 12";
    EXPECT_EQ(formatRunLog(log), expected);
    EXPECT_EQ(formatRunLog(log), formatRunLog(log));
  }

} // namespace labsim::test
