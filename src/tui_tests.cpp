#include "tui.h"

#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(scout::tui::init(), std::logic_error);
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(scout::tui::set_output_handler(handler));
  CHECK_NOTHROW(scout::tui::run(scout::tui::level::TUI_INFO));
  CHECK_NOTHROW(scout::tui::shutdown());

  CHECK_NOTHROW(scout::tui::run(std::nullopt));
  CHECK_THROWS_AS(scout::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(scout::tui::run(std::nullopt), std::logic_error);
  CHECK_THROWS_AS(scout::tui::configure_trace_outputs({}), std::logic_error);

  CHECK_NOTHROW(scout::tui::shutdown());
  CHECK_THROWS_AS(scout::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(scout::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    scout::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      scout::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

void expect_json_tokens(scout::trace_event_t const &event,
                        std::vector<std::string> const &tokens) {
  auto const json{ scout::trace_event_to_json(event) };
  CHECK(json.front() == '{');
  CHECK(json.back() == '}');
  CHECK(json.find("\"ts\":\"") != std::string::npos);
  CHECK(json.find("\"event\":\"" + std::string{ scout::trace_event_name(event) } + "\"") !=
        std::string::npos);
  for (auto const &token : tokens) {
    CHECK_MESSAGE(json.find(token) != std::string::npos, "missing " << token << " in " << json);
  }
}

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  REQUIRE(messages.empty());

  CHECK_NOTHROW(scout::tui::run(std::nullopt));

  scout::tui::debug("hello %s", "world");
  scout::tui::info("value %d", 42);
  scout::tui::warn("three %d", 3);
  scout::tui::error("boom");

  CHECK_NOTHROW(scout::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(scout::tui::run(scout::tui::level::TUI_DEBUG, true));
  scout::tui::info("structured %d", 7);
  CHECK_NOTHROW(scout::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.front() == '[');
  CHECK(line.find("[INF") != std::string::npos);
  CHECK(line.rfind("structured 7\n") ==
        line.size() - std::string("structured 7\n").size());
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(scout::tui::run(scout::tui::level::TUI_WARN, true));
  scout::tui::debug("debug");
  scout::tui::info("info");
  scout::tui::warn("warn");
  scout::tui::error("error");
  CHECK_NOTHROW(scout::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui trace events reach handler") {
  scout::tui::configure_trace_outputs(
      { { scout::tui::trace_output_type::std_err, std::nullopt } });
  CHECK(scout::tui::g_trace_enabled);
  CHECK_NOTHROW(scout::tui::run(scout::tui::level::TUI_TRACE, false));

  SCOUT_TRACE_DISCOVERY_START(std::string{ "r2x-demo" }, std::string{ "/site" });

  CHECK_NOTHROW(scout::tui::shutdown());
  CHECK_FALSE(scout::tui::g_trace_enabled);
  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "discovery_start package=r2x-demo root=/site\n");
}

TEST_CASE_FIXTURE(captured_output, "trace macros are inert when tracing is disabled") {
  scout::tui::configure_trace_outputs({});
  CHECK_FALSE(scout::tui::g_trace_enabled);
  CHECK_NOTHROW(scout::tui::run(scout::tui::level::TUI_TRACE, false));
  SCOUT_TRACE_CACHE_MISS(std::string{ "pkg" }, std::string{ "abc" });
  CHECK_NOTHROW(scout::tui::shutdown());
  CHECK(messages.empty());
}

TEST_CASE("trace_event_to_json serializes discovery events") {
  expect_json_tokens(scout::trace_events::discovery_start{ .package = "p", .root = "/r" },
                     { "\"package\":\"p\"", "\"root\":\"/r\"" });
  expect_json_tokens(
      scout::trace_events::source_located{ .package = "p",
                                           .path = "/r/plugins.py",
                                           .strategy = "direct" },
      { "\"path\":\"/r/plugins.py\"", "\"strategy\":\"direct\"" });
  expect_json_tokens(
      scout::trace_events::import_skipped{ .package = "p", .line = 7, .reason = "star" },
      { "\"line\":7", "\"reason\":\"star\"" });
  expect_json_tokens(scout::trace_events::site_extracted{ .package = "p",
                                                          .constructor = "ParserPlugin",
                                                          .begin = 10,
                                                          .end = 42 },
                     { "\"constructor\":\"ParserPlugin\"", "\"begin\":10", "\"end\":42" });
  expect_json_tokens(scout::trace_events::discovery_complete{ .package = "p",
                                                              .plugin_count = 2,
                                                              .duration_ms = 3 },
                     { "\"plugin_count\":2", "\"duration_ms\":3" });
  expect_json_tokens(
      scout::trace_events::discovery_failed{ .package = "p",
                                             .error_kind = "UnresolvedSymbol",
                                             .message = "Foo" },
      { "\"error_kind\":\"UnresolvedSymbol\"", "\"message\":\"Foo\"" });
  expect_json_tokens(
      scout::trace_events::fallback_invoked{ .package = "p", .reason = "why" },
      { "\"reason\":\"why\"" });
  expect_json_tokens(scout::trace_events::cache_hit{ .package = "p", .fingerprint = "ab" },
                     { "\"fingerprint\":\"ab\"" });
  expect_json_tokens(scout::trace_events::cache_miss{ .package = "p", .fingerprint = "cd" },
                     { "\"fingerprint\":\"cd\"" });
  expect_json_tokens(scout::trace_events::match_tool_run{ .file = "f.py",
                                                          .pattern = "def x()",
                                                          .exit_code = 1,
                                                          .duration_ms = 5 },
                     { "\"file\":\"f.py\"", "\"exit_code\":1" });
}

TEST_CASE("trace_event_to_json escapes special characters") {
  auto const json{ scout::trace_event_to_json(scout::trace_events::discovery_failed{
      .package = "p",
      .error_kind = "MalformedRegistrationSite",
      .message = "quote \" backslash \\ newline \n tab \t ctl \x01" }) };
  CHECK(json.find("quote \\\" backslash \\\\ newline \\n tab \\t ctl \\u0001") !=
        std::string::npos);
}

TEST_CASE("trace file output writes JSONL format") {
  scout::test::scoped_temp_dir dir{ "trace" };
  auto const trace_path{ dir.path() / "trace.jsonl" };

  scout::tui::configure_trace_outputs(
      { { scout::tui::trace_output_type::file, trace_path } });
  CHECK(scout::tui::g_trace_enabled);
  CHECK_NOTHROW(scout::tui::run(scout::tui::level::TUI_TRACE, false));

  SCOUT_TRACE_CACHE_HIT(std::string{ "pkg" }, std::string{ "f00d" });
  SCOUT_TRACE_FALLBACK_INVOKED(std::string{ "pkg" }, std::string{ "UnresolvedSymbol" });

  CHECK_NOTHROW(scout::tui::shutdown());

  std::ifstream file{ trace_path };
  REQUIRE(file.is_open());
  std::vector<std::string> lines;
  for (std::string line; std::getline(file, line);) {
    if (!line.empty()) { lines.push_back(line); }
  }

  REQUIRE(lines.size() == 2);
  CHECK(lines[0].find("\"event\":\"cache_hit\"") != std::string::npos);
  CHECK(lines[1].find("\"event\":\"fallback_invoked\"") != std::string::npos);
}

TEST_CASE("configure_trace_outputs rejects multiple file outputs") {
  scout::test::scoped_temp_dir dir{ "trace-multi" };
  CHECK_THROWS_AS(scout::tui::configure_trace_outputs(
                      { { scout::tui::trace_output_type::file, dir.path() / "a.jsonl" },
                        { scout::tui::trace_output_type::file, dir.path() / "b.jsonl" } }),
                  std::logic_error);
  scout::tui::configure_trace_outputs({});
}
