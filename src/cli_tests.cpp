#include "cli.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

scout::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return scout::cli_parse(static_cast<int>(args.size()), argv.data());
}

}  // namespace

TEST_CASE("cli_parse: no arguments prints help") {
  auto const parsed{ parse({ "scout" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK(parsed.cli_output.find("discover") != std::string::npos);
}

TEST_CASE("cli_parse: version") {
  for (auto const *flag : { "-v", "--version", "version" }) {
    CAPTURE(flag);
    auto const parsed{ parse({ "scout", flag }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<scout::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: discover") {
  auto const parsed{ parse({ "scout",
                             "discover",
                             "/site-packages/r2x_reeds",
                             "r2x-reeds",
                             "--metadata",
                             "version=0.4.1",
                             "--metadata",
                             "summary=ReEDS" }) };
  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<scout::cmd_discover::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg);
  CHECK(cfg->package_root == std::filesystem::path{ "/site-packages/r2x_reeds" });
  CHECK(cfg->package_name == "r2x-reeds");
  CHECK_FALSE(cfg->config_path.has_value());
  CHECK(cfg->metadata == std::vector<std::string>{ "version=0.4.1", "summary=ReEDS" });
}

TEST_CASE("cli_parse: discover requires both positionals") {
  auto const parsed{ parse({ "scout", "discover", "/site-packages/r2x_reeds" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: fingerprint and compare") {
  auto const fp{ parse({ "scout", "fingerprint", "plugins.py" }) };
  REQUIRE(fp.cmd_cfg.has_value());
  CHECK(std::get<scout::cmd_fingerprint::cfg>(*fp.cmd_cfg).file_path == "plugins.py");

  auto const cmp{ parse({ "scout", "compare", "/nonexistent/a.json", "/nonexistent/b.json" }) };
  CHECK_FALSE(cmp.cmd_cfg.has_value());
  CHECK(cmp.cli_output.find("a.json") != std::string::npos);
}

TEST_CASE("cli_parse: logging levels") {
  auto const plain{ parse({ "scout", "version" }) };
  CHECK(plain.verbosity == scout::tui::level::TUI_INFO);
  CHECK_FALSE(plain.decorated_logging);

  auto const verbose{ parse({ "scout", "--verbose", "version" }) };
  CHECK(verbose.verbosity == scout::tui::level::TUI_DEBUG);
  CHECK(verbose.decorated_logging);
}

TEST_CASE("cli_parse: trace outputs") {
  SUBCASE("defaults to stderr") {
    auto const parsed{ parse({ "scout", "--trace", "version" }) };
    CHECK(parsed.verbosity == scout::tui::level::TUI_TRACE);
    REQUIRE(parsed.trace_outputs.size() == 1);
    CHECK(parsed.trace_outputs[0].type == scout::tui::trace_output_type::std_err);
  }

  SUBCASE("stderr and file") {
    auto const parsed{ parse({ "scout", "--trace=stderr,file:/tmp/scout.jsonl", "version" }) };
    REQUIRE(parsed.trace_outputs.size() == 2);
    CHECK(parsed.trace_outputs[1].type == scout::tui::trace_output_type::file);
    CHECK(parsed.trace_outputs[1].file_path == std::filesystem::path{ "/tmp/scout.jsonl" });
  }

  SUBCASE("rejects unknown sinks") {
    auto const parsed{ parse({ "scout", "--trace=syslog", "version" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output.find("syslog") != std::string::npos);
  }
}
