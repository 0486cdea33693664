#include "cli.h"

#include "CLI/CLI.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scout {

namespace {

// Comma-separated list of "stderr" and "file:<path>"; an empty spec means stderr.
std::optional<std::vector<tui::trace_output_spec>> parse_trace_outputs(std::string_view spec) {
  std::vector<tui::trace_output_spec> outputs;
  for (std::string_view sv{ spec }; !sv.empty();) {
    auto const pos{ sv.find(',') };
    auto const token{ sv.substr(0, pos) };
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);

    if (token.empty()) { continue; }
    if (token == "stderr") {
      outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    } else if (token.starts_with("file:") && token.size() > 5) {
      outputs.push_back(
          { tui::trace_output_type::file, std::filesystem::path{ token.substr(5) } });
    } else {
      return std::nullopt;
    }
  }

  if (outputs.empty()) { outputs.push_back({ tui::trace_output_type::std_err, std::nullopt }); }
  return outputs;
}

}  // namespace

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "scout - static plugin discovery for Python packages" };
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag("--verbose",
               verbose,
               "Enable decorated verbose logging (timestamp and level prefixes)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace events: 'stderr' for human-readable "
                                     "output and/or 'file:<path>' for JSONL. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const select{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_discover::register_cli(app, select);
  cmd_compare::register_cli(app, select);
  cmd_fingerprint::register_cli(app, select);
  cmd_version::register_cli(app, select);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (trace_option->count() > 0) {
    auto outputs{ parse_trace_outputs(trace_spec) };
    if (!outputs) {
      args.cli_output = "Invalid trace output spec: " + trace_spec;
      return args;
    }
    args.trace_outputs = std::move(*outputs);
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
  }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (!args.cli_output.empty()) { return args; }

  if (cmd_cfg) {
    args.cmd_cfg = std::move(cmd_cfg);
  } else {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace scout
