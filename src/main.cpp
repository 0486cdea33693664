#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  scout::tui::init();

  auto args{ scout::cli_parse(argc, argv) };
  scout::tui::configure_trace_outputs(args.trace_outputs);
  scout::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cmd_cfg.has_value()) {
    scout::tui::error("%s", args.cli_output.c_str());
    return EXIT_FAILURE;
  }

  auto cmd{ std::visit([](auto const &cfg) { return scout::cmd::create(cfg); },
                       *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    scout::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
