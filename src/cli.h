#pragma once

#include "cmds/cmd_compare.h"
#include "cmds/cmd_discover.h"
#include "cmds/cmd_fingerprint.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scout {

struct cli_args {
  using cmd_cfg_t =
      std::variant<cmd_compare::cfg, cmd_discover::cfg, cmd_fingerprint::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;  // help text or parse error
};

cli_args cli_parse(int argc, char **argv);

}  // namespace scout
