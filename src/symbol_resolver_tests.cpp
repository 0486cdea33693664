#include "symbol_resolver.h"

#include "discovery_error.h"

#include "doctest/doctest.h"

#include <string>
#include <variant>

namespace {

constexpr char const *kImports{
  "from r2x_core import IOType, PluginConfig\n"
  "from r2x_core import IOType as Mode\n"
  "from r2x_reeds.parser import ReEDSParser, build_parser\n"
  "from r2x_reeds import upgrader\n"
  "import r2x_reeds.exporter as rx\n"
  "import r2x_core\n"
};

scout::resolved_value resolve(std::string const &expr) {
  static auto const imports{ scout::import_map::build(kImports) };
  return scout::symbol_resolve(scout::argument_classify(expr), imports, scout::discovery_options{});
}

scout::discovery_error_kind failure_of(std::string const &expr) {
  try {
    resolve(expr);
  } catch (scout::discovery_error const &e) {
    return e.kind();
  }
  FAIL("expected discovery_error for " << expr);
  return scout::discovery_error_kind::SCHEMA_MISMATCH;
}

scout::resolved_reference reference(std::string const &expr) {
  auto const value{ resolve(expr) };
  REQUIRE(std::holds_alternative<scout::resolved_reference>(value));
  return std::get<scout::resolved_reference>(value);
}

}  // namespace

TEST_CASE("symbol_resolve passes literals through") {
  CHECK(std::get<std::string>(resolve("'x'")) == "x");
  CHECK(std::get<bool>(resolve("True")));
  CHECK(std::holds_alternative<std::nullptr_t>(resolve("None")));
  CHECK(std::get<std::int64_t>(resolve("3")) == 3);
  CHECK(std::get<double>(resolve("0.5")) == doctest::Approx(0.5));
  CHECK(std::get<scout::unsupported_value>(resolve("make()")).raw == "make()");
}

TEST_CASE("symbol_resolve maps imported names to references") {
  CHECK(reference("ReEDSParser") == scout::resolved_reference{ .module = "r2x_reeds.parser",
                                                               .name = "ReEDSParser",
                                                               .kind = scout::object_kind::CLASS });
  CHECK(reference("build_parser").kind == scout::object_kind::FUNCTION);
  CHECK(reference("PluginConfig").module == "r2x_core");
}

TEST_CASE("symbol_resolve follows module bindings") {
  auto const via_alias{ reference("rx.ReEDSExporter") };
  CHECK(via_alias.module == "r2x_reeds.exporter");
  CHECK(via_alias.name == "ReEDSExporter");

  auto const via_package{ reference("r2x_core.plugin.ParserPlugin") };
  CHECK(via_package.module == "r2x_core.plugin");
  CHECK(via_package.name == "ParserPlugin");

  auto const via_submodule{ reference("upgrader.run_upgrades") };
  CHECK(via_submodule.module == "r2x_reeds.upgrader");
  CHECK(via_submodule.kind == scout::object_kind::FUNCTION);
}

TEST_CASE("symbol_resolve serializes enumeration members") {
  CHECK(std::get<std::string>(resolve("IOType.STDOUT")) == "stdout");
  CHECK(std::get<std::string>(resolve("Mode.BOTH")) == "both");
  CHECK(std::get<std::string>(resolve("r2x_core.IOType.STDIN")) == "stdin");
  CHECK(failure_of("IOType.SIDEWAYS") == scout::discovery_error_kind::REQUIRES_RUNTIME_INSPECTION);
  CHECK(failure_of("IOType.STDOUT.value") ==
        scout::discovery_error_kind::REQUIRES_RUNTIME_INSPECTION);
}

TEST_CASE("symbol_resolve reports names it cannot resolve statically") {
  CHECK(failure_of("Unknown") == scout::discovery_error_kind::UNRESOLVED_SYMBOL);
  CHECK(failure_of("missing.attr") == scout::discovery_error_kind::UNRESOLVED_SYMBOL);
  CHECK(failure_of("rx") == scout::discovery_error_kind::REQUIRES_RUNTIME_INSPECTION);
  CHECK(failure_of("ReEDSParser.steps") ==
        scout::discovery_error_kind::REQUIRES_RUNTIME_INSPECTION);
  CHECK(failure_of("rx.Exporter.config") ==
        scout::discovery_error_kind::REQUIRES_RUNTIME_INSPECTION);
}

TEST_CASE("symbol_resolve rejects names redefined in the file") {
  auto const imports{ scout::import_map::build("from r2x_reeds.parser import ReEDSParser\n"
                                               "import r2x_reeds.exporter as rx\n"
                                               "class ReEDSParser: pass\n"
                                               "rx = None\n") };
  for (auto const *expr : { "ReEDSParser", "rx.ReEDSExporter" }) {
    CAPTURE(expr);
    try {
      scout::symbol_resolve(scout::argument_classify(expr), imports, {});
      FAIL("expected discovery_error");
    } catch (scout::discovery_error const &e) {
      CHECK(e.kind() == scout::discovery_error_kind::UNRESOLVED_SYMBOL);
      CHECK(std::string{ e.what() }.find("defined in the registration file") != std::string::npos);
    }
  }
}

TEST_CASE("symbol_resolve honors configured enumerations") {
  scout::discovery_options options;
  options.enumerations["Stage"] = { { "EARLY", "early" } };
  auto const imports{ scout::import_map::build("from pipeline import Stage\n") };
  auto const value{ scout::symbol_resolve(scout::argument_classify("Stage.EARLY"), imports, options) };
  CHECK(std::get<std::string>(value) == "early");
}

TEST_CASE("symbol_resolve_arguments names the failing keyword") {
  auto const imports{ scout::import_map::build(kImports) };
  std::vector<scout::argument> const args{
    { .name = "name", .value = scout::string_literal{ "x" } },
    { .name = "obj", .value = scout::bare_identifier{ "Nope" } },
  };

  try {
    scout::symbol_resolve_arguments(args, imports, {});
    FAIL("expected discovery_error");
  } catch (scout::discovery_error const &e) {
    CHECK(e.kind() == scout::discovery_error_kind::UNRESOLVED_SYMBOL);
    CHECK(std::string{ e.what() }.find("argument 'obj'") != std::string::npos);
  }
}
