#include "manifest.h"

#include "doctest/doctest.h"

#include <string>
#include <utility>
#include <vector>

namespace {

scout::registration_site site_of(std::string descriptor) {
  auto const kind{ scout::plugin_kind_from_constructor(descriptor) };
  return scout::registration_site{ .constructor = descriptor,
                                   .descriptor = descriptor,
                                   .kind = kind,
                                   .text = {},
                                   .arguments = {},
                                   .begin = 0,
                                   .end = 0,
                                   .line_number = 3 };
}

scout::resolved_reference ref(std::string module, std::string name) {
  auto const kind{ scout::symbol_object_kind(name) };
  return scout::resolved_reference{ .module = std::move(module),
                                    .name = std::move(name),
                                    .kind = kind };
}

scout::discovery_error_kind build_error(std::string descriptor,
                                        std::vector<scout::resolved_argument> args,
                                        scout::discovery_options const &options = {}) {
  try {
    scout::manifest_build_plugin(site_of(std::move(descriptor)), std::move(args), options);
  } catch (scout::discovery_error const &e) {
    return e.kind();
  }
  FAIL("expected discovery_error");
  return scout::discovery_error_kind::SCHEMA_MISMATCH;
}

}  // namespace

TEST_CASE("manifest_fields extends the schema for upgraders") {
  auto const &parser{ scout::manifest_fields(scout::plugin_kind::PARSER) };
  auto const &upgrader{ scout::manifest_fields(scout::plugin_kind::UPGRADER) };
  CHECK(parser.size() == 7);
  CHECK(upgrader.size() == 9);
  CHECK(upgrader.back().name == "version_reader");
  CHECK(parser.front().required);
}

TEST_CASE("manifest_build_plugin keeps arguments in source order") {
  auto const plugin{ scout::manifest_build_plugin(
      site_of("ParserPlugin"),
      { { .name = "obj", .value = ref("pkg.parser", "Foo") },
        { .name = "config", .value = ref("pkg.config", "FooConfig") },
        { .name = "name", .value = std::string{ "x" } },
        { .name = "io_type", .value = std::string{ "stdout" } } },
      {}) };

  CHECK(plugin.name == "x");
  CHECK(plugin.kind == scout::plugin_kind::PARSER);
  REQUIRE(plugin.config.has_value());
  CHECK(plugin.config->name == "FooConfig");
  REQUIRE(plugin.constructor_args.size() == 4);
  CHECK(plugin.constructor_args[0].name == "obj");
  CHECK(plugin.constructor_args[3].name == "io_type");
}

TEST_CASE("manifest_build_plugin enforces the kind schema") {
  using kind = scout::discovery_error_kind;

  CHECK(build_error("TranslationPlugin", {}) == kind::UNKNOWN_PLUGIN_KIND);
  CHECK(build_error("ParserPlugin", { { .name = "name", .value = std::string{ "x" } } }) ==
        kind::MISSING_REQUIRED_ARGUMENT);
  CHECK(build_error("ParserPlugin",
                    { { .name = "name", .value = std::string{ "x" } },
                      { .name = "obj", .value = nullptr } }) == kind::MISSING_REQUIRED_ARGUMENT);
  CHECK(build_error("ParserPlugin",
                    { { .name = "name", .value = std::string{ "x" } },
                      { .name = "obj", .value = ref("m", "C") },
                      { .name = "steps", .value = std::string{ "a" } } }) ==
        kind::REQUIRES_RUNTIME_INSPECTION);
  CHECK(build_error("ExporterPlugin",
                    { { .name = "name", .value = std::string{ "x" } },
                      { .name = "obj", .value = ref("m", "C") },
                      { .name = "version_strategy", .value = ref("m", "S") } }) ==
        kind::REQUIRES_RUNTIME_INSPECTION);
  CHECK(build_error("ParserPlugin",
                    { { .name = "name", .value = std::int64_t{ 3 } },
                      { .name = "obj", .value = ref("m", "C") } }) ==
        kind::REQUIRES_RUNTIME_INSPECTION);
  CHECK(build_error("ParserPlugin",
                    { { .name = "name", .value = std::string{ "x" } },
                      { .name = "obj", .value = ref("m", "C") },
                      { .name = "io_type", .value = std::string{ "sideways" } } }) ==
        kind::REQUIRES_RUNTIME_INSPECTION);
}

TEST_CASE("manifest_build_plugin tolerates unsupported values only where configured") {
  std::vector<scout::resolved_argument> const args{
    { .name = "name", .value = std::string{ "x" } },
    { .name = "obj", .value = ref("m", "C") },
    { .name = "description", .value = scout::unsupported_value{ "f'{x}'" } },
  };

  CHECK(build_error("ParserPlugin", args) ==
        scout::discovery_error_kind::REQUIRES_RUNTIME_INSPECTION);

  scout::discovery_options options;
  options.tolerant_fields.insert("description");
  auto const plugin{ scout::manifest_build_plugin(site_of("ParserPlugin"), args, options) };
  REQUIRE(plugin.constructor_args.size() == 3);
  CHECK(std::holds_alternative<std::nullptr_t>(plugin.constructor_args[2].value));

  std::vector<scout::resolved_argument> const required_unsupported{
    { .name = "name", .value = std::string{ "x" } },
    { .name = "obj", .value = scout::unsupported_value{ "factory()" } },
  };
  options.tolerant_fields.insert("obj");
  CHECK(build_error("ParserPlugin", required_unsupported, options) ==
        scout::discovery_error_kind::REQUIRES_RUNTIME_INSPECTION);
}

TEST_CASE("manifest_to_json emits sorted compact output with explicit nulls") {
  auto const plugin{ scout::manifest_build_plugin(
      site_of("ParserPlugin"),
      { { .name = "name", .value = std::string{ "x" } },
        { .name = "obj", .value = ref("pkg.parser", "Foo") } },
      {}) };
  auto const pkg{ scout::manifest_build_package("demo", { plugin }, { { "version", "1.0" } }) };

  CHECK(scout::manifest_to_json(pkg) ==
        "{\"metadata\":{\"version\":\"1.0\"},\"name\":\"demo\",\"plugins\":[{"
        "\"call_method\":null,\"config\":null,\"description\":null,\"io_type\":null,"
        "\"name\":\"x\",\"obj\":{\"kind\":\"class\",\"module\":\"pkg.parser\",\"name\":\"Foo\"},"
        "\"plugin_kind\":\"parser\",\"requires_store\":null}]}");
}

TEST_CASE("manifest_to_json includes upgrader fields") {
  auto const plugin{ scout::manifest_build_plugin(
      site_of("UpgraderPlugin"),
      { { .name = "name", .value = std::string{ "up" } },
        { .name = "obj", .value = ref("pkg.upgrade", "run_upgrade") },
        { .name = "requires_store", .value = true } },
      {}) };
  auto const json{ scout::manifest_to_json(scout::manifest_build_package("p", { plugin }, {})) };

  CHECK(json.find("\"version_reader\":null") != std::string::npos);
  CHECK(json.find("\"version_strategy\":null") != std::string::npos);
  CHECK(json.find("\"kind\":\"function\"") != std::string::npos);
  CHECK(json.find("\"requires_store\":true") != std::string::npos);
  CHECK(json.find("\"plugin_kind\":\"upgrader\"") != std::string::npos);
}

TEST_CASE("manifest_to_json of an empty package") {
  auto const pkg{ scout::manifest_build_package("empty", {}, {}) };
  CHECK(scout::manifest_to_json(pkg) == "{\"metadata\":{},\"name\":\"empty\",\"plugins\":[]}");
}

TEST_CASE("manifest_compare ignores key order and whitespace") {
  CHECK_FALSE(scout::manifest_compare("{\"a\":1,\"b\":[true,null]}",
                                      "{ \"b\": [true, null], \"a\": 1.0 }")
                  .has_value());
}

TEST_CASE("manifest_compare names the first differing path") {
  auto const diff{ scout::manifest_compare(
      "{\"plugins\":[{\"obj\":{\"name\":\"Foo\"}}]}",
      "{\"plugins\":[{\"obj\":{\"name\":\"Bar\"}}]}") };
  REQUIRE(diff.has_value());
  CHECK(diff->kind == scout::discovery_error_kind::SCHEMA_MISMATCH);
  CHECK(diff->message.find("$.plugins[0].obj.name") != std::string::npos);

  auto const missing{ scout::manifest_compare("{\"a\":null}", "{}") };
  REQUIRE(missing.has_value());
  CHECK(missing->message.find("$.a (missing in dynamic manifest)") != std::string::npos);

  auto const length{ scout::manifest_compare("[1]", "[1,2]") };
  REQUIRE(length.has_value());
  CHECK(length->message.find("length 1 vs 2") != std::string::npos);

  auto const invalid{ scout::manifest_compare("{", "{}") };
  REQUIRE(invalid.has_value());
  CHECK(invalid->message.find("static manifest") != std::string::npos);
}
