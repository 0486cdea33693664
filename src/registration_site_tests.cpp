#include "registration_site.h"

#include "discovery_error.h"
#include "source_scan.h"

#include "doctest/doctest.h"

#include <string>
#include <string_view>

namespace {

constexpr std::string_view kRegistration{
  "from r2x_core import ExporterPlugin, ParserPlugin as Parser, PluginManifest\n"
  "from r2x_reeds.parser import ReEDSParser\n"
  "\n"
  "def helper():\n"
  "    return ParserPlugin(name='not-this-one', obj=ReEDSParser)\n"
  "\n"
  "def register_plugin() -> PluginManifest:\n"
  "    \"\"\"Register ReEDSPlugin(s).\"\"\"\n"
  "    manifest = PluginManifest(package='r2x-reeds')\n"
  "    # ParserPlugin(name='commented')\n"
  "    manifest.add(\n"
  "        Parser(\n"
  "            name='reeds-parser',\n"
  "            obj=ReEDSParser,\n"
  "            description=str('nested(')  ,\n"
  "        )\n"
  "    )\n"
  "    manifest.add(ExporterPlugin(name='reeds-exporter', obj=ReEDSParser))\n"
  "    return manifest\n"
  "\n"
  "VERSION = '1.0'\n"
};

scout::discovery_error_kind error_kind_of(auto &&fn) {
  try {
    fn();
  } catch (scout::discovery_error const &e) {
    return e.kind();
  }
  FAIL("expected discovery_error");
  return scout::discovery_error_kind::SCHEMA_MISMATCH;
}

}  // namespace

TEST_CASE("plugin_kind mapping is closed") {
  CHECK(scout::plugin_kind_from_constructor("ParserPlugin") == scout::plugin_kind::PARSER);
  CHECK(scout::plugin_kind_from_constructor("UpgraderPlugin") == scout::plugin_kind::UPGRADER);
  CHECK(scout::plugin_kind_from_constructor("ExporterPlugin") == scout::plugin_kind::EXPORTER);
  CHECK(scout::plugin_kind_from_constructor("BasePlugin") == scout::plugin_kind::BASE);
  CHECK_FALSE(scout::plugin_kind_from_constructor("TranslationPlugin").has_value());
  CHECK(std::string{ scout::plugin_kind_name(scout::plugin_kind::UPGRADER) } == "upgrader");
}

TEST_CASE("registration_find_entry_point returns the indented body") {
  auto const body{ scout::registration_find_entry_point(kRegistration, "register_plugin") };
  auto const text{ kRegistration.substr(body.begin, body.end - body.begin) };
  CHECK(text.starts_with("\"\"\"Register"));
  CHECK(text.ends_with("return manifest"));
  CHECK(text.find("VERSION") == std::string_view::npos);
}

TEST_CASE("registration_find_entry_point handles inline and async bodies") {
  std::string_view const inline_fn{ "def register_plugin(): return ParserPlugin(name='x')\n" };
  auto const body{ scout::registration_find_entry_point(inline_fn, "register_plugin") };
  CHECK(scout::scan_trim(inline_fn.substr(body.begin, body.end - body.begin)) ==
        "return ParserPlugin(name='x')");

  std::string_view const async_fn{ "async def register_plugin(\n    ctx,\n):\n    pass\n" };
  auto const async_body{ scout::registration_find_entry_point(async_fn, "register_plugin") };
  CHECK(async_fn.substr(async_body.begin, async_body.end - async_body.begin) == "pass");
}

TEST_CASE("registration_find_entry_point uses the last definition") {
  std::string_view const content{ "def register_plugin():\n"
                                  "    return 1\n"
                                  "def register_plugin():\n"
                                  "    return 2\n" };
  auto const body{ scout::registration_find_entry_point(content, "register_plugin") };
  CHECK(content.substr(body.begin, body.end - body.begin) == "return 2");
}

TEST_CASE("registration_find_entry_point reports a missing function") {
  CHECK(error_kind_of([] {
          scout::registration_find_entry_point("def register_plugins():\n    pass\n",
                                               "register_plugin");
        }) == scout::discovery_error_kind::REGISTRATION_FUNCTION_NOT_FOUND);
  CHECK(error_kind_of([] {
          scout::registration_find_entry_point("x = 'def register_plugin(): pass'\n",
                                               "register_plugin");
        }) == scout::discovery_error_kind::REGISTRATION_FUNCTION_NOT_FOUND);
}

TEST_CASE("registration_extract_sites finds descriptor calls in source order") {
  auto const imports{ scout::import_map::build(kRegistration) };
  auto const body{ scout::registration_find_entry_point(kRegistration, "register_plugin") };
  auto const sites{ scout::registration_extract_sites(kRegistration, body, imports) };

  REQUIRE(sites.size() == 2);

  CHECK(sites[0].constructor == "Parser");
  CHECK(sites[0].descriptor == "ParserPlugin");
  CHECK(sites[0].kind == scout::plugin_kind::PARSER);
  CHECK(sites[0].line_number == 12);
  CHECK(sites[0].arguments.find("nested(") != std::string::npos);
  CHECK(kRegistration.substr(sites[0].begin, sites[0].end - sites[0].begin) == sites[0].text);

  CHECK(sites[1].constructor == "ExporterPlugin");
  CHECK(sites[1].kind == scout::plugin_kind::EXPORTER);
  CHECK(sites[1].arguments == "name='reeds-exporter', obj=ReEDSParser");
}

TEST_CASE("registration_extract_sites tags unknown descriptors") {
  std::string_view const content{ "def register_plugin():\n"
                                  "    return [r2x_core.TranslationPlugin(name='t')]\n" };
  auto const body{ scout::registration_find_entry_point(content, "register_plugin") };
  auto const sites{ scout::registration_extract_sites(content, body, scout::import_map{}) };
  REQUIRE(sites.size() == 1);
  CHECK(sites[0].constructor == "r2x_core.TranslationPlugin");
  CHECK(sites[0].descriptor == "TranslationPlugin");
  CHECK_FALSE(sites[0].kind.has_value());
}

TEST_CASE("registration_extract_sites allows an empty registration") {
  std::string_view const content{ "def register_plugin():\n"
                                  "    class LocalPlugin(Base):\n"
                                  "        pass\n"
                                  "    return PluginManifest(package='empty')\n" };
  auto const body{ scout::registration_find_entry_point(content, "register_plugin") };
  CHECK(scout::registration_extract_sites(content, body, scout::import_map{}).empty());
}

TEST_CASE("registration_extract_sites rejects unbalanced calls") {
  std::string_view const content{ "def register_plugin():\n"
                                  "    return ParserPlugin(name='x'\n" };
  auto const body{ scout::registration_find_entry_point(content, "register_plugin") };
  CHECK(error_kind_of([&] {
          scout::registration_extract_sites(content, body, scout::import_map{});
        }) == scout::discovery_error_kind::MALFORMED_REGISTRATION_SITE);
}

TEST_CASE("registration_body_of resolves a matched function span") {
  auto const start{ kRegistration.find("def register_plugin") };
  auto const end{ kRegistration.find("VERSION") };
  auto const body{ scout::registration_body_of(kRegistration, { start, end }) };
  CHECK(body.begin == scout::registration_find_entry_point(kRegistration, "register_plugin").begin);

  CHECK(error_kind_of([] { scout::registration_body_of("x = 1\n", { 0, 5 }); }) ==
        scout::discovery_error_kind::STRUCTURAL_MATCH_TOOL_FAILURE);
}
