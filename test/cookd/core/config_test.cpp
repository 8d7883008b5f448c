#include <filesystem>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/temp_workspace.hpp"
#include "cookd/core/config_reader.hpp"
#include "cookd/core/cookd_config_file.hpp"

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(spdlog::level::debug);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using cookd::ConfigReader;
using cookd::CookdConfigFile;
using cookd::test::TempWorkspace;

TEST_CASE("CookdConfigFile reads every setting", "[config]") {
  TempWorkspace workspace;
  workspace.WriteFile(".cookd", R"(
AisleFile: config/aisles.conf
Completion:
  WorkspaceSuggestions: false
  BuiltinVocabulary: false
Diagnostics:
  Warnings: false
)");

  auto config = CookdConfigFile::LoadFromFile(workspace.Root() / ".cookd");

  REQUIRE(config.has_value());
  REQUIRE(config->GetAisleFile().has_value());
  CHECK(*config->GetAisleFile() == "config/aisles.conf");
  CHECK_FALSE(config->GetCompletion().workspace_suggestions);
  CHECK_FALSE(config->GetCompletion().builtin_vocabulary);
  CHECK_FALSE(config->GetDiagnostics().warnings);
}

TEST_CASE("CookdConfigFile defaults unspecified settings", "[config]") {
  TempWorkspace workspace;
  workspace.WriteFile(".cookd", "Completion:\n  BuiltinVocabulary: false\n");

  auto config = CookdConfigFile::LoadFromFile(workspace.Root() / ".cookd");

  REQUIRE(config.has_value());
  CHECK_FALSE(config->GetAisleFile().has_value());
  CHECK(config->GetCompletion().workspace_suggestions);
  CHECK_FALSE(config->GetCompletion().builtin_vocabulary);
  CHECK(config->GetDiagnostics().warnings);
}

TEST_CASE("CookdConfigFile treats an empty file as defaults", "[config]") {
  TempWorkspace workspace;
  workspace.WriteFile(".cookd", "");

  auto config = CookdConfigFile::LoadFromFile(workspace.Root() / ".cookd");

  REQUIRE(config.has_value());
  CHECK(config->GetCompletion().workspace_suggestions);
}

TEST_CASE("CookdConfigFile rejects unusable files", "[config]") {
  TempWorkspace workspace;

  SECTION("Missing file") {
    CHECK_FALSE(CookdConfigFile::LoadFromFile(workspace.Root() / ".cookd")
                    .has_value());
  }

  SECTION("Malformed YAML") {
    workspace.WriteFile(".cookd", "Completion: [unclosed\n");
    CHECK_FALSE(CookdConfigFile::LoadFromFile(workspace.Root() / ".cookd")
                    .has_value());
  }

  SECTION("Root is not a mapping") {
    workspace.WriteFile(".cookd", "- one\n- two\n");
    CHECK_FALSE(CookdConfigFile::LoadFromFile(workspace.Root() / ".cookd")
                    .has_value());
  }

  SECTION("Wrong value type") {
    workspace.WriteFile(".cookd", "Diagnostics:\n  Warnings: sometimes\n");
    CHECK_FALSE(CookdConfigFile::LoadFromFile(workspace.Root() / ".cookd")
                    .has_value());
  }
}

TEST_CASE("ConfigReader falls back to defaults", "[config]") {
  TempWorkspace workspace;
  ConfigReader reader;

  SECTION("No config file") {
    auto config = reader.LoadFromWorkspace(workspace.Root());
    CHECK(config.GetCompletion().builtin_vocabulary);
    CHECK(config.GetDiagnostics().warnings);
  }

  SECTION("Malformed config file") {
    workspace.WriteFile(".cookd", "Diagnostics: [\n");
    auto config = reader.LoadFromWorkspace(workspace.Root());
    CHECK(config.GetDiagnostics().warnings);
  }

  SECTION("Valid config file") {
    workspace.WriteFile(".cookd", "Diagnostics:\n  Warnings: false\n");
    auto config = reader.LoadFromWorkspace(workspace.Root());
    CHECK_FALSE(config.GetDiagnostics().warnings);
  }
}

TEST_CASE("ConfigReader resolves the alias file", "[config]") {
  TempWorkspace workspace;
  ConfigReader reader;
  const CookdConfigFile defaults;

  SECTION("Nothing to find") {
    CHECK_FALSE(reader.ResolveAisleFile(workspace.Root(), defaults)
                    .has_value());
  }

  SECTION("Workspace root file") {
    workspace.WriteFile("aisle.conf", "[produce]\nleek\n");
    auto path = reader.ResolveAisleFile(workspace.Root(), defaults);
    REQUIRE(path.has_value());
    CHECK(path->Path().filename() == "aisle.conf");
    CHECK(path->Path().parent_path() == workspace.Root().Path());
  }

  SECTION("Config directory file") {
    workspace.WriteFile("config/aisle.conf", "[produce]\nleek\n");
    auto path = reader.ResolveAisleFile(workspace.Root(), defaults);
    REQUIRE(path.has_value());
    CHECK(path->Path().parent_path().filename() == "config");
  }

  SECTION("Configured path wins") {
    workspace.WriteFile("aisle.conf", "[produce]\nleek\n");
    workspace.WriteFile("lists/shop.conf", "[produce]\nkale\n");
    workspace.WriteFile(".cookd", "AisleFile: lists/shop.conf\n");

    auto config = reader.LoadFromWorkspace(workspace.Root());
    auto path = reader.ResolveAisleFile(workspace.Root(), config);
    REQUIRE(path.has_value());
    CHECK(path->Path().filename() == "shop.conf");
  }
}
