#include "cookd/services/language_service.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/async_fixture.hpp"
#include "../common/temp_workspace.hpp"

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(spdlog::level::debug);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using cookd::services::LanguageService;
using cookd::test::RunAsyncTest;
using cookd::test::TempWorkspace;

namespace {

constexpr auto kSoupUri = "file:///workspace/soup.cook";
constexpr auto kStewUri = "file:///workspace/stew.cook";

struct PublishedDiagnostics {
  std::string uri;
  std::optional<int> version;
  std::vector<lsp::Diagnostic> diagnostics;
};

// Records every publication made by the service.
class DiagnosticsRecorder {
 public:
  void Attach(LanguageService& service) {
    service.SetDiagnosticPublisher(
        [this](
            std::string uri, std::optional<int> version,
            std::vector<lsp::Diagnostic> diagnostics) {
          published_.push_back(
              {.uri = std::move(uri),
               .version = version,
               .diagnostics = std::move(diagnostics)});
        });
  }

  [[nodiscard]] auto Count() const -> std::size_t {
    return published_.size();
  }

  [[nodiscard]] auto Last() const -> const PublishedDiagnostics& {
    return published_.back();
  }

 private:
  std::vector<PublishedDiagnostics> published_;
};

auto HasLabel(const lsp::CompletionList& list, std::string_view label)
    -> bool {
  return std::ranges::any_of(
      list.items, [label](const auto& item) { return item.label == label; });
}

}  // namespace

TEST_CASE("LanguageService publishes diagnostics on open", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    DiagnosticsRecorder recorder;
    recorder.Attach(service);

    co_await service.OnDocumentOpened(kSoupUri, "Add @flour{200 now", 1);

    REQUIRE(recorder.Count() == 1);
    CHECK(recorder.Last().uri == kSoupUri);
    CHECK(recorder.Last().version == 1);
    REQUIRE(recorder.Last().diagnostics.size() == 1);
    CHECK(
        recorder.Last().diagnostics[0].message ==
        "Unclosed '{' in ingredient");
    CHECK(service.IsDocumentOpen(kSoupUri));
  });
}

TEST_CASE("LanguageService follows document changes", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    DiagnosticsRecorder recorder;
    recorder.Attach(service);

    co_await service.OnDocumentOpened(kSoupUri, "Add @flour{200 now", 1);
    co_await service.OnDocumentChanged(kSoupUri, "Add @flour{200}.", 2);

    REQUIRE(recorder.Count() == 2);
    CHECK(recorder.Last().version == 2);
    CHECK(recorder.Last().diagnostics.empty());

    SECTION("Stale change is dropped") {
      co_await service.OnDocumentChanged(kSoupUri, "Add @flour{", 1);
      CHECK(recorder.Count() == 2);

      auto symbols = co_await service.GetDocumentSymbols(kSoupUri);
      REQUIRE(symbols.has_value());
      CHECK_FALSE(symbols->empty());
    }

    SECTION("Change for an unopened buffer is dropped") {
      co_await service.OnDocumentChanged(kStewUri, "Add @salt.", 4);
      CHECK(recorder.Count() == 2);
      CHECK_FALSE(service.IsDocumentOpen(kStewUri));
    }

    SECTION("Save republishes the current diagnostics") {
      co_await service.OnDocumentSaved(kSoupUri);
      CHECK(recorder.Count() == 3);
      CHECK(recorder.Last().version == 2);
    }
  });
}

TEST_CASE("LanguageService clears diagnostics on close", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    DiagnosticsRecorder recorder;
    recorder.Attach(service);

    co_await service.OnDocumentOpened(kSoupUri, "Wait ~{}.", 3);
    service.OnDocumentClosed(kSoupUri);

    REQUIRE(recorder.Count() == 2);
    CHECK(recorder.Last().uri == kSoupUri);
    CHECK_FALSE(recorder.Last().version.has_value());
    CHECK(recorder.Last().diagnostics.empty());
    CHECK_FALSE(service.IsDocumentOpen(kSoupUri));
  });
}

TEST_CASE(
    "LanguageService answers unknown URIs with empty results", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    const lsp::Position position{.line = 0, .character = 0};

    auto completions = co_await service.GetCompletions(kSoupUri, position);
    REQUIRE(completions.has_value());
    CHECK(completions->items.empty());

    auto hover = co_await service.GetHover(kSoupUri, position);
    REQUIRE(hover.has_value());
    CHECK_FALSE(hover->has_value());

    auto symbols = co_await service.GetDocumentSymbols(kSoupUri);
    REQUIRE(symbols.has_value());
    CHECK(symbols->empty());

    auto tokens = co_await service.GetSemanticTokens(kSoupUri);
    REQUIRE(tokens.has_value());
    CHECK(tokens->data.empty());
  });
}

TEST_CASE("LanguageService serves language features", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    co_await service.OnDocumentOpened(
        kSoupUri, "== Base ==\nSweat @leeks{2} in a #pot{}.", 1);

    auto hover = co_await service.GetHover(
        kSoupUri, lsp::Position{.line = 1, .character = 8});
    REQUIRE(hover.has_value());
    REQUIRE(hover->has_value());
    CHECK(
        (*hover)->contents.value ==
        "**Ingredient:** leeks\n\n**Quantity:** 2");

    auto symbols = co_await service.GetDocumentSymbols(kSoupUri);
    REQUIRE(symbols.has_value());
    REQUIRE(symbols->size() == 3);
    CHECK((*symbols)[0].name == "Base");

    auto tokens = co_await service.GetSemanticTokens(kSoupUri);
    REQUIRE(tokens.has_value());
    CHECK_FALSE(tokens->data.empty());
    CHECK(tokens->data.size() % 5 == 0);
  });
}

TEST_CASE("LanguageService completes from other buffers", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    co_await service.OnDocumentOpened(kStewUri, "Brown @shallots{3}.", 1);
    co_await service.OnDocumentOpened(kSoupUri, "Add @sha", 1);

    auto completions = co_await service.GetCompletions(
        kSoupUri, lsp::Position{.line = 0, .character = 8});

    REQUIRE(completions.has_value());
    REQUIRE_FALSE(completions->items.empty());
    CHECK(completions->items[0].label == "shallots");
    CHECK(completions->items[0].detail == "Ingredient (from workspace)");
  });
}

TEST_CASE("LanguageService loads workspace settings", "[service]") {
  TempWorkspace workspace;
  workspace.WriteFile("aisle.conf", "[produce]\nonions|yellow onion\n");
  workspace.WriteFile(
      ".cookd",
      "Completion:\n"
      "  WorkspaceSuggestions: false\n"
      "  BuiltinVocabulary: false\n");
  auto workspace_uri = workspace.Uri();

  RunAsyncTest(
      [&workspace_uri](
          asio::any_io_executor executor) -> asio::awaitable<void> {
        LanguageService service(executor);
        co_await service.InitializeWorkspace(workspace_uri);

        CHECK(service.GetAliasRegistry().Current()->Size() == 2);
        CHECK_FALSE(service.GetConfig().GetCompletion().builtin_vocabulary);

        co_await service.OnDocumentOpened(kStewUri, "Fry @onion rings.", 1);
        co_await service.OnDocumentOpened(kSoupUri, "Add @on", 1);
        auto completions = co_await service.GetCompletions(
            kSoupUri, lsp::Position{.line = 0, .character = 7});

        REQUIRE(completions.has_value());
        REQUIRE(completions->items.size() == 1);
        CHECK(completions->items[0].label == "onions");
        CHECK_FALSE(HasLabel(*completions, "onion"));
      });
}

TEST_CASE("LanguageService reloads settings on config change", "[service]") {
  TempWorkspace workspace;
  auto workspace_uri = workspace.Uri();

  RunAsyncTest(
      [&workspace, &workspace_uri](
          asio::any_io_executor executor) -> asio::awaitable<void> {
        LanguageService service(executor);
        DiagnosticsRecorder recorder;
        recorder.Attach(service);

        co_await service.InitializeWorkspace(workspace_uri);
        CHECK(service.GetAliasRegistry().Current()->Empty());

        co_await service.OnDocumentOpened(
            kSoupUri, ">> a: 1\n>> a: 2\nStir.", 1);
        REQUIRE(recorder.Count() == 1);
        CHECK(recorder.Last().diagnostics.size() == 1);

        workspace.WriteFile(".cookd", "Diagnostics:\n  Warnings: false\n");
        workspace.WriteFile("config/aisle.conf", "[herbs]\ndill\n");
        co_await service.HandleConfigChange();

        CHECK(service.GetAliasRegistry().Current()->Size() == 1);
        REQUIRE(recorder.Count() == 2);
        CHECK(recorder.Last().uri == kSoupUri);
        CHECK(recorder.Last().diagnostics.empty());

        SECTION("Removing the alias file empties the table") {
          workspace.RemoveFile("config/aisle.conf");
          co_await service.HandleConfigChange();
          CHECK(service.GetAliasRegistry().Current()->Empty());
        }
      });
}

TEST_CASE("LanguageService runs without a workspace folder", "[service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    co_await service.InitializeWorkspace(std::nullopt);

    CHECK(service.GetAliasRegistry().Current()->Empty());
    CHECK(service.GetConfig().GetCompletion().builtin_vocabulary);

    co_await service.OnDocumentOpened(kSoupUri, "Add @sal", 1);
    auto completions = co_await service.GetCompletions(
        kSoupUri, lsp::Position{.line = 0, .character = 8});
    REQUIRE(completions.has_value());
    CHECK(HasLabel(*completions, "salt"));
  });
}
