#include "cookd/features/completion_provider.hpp"

#include <fmt/format.h>

#include "cookd/features/vocabulary.hpp"
#include "cookd/utils/conversion.hpp"

namespace cookd {

namespace {

// The element being typed is parsed like any other. It is only worth offering
// back when the recipe mentions it somewhere else too.
template <typename T>
auto IsOnlyUnderCursor(const T& item, const scan::CompletionContext& context)
    -> bool {
  return item.span.start == context.marker_offset && item.references.empty();
}

auto IsOtherBuffer(
    const std::shared_ptr<const DocumentState>& state,
    const DocumentState& document) -> bool {
  return state && state->uri != document.uri && state->parse.HasRecipe();
}

auto MakeItem(
    std::string label, lsp::CompletionItemKind kind, std::string detail)
    -> lsp::CompletionItem {
  return lsp::CompletionItem{
      .label = std::move(label), .kind = kind, .detail = std::move(detail)};
}

auto PlainDocumentation(std::string text) -> lsp::MarkupContent {
  return lsp::MarkupContent{
      .kind = lsp::MarkupKind::kPlainText, .value = std::move(text)};
}

}  // namespace

auto CompletionProvider::ResolveCompletion(
    const DocumentState& document, const lsp::Position& position,
    const CompletionSources& sources) -> lsp::CompletionList {
  auto offset = ToOffset(document.index, position);
  auto context = scan::ScanCompletionContext(document.Content(), offset);
  if (!context) {
    return {};
  }

  CandidateList candidates(context->prefix);
  switch (context->kind) {
    case scan::CompletionContextKind::kIngredientName:
      AddIngredients(document, *context, sources, candidates);
      break;
    case scan::CompletionContextKind::kCookwareName:
      AddCookware(document, *context, sources, candidates);
      break;
    case scan::CompletionContextKind::kTimerName:
      AddTimers(document, *context, sources, candidates);
      break;
    case scan::CompletionContextKind::kQuantity:
      AddQuantitySnippets(candidates);
      break;
    case scan::CompletionContextKind::kUnit:
      if (sources.builtin_vocabulary) {
        AddUnits(*context, candidates);
      }
      break;
  }

  return lsp::CompletionList{.isIncomplete = false, .items = candidates.Take()};
}

void CompletionProvider::AddIngredients(
    const DocumentState& document, const scan::CompletionContext& context,
    const CompletionSources& sources, CandidateList& candidates) {
  if (const auto& recipe = document.parse.recipe) {
    for (const auto& ingredient : recipe->ingredients) {
      if (IsOnlyUnderCursor(ingredient, context)) {
        continue;
      }
      auto item = MakeItem(
          ingredient.name, lsp::CompletionItemKind::kVariable,
          "Ingredient (from recipe)");
      item.insertText = fmt::format("{}{{}}", ingredient.name);
      item.insertTextFormat = lsp::InsertTextFormat::kPlainText;
      candidates.Add(std::move(item));
    }
  }

  for (const auto& state : sources.workspace) {
    if (!IsOtherBuffer(state, document)) {
      continue;
    }
    for (const auto& ingredient : state->parse.recipe->ingredients) {
      candidates.Add(MakeItem(
          ingredient.name, lsp::CompletionItemKind::kVariable,
          "Ingredient (from workspace)"));
    }
  }

  if (sources.aliases) {
    for (const auto& entry : sources.aliases->Entries()) {
      auto detail = entry.IsAlias() ? fmt::format(
                                          "{} (alias for {})", entry.category,
                                          entry.canonical)
                                    : entry.category;
      auto item = MakeItem(
          entry.name, lsp::CompletionItemKind::kVariable, std::move(detail));
      item.documentation = PlainDocumentation(
          fmt::format("From aisle.conf - {}", entry.category));
      candidates.Add(std::move(item));
    }
  }

  if (sources.builtin_vocabulary) {
    for (auto name : kCommonIngredients) {
      candidates.Add(MakeItem(
          std::string(name), lsp::CompletionItemKind::kVariable,
          "Common ingredient"));
    }
  }
}

void CompletionProvider::AddCookware(
    const DocumentState& document, const scan::CompletionContext& context,
    const CompletionSources& sources, CandidateList& candidates) {
  if (const auto& recipe = document.parse.recipe) {
    for (const auto& cookware : recipe->cookware) {
      if (IsOnlyUnderCursor(cookware, context)) {
        continue;
      }
      candidates.Add(MakeItem(
          cookware.name, lsp::CompletionItemKind::kClass,
          "Cookware (from recipe)"));
    }
  }

  for (const auto& state : sources.workspace) {
    if (!IsOtherBuffer(state, document)) {
      continue;
    }
    for (const auto& cookware : state->parse.recipe->cookware) {
      candidates.Add(MakeItem(
          cookware.name, lsp::CompletionItemKind::kClass,
          "Cookware (from workspace)"));
    }
  }

  if (sources.builtin_vocabulary) {
    for (auto name : kCommonCookware) {
      candidates.Add(MakeItem(
          std::string(name), lsp::CompletionItemKind::kClass,
          "Common cookware"));
    }
  }
}

void CompletionProvider::AddTimers(
    const DocumentState& document, const scan::CompletionContext& context,
    const CompletionSources& sources, CandidateList& candidates) {
  if (const auto& recipe = document.parse.recipe) {
    for (const auto& timer : recipe->timers) {
      if (!timer.name || timer.span.start == context.marker_offset) {
        continue;
      }
      candidates.Add(MakeItem(
          *timer.name, lsp::CompletionItemKind::kFunction,
          "Timer (from recipe)"));
    }
  }

  for (const auto& state : sources.workspace) {
    if (!IsOtherBuffer(state, document)) {
      continue;
    }
    for (const auto& timer : state->parse.recipe->timers) {
      if (timer.name) {
        candidates.Add(MakeItem(
            *timer.name, lsp::CompletionItemKind::kFunction,
            "Timer (from workspace)"));
      }
    }
  }

  // Keeps whatever name was typed and appends the duration group.
  auto snippet = MakeItem(
      "duration", lsp::CompletionItemKind::kSnippet, "Insert timer duration");
  snippet.filterText = std::string(candidates.Prefix());
  snippet.insertText =
      fmt::format("{}{{${{1:amount}}%${{2:minutes}}}}", candidates.Prefix());
  snippet.insertTextFormat = lsp::InsertTextFormat::kSnippet;
  candidates.AddUnfiltered(std::move(snippet));
}

void CompletionProvider::AddUnits(
    const scan::CompletionContext& context, CandidateList& candidates) {
  auto add_time_units = [&candidates](bool in_timer) {
    for (const auto& unit : kTimeUnits) {
      auto item = MakeItem(
          std::string(unit.short_name), lsp::CompletionItemKind::kUnit,
          in_timer ? std::string(unit.long_name)
                   : fmt::format("{} (time)", unit.long_name));
      if (in_timer) {
        item.documentation =
            PlainDocumentation(fmt::format("Time unit: {}", unit.long_name));
      }
      candidates.Add(std::move(item));
    }
  };
  auto add_units = [&candidates]() {
    for (const auto& unit : kUnits) {
      candidates.Add(MakeItem(
          std::string(unit.short_name), lsp::CompletionItemKind::kUnit,
          std::string(unit.long_name)));
    }
  };

  if (context.marker == scan::MarkerKind::kTimer) {
    add_time_units(true);
    add_units();
  } else {
    add_units();
    add_time_units(false);
  }
}

void CompletionProvider::AddQuantitySnippets(CandidateList& candidates) {
  auto with_unit = MakeItem(
      "quantity with unit", lsp::CompletionItemKind::kSnippet,
      "Insert quantity with unit");
  with_unit.insertText = "${1:amount}%${2:unit}";
  with_unit.insertTextFormat = lsp::InsertTextFormat::kSnippet;
  candidates.AddUnfiltered(std::move(with_unit));

  auto only = MakeItem(
      "quantity only", lsp::CompletionItemKind::kSnippet,
      "Insert quantity without unit");
  only.insertText = "${1:amount}";
  only.insertTextFormat = lsp::InsertTextFormat::kSnippet;
  candidates.AddUnfiltered(std::move(only));
}

}  // namespace cookd
