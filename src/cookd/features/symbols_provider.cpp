#include "cookd/features/symbols_provider.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "cookd/utils/conversion.hpp"

namespace cookd {

namespace {

auto MakeLeaf(
    const text::PositionIndex& index, std::string name,
    std::optional<std::string> detail, lsp::SymbolKind kind,
    const recipe::SourceSpan& span) -> lsp::DocumentSymbol {
  auto range = ToLspRange(index, span);
  return lsp::DocumentSymbol{
      .name = std::move(name),
      .detail = std::move(detail),
      .kind = kind,
      .range = range,
      .selectionRange = range,
      .children = std::nullopt};
}

auto QuantityDetail(const std::optional<recipe::Quantity>& quantity)
    -> std::optional<std::string> {
  if (!quantity) {
    return std::nullopt;
  }
  return quantity->ToString();
}

// Group node covering all of its children. Children keep source order.
auto MakeGroup(
    const text::PositionIndex& index, std::string name, std::string detail,
    const std::vector<recipe::SourceSpan>& spans,
    std::vector<lsp::DocumentSymbol> children) -> lsp::DocumentSymbol {
  auto start = std::ranges::min(spans, {}, &recipe::SourceSpan::start).start;
  auto end = std::ranges::max(spans, {}, &recipe::SourceSpan::end).end;
  return lsp::DocumentSymbol{
      .name = std::move(name),
      .detail = std::move(detail),
      .kind = lsp::SymbolKind::kNamespace,
      .range = ToLspRange(index, start, end),
      .selectionRange = children.front().selectionRange,
      .children = std::move(children)};
}

template <typename T, typename ToSymbol>
auto BuildGroup(
    const text::PositionIndex& index, std::string name,
    const std::vector<T>& items, ToSymbol to_symbol)
    -> std::optional<lsp::DocumentSymbol> {
  if (items.empty()) {
    return std::nullopt;
  }
  std::vector<lsp::DocumentSymbol> children;
  std::vector<recipe::SourceSpan> spans;
  for (const auto& item : items) {
    children.push_back(to_symbol(item));
    spans.push_back(item.span);
  }
  auto detail = fmt::format("{} items", children.size());
  return MakeGroup(
      index, std::move(name), std::move(detail), spans, std::move(children));
}

}  // namespace

auto SymbolsProvider::BuildDocumentSymbols(const DocumentState& document)
    -> std::vector<lsp::DocumentSymbol> {
  const auto& parse = document.parse;
  if (!parse.recipe) {
    return {};
  }
  const auto& recipe = *parse.recipe;
  const auto& index = document.index;

  std::vector<lsp::DocumentSymbol> symbols;

  if (!recipe.metadata.empty()) {
    std::vector<lsp::DocumentSymbol> children;
    std::vector<recipe::SourceSpan> spans;
    for (const auto& entry : recipe.metadata) {
      children.push_back(MakeLeaf(
          index, entry.key, entry.value, lsp::SymbolKind::kProperty,
          entry.span));
      spans.push_back(entry.span);
    }
    auto detail = fmt::format("{} properties", children.size());
    symbols.push_back(MakeGroup(
        index, "Metadata", std::move(detail), spans, std::move(children)));
  }

  for (const auto& section : recipe.sections) {
    auto range = ToLspRange(index, section.span);
    symbols.push_back(lsp::DocumentSymbol{
        .name = section.name.value_or("Steps"),
        .detail = fmt::format("{} steps", section.steps.size()),
        .kind = lsp::SymbolKind::kNamespace,
        .range = range,
        .selectionRange = range,
        .children = std::nullopt});
  }

  auto ingredients = BuildGroup(
      index, "Ingredients", recipe.ingredients,
      [&index](const recipe::Ingredient& ingredient) {
        return MakeLeaf(
            index, ingredient.name, QuantityDetail(ingredient.quantity),
            lsp::SymbolKind::kVariable, ingredient.span);
      });
  if (ingredients) {
    symbols.push_back(std::move(*ingredients));
  }

  auto cookware = BuildGroup(
      index, "Cookware", recipe.cookware,
      [&index](const recipe::Cookware& item) {
        return MakeLeaf(
            index, item.name, QuantityDetail(item.quantity),
            lsp::SymbolKind::kClass, item.span);
      });
  if (cookware) {
    symbols.push_back(std::move(*cookware));
  }

  auto timers = BuildGroup(
      index, "Timers", recipe.timers, [&index](const recipe::Timer& timer) {
        return MakeLeaf(
            index, timer.name.value_or("Timer"), QuantityDetail(timer.quantity),
            lsp::SymbolKind::kFunction, timer.span);
      });
  if (timers) {
    symbols.push_back(std::move(*timers));
  }

  return symbols;
}

}  // namespace cookd
