#include "cookd/features/hover_provider.hpp"

#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "cookd/scan/element_locator.hpp"
#include "cookd/utils/conversion.hpp"

namespace cookd {

namespace {

auto JoinParts(const std::vector<std::string>& parts) -> std::string {
  return fmt::format("{}", fmt::join(parts, "\n\n"));
}

template <typename T>
auto FormatNamed(std::string_view label, const T& item) -> std::string {
  std::vector<std::string> parts;
  parts.push_back(fmt::format("**{}:** {}", label, item.name));
  if (item.quantity) {
    parts.push_back(fmt::format("**Quantity:** {}", item.quantity->ToString()));
  }
  if (item.note) {
    parts.push_back(fmt::format("**Note:** {}", *item.note));
  }
  return JoinParts(parts);
}

auto DescribeElement(
    const scan::ElementSpan& element, const recipe::Recipe* recipe)
    -> std::string {
  switch (element.kind) {
    case scan::ElementKind::kIngredient:
      if (recipe != nullptr) {
        if (const auto* found = recipe->FindIngredient(element.name)) {
          return HoverProvider::FormatIngredient(*found);
        }
      }
      return fmt::format("**Ingredient:** {}", element.name);

    case scan::ElementKind::kCookware:
      if (recipe != nullptr) {
        if (const auto* found = recipe->FindCookware(element.name)) {
          return HoverProvider::FormatCookware(*found);
        }
      }
      return fmt::format("**Cookware:** {}", element.name);

    case scan::ElementKind::kTimer: {
      if (recipe != nullptr) {
        const auto* found = element.name.empty()
                                ? recipe->FindTimerAt(element.start)
                                : recipe->FindTimer(element.name);
        if (found != nullptr) {
          return HoverProvider::FormatTimer(*found);
        }
      }
      return fmt::format(
          "**Timer:** {}", element.name.empty() ? "unnamed" : element.name);
    }

    case scan::ElementKind::kSection:
      return fmt::format("**Section:** {}", element.name);

    case scan::ElementKind::kMetadata:
      return fmt::format(
          "**Metadata:** {}", scan::Trim(element.text.substr(2)));

    case scan::ElementKind::kComment:
      return "**Comment**";
  }
  return {};
}

auto DescribeAisle(const AliasEntry& entry) -> std::string {
  if (entry.IsAlias()) {
    return fmt::format(
        "**Aisle:** {} (alias for {})", entry.category, entry.canonical);
  }
  return fmt::format("**Aisle:** {}", entry.category);
}

}  // namespace

auto HoverProvider::ResolveHover(
    const DocumentState& document, const lsp::Position& position,
    const AliasTable* aliases) -> lsp::HoverResult {
  auto offset = ToOffset(document.index, position);
  auto element = scan::FindElementAt(document.Content(), offset);
  if (!element) {
    return std::nullopt;
  }

  const auto* recipe =
      document.parse.recipe ? &*document.parse.recipe : nullptr;
  auto description = DescribeElement(*element, recipe);
  if (aliases != nullptr && element->kind == scan::ElementKind::kIngredient) {
    if (const auto* entry = aliases->Find(element->name)) {
      description = JoinParts({description, DescribeAisle(*entry)});
    }
  }

  return lsp::Hover{
      .contents =
          lsp::MarkupContent{
              .kind = lsp::MarkupKind::kMarkdown,
              .value = std::move(description)},
      .range = ToLspRange(document.index, element->start, element->end)};
}

auto HoverProvider::FormatIngredient(const recipe::Ingredient& ingredient)
    -> std::string {
  return FormatNamed("Ingredient", ingredient);
}

auto HoverProvider::FormatCookware(const recipe::Cookware& cookware)
    -> std::string {
  return FormatNamed("Cookware", cookware);
}

auto HoverProvider::FormatTimer(const recipe::Timer& timer) -> std::string {
  std::vector<std::string> parts;
  if (timer.name) {
    parts.push_back(fmt::format("**Timer:** {}", *timer.name));
  } else {
    parts.emplace_back("**Timer**");
  }
  if (timer.quantity) {
    parts.push_back(
        fmt::format("**Duration:** {}", timer.quantity->ToString()));
  }
  return JoinParts(parts);
}

}  // namespace cookd
