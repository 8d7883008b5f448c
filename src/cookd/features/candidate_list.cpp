#include "cookd/features/candidate_list.hpp"

#include <fmt/format.h>

#include "cookd/utils/string_utils.hpp"

namespace cookd {

CandidateList::CandidateList(std::string_view prefix) : prefix_(prefix) {
}

auto CandidateList::Matches(std::string_view label) const -> bool {
  return utils::StartsWithIgnoreCase(label, prefix_);
}

auto CandidateList::Add(lsp::CompletionItem item) -> bool {
  if (!Matches(item.label)) {
    return false;
  }
  return AddUnfiltered(std::move(item));
}

auto CandidateList::AddUnfiltered(lsp::CompletionItem item) -> bool {
  if (!seen_.insert(utils::ToLower(item.label)).second) {
    return false;
  }
  item.sortText = fmt::format("{:04}", items_.size());
  items_.push_back(std::move(item));
  return true;
}

auto CandidateList::Take() -> std::vector<lsp::CompletionItem> {
  auto items = std::move(items_);
  items_.clear();
  seen_.clear();
  return items;
}

}  // namespace cookd
