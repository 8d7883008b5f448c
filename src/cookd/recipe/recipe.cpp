#include "cookd/recipe/recipe.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "cookd/utils/string_utils.hpp"

namespace cookd::recipe {

auto Quantity::ToString() const -> std::string {
  if (!unit || unit->empty()) {
    return value;
  }
  if (value.empty()) {
    return *unit;
  }
  return fmt::format("{} {}", value, *unit);
}

namespace {

template <typename T>
auto FindByName(const std::vector<T>& items, std::string_view name)
    -> const T* {
  auto it = std::ranges::find_if(items, [name](const T& item) {
    return utils::EqualsIgnoreCase(item.name, name);
  });
  return it == items.end() ? nullptr : &*it;
}

}  // namespace

auto Recipe::FindIngredient(std::string_view name) const -> const Ingredient* {
  return FindByName(ingredients, name);
}

auto Recipe::FindCookware(std::string_view name) const -> const Cookware* {
  return FindByName(cookware, name);
}

auto Recipe::FindTimer(std::string_view name) const -> const Timer* {
  auto it = std::ranges::find_if(timers, [name](const Timer& timer) {
    return timer.name && utils::EqualsIgnoreCase(*timer.name, name);
  });
  return it == timers.end() ? nullptr : &*it;
}

auto Recipe::FindTimerAt(std::size_t offset) const -> const Timer* {
  auto it = std::ranges::find_if(timers, [offset](const Timer& timer) {
    return timer.span.start == offset;
  });
  return it == timers.end() ? nullptr : &*it;
}

}  // namespace cookd::recipe
