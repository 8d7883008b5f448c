#pragma once

#include <array>
#include <string_view>

namespace cookd {

struct UnitName {
  std::string_view short_name;
  std::string_view long_name;
};

// Fallback suggestions used when nothing better is known. None of these are
// validated against; the parser accepts any unit text.

inline constexpr std::array<UnitName, 34> kUnits = {{
    {"g", "grams"},
    {"kg", "kilograms"},
    {"mg", "milligrams"},
    {"oz", "ounces"},
    {"lb", "pounds"},
    {"ml", "milliliters"},
    {"cl", "centiliters"},
    {"dl", "deciliters"},
    {"l", "liters"},
    {"tsp", "teaspoons"},
    {"tbsp", "tablespoons"},
    {"cup", "cups"},
    {"cups", "cups"},
    {"fl oz", "fluid ounces"},
    {"pt", "pints"},
    {"qt", "quarts"},
    {"gal", "gallons"},
    {"pinch", "pinches"},
    {"dash", "dashes"},
    {"drop", "drops"},
    {"clove", "cloves"},
    {"cloves", "cloves"},
    {"slice", "slices"},
    {"slices", "slices"},
    {"piece", "pieces"},
    {"pieces", "pieces"},
    {"can", "cans"},
    {"bunch", "bunches"},
    {"handful", "handfuls"},
    {"sprig", "sprigs"},
    {"stick", "sticks"},
    {"package", "packages"},
    {"large", "large"},
    {"small", "small"},
}};

inline constexpr std::array<UnitName, 14> kTimeUnits = {{
    {"s", "seconds"},
    {"sec", "seconds"},
    {"secs", "seconds"},
    {"second", "seconds"},
    {"seconds", "seconds"},
    {"min", "minutes"},
    {"mins", "minutes"},
    {"minute", "minutes"},
    {"minutes", "minutes"},
    {"h", "hours"},
    {"hr", "hours"},
    {"hrs", "hours"},
    {"hour", "hours"},
    {"hours", "hours"},
}};

inline constexpr std::array<std::string_view, 46> kCommonCookware = {
    "pot",
    "pan",
    "skillet",
    "saucepan",
    "wok",
    "dutch oven",
    "stockpot",
    "frying pan",
    "bowl",
    "mixing bowl",
    "large bowl",
    "small bowl",
    "cutting board",
    "knife",
    "chef's knife",
    "paring knife",
    "oven",
    "stove",
    "grill",
    "blender",
    "food processor",
    "mixer",
    "stand mixer",
    "whisk",
    "spatula",
    "wooden spoon",
    "ladle",
    "tongs",
    "colander",
    "strainer",
    "sieve",
    "baking sheet",
    "baking dish",
    "roasting pan",
    "casserole dish",
    "measuring cup",
    "measuring spoons",
    "rolling pin",
    "grater",
    "peeler",
    "can opener",
    "thermometer",
    "timer",
    "foil",
    "parchment paper",
    "plastic wrap",
};

inline constexpr std::array<std::string_view, 33> kCommonIngredients = {
    "salt",          "pepper",      "olive oil", "vegetable oil",
    "butter",        "garlic",      "onion",     "water",
    "chicken broth", "beef broth",  "flour",     "sugar",
    "eggs",          "milk",        "cream",     "cheese",
    "tomato",        "lemon",       "lime",      "parsley",
    "cilantro",      "basil",       "oregano",   "thyme",
    "rosemary",      "cumin",       "paprika",   "cinnamon",
    "vanilla",       "honey",       "soy sauce", "vinegar",
    "wine",
};

}  // namespace cookd
