#pragma once

namespace ingredients {

#ifdef INGREDIENTS_VERSION
constexpr const char* kVersion = INGREDIENTS_VERSION;
constexpr const char* kUserAgent = "ingredient-classifier/" INGREDIENTS_VERSION;
#else
constexpr const char* kVersion = "0.0.0-dev";
constexpr const char* kUserAgent = "ingredient-classifier/0.0.0-dev";
#endif

}  // namespace ingredients
