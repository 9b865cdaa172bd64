#include "domain/Recipe.hpp"
#include "domain/RecipeBuilder.hpp"

#include <utility>

namespace cookbook::domain {

Recipe::Recipe(const Uuid& id,
               std::string name,
               Difficulty difficulty,
               std::uint16_t duration,
               std::string description,
               IngredientSet ingredients,
               std::string directions,
               TagSet tags,
               ImageBytes img)
    : id_(id)
    , name_(std::move(name))
    , difficulty_(difficulty)
    , duration_(duration)
    , description_(std::move(description))
    , ingredients_(std::move(ingredients))
    , directions_(std::move(directions))
    , tags_(std::move(tags))
    , img_(std::move(img))
{}

RecipeBuilder Recipe::builder() {
    return RecipeBuilder();
}

} // namespace cookbook::domain
