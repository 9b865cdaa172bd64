#include "domain/RecipeBuilder.hpp"
#include "domain/exceptions/MissingFieldException.hpp"

namespace cookbook::domain {

RecipeBuilder& RecipeBuilder::withId(const Uuid& id) & {
    id_ = id;
    return *this;
}

RecipeBuilder& RecipeBuilder::withName(const std::string& name) & {
    name_ = name;
    return *this;
}

RecipeBuilder& RecipeBuilder::withDifficulty(Difficulty difficulty) & {
    difficulty_ = difficulty;
    return *this;
}

RecipeBuilder& RecipeBuilder::withDuration(std::uint16_t minutes) & {
    duration_ = minutes;
    return *this;
}

RecipeBuilder& RecipeBuilder::withDescription(const std::string& description) & {
    description_ = description;
    return *this;
}

RecipeBuilder& RecipeBuilder::withDirections(const std::string& directions) & {
    directions_ = directions;
    return *this;
}

RecipeBuilder& RecipeBuilder::withImage(const ImageBytes& img) & {
    img_ = img;
    return *this;
}

RecipeBuilder& RecipeBuilder::addIngredient(const Ingredient& ingredient) & {
    // insert() не перезаписывает равный по id элемент, поэтому сначала удаляем
    ingredients_.erase(ingredient);
    ingredients_.insert(ingredient);
    return *this;
}

RecipeBuilder& RecipeBuilder::addTag(const RecipeTag& tag) & {
    tags_.insert(tag);
    return *this;
}

std::optional<RecipeField> RecipeBuilder::firstMissingField() const {
    if (!id_)          return RecipeField::ID;
    if (!name_)        return RecipeField::NAME;
    if (!difficulty_)  return RecipeField::DIFFICULTY;
    if (!duration_)    return RecipeField::DURATION;
    if (!description_) return RecipeField::DESCRIPTION;
    if (!directions_)  return RecipeField::DIRECTIONS;
    return std::nullopt;
}

RecipeBuildResult RecipeBuilder::tryBuild() && {
    if (auto missing = firstMissingField()) {
        return RecipeBuildResult::missing(*missing, MissingFieldException::messageFor(*missing));
    }

    Recipe recipe(
        *id_,
        std::move(*name_),
        *difficulty_,
        *duration_,
        std::move(*description_),
        std::move(ingredients_),
        std::move(*directions_),
        std::move(tags_),
        img_ ? std::move(*img_) : ImageBytes{}
    );

    // Билдер израсходован
    *this = RecipeBuilder();

    return RecipeBuildResult::success(std::move(recipe));
}

Recipe RecipeBuilder::build() && {
    auto result = std::move(*this).tryBuild();
    if (!result.isSuccess()) {
        throw MissingFieldException(*result.missingField);
    }
    return std::move(*result.recipe);
}

} // namespace cookbook::domain
