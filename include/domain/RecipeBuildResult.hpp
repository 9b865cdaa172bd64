#pragma once

#include "Recipe.hpp"
#include "enums/RecipeField.hpp"
#include <optional>
#include <string>
#include <utility>

namespace cookbook::domain {

/**
 * @brief Результат сборки рецепта
 * 
 * Либо готовый рецепт, либо первое незаполненное обязательное поле.
 */
struct RecipeBuildResult {
    std::optional<Recipe> recipe;               ///< Заполнен при успехе
    std::optional<RecipeField> missingField;    ///< Заполнен при ошибке
    std::string message;                        ///< Текст ошибки (пустой при успехе)

    static RecipeBuildResult success(Recipe recipe) {
        RecipeBuildResult result;
        result.recipe.emplace(std::move(recipe));
        return result;
    }

    static RecipeBuildResult missing(RecipeField field, const std::string& message) {
        RecipeBuildResult result;
        result.missingField = field;
        result.message = message;
        return result;
    }

    bool isSuccess() const {
        return recipe.has_value();
    }
};

} // namespace cookbook::domain
