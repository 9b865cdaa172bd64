#pragma once

#include "domain/Uuid.hpp"
#include <stdexcept>

namespace cookbook::domain {

/**
 * @brief Исключение: рецепт с таким id уже сохранён
 */
class DuplicateRecipeException : public std::runtime_error {
public:
    explicit DuplicateRecipeException(const Uuid& recipeId)
        : std::runtime_error("Recipe already exists: " + recipeId.toString())
        , recipeId_(recipeId) {}

    const Uuid& recipeId() const { return recipeId_; }

private:
    Uuid recipeId_;
};

} // namespace cookbook::domain
