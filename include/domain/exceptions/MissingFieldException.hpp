#pragma once

#include "domain/enums/RecipeField.hpp"
#include <stdexcept>
#include <string>

namespace cookbook::domain {

/**
 * @brief Исключение: рецепт собирается без обязательного поля
 * 
 * Бросается RecipeBuilder::build(). Для обработки без исключений
 * есть RecipeBuilder::tryBuild().
 */
class MissingFieldException : public std::runtime_error {
public:
    explicit MissingFieldException(RecipeField field)
        : std::runtime_error(messageFor(field))
        , field_(field) {}

    RecipeField field() const { return field_; }

    static std::string messageFor(RecipeField field) {
        return "cannot build Recipe without " + toString(field) + " set";
    }

private:
    RecipeField field_;
};

} // namespace cookbook::domain
