#pragma once

#include <string>

namespace cookbook::domain {

/**
 * @brief Обязательные поля рецепта
 * 
 * Порядок объявления совпадает с порядком проверки в RecipeBuilder.
 */
enum class RecipeField {
    ID,
    NAME,
    DIFFICULTY,
    DURATION,
    DESCRIPTION,
    DIRECTIONS
};

inline std::string toString(RecipeField field) {
    switch (field) {
        case RecipeField::ID:          return "id";
        case RecipeField::NAME:        return "name";
        case RecipeField::DIFFICULTY:  return "difficulty";
        case RecipeField::DURATION:    return "duration";
        case RecipeField::DESCRIPTION: return "description";
        case RecipeField::DIRECTIONS:  return "directions";
        default: return "unknown";
    }
}

} // namespace cookbook::domain
