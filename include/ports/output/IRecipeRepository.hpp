#pragma once

#include "domain/Recipe.hpp"
#include "domain/Uuid.hpp"
#include <optional>

namespace cookbook::ports::output {

/**
 * @brief Интерфейс хранилища рецептов
 * 
 * Уникальность id рецепта обеспечивает реализация хранилища,
 * домен её не проверяет.
 */
class IRecipeRepository {
public:
    virtual ~IRecipeRepository() = default;

    /**
     * @brief Сохранить рецепт
     * @return false если рецепт с таким id уже есть
     */
    virtual bool save(const domain::Recipe& recipe) = 0;

    virtual std::optional<domain::Recipe> findById(const domain::Uuid& recipeId) = 0;
    virtual bool exists(const domain::Uuid& recipeId) = 0;
};

} // namespace cookbook::ports::output
