#pragma once

#include "domain/Ingredient.hpp"
#include "domain/Recipe.hpp"
#include "domain/RecipeBuildResult.hpp"
#include "domain/RecipeTag.hpp"
#include "domain/Uuid.hpp"
#include "domain/enums/Difficulty.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cookbook::ports::input {

/**
 * @brief Запрос на создание рецепта
 * 
 * Незаданные обязательные поля приводят к ошибке сборки.
 * Если id не задан, сервис сгенерирует его сам.
 */
struct CreateRecipeRequest {
    std::optional<domain::Uuid> id;
    std::optional<std::string> name;
    std::optional<domain::Difficulty> difficulty;
    std::optional<std::uint16_t> duration;
    std::optional<std::string> description;
    std::optional<std::string> directions;
    std::vector<domain::Ingredient> ingredients;
    std::vector<domain::RecipeTag> tags;
    std::optional<domain::ImageBytes> img;
};

/**
 * @brief Интерфейс сервиса рецептов
 */
class IRecipeService {
public:
    virtual ~IRecipeService() = default;

    /**
     * @brief Собрать и сохранить рецепт
     * @throws domain::DuplicateRecipeException если id уже занят
     */
    virtual domain::RecipeBuildResult createRecipe(const CreateRecipeRequest& request) = 0;

    /**
     * @brief Получить рецепт по ID
     */
    virtual std::optional<domain::Recipe> getRecipe(const domain::Uuid& recipeId) = 0;
};

} // namespace cookbook::ports::input
