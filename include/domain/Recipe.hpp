// include/domain/Recipe.hpp
#pragma once

#include "Ingredient.hpp"
#include "RecipeTag.hpp"
#include "Uuid.hpp"
#include "enums/Difficulty.hpp"
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace cookbook::domain {

using IngredientSet = std::unordered_set<Ingredient>;
using TagSet = std::unordered_set<RecipeTag>;
using ImageBytes = std::vector<std::uint8_t>;

class RecipeBuilder;

/**
 * @brief Рецепт из кулинарной книги
 * 
 * Неизменяемый агрегат. Создать его можно только через RecipeBuilder,
 * который проверяет наличие всех обязательных полей. После создания
 * сеттеров нет, поэтому готовый рецепт можно читать из любого числа потоков.
 * 
 * @example
 * ```cpp
 * auto recipe = Recipe::builder()
 *     .withId(id)
 *     .withName("Pancakes")
 *     .withDifficulty(Difficulty::EASY)
 *     .withDuration(15)
 *     .withDescription("Fluffy pancakes")
 *     .withDirections("Mix and fry.")
 *     .build();
 * ```
 */
class Recipe {
public:
    /**
     * @brief Начать сборку нового рецепта
     */
    static RecipeBuilder builder();

    const Uuid& id() const { return id_; }
    const std::string& name() const { return name_; }
    Difficulty difficulty() const { return difficulty_; }

    /// Оценка времени приготовления в минутах
    std::uint16_t duration() const { return duration_; }

    const std::string& description() const { return description_; }
    const IngredientSet& ingredients() const { return ingredients_; }
    const std::string& directions() const { return directions_; }
    const TagSet& tags() const { return tags_; }

    /// Сырые байты картинки, пустой вектор если картинки нет
    const ImageBytes& img() const { return img_; }

    bool hasImage() const { return !img_.empty(); }

private:
    friend class RecipeBuilder;

    Recipe(const Uuid& id,
           std::string name,
           Difficulty difficulty,
           std::uint16_t duration,
           std::string description,
           IngredientSet ingredients,
           std::string directions,
           TagSet tags,
           ImageBytes img);

    Uuid id_;
    std::string name_;
    Difficulty difficulty_;
    std::uint16_t duration_;
    std::string description_;
    IngredientSet ingredients_;
    std::string directions_;
    TagSet tags_;
    ImageBytes img_;
};

} // namespace cookbook::domain
