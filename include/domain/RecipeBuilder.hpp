// include/domain/RecipeBuilder.hpp
#pragma once

#include "Recipe.hpp"
#include "RecipeBuildResult.hpp"
#include "enums/RecipeField.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace cookbook::domain {

/**
 * @brief Пошаговая сборка Recipe
 * 
 * Обязательные поля (id, name, difficulty, duration, description, directions)
 * хранятся как std::optional до финализации. Сеттеры можно вызывать в любом
 * порядке и сколько угодно раз - побеждает последнее значение.
 * 
 * Финализация (build / tryBuild) доступна только на rvalue и забирает
 * состояние билдера, повторно использовать его нельзя:
 * ```cpp
 * RecipeBuilder builder;
 * builder.withId(id).withName("Soup");
 * auto result = std::move(builder).tryBuild();
 * ```
 * 
 * @note Не потокобезопасен: у каждой задачи сборки свой билдер.
 */
class RecipeBuilder {
public:
    RecipeBuilder() = default;

    RecipeBuilder& withId(const Uuid& id) &;
    RecipeBuilder& withName(const std::string& name) &;
    RecipeBuilder& withDifficulty(Difficulty difficulty) &;
    RecipeBuilder& withDuration(std::uint16_t minutes) &;
    RecipeBuilder& withDescription(const std::string& description) &;
    RecipeBuilder& withDirections(const std::string& directions) &;
    RecipeBuilder& withImage(const ImageBytes& img) &;

    /**
     * @brief Добавить ингредиент
     * 
     * Ингредиент с уже добавленным id заменяет предыдущий.
     */
    RecipeBuilder& addIngredient(const Ingredient& ingredient) &;

    /**
     * @brief Добавить тег (повторный тег игнорируется)
     */
    RecipeBuilder& addTag(const RecipeTag& tag) &;

    // Перегрузки для цепочки на временном объекте: Recipe::builder().withId(..)...
    RecipeBuilder&& withId(const Uuid& id) && { return std::move(withId(id)); }
    RecipeBuilder&& withName(const std::string& name) && { return std::move(withName(name)); }
    RecipeBuilder&& withDifficulty(Difficulty difficulty) && { return std::move(withDifficulty(difficulty)); }
    RecipeBuilder&& withDuration(std::uint16_t minutes) && { return std::move(withDuration(minutes)); }
    RecipeBuilder&& withDescription(const std::string& description) && { return std::move(withDescription(description)); }
    RecipeBuilder&& withDirections(const std::string& directions) && { return std::move(withDirections(directions)); }
    RecipeBuilder&& withImage(const ImageBytes& img) && { return std::move(withImage(img)); }
    RecipeBuilder&& addIngredient(const Ingredient& ingredient) && { return std::move(addIngredient(ingredient)); }
    RecipeBuilder&& addTag(const RecipeTag& tag) && { return std::move(addTag(tag)); }

    /**
     * @brief Первое незаполненное обязательное поле
     * 
     * Порядок проверки: id, name, difficulty, duration, description, directions.
     * @return std::nullopt если заполнены все
     */
    std::optional<RecipeField> firstMissingField() const;

    /**
     * @brief Собрать рецепт без исключений
     * 
     * Картинка по умолчанию - пустой вектор, ингредиенты и теги - пустые множества.
     */
    RecipeBuildResult tryBuild() &&;

    /**
     * @brief Собрать рецепт
     * @throws MissingFieldException если не задано обязательное поле
     */
    Recipe build() &&;

private:
    std::optional<Uuid> id_;
    std::optional<std::string> name_;
    std::optional<Difficulty> difficulty_;
    std::optional<std::uint16_t> duration_;
    std::optional<std::string> description_;
    std::optional<std::string> directions_;
    IngredientSet ingredients_;
    TagSet tags_;
    std::optional<ImageBytes> img_;
};

} // namespace cookbook::domain
