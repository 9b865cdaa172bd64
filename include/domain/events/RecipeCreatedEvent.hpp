// include/domain/events/RecipeCreatedEvent.hpp
#pragma once

#include "domain/Recipe.hpp"
#include "domain/enums/Difficulty.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cookbook::domain {

/**
 * @brief Событие: рецепт создан
 * 
 * Несёт сводку рецепта, не содержимое: описание, шаги и картинка
 * в событие не попадают. Время в JSON - ISO 8601 (UTC, секунды).
 */
struct RecipeCreatedEvent {
    std::string eventId;                        ///< UUID события
    std::string eventType = "recipe.created";
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    std::string recipeId;
    std::string name;
    Difficulty difficulty = Difficulty::EASY;
    std::uint16_t duration = 0;
    std::size_t ingredientCount = 0;
    std::size_t tagCount = 0;
    std::vector<std::string> tags;  ///< Отсортированы для стабильного JSON
    bool hasImage = false;

    RecipeCreatedEvent() = default;

    /// Сводка по готовому рецепту
    explicit RecipeCreatedEvent(const Recipe& recipe);

    /**
     * @brief JSON конструктор для десериализации
     * 
     * Отсутствующие ключи оставляют значения по умолчанию.
     * @throws std::invalid_argument если difficulty не распознана,
     *         duration вне 0..65535 или счётчик не целое неотрицательное число
     */
    explicit RecipeCreatedEvent(const std::string& json);

    std::string toJson() const;
};

} // namespace cookbook::domain
