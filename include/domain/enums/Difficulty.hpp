#pragma once

#include <string>
#include <stdexcept>

namespace cookbook::domain {

/**
 * @brief Сложность рецепта по шкале от 1 до 4
 * 
 * Порядок объявления задаёт порядок сравнения:
 * EASY < MEDIUM < HARD < EXPERT.
 */
enum class Difficulty {
    EASY,       ///< Справится любой
    MEDIUM,
    HARD,
    EXPERT      ///< Для опытных поваров
};

/**
 * @brief Преобразовать Difficulty в строку
 */
inline std::string toString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY:   return "EASY";
        case Difficulty::MEDIUM: return "MEDIUM";
        case Difficulty::HARD:   return "HARD";
        case Difficulty::EXPERT: return "EXPERT";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Преобразовать строку в Difficulty
 * @throws std::invalid_argument если строка не распознана
 */
inline Difficulty parseDifficulty(const std::string& str) {
    if (str == "EASY" || str == "easy")     return Difficulty::EASY;
    if (str == "MEDIUM" || str == "medium") return Difficulty::MEDIUM;
    if (str == "HARD" || str == "hard")     return Difficulty::HARD;
    if (str == "EXPERT" || str == "expert") return Difficulty::EXPERT;
    throw std::invalid_argument("Unknown difficulty: " + str);
}

} // namespace cookbook::domain
