#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace cookbook::domain {

/**
 * @brief Тег рецепта ("vegan", "breakfast")
 * 
 * Сравнивается по содержимому. Пустой тег допустим.
 */
class RecipeTag {
public:
    explicit RecipeTag(const std::string& value) : value_(value) {}

    const std::string& value() const { return value_; }

    bool operator==(const RecipeTag& other) const { return value_ == other.value_; }
    bool operator!=(const RecipeTag& other) const { return value_ != other.value_; }

private:
    std::string value_;
};

} // namespace cookbook::domain

template <>
struct std::hash<cookbook::domain::RecipeTag> {
    std::size_t operator()(const cookbook::domain::RecipeTag& tag) const noexcept {
        return std::hash<std::string>{}(tag.value());
    }
};
