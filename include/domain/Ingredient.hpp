#pragma once

#include "Uuid.hpp"
#include <cstddef>
#include <functional>
#include <string>

namespace cookbook::domain {

/**
 * @brief Ингредиент рецепта
 * 
 * Неизменяемое значение. Равенство и хэш - только по id: два ингредиента
 * с одинаковым id считаются одним элементом множества, даже если остальные
 * поля различаются.
 */
class Ingredient {
public:
    Ingredient(const Uuid& id,
               const std::string& name,
               const std::string& unit,
               const std::string& measurement)
        : id_(id)
        , name_(name)
        , unit_(unit)
        , measurement_(measurement)
    {}

    const Uuid& id() const { return id_; }
    const std::string& name() const { return name_; }                ///< "Мука"
    const std::string& unit() const { return unit_; }                ///< "г", "cup"
    const std::string& measurement() const { return measurement_; }  ///< "200", "1/2"

    bool operator==(const Ingredient& other) const { return id_ == other.id_; }
    bool operator!=(const Ingredient& other) const { return id_ != other.id_; }

private:
    Uuid id_;
    std::string name_;
    std::string unit_;
    std::string measurement_;
};

} // namespace cookbook::domain

template <>
struct std::hash<cookbook::domain::Ingredient> {
    std::size_t operator()(const cookbook::domain::Ingredient& ingredient) const noexcept {
        return std::hash<cookbook::domain::Uuid>{}(ingredient.id());
    }
};
