// include/domain/Uuid.hpp
#pragma once

#include <boost/container_hash/hash.hpp>
#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <cstddef>
#include <functional>
#include <string>

namespace cookbook::domain {

/**
 * @brief 128-битный непрозрачный идентификатор
 * 
 * Обёртка над boost::uuids::uuid. Значения всегда приходят от вызывающей
 * стороны, домен их не генерирует и не проверяет уникальность.
 * По умолчанию - nil UUID.
 */
struct Uuid {
    boost::uuids::uuid value = boost::uuids::nil_uuid();

    Uuid() = default;

    explicit Uuid(const boost::uuids::uuid& raw) : value(raw) {}

    /**
     * @brief Разобрать строку "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
     * 
     * Форма без дефисов и в фигурных скобках тоже принимается.
     * @throws std::invalid_argument если строка не является UUID
     */
    static Uuid fromString(const std::string& str);

    /**
     * @brief Каноническое представление в нижнем регистре
     */
    std::string toString() const;

    bool isNil() const { return value.is_nil(); }

    bool operator==(const Uuid& other) const { return value == other.value; }
    bool operator!=(const Uuid& other) const { return value != other.value; }
    bool operator<(const Uuid& other) const { return value < other.value; }
};

} // namespace cookbook::domain

template <>
struct std::hash<cookbook::domain::Uuid> {
    std::size_t operator()(const cookbook::domain::Uuid& id) const noexcept {
        return boost::hash<boost::uuids::uuid>{}(id.value);
    }
};
