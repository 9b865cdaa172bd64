#pragma once

#include <string>

namespace cookbook::ports::output {

/**
 * @brief Интерфейс для публикации событий
 * 
 * Строковый интерфейс (routingKey + message) подходит для любого
 * брокера сообщений.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "recipe.created")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace cookbook::ports::output
