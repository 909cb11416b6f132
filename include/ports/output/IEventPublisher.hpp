#pragma once

#include <string>

namespace clinic::ports::output {

/**
 * @brief Интерфейс для публикации доменных событий
 *
 * Реализуется RabbitMQEventPublisher.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "user.logged_in")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace clinic::ports::output
