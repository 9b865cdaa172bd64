#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace cookbook::settings {

/**
 * @brief Настройки сервиса рецептов
 * 
 * Читает из ENV:
 * - COOKBOOK_SERVICE_NAME (default: cookbook-service)
 * - COOKBOOK_EVENTS_ENABLED (default: true; "0", "false", "off", "no"
 *   в любом регистре выключают публикацию)
 * - COOKBOOK_EVENT_ROUTING_KEY (default: recipe.created)
 */
class ServiceSettings {
public:
    ServiceSettings() {
        if (const char* val = std::getenv("COOKBOOK_SERVICE_NAME")) {
            serviceName_ = val;
        }
        if (const char* val = std::getenv("COOKBOOK_EVENTS_ENABLED")) {
            eventsEnabled_ = !isOffValue(val);
        }
        if (const char* val = std::getenv("COOKBOOK_EVENT_ROUTING_KEY")) {
            eventRoutingKey_ = val;
        }
    }

    std::string getServiceName() const { return serviceName_; }
    bool isEventsEnabled() const { return eventsEnabled_; }
    std::string getEventRoutingKey() const { return eventRoutingKey_; }

private:
    static bool isOffValue(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s == "0" || s == "false" || s == "off" || s == "no";
    }

    std::string serviceName_ = "cookbook-service";
    bool eventsEnabled_ = true;
    std::string eventRoutingKey_ = "recipe.created";
};

} // namespace cookbook::settings
