#pragma once

#include "domain/Uuid.hpp"
#include <boost/uuid/random_generator.hpp>

namespace cookbook::utils {

/**
 * @brief Генератор UUID v4
 * 
 * Домен идентификаторы не генерирует: они приходят от вызывающей стороны.
 * Утилита нужна слою application, когда запрос пришёл без id.
 * 
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    static domain::Uuid generate() {
        thread_local boost::uuids::random_generator gen;
        return domain::Uuid(gen());
    }
};

} // namespace cookbook::utils
