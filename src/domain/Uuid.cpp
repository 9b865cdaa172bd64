#include "domain/Uuid.hpp"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

namespace cookbook::domain {

Uuid Uuid::fromString(const std::string& str) {
    try {
        return Uuid(boost::uuids::string_generator()(str));
    } catch (const std::runtime_error&) {
        // string_generator сообщает об ошибке через std::runtime_error
        throw std::invalid_argument("Invalid UUID: " + str);
    }
}

std::string Uuid::toString() const {
    return boost::uuids::to_string(value);
}

} // namespace cookbook::domain
