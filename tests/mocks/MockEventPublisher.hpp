#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <gmock/gmock.h>

namespace cookbook::tests::mocks {

class MockEventPublisher : public ports::output::IEventPublisher {
public:
    MOCK_METHOD(void, publish, (const std::string& routingKey, const std::string& message), (override));
};

} // namespace cookbook::tests::mocks
