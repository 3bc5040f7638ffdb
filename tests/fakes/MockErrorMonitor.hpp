#pragma once
/** @file  MockErrorMonitor.hpp
 *  @brief gmock ErrorMonitor for escalation expectations.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"

namespace ferry {
  namespace test {

    class MockErrorMonitor : public ferry::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

  } // namespace test
} // namespace ferry
