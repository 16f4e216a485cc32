#pragma once
/** @file  MockErrorMonitor.hpp
 *  @brief gmock ErrorMonitor for asserting on reported faults.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"

namespace cloneflow {
  namespace test {

    class MockErrorMonitor : public cloneflow::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

  } // namespace test
} // namespace cloneflow
