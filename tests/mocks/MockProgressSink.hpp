/**
 * @file MockProgressSink.hpp
 * @brief Google Mock implementation of IProgressSink
 */

#pragma once

#include "interfaces/IProgressSink.hpp"
#include <gmock/gmock.h>

class MockProgressSink : public IProgressSink {
public:
    MOCK_METHOD(void, on_progress, (const WipeProgress& progress), (override));
};
