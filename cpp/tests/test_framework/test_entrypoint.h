// tests/test_framework/test_entrypoint.h
#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

/**
 * @file test_entrypoint.h
 * @brief Common includes for every zonechat test translation unit.
 */
