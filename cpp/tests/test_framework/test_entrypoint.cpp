// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief Main entry point for the zonechat test executables.
 *
 * Runs GoogleTest with NO lifecycle initialization. Everything under test either
 * initializes lazily (Logger, libsodium) or is constructed per test (EventLoop,
 * LocalBus, SessionManager). Tests that exercise LifecycleGuard itself build
 * their own guard from test-local modules and tear it down before returning.
 */
#include "test_entrypoint.h"

#include "utils/logger.hpp"

#include <cstdlib>

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    // Keep test output readable; ZONECHAT_TEST_LOG_LEVEL=debug restores the chatter.
    const char *level_env = std::getenv("ZONECHAT_TEST_LOG_LEVEL");
    auto level = zonechat::utils::Logger::level_from_string(level_env != nullptr ? level_env
                                                                                 : "warn");
    zonechat::utils::Logger::instance().set_level(
        level.value_or(zonechat::utils::Logger::Level::L_WARNING));

    const int rc = RUN_ALL_TESTS();
    zonechat::utils::Logger::instance().flush();
    return rc;
}
