#pragma once
/**
 * @file zc_service.hpp
 * @brief Layer 2: service modules built on zc_base.
 *
 * Provides lifecycle management, logging, cryptographic utilities and
 * identifier generation.
 */
#include "zc_base.hpp"

#include "utils/crypto_utils.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"
