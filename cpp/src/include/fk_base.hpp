#pragma once
/**
 * @file fk_base.hpp
 * @brief Layer 1: basic utilities shared by every fieldkit module.
 *
 * Provides the fmt-based Logger (LOGGER_* macros) and the RAII ScopeGuard.
 */
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"
