#pragma once
/**
 * @file ct_base.hpp
 * @brief Layer 1: Basic modules built on ct_platform.
 *
 * Provides format_tools, debug_info, the thread-local call frame stack and the
 * keyed instance cache. Include this when you need formatting, debug utilities
 * or the singleton factory.
 */
#include "ct_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/call_frame.hpp"
#include "utils/instance_cache.hpp"
