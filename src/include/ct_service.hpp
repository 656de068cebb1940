#pragma once
/**
 * @file ct_service.hpp
 * @brief Layer 2: Service modules built on ct_base.
 *
 * Provides the TraceConfig loader and the Logger facade with its sinks.
 * Include this when you need to log or read the configuration.
 */
#include "ct_base.hpp"

#include "utils/trace_config.hpp"
#include "utils/logger.hpp"
#include "utils/logger_sinks/sink.hpp"
#include "utils/logger_sinks/sink_config.hpp"
