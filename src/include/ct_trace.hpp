#pragma once
/**
 * @file ct_trace.hpp
 * @brief Umbrella header for the call-tracing layer.
 *
 * Includes the service layer (config, logger, sinks) and every public trace header.
 */
#include "ct_service.hpp"

#include "trace/value.hpp"
#include "trace/callable_descriptor.hpp"
#include "trace/classifier.hpp"
#include "trace/title_template.hpp"
#include "trace/step_reporter.hpp"
#include "trace/call_tracer.hpp"
#include "trace/class_spec.hpp"
#include "trace/class_builder.hpp"
#include "trace/instrumentor.hpp"
