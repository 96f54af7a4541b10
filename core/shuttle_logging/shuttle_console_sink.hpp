// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SHUTTLE_CONSOLE_SINK_HPP
#define SHUTTLE_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "shuttle_log_severity.hpp"

namespace shuttle {
namespace logging {

/**
 * Async console sink writing to std::clog.
 * Records are dropped when the queue is full so that upload workers never
 * block on terminal output.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * ANSI colour escape for a severity level.
 */
const char* severity_color(severity_level level);

/**
 * Create the console sink.
 *
 * @param min_level Minimum severity level to emit
 * @param use_colors Wrap the severity tag in ANSI colour codes
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

}  // namespace logging
}  // namespace shuttle

#endif  // SHUTTLE_CONSOLE_SINK_HPP
