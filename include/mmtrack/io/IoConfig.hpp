#pragma once

#include <asio.hpp>
#include <system_error>   // std::error_code

namespace mmtrack::io {

/**
 * @brief Centralises Asio aliases so higher-level code never includes Asio directly.
 *
 * Exposes `mmtrack::io::asio` as the standalone Asio namespace and the timer
 * and strand types the location poller schedules with.
 */
namespace asio = ::asio;

using steady_timer = asio::steady_timer;
using strand = asio::strand<asio::io_context::executor_type>;

} // namespace mmtrack::io
