#pragma once
#include "mmtrack/io/IoConfig.hpp"
#include <memory>
#include <thread>

namespace mmtrack::io {

/**
 * @brief Owns an `asio::io_context` and the thread that runs it.
 *
 * Location pollers post their blocking vendor reads here so callers never
 * block on the hardware. Pollers must be destroyed before the service.
 */
class IoService {
public:
    IoService();
    ~IoService();

    IoService(const IoService&) = delete;
    IoService& operator=(const IoService&) = delete;

    std::shared_ptr<asio::io_context> context() const { return context_; }

private:
    std::shared_ptr<asio::io_context> context_;
    asio::executor_work_guard<asio::io_context::executor_type> guard_;
    std::thread runner_;
};

/// Context of the process-wide service, started on first use.
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace mmtrack::io
