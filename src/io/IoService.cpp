#include "mmtrack/io/IoService.hpp"
#include "mmtrack/log/Log.hpp"

namespace mmtrack::io {

IoService::IoService()
: context_(std::make_shared<asio::io_context>())
, guard_(asio::make_work_guard(*context_))
, runner_([context = context_] { context->run(); })
{
    logInfo("[IoService] I/O thread started\n");
}

IoService::~IoService() {
    guard_.reset();
    context_->stop();
    if (runner_.joinable()) {
        runner_.join();
    }
}

std::shared_ptr<asio::io_context> shared_io_context() {
    static IoService service;
    return service.context();
}

} // namespace mmtrack::io
