#include "castlink/net/NetService.hpp"
#include "castlink/log/Log.hpp"

#include <exception>

namespace castlink::net {

namespace {
NetService& static_service() {
    static NetService service;
    return service;
}
} // namespace

NetService::NetService()
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
, t_([this]{ run(); })
{
    logDebug("[NetService] I/O thread started\n");
}

NetService::~NetService() {
    work_guard_.reset();
    io_->stop();
    if (t_.joinable()) t_.join();
}

// Handler exceptions are logged; the loop keeps running until stop().
void NetService::run() {
    for (;;) {
        try {
            io_->run();
            return;
        } catch (const std::exception& e) {
            logError("[NetService] handler threw: ", e.what(), "\n");
        }
    }
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return static_service().io();
}

} // namespace castlink::net
