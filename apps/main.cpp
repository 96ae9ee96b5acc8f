#include "castlink/cast/CastDevice.hpp"
#include "castlink/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace castlink;
using namespace std::chrono_literals;

namespace {

void usage() {
    std::cerr <<
        "usage: castctl [-t <timeout-ms>] <address>[:port] <command> [args]\n"
        "commands:\n"
        "  status\n"
        "  volume <0..1>\n"
        "  mute | unmute\n"
        "  launch <appId>\n"
        "  load <url> <mime-type>\n";
}

// Wakes the main thread whenever a merge changes the device.
struct ChangeWaiter {
    std::mutex m;
    std::condition_variable cv;

    void notify() {
        {
            std::lock_guard lock(m);
        }
        cv.notify_all();
    }

    template <typename Predicate>
    bool waitFor(std::chrono::milliseconds timeout, Predicate ready) {
        std::unique_lock lock(m);
        return cv.wait_for(lock, timeout, ready);
    }
};

bool report(const char* what, const expected<void>& result) {
    if (!result) {
        const auto err = result.error();
        std::cerr << what << " failed: " << err.message()
                  << " (" << err.category().name() << ":" << err.value() << ")\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    int first = 1;
    if (argc > 2 && std::string(argv[1]) == "-t") {
        net::TimeoutConfig::setConnectTimeout(std::chrono::milliseconds{std::atol(argv[2])});
        first = 3;
    }
    if (argc - first < 2) {
        usage();
        return 2;
    }

    std::string host = argv[first];
    unsigned short port = cast::config::CAST_PORT_DEFAULT;
    if (auto colon = host.rfind(':'); colon != std::string::npos && host.find(':') == colon) {
        auto parsed = cast::parsePort(host.substr(colon + 1));
        if (!parsed) {
            std::cerr << "bad port '" << host.substr(colon + 1) << "': " << parsed.error().message() << "\n";
            usage();
            return 2;
        }
        port = *parsed;
        host.erase(colon);
    }

    std::error_code ec;
    auto address = net::asio::ip::make_address(host, ec);
    if (ec) {
        std::cerr << "bad address '" << host << "': " << ec.message() << "\n";
        return 2;
    }

    const std::string command = argv[first + 1];
    std::vector<std::string> args(argv + first + 2, argv + argc);

    cast::DeviceRecord record;
    record.id = host;
    record.port = port;
    record.addresses = {address};

    auto created = cast::CastDevice::create(record);
    if (!created) {
        std::cerr << "invalid receiver: " << created.error().message() << "\n";
        return 2;
    }
    auto& device = **created;

    ChangeWaiter changes;
    device.setChangeHandler([&](const std::string&, cast::ChangeFlags) { changes.notify(); });

    auto errors = [](const cast::DeviceError& error) {
        std::cerr << "[" << error.deviceId << "] " << error.context << ": "
                  << error.code.message() << "\n";
    };

    if (!report("connect", device.connect(net::TimeoutConfig::connectTimeout(), errors))) {
        return 1;
    }

    bool ok = true;
    if (command == "status") {
        ok = report("status", device.updateStatus())
          && changes.waitFor(3s, [&]{ return device.volume() && device.app(); });
        std::cout << device.describe() << "\n";
    } else if (command == "volume" && args.size() == 1) {
        ok = report("volume", device.setVolumeLevel(std::strtof(args[0].c_str(), nullptr)));
    } else if (command == "mute" || command == "unmute") {
        ok = report(command.c_str(), device.setMuted(command == "mute"));
    } else if (command == "launch" && args.size() == 1) {
        ok = report("launch", device.launchApp(args[0]));
    } else if (command == "load" && args.size() == 2) {
        ok = report("status", device.updateStatus())
          && changes.waitFor(3s, [&]{ return device.app().has_value(); });
        if (ok && !device.app()->hasTransport()) {
            logInfo("[castctl] no app running, launching the default media receiver\n");
            ok = report("launch", device.launchApp(cast::config::CAST_DEFAULT_MEDIA_RECEIVER_APP_ID))
              && changes.waitFor(10s, [&]{
                     auto app = device.app();
                     return app && app->hasTransport();
                 });
        }
        if (ok) {
            ok = report("load", device.loadMedia(args[0], args[1], true));
            if (ok && changes.waitFor(5s, [&]{ return device.media().has_value(); })) {
                std::cout << device.media()->describe() << "\n";
            }
        }
    } else {
        usage();
        ok = false;
    }

    // Give fire-and-forget requests a moment on the wire before closing.
    std::this_thread::sleep_for(200ms);

    if (auto closed = device.disconnect(); !closed) {
        std::cerr << "disconnect: " << closed.error().message() << "\n";
    }
    return ok ? 0 : 1;
}
