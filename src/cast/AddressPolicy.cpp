#include "castlink/cast/AddressPolicy.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <random>

namespace castlink::cast {

AddressPolicy firstAddress() {
    return [](const std::vector<net::asio::ip::address>&) -> std::size_t {
        return 0;
    };
}

AddressPolicy randomAddress() {
    struct Generator {
        std::mutex m;
        std::mt19937 engine{std::random_device{}()};
    };
    auto gen = std::make_shared<Generator>();
    return [gen](const std::vector<net::asio::ip::address>& candidates) -> std::size_t {
        if (candidates.size() < 2) {
            return 0;
        }
        std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
        std::lock_guard lock(gen->m);
        return pick(gen->engine);
    };
}

AddressPolicy roundRobin() {
    auto next = std::make_shared<std::atomic<std::size_t>>(0);
    return [next](const std::vector<net::asio::ip::address>& candidates) -> std::size_t {
        if (candidates.empty()) {
            return 0;
        }
        return next->fetch_add(1) % candidates.size();
    };
}

} // namespace castlink::cast
