#include "castlink/cast/DeviceRecord.hpp"

#include <cerrno>
#include <cstdlib>
#include <map>
#include <system_error>
#include <utility>

namespace castlink::cast {

using castlink::unexpected;

namespace {

std::map<std::string, std::string> txtToMap(const std::vector<std::string>& txt) {
    std::map<std::string, std::string> result;
    for (const auto& entry : txt) {
        const auto eq = entry.find('=');
        if (eq == std::string::npos) {
            result[entry] = "";
        } else {
            result[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    return result;
}

bool parseUnsigned(const std::string& text, int base, unsigned long& out) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long value = std::strtoul(text.c_str(), &end, base);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

} // namespace

bool DeviceRecord::isValid() const {
    return !id.empty() && port != 0 && !addresses.empty();
}

DeviceRecord DeviceRecord::fromTxt(const std::vector<std::string>& txt,
                                   std::vector<net::asio::ip::address> addresses,
                                   unsigned short port) {
    DeviceRecord record;
    record.addresses = std::move(addresses);
    record.port = port;

    const auto tuples = txtToMap(txt);
    auto lookup = [&tuples](const char* key) -> std::string {
        auto it = tuples.find(key);
        return it == tuples.end() ? std::string{} : it->second;
    };

    record.id = lookup("id");
    record.friendlyName = lookup("fn");
    record.model = lookup("md");
    record.statusText = lookup("rs");

    unsigned long flag = 0;
    if (parseUnsigned(lookup("st"), 0, flag)) {
        record.statusFlag = static_cast<unsigned>(flag);
    }
    return record;
}

expected<unsigned short> parsePort(const std::string& text) {
    unsigned long value = 0;
    if (!parseUnsigned(text, 10, value)) {
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    if (value == 0 || value > 65535) {
        return unexpected(std::make_error_code(std::errc::result_out_of_range));
    }
    return static_cast<unsigned short>(value);
}

} // namespace castlink::cast
