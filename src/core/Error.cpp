#include "castlink/core/Error.hpp"

#include <sstream>
#include <utility>

namespace castlink {

namespace {

class CastlinkCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "castlink"; }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
            case errc::not_found:        return "no usable address";
            case errc::out_of_order:     return "operation out of order";
            case errc::protocol_decode:  return "malformed protocol frame";
            case errc::request_rejected: return "request rejected by receiver";
            case errc::invalid_record:   return "invalid device record";
        }
        return "unknown castlink error";
    }
};

} // namespace

const std::error_category& castlink_category() noexcept {
    static CastlinkCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), castlink_category()};
}

void ErrorList::append(std::string context, std::error_code code) {
    if (!code) {
        return;
    }
    entries.push_back(Entry{std::move(context), code});
}

std::error_code ErrorList::first() const {
    return entries.empty() ? std::error_code{} : entries.front().code;
}

std::string ErrorList::message() const {
    std::ostringstream os;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (i) os << "; ";
        os << entries[i].context << ": " << entries[i].code.message();
    }
    return os.str();
}

} // namespace castlink
