#include "common/errors.hpp"

#include <utility>

namespace infocode {

namespace {
std::string describe_missing(const std::set<std::string>& symbols) {
    std::string msg = "encode: missing symbols {";
    bool first = true;
    for (const auto& s : symbols) {
        if (!first) msg += ", ";
        msg += "'" + s + "'";
        first = false;
    }
    msg += "}";
    return msg;
}
} // namespace

MissingSymbol::MissingSymbol(std::set<std::string> symbols)
    : std::runtime_error(describe_missing(symbols)), symbols_(std::move(symbols)) {}

} // namespace infocode
