#include "sightline/cli.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace sl {
namespace {

void require_consumed(const std::string& text, std::size_t pos) {
    if (pos != text.size()) {
        throw std::invalid_argument("trailing characters in number: " + text);
    }
}

} // namespace

int parse_int(const std::string& text) {
    std::size_t pos = 0;
    const int value = std::stoi(text, &pos);
    require_consumed(text, pos);
    return value;
}

std::uint64_t parse_u64(const std::string& text) {
    if (text.find('-') != std::string::npos) {
        throw std::invalid_argument("negative value for unsigned number: " + text);
    }
    std::size_t pos = 0;
    const unsigned long long value = std::stoull(text, &pos);
    require_consumed(text, pos);
    return static_cast<std::uint64_t>(value);
}

std::optional<Circle> parse_circle(const std::string& text) {
    std::istringstream iss(text);
    double values[3] = {0.0, 0.0, 0.0};
    for (int i = 0; i < 3; ++i) {
        if (!(iss >> values[i])) {
            return std::nullopt;
        }
        if (i < 2) {
            char comma = 0;
            if (!(iss >> comma) || comma != ',') {
                return std::nullopt;
            }
        }
    }
    iss >> std::ws;
    if (!iss.eof() || values[2] < 0.0 || !std::isfinite(values[0]) || !std::isfinite(values[1]) ||
        !std::isfinite(values[2])) {
        return std::nullopt;
    }
    return Circle{{values[0], values[1]}, values[2]};
}

} // namespace sl
