#include "MiscFunctions.hpp"

#include <exception>

#include <hyprutils/string/String.hpp>

using namespace Hyprutils::String;

std::expected<int64_t, std::string> configStringToInt(const std::string& VALUE) {
    if (VALUE.starts_with("0x")) {
        // Values with 0x are hex
        try {
            size_t     position = 0;
            const auto RES      = std::stoll(VALUE.substr(2), &position, 16);
            if (position == VALUE.size() - 2)
                return RES;
        } catch (const std::exception&) {}
        return std::unexpected("invalid hex " + VALUE);
    } else if (VALUE.starts_with("true") || VALUE.starts_with("on") || VALUE.starts_with("yes")) {
        return 1;
    } else if (VALUE.starts_with("false") || VALUE.starts_with("off") || VALUE.starts_with("no")) {
        return 0;
    }

    if (VALUE.empty() || !isNumber(VALUE, false))
        return std::unexpected("cannot parse \"" + VALUE + "\" as an int.");

    try {
        const auto RES = std::stoll(VALUE);
        return RES;
    } catch (std::exception& e) { return std::unexpected(std::string{"stoll threw: "} + e.what()); }
}

std::optional<float> configStringToFloat(const std::string& VALUE) {
    const auto TRIMMED = trim(VALUE);

    if (TRIMMED.empty() || !isNumber(TRIMMED, true))
        return std::nullopt;

    try {
        return std::stof(TRIMMED);
    } catch (std::exception& e) { return std::nullopt; }
}
