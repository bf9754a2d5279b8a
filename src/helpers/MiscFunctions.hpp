#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

std::expected<int64_t, std::string> configStringToInt(const std::string&);
std::optional<float>                configStringToFloat(const std::string&);
