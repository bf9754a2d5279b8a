#pragma once

#include <optional>
#include <string>

// hyprtabs reads a small set of HYPRTABS_* variables; everything else is config.
namespace Env {
    bool                       envEnabled(const std::string& env);
    std::optional<std::string> envString(const std::string& env);

    bool                       isTrace();
    std::optional<std::string> configPathOverride();
}
