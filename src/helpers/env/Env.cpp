#include "Env.hpp"

#include <cstdlib>

std::optional<std::string> Env::envString(const std::string& env) {
    const auto RET = getenv(env.c_str());
    if (!RET || RET[0] == '\0')
        return std::nullopt;

    return std::string{RET};
}

bool Env::envEnabled(const std::string& env) {
    const auto VAL = envString(env);

    return VAL.has_value() && *VAL != "0";
}

bool Env::isTrace() {
    static bool TRACE = envEnabled("HYPRTABS_TRACE");
    return TRACE;
}

std::optional<std::string> Env::configPathOverride() {
    // not cached, tests switch it between managers
    return envString("HYPRTABS_CONFIG");
}
