#include "ConfigManager.hpp"
#include "ConfigDescriptions.hpp"
#include "ConfigValue.hpp"
#include "../managers/animation/AnimationManager.hpp"
#include "../helpers/MiscFunctions.hpp"
#include "../helpers/env/Env.hpp"

#include <filesystem>
#include <stdexcept>

#include <hyprutils/path/Path.hpp>
#include <hyprutils/string/String.hpp>
#include <hyprutils/string/VarList.hpp>

using namespace Hyprutils::String;

static Hyprlang::CParseResult handleBezier(const char* c, const char* v) {
    const std::string      VALUE   = v;
    const std::string      COMMAND = c;

    const auto             RESULT = g_pConfigManager->handleBezier(COMMAND, VALUE);

    Hyprlang::CParseResult result;
    if (RESULT.has_value())
        result.setError(RESULT.value().c_str());
    return result;
}

static Hyprlang::CParseResult handleAnimation(const char* c, const char* v) {
    const std::string      VALUE   = v;
    const std::string      COMMAND = c;

    const auto             RESULT = g_pConfigManager->handleAnimation(COMMAND, VALUE);

    Hyprlang::CParseResult result;
    if (RESULT.has_value())
        result.setError(RESULT.value().c_str());
    return result;
}

Hyprlang::INT SConfigOptionDescription::defaultValue() const {
    if (const auto PBOOL = std::get_if<SBoolData>(&data))
        return PBOOL->value;

    return std::get<SRangeData>(data).value;
}

void CConfigManager::registerConfigVar(const char* name, const Hyprlang::INT& val) {
    m_configValueNumber++;
    m_config->addConfigValue(name, val);
}

CConfigManager::CConfigManager(const std::string& explicitPath) {
    m_mainConfigPath = findMainConfigPath(explicitPath);
    m_config = makeUnique<Hyprlang::CConfig>(m_mainConfigPath.c_str(), Hyprlang::SConfigOptions{.throwAllErrors = true, .allowMissingConfig = true});

    registerConfigVar("tabs:swipe_enabled", Hyprlang::INT{1});
    registerConfigVar("tabs:diagonal_swipe", Hyprlang::INT{0});
    registerConfigVar("tabs:edge_width", Hyprlang::INT{20});
    registerConfigVar("tabs:hide_bar_on_first_page", Hyprlang::INT{1});

    registerConfigVar("animations:enabled", Hyprlang::INT{1});

    registerConfigVar("debug:disable_logs", Hyprlang::INT{0});
    registerConfigVar("debug:disable_time", Hyprlang::INT{1});
    registerConfigVar("debug:enable_stdout_logs", Hyprlang::INT{1});
    registerConfigVar("debug:colored_stdout_logs", Hyprlang::INT{1});

    m_config->registerHandler(&::handleBezier, "bezier", {false});
    m_config->registerHandler(&::handleAnimation, "animation", {false});

    m_config->commence();

    resetConfig();

    if (CONFIG_OPTIONS.size() != m_configValueNumber)
        Log::logger->log(Log::WARN, "Warning: config descriptions have {} entries, but there are {} config values. This should fail tests!!", CONFIG_OPTIONS.size(),
                         m_configValueNumber);
}

std::string CConfigManager::findMainConfigPath(const std::string& explicitPath) {
    if (!explicitPath.empty())
        return explicitPath;

    if (const auto CFG_ENV = Env::configPathOverride(); CFG_ENV)
        return *CFG_ENV;

    const auto PATHS = Hyprutils::Path::findConfig(ISDEBUG ? "hyprtabsd" : "hyprtabs");
    if (PATHS.first.has_value())
        return PATHS.first.value();
    else if (PATHS.second.has_value())
        return Hyprutils::Path::fullConfigPath(PATHS.second.value(), ISDEBUG ? "hyprtabsd" : "hyprtabs");

    throw std::runtime_error("Neither HOME nor XDG_CONFIG_HOME are set in the environment. Could not find config in XDG_CONFIG_DIRS or /etc/xdg.");
}

const std::string& CConfigManager::getMainConfigPath() const {
    return m_mainConfigPath;
}

void CConfigManager::init() {
    Log::logger->initCallbacks();

    reload();
}

void CConfigManager::reload() {
    resetConfig();
    m_configCurrentPath                   = m_mainConfigPath;
    const auto ERR                        = m_config->parse();
    m_lastConfigVerificationWasSuccessful = !ERR.error;
    postConfigReload(ERR);
}

std::string CConfigManager::verify() {
    resetConfig();
    m_configCurrentPath                   = m_mainConfigPath;
    const auto ERR                        = m_config->parse();
    m_lastConfigVerificationWasSuccessful = !ERR.error;
    if (ERR.error)
        return ERR.getError();
    return "config ok";
}

void CConfigManager::setDefaultAnimationVars() {
    m_animationTree.createNode("global");

    // global
    m_animationTree.createNode("tabs", "global");
    m_animationTree.createNode("tabBar", "global");

    // tabs
    m_animationTree.createNode("tabsSwipe", "tabs");
    m_animationTree.createNode("tabsTap", "tabs");

    // init the root nodes
    m_animationTree.setConfigForNode("global", 1, 8.f, "default");
    m_animationTree.setConfigForNode("tabBar", 1, 3.f, "default");
}

void CConfigManager::resetConfig() {
    if (g_pAnimationManager) {
        g_pAnimationManager->removeAllBeziers();
        g_pAnimationManager->addBezierWithName("linear", Vector2D(0.0, 0.0), Vector2D(1.0, 1.0));
    }

    setDefaultAnimationVars(); // reset anims
}

void CConfigManager::postConfigReload(const Hyprlang::CParseResult& result) {
    m_configErrors = result.error ? result.getError() : "";

    if (result.error)
        Log::logger->log(Log::ERR, "Config has errors:\n{}", m_configErrors);
    else
        Log::logger->log(Log::DEBUG, "Config {} loaded", m_configCurrentPath);

    m_events.reloaded.emit();
}

std::string CConfigManager::parseKeyword(const std::string& COMMAND, const std::string& VALUE) {
    const auto RET = m_config->parseDynamic(COMMAND.c_str(), VALUE.c_str());

    // keyword changes affect everything that caches config, same as a reload does
    m_events.reloaded.emit();

    if (RET.error) {
        Log::logger->log(Log::WARN, "parseKeyword: {} = {} failed: {}", COMMAND, VALUE, RET.getError());
        return RET.getError();
    }

    return "";
}

Hyprlang::CConfigValue* CConfigManager::getHyprlangConfigValuePtr(const std::string& name) {
    return m_config->getConfigValuePtr(name.c_str());
}

const std::vector<SConfigOptionDescription>& CConfigManager::getAllDescriptions() {
    return CONFIG_OPTIONS;
}

const std::unordered_map<std::string, SP<Hyprutils::Animation::SAnimationPropertyConfig>>& CConfigManager::getAnimationConfig() {
    return m_animationTree.getFullConfig();
}

SP<Hyprutils::Animation::SAnimationPropertyConfig> CConfigManager::getAnimationPropertyConfig(const std::string& name) {
    return m_animationTree.getConfig(name);
}

std::optional<std::string> CConfigManager::handleBezier(const std::string& command, const std::string& args) {
    const auto  ARGS = CVarList(args);

    std::string bezierName = ARGS[0];

    if (bezierName.empty())
        return "bezier has no name";

    float points[4] = {0.F, 0.F, 0.F, 0.F};
    for (size_t i = 0; i < 4; ++i) {
        if (ARGS[i + 1].empty())
            return "too few arguments";

        const auto POINT = configStringToFloat(ARGS[i + 1]);
        if (!POINT)
            return "invalid bezier point " + ARGS[i + 1];

        points[i] = *POINT;
    }

    if (!ARGS[5].empty())
        return "too many arguments";

    g_pAnimationManager->addBezierWithName(bezierName, Vector2D(points[0], points[1]), Vector2D(points[2], points[3]));

    return {};
}

std::optional<std::string> CConfigManager::handleAnimation(const std::string& command, const std::string& args) {
    const auto ARGS = CVarList(args);

    // anim name
    const auto ANIMNAME = ARGS[0];

    if (!m_animationTree.nodeExists(ANIMNAME))
        return "no such animation";

    // This helper casts strings like "1", "true", "off", "yes"... to int.
    int64_t enabledInt = configStringToInt(ARGS[1]).value_or(0) == 1;

    if (!enabledInt) {
        m_animationTree.setConfigForNode(ANIMNAME, enabledInt, 1, "default");
        return {};
    }

    // speed
    const auto SPEED = configStringToFloat(ARGS[2]);
    if (!SPEED || *SPEED <= 0)
        return "invalid speed";

    std::string bezierName = ARGS[3];
    m_animationTree.setConfigForNode(ANIMNAME, enabledInt, *SPEED, ARGS[3], ARGS[4]);

    if (!g_pAnimationManager->bezierExists(bezierName)) {
        const auto PANIMNODE      = m_animationTree.getConfig(ANIMNAME);
        PANIMNODE->internalBezier = "default";
        return "no such bezier";
    }

    if (!ARGS[4].empty()) {
        auto ERR = g_pAnimationManager->styleValidInConfigVar(ANIMNAME, ARGS[4]);

        if (!ERR.empty())
            return ERR;
    }

    return {};
}
