#pragma once

#include <hyprutils/animation/AnimationConfig.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "../defines.hpp"

#include <hyprlang.hpp>

enum eConfigOptionType : uint8_t {
    CONFIG_OPTION_BOOL = 0,
    CONFIG_OPTION_INT  = 1, /* e.g. 0/1/2*/
};

struct SConfigOptionDescription {

    struct SBoolData {
        bool value = false;
    };

    struct SRangeData {
        int value = 0, min = 0, max = 2;
    };

    std::string                           value; // e.g. tabs:swipe_enabled
    std::string                           description;
    eConfigOptionType                     type = CONFIG_OPTION_BOOL;

    std::variant<SBoolData, SRangeData>   data;

    Hyprlang::INT                         defaultValue() const;
};

class CConfigManager {
  public:
    CConfigManager(const std::string& explicitPath = "");

    void                                                                                       init();
    void                                                                                       reload();
    std::string                                                                                verify();

    Hyprlang::CConfigValue*                                                                    getHyprlangConfigValuePtr(const std::string& name);
    const std::string&                                                                         getMainConfigPath() const;

    const std::vector<SConfigOptionDescription>&                                               getAllDescriptions();
    const std::unordered_map<std::string, SP<Hyprutils::Animation::SAnimationPropertyConfig>>& getAnimationConfig();

    // runtime overrides, same syntax as the config file
    std::string                                        parseKeyword(const std::string&, const std::string&);

    SP<Hyprutils::Animation::SAnimationPropertyConfig> getAnimationPropertyConfig(const std::string&);

    // keywords
    std::optional<std::string> handleBezier(const std::string&, const std::string&);
    std::optional<std::string> handleAnimation(const std::string&, const std::string&);

    std::string                m_configCurrentPath;

    bool                       m_lastConfigVerificationWasSuccessful = true;

    struct {
        CSignalT<> reloaded;
    } m_events;

  private:
    UP<Hyprlang::CConfig>                      m_config;

    std::string                                m_mainConfigPath;

    Hyprutils::Animation::CAnimationConfigTree m_animationTree;

    std::string                                m_configErrors = "";

    uint32_t                                   m_configValueNumber = 0;

    // internal methods
    void        setDefaultAnimationVars();
    void        resetConfig();
    void        postConfigReload(const Hyprlang::CParseResult& result);
    std::string findMainConfigPath(const std::string& explicitPath);

    void        registerConfigVar(const char* name, const Hyprlang::INT& val);
};

inline UP<CConfigManager> g_pConfigManager;
