#pragma once

#include <hyprutils/animation/AnimationManager.hpp>
#include <hyprutils/animation/AnimatedVariable.hpp>

#include "../../defines.hpp"
#include "../../helpers/AnimatedVariable.hpp"
#include "../../helpers/time/Timer.hpp"
#include "../../tabs/TabTypes.hpp"

// Animations are ticked by the host. frameTick() is meant to be called once per rendered frame,
// tick() advances every active variable unconditionally.
class CTabsAnimationManager : public Hyprutils::Animation::CAnimationManager {
  public:
    CTabsAnimationManager();

    void         tick();
    void         frameTick();
    virtual void scheduleTick();
    virtual void onTicked();

    bool         tickScheduled() const;

    using SAnimationPropertyConfig = Hyprutils::Animation::SAnimationPropertyConfig;
    template <Animable VarType>
    void createAnimation(const VarType& v, PHLANIMVAR<VarType>& pav, SP<SAnimationPropertyConfig> pConfig, eAVarDamagePolicy policy) {
        constexpr const eAnimatedVarType EAVTYPE = typeToeAnimatedVarType<VarType>;
        const auto                       PAV     = makeShared<CAnimatedVariable<VarType>>();

        PAV->create(EAVTYPE, static_cast<Hyprutils::Animation::CAnimationManager*>(this), PAV, v);
        PAV->setConfig(pConfig);
        PAV->m_Context.eDamagePolicy = policy;

        pav = std::move(PAV);
    }

    template <Animable VarType>
    void createAnimation(const VarType& v, PHLANIMVAR<VarType>& pav, SP<SAnimationPropertyConfig> pConfig, PHLPAGE pPage, eAVarDamagePolicy policy) {
        createAnimation(v, pav, pConfig, policy);
        pav->m_Context.pPage = pPage;
    }
    template <Animable VarType>
    void createAnimation(const VarType& v, PHLANIMVAR<VarType>& pav, SP<SAnimationPropertyConfig> pConfig, PHLBAR pBar, eAVarDamagePolicy policy) {
        createAnimation(v, pav, pConfig, policy);
        pav->m_Context.pBar = pBar;
    }

    std::string styleValidInConfigVar(const std::string&, const std::string&);

  private:
    bool   m_tickScheduled = false;
    bool   m_lastTickValid = false;
    CTimer m_lastTickTimer;
};

inline UP<CTabsAnimationManager> g_pAnimationManager;
