#include "Logger.hpp"

#include "../../macros.hpp"
#include "../../config/ConfigManager.hpp"
#include "../../config/ConfigValue.hpp"

using namespace Log;

CLogger::CLogger() {
    const auto IS_TRACE = Env::isTrace();
    m_logger.setLogLevel(IS_TRACE ? Hyprutils::CLI::LOG_TRACE : Hyprutils::CLI::LOG_DEBUG);
    m_logger.setEnableStdout(true);
    m_logger.setTime(false);
    // hosts show the tail of this when a switch misbehaves
    m_logger.setEnableRolling(true);
}

void CLogger::log(Hyprutils::CLI::eLogLevel level, const std::string_view& str) {
    static bool TRACE = Env::isTrace();

    if (!m_logsEnabled)
        return;

    if (level == Hyprutils::CLI::LOG_TRACE && !TRACE)
        return;

    m_logger.log(level, str);
}

void CLogger::initCallbacks() {
    if (!g_pConfigManager)
        return;

    m_configReloaded = g_pConfigManager->m_events.reloaded.listen([this] { recheckCfg(); });
    recheckCfg();
}

void CLogger::recheckCfg() {
    static auto PDISABLELOGS  = CConfigValue<Hyprlang::INT>("debug:disable_logs");
    static auto PDISABLETIME  = CConfigValue<Hyprlang::INT>("debug:disable_time");
    static auto PENABLESTDOUT = CConfigValue<Hyprlang::INT>("debug:enable_stdout_logs");
    static auto PENABLECOLOR  = CConfigValue<Hyprlang::INT>("debug:colored_stdout_logs");

    m_logger.setEnableStdout(!*PDISABLELOGS && *PENABLESTDOUT);
    m_logsEnabled = !*PDISABLELOGS;
    m_logger.setTime(!*PDISABLETIME);
    m_logger.setEnableColor(*PENABLECOLOR);
}

const std::string& CLogger::rolling() {
    return m_logger.rollingLog();
}
