#include "charx/util/config-global.hh"
#include "charx/util/file-system.hh"

#include <cstdlib>

#include <nlohmann/json.hpp>

namespace charx {

std::vector<Config *> & GlobalConfig::configRegistrations()
{
    static std::vector<Config *> registrations;
    return registrations;
}

GlobalConfig::Register::Register(Config * config)
{
    configRegistrations().push_back(config);
}

bool GlobalConfig::set(const std::string & name, const std::string & value)
{
    for (auto config : configRegistrations())
        if (config->set(name, value))
            return true;
    return false;
}

void GlobalConfig::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly) const
{
    for (auto config : configRegistrations())
        config->getSettings(res, overriddenOnly);
}

void GlobalConfig::resetOverridden()
{
    for (auto config : configRegistrations())
        config->resetOverridden();
}

nlohmann::json GlobalConfig::toJSON() const
{
    auto res = nlohmann::json::object();
    for (auto config : configRegistrations())
        res.update(config->toJSON());
    return res;
}

GlobalConfig globalConfig;

void loadConfFile(AbstractConfig & config)
{
    auto conf = getenv("CHARX_CONF");
    if (!conf || !*conf)
        return;
    if (!pathExists(conf))
        throw UsageError("configuration file '%s' (from $CHARX_CONF) does not exist", conf);
    config.applyConfig(readFile(conf), conf);
}

} // namespace charx
