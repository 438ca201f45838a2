#include "chunkcache/util/config-global.hh"
#include "chunkcache/util/fmt.hh"

#include <nlohmann/json.hpp>

namespace chunkcache {

GlobalConfig globalConfig;

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

nlohmann::json GlobalConfig::toJSON()
{
    nlohmann::json res = nlohmann::json::object();
    for (auto config : configRegistrations())
        res.merge_patch(config->toJSON());
    return res;
}

std::string GlobalConfig::toKeyValue()
{
    /* Sorted across all registered configs, not per config. */
    std::map<std::string, SettingInfo> all;
    getSettings(all);

    std::string res;
    for (auto & [name, info] : all)
        res += fmt("%s = %s\n", name, info.value);
    return res;
}

} // namespace chunkcache
