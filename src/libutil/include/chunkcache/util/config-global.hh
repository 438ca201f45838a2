#pragma once
///@file

#include "chunkcache/util/configuration.hh"

namespace chunkcache {

/**
 * The union of every `Config` registered with `Register`, so that a
 * configuration file or `--option` can set a setting without knowing
 * which library declares it.
 */
struct GlobalConfig : public AbstractConfig
{
    typedef std::vector<Config *> ConfigRegistrations;

    static ConfigRegistrations & configRegistrations()
    {
        static ConfigRegistrations configRegistrations;
        return configRegistrations;
    }

    bool set(const std::string & name, const std::string & value) override;

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const override;

    void resetOverridden() override;

    nlohmann::json toJSON() override;

    std::string toKeyValue() override;

    struct Register
    {
        Register(Config * config);
    };
};

extern GlobalConfig globalConfig;

} // namespace chunkcache
