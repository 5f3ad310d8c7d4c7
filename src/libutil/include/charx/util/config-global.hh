#pragma once
///@file

#include "charx/util/configuration.hh"

#include <vector>

namespace charx {

/**
 * The union of every `Config` registered with `Register`, which is
 * what `--option` and `$CHARX_CONF` act on.
 */
struct GlobalConfig : public AbstractConfig
{
    static std::vector<Config *> & configRegistrations();

    /**
     * Sets `name` on the first registered config that knows it.
     */
    bool set(const std::string & name, const std::string & value) override;

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const override;

    void resetOverridden() override;

    nlohmann::json toJSON() const override;

    struct Register
    {
        Register(Config * config);
    };
};

extern GlobalConfig globalConfig;

/**
 * Apply the configuration file named by `$CHARX_CONF`, if set.
 *
 * @throws UsageError if the variable names a file that does not exist.
 */
void loadConfFile(AbstractConfig & config = globalConfig);

} // namespace charx
