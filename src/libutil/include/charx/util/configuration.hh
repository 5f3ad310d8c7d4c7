#pragma once
/**
 * @file
 *
 * Named settings. Each `Setting<T>` member registers itself with the
 * `Config` that owns it:
 *
 *     struct MySettings : Config
 *     {
 *         Setting<uint64_t> maxSize{this, 1024, "max-size", "The largest accepted size."};
 *     };
 *
 * and can then be set by name (`set("max-size", "2M")`), from
 * `name = value` lines (`applyConfig()`), or listed.
 *
 * Supported types are `std::string`, `bool`, `unsigned int` and
 * `uint64_t`; integers accept a `K`, `M`, `G` or `T` suffix.
 */

#include <map>

#include <nlohmann/json_fwd.hpp>

#include "charx/util/types.hh"

namespace charx {

class AbstractConfig
{
public:

    virtual ~AbstractConfig() = default;

    /**
     * @return false if no setting is called `name`.
     * @throws UsageError if `value` does not parse.
     */
    virtual bool set(const std::string & name, const std::string & value) = 0;

    struct SettingInfo
    {
        std::string value;
        std::string description;
    };

    /**
     * Add every setting (aliases excluded) to `res`, or only those that
     * were explicitly set since the last `resetOverridden()`.
     */
    virtual void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const = 0;

    virtual void resetOverridden() = 0;

    virtual nlohmann::json toJSON() const = 0;

    /**
     * Apply `name = value` lines. `#` starts a comment; names this
     * config does not know are ignored.
     *
     * @param path Used in error messages.
     * @throws UsageError on a malformed line.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    /**
     * All settings in the form read by `applyConfig()`.
     */
    std::string toKeyValue() const;
};

class AbstractSetting
{
public:

    const std::string name;
    const std::string description;
    const StringSet aliases;

    bool overridden = false;

    virtual ~AbstractSetting() = default;

    virtual void set(const std::string & str) = 0;

    virtual std::string to_string() const = 0;

    virtual nlohmann::json toJSON() const = 0;

protected:

    AbstractSetting(const std::string & name, const std::string & description, const StringSet & aliases);
};

class Config : public AbstractConfig
{
    struct Entry
    {
        bool isAlias;
        AbstractSetting * setting;
    };

    std::map<std::string, Entry> entries;

    /**
     * Values given before their setting was registered.
     */
    StringMap pending;

public:

    Config(StringMap initials = {})
        : pending(std::move(initials))
    {
    }

    bool set(const std::string & name, const std::string & value) override;

    void addSetting(AbstractSetting * setting);

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const override;

    void resetOverridden() override;

    nlohmann::json toJSON() const override;
};

template<typename T>
class Setting : public AbstractSetting
{
    T value;
    const T defaultValue;

public:

    Setting(
        Config * config,
        const T & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {})
        : AbstractSetting(name, description, aliases)
        , value(def)
        , defaultValue(def)
    {
        config->addSetting(this);
    }

    const T & get() const
    {
        return value;
    }

    operator const T &() const
    {
        return value;
    }

    void operator=(const T & v)
    {
        value = v;
    }

    /**
     * Set the value and mark it as explicitly given.
     */
    void override(const T & v)
    {
        value = v;
        overridden = true;
    }

    /**
     * @throws UsageError naming the setting if `str` is not a valid
     * `T`.
     */
    void set(const std::string & str) override;

    std::string to_string() const override;

    nlohmann::json toJSON() const override;
};

} // namespace charx
