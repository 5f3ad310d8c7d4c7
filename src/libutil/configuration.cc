#include "charx/util/configuration.hh"
#include "charx/util/util.hh"

#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace charx {

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description, const StringSet & aliases)
    : name(name)
    , description(trim(description))
    , aliases(aliases)
{
}

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = entries.find(name);
    if (i == entries.end())
        return false;
    i->second.setting->set(value);
    i->second.setting->overridden = true;
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    entries.emplace(setting->name, Entry{false, setting});
    for (auto & alias : setting->aliases)
        entries.emplace(alias, Entry{true, setting});

    /* An initial value given under the canonical name wins over one
       given under an alias. */
    std::optional<std::string> initial;
    for (auto & alias : setting->aliases)
        if (auto i = pending.find(alias); i != pending.end()) {
            initial = std::move(i->second);
            pending.erase(i);
        }
    if (auto i = pending.find(setting->name); i != pending.end()) {
        initial = std::move(i->second);
        pending.erase(i);
    }

    if (initial) {
        setting->set(*initial);
        setting->overridden = true;
    }
}

void Config::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly) const
{
    for (auto & [name, entry] : entries)
        if (!entry.isAlias && (!overriddenOnly || entry.setting->overridden))
            res.emplace(name, SettingInfo{entry.setting->to_string(), entry.setting->description});
}

void Config::resetOverridden()
{
    for (auto & [_, entry] : entries)
        entry.setting->overridden = false;
}

nlohmann::json Config::toJSON() const
{
    auto res = nlohmann::json::object();
    for (auto & [name, entry] : entries)
        if (!entry.isAlias)
            res.emplace(name, entry.setting->toJSON());
    return res;
}

void AbstractConfig::applyConfig(const std::string & contents, const std::string & path)
{
    std::string_view rest = contents;
    while (!rest.empty()) {
        auto eol = rest.find('\n');
        auto line = rest.substr(0, eol);
        rest.remove_prefix(eol == rest.npos ? rest.size() : eol + 1);

        line = line.substr(0, line.find('#'));
        auto stripped = trim(line);
        if (stripped.empty())
            continue;

        /* `name = value`, with whitespace around the `=`. */
        auto nameEnd = stripped.find_first_of(" \t");
        auto assignment = nameEnd == stripped.npos ? std::string() : trim(stripped.substr(nameEnd));
        if (assignment.empty() || assignment[0] != '='
            || (assignment.size() > 1 && !std::isspace((unsigned char) assignment[1])))
            throw UsageError("syntax error in configuration line '%1%' in '%2%'", stripped, path);

        set(stripped.substr(0, nameEnd), trim(assignment.substr(1)));
    }
}

std::string AbstractConfig::toKeyValue() const
{
    std::map<std::string, SettingInfo> settings;
    getSettings(settings);
    std::string res;
    for (auto & [name, info] : settings)
        res += fmt("%s = %s\n", name, info.value);
    return res;
}

template<typename T>
static T parseValue(const std::string & name, const std::string & str)
{
    if constexpr (std::is_same_v<T, std::string>)
        return str;
    else if constexpr (std::is_same_v<T, bool>) {
        if (str == "true" || str == "yes" || str == "1")
            return true;
        if (str == "false" || str == "no" || str == "0")
            return false;
        throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
    } else {
        try {
            return string2IntWithUnitPrefix<T>(str);
        } catch (UsageError &) {
            throw UsageError("setting '%s' has invalid value '%s'", name, str);
        }
    }
}

template<typename T>
void Setting<T>::set(const std::string & str)
{
    value = parseValue<T>(name, str);
}

template<typename T>
std::string Setting<T>::to_string() const
{
    if constexpr (std::is_same_v<T, std::string>)
        return value;
    else if constexpr (std::is_same_v<T, bool>)
        return value ? "true" : "false";
    else
        return std::to_string(value);
}

template<typename T>
nlohmann::json Setting<T>::toJSON() const
{
    return {
        {"value", value},
        {"defaultValue", defaultValue},
        {"description", description},
        {"aliases", aliases},
    };
}

template class Setting<std::string>;
template class Setting<bool>;
template class Setting<unsigned int>;
template class Setting<uint64_t>;

} // namespace charx
