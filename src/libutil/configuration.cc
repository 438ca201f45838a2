#include "chunkcache/util/configuration.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/strings.hh"
#include "chunkcache/util/util.hh"

#include <nlohmann/json.hpp>

#include <type_traits>

namespace chunkcache {

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = byName.find(name);
    if (i != byName.end()) {
        i->second->set(value, false);
        i->second->overridden = true;
        return true;
    }

    if (hasPrefix(name, "extra-")) {
        i = byName.find(name.substr(6));
        if (i != byName.end() && i->second->isAppendable()) {
            i->second->set(value, true);
            i->second->overridden = true;
            return true;
        }
    }

    return false;
}

void Config::addSetting(AbstractSetting * setting)
{
    byName.emplace(setting->name, setting);

    if (auto i = unknownSettings.find(setting->name); i != unknownSettings.end()) {
        setting->set(i->second, false);
        setting->overridden = true;
        unknownSettings.erase(i);
    }
}

void Config::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly) const
{
    for (auto & [name, setting] : byName)
        if (!overriddenOnly || setting->overridden)
            res.emplace(name, SettingInfo{setting->to_string(), setting->description});
}

void Config::resetOverridden()
{
    for (auto & [name, setting] : byName)
        setting->overridden = false;
}

nlohmann::json Config::toJSON()
{
    auto res = nlohmann::json::object();
    for (auto & [name, setting] : byName)
        res.emplace(name, setting->toJSON());
    return res;
}

std::string Config::toKeyValue()
{
    std::string res;
    for (auto & [name, setting] : byName)
        res += fmt("%s = %s\n", name, setting->to_string());
    return res;
}

void AbstractConfig::warnUnknownSettings()
{
    for (auto & [name, value] : unknownSettings)
        warn("unknown setting '%s'", name);
}

void AbstractConfig::reapplyUnknownSettings()
{
    auto pending = std::move(unknownSettings);
    unknownSettings = {};
    for (auto & [name, value] : pending)
        set(name, value);
}

typedef std::vector<std::pair<std::string, std::string>> Assignments;

/* Collect the assignments of a configuration file, following
   `include` (an error if missing) and `!include` (skipped if missing)
   relative to the including file. */
static void parseConfigFile(const std::string & contents, const std::string & path, Assignments & res)
{
    auto syntaxError = [&](const std::string & line) {
        return UsageError("syntax error in configuration line '%1%' in '%2%'", line, path);
    };

    for (auto & rawLine : tokenizeString<std::vector<std::string>>(contents, "\n")) {
        auto line = rawLine.substr(0, rawLine.find('#'));

        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty())
            continue;

        if (tokens[0] == "include" || tokens[0] == "!include") {
            if (tokens.size() != 2)
                throw syntaxError(line);
            auto included = absPath(tokens[1], dirOf(path));
            if (pathExists(included))
                parseConfigFile(readFile(included), included, res);
            else if (tokens[0] == "include")
                throw Error("file '%1%' included from '%2%' not found", included, path);
            continue;
        }

        if (tokens.size() < 2 || tokens[1] != "=")
            throw syntaxError(line);

        res.emplace_back(tokens[0], concatStringsSep(" ", Strings(tokens.begin() + 2, tokens.end())));
    }
}

void AbstractConfig::applyConfig(const std::string & contents, const std::string & path)
{
    Assignments assignments;
    parseConfigFile(contents, path, assignments);

    for (auto & [name, value] : assignments)
        if (!set(name, value))
            unknownSettings.emplace(name, value);
}

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description)
    : name(name)
    , description(stripIndentation(description))
{
}

template<typename T>
T Setting<T>::parse(const std::string & str) const
{
    if constexpr (std::is_same_v<T, bool>) {
        if (str == "true" || str == "yes" || str == "1")
            return true;
        if (str == "false" || str == "no" || str == "0")
            return false;
        throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
    } else if constexpr (std::is_integral_v<T>) {
        try {
            return string2IntWithUnitPrefix<T>(str);
        } catch (UsageError &) {
            throw UsageError("setting '%s' has invalid value '%s'", name, str);
        }
    } else if constexpr (std::is_same_v<T, Strings>)
        return tokenizeString<Strings>(str);
    else
        return str;
}

template<typename T>
void Setting<T>::set(const std::string & str, bool append)
{
    auto parsed = parse(str);
    if constexpr (std::is_same_v<T, Strings>) {
        if (!append)
            value.clear();
        value.splice(value.end(), parsed);
    } else
        value = std::move(parsed);
}

template<typename T>
bool Setting<T>::isAppendable() const
{
    return std::is_same_v<T, Strings>;
}

template<typename T>
std::string Setting<T>::to_string() const
{
    if constexpr (std::is_same_v<T, bool>)
        return value ? "true" : "false";
    else if constexpr (std::is_integral_v<T>)
        return std::to_string(value);
    else if constexpr (std::is_same_v<T, Strings>)
        return concatStringsSep(" ", value);
    else
        return value;
}

template<typename T>
nlohmann::json Setting<T>::toJSON() const
{
    return {
        {"value", value},
        {"defaultValue", defaultValue},
        {"description", description},
    };
}

template class Setting<int>;
template class Setting<unsigned int>;
template class Setting<unsigned long>;
template class Setting<unsigned long long>;
template class Setting<bool>;
template class Setting<std::string>;
template class Setting<Strings>;

Path PathSetting::parse(const std::string & str) const
{
    if (str.empty())
        throw UsageError("setting '%s' is a path and paths cannot be empty", name);
    return canonPath(str);
}

} // namespace chunkcache
