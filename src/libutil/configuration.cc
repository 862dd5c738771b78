#include "papercache/util/configuration.hh"
#include "papercache/util/file-system.hh"
#include "papercache/util/logging.hh"
#include "papercache/util/strings.hh"

#include <vector>

#include <nlohmann/json.hpp>

namespace papercache {

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = settings.find(name);
    if (i == settings.end()) {
        unknownSettings.insert_or_assign(name, value);
        return false;
    }
    i->second.setting->set(value);
    i->second.setting->overridden = true;
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    settings.emplace(setting->name, SettingData{false, setting});
    for (auto & alias : setting->aliases)
        settings.emplace(alias, SettingData{true, setting});

    /* A value may have been read before the setting existed. The
       canonical name wins over aliases. */
    std::optional<std::string> pending;
    for (auto & alias : setting->aliases)
        if (auto i = unknownSettings.find(alias); i != unknownSettings.end()) {
            if (!pending)
                pending = i->second;
            unknownSettings.erase(i);
        }
    if (auto i = unknownSettings.find(setting->name); i != unknownSettings.end()) {
        pending = i->second;
        unknownSettings.erase(i);
    }

    if (pending) {
        setting->set(*pending);
        setting->overridden = true;
    }
}

void Config::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly) const
{
    for (auto & [name, data] : settings) {
        if (data.isAlias || (overriddenOnly && !data.setting->overridden))
            continue;
        res.emplace(name, SettingInfo{data.setting->to_string(), data.setting->description});
    }
}

typedef std::vector<std::pair<std::string, std::string>> Assignments;

static void parseConfig(const std::string & contents, const std::filesystem::path & path, Assignments & res)
{
    auto syntaxError = [&](const std::string & line) {
        return UsageError("syntax error in configuration line '%s' in '%s'", line, path.string());
    };

    for (auto & fullLine : tokenizeString<std::vector<std::string>>(contents, "\n")) {
        auto line = fullLine.substr(0, fullLine.find('#'));

        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty())
            continue;

        if (tokens[0] == "include" || tokens[0] == "!include") {
            if (tokens.size() != 2)
                throw syntaxError(line);
            std::filesystem::path included = tokens[1];
            if (included.is_relative())
                included = path.parent_path() / included;
            if (pathExists(included))
                parseConfig(readFile(included), included, res);
            else if (tokens[0] == "include")
                throw Error("file '%s' included from '%s' not found", included.string(), path.string());
            continue;
        }

        if (tokens.size() < 2 || tokens[1] != "=")
            throw syntaxError(line);

        res.emplace_back(tokens[0], concatStringsSep(" ", std::vector<std::string>(tokens.begin() + 2, tokens.end())));
    }
}

void Config::applyConfig(const std::string & contents, const std::string & path)
{
    Assignments assignments;
    parseConfig(contents, path, assignments);

    /* Nothing is applied unless the whole file parsed. */
    for (auto & [name, value] : assignments)
        set(name, value);
}

void Config::warnUnknownSettings() const
{
    for (auto & [name, value] : unknownSettings)
        warn("unknown setting '%s'", name);
}

nlohmann::json Config::toJSON() const
{
    auto res = nlohmann::json::object();
    for (auto & [name, data] : settings)
        if (!data.isAlias)
            res[name] = data.setting->toJSON();
    return res;
}

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description, const StringSet & aliases)
    : name(name)
    , description(trim(description))
    , aliases(aliases)
{
}

nlohmann::json AbstractSetting::toJSON() const
{
    return {
        {"description", description},
        {"aliases", aliases},
    };
}

template<typename T>
void BaseSetting<T>::set(const std::string & str)
{
    value = parse(str);
}

template<typename T>
T BaseSetting<T>::parse(const std::string & str) const
{
    static_assert(std::is_integral_v<T>, "no parser for this setting type");

    try {
        return string2IntWithUnitPrefix<T>(str);
    } catch (UsageError &) {
        throw UsageError("setting '%s' has invalid value '%s'", name, str);
    }
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    return std::to_string(value);
}

template<typename T>
nlohmann::json BaseSetting<T>::toJSON() const
{
    auto res = AbstractSetting::toJSON();
    res["value"] = value;
    res["defaultValue"] = defaultValue;
    return res;
}

template<>
std::string BaseSetting<std::string>::parse(const std::string & str) const
{
    return str;
}

template<>
std::string BaseSetting<std::string>::to_string() const
{
    return value;
}

template<>
bool BaseSetting<bool>::parse(const std::string & str) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    if (str == "false" || str == "no" || str == "0")
        return false;
    throw UsageError("boolean setting '%s' has invalid value '%s'", name, str);
}

template<>
std::string BaseSetting<bool>::to_string() const
{
    return value ? "true" : "false";
}

template class BaseSetting<int>;
template class BaseSetting<unsigned int>;
template class BaseSetting<long>;
template class BaseSetting<unsigned long>;
template class BaseSetting<bool>;
template class BaseSetting<std::string>;

PathSetting::PathSetting(
    Config * options,
    const Path & def,
    const std::string & name,
    const std::string & description,
    const StringSet & aliases)
    : BaseSetting<Path>(def, name, description, aliases)
{
    options->addSetting(this);
}

Path PathSetting::parse(const std::string & str) const
{
    if (str.empty())
        throw UsageError("setting '%s' is a path and cannot be empty", name);
    auto p = std::filesystem::absolute(str).lexically_normal();
    /* "/foo/bar/" normalises to "/foo/bar/"; drop the empty last component. */
    if (!p.has_filename() && p != p.root_path())
        p = p.parent_path();
    return p.string();
}

} // namespace papercache
