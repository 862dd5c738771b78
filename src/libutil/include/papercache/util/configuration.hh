#pragma once
///@file

#include "papercache/util/types.hh"

#include <map>

#include <nlohmann/json_fwd.hpp>

namespace papercache {

class AbstractSetting;

/**
 * A collection of named, typed settings, filled from `name = value`
 * text such as `papercache.conf`.
 *
 * Settings register themselves with the object that owns them:
 *
 *   struct MySettings : Config
 *   {
 *       Setting<unsigned int> lockTimeout{this, 30, "lock-timeout", "Seconds to wait."};
 *   };
 *
 * A name no setting claims is remembered rather than rejected, and is
 * applied if a setting of that name registers later.
 */
class Config
{
public:

    struct SettingInfo
    {
        std::string value;
        std::string description;
    };

    Config() = default;

    /* Settings keep a pointer to their owner. */
    Config(const Config &) = delete;
    Config & operator=(const Config &) = delete;

    virtual ~Config() = default;

    /**
     * Set the setting called `name` (or one of its aliases) from its
     * textual form.
     *
     * @return false if there is no such setting.
     */
    bool set(const std::string & name, const std::string & value);

    void addSetting(AbstractSetting * setting);

    /**
     * Fill `res` with the value and description of every setting,
     * keyed by name. Aliases are not listed.
     */
    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const;

    /**
     * Apply the settings in `contents`, which is in `papercache.conf`
     * syntax: one `name = value` per line, `#` comments, and
     * `include <file>` / `!include <file>` directives. Relative includes
     * are resolved against the directory of `path`; a missing file is
     * an error for `include` only.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    /**
     * Warn about every name that was set but never claimed.
     */
    void warnUnknownSettings() const;

    nlohmann::json toJSON() const;

private:

    struct SettingData
    {
        bool isAlias;
        AbstractSetting * setting;
    };

    std::map<std::string, SettingData> settings;

    StringMap unknownSettings;
};

class AbstractSetting
{
public:

    const std::string name;

    /**
     * With surrounding whitespace removed, so it can be written as an
     * indented raw string.
     */
    const std::string description;

    const StringSet aliases;

    bool overridden = false;

    virtual void set(const std::string & str) = 0;

    virtual std::string to_string() const = 0;

    virtual nlohmann::json toJSON() const;

protected:

    AbstractSetting(const std::string & name, const std::string & description, const StringSet & aliases);

    virtual ~AbstractSetting() = default;
};

/**
 * A setting holding a `T`. Instantiated in `configuration.cc` for
 * `std::string`, `bool` and the integer types.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;
    const T defaultValue;

    virtual T parse(const std::string & str) const;

public:

    BaseSetting(const T & def, const std::string & name, const std::string & description, const StringSet & aliases)
        : AbstractSetting(name, description, aliases)
        , value(def)
        , defaultValue(def)
    {
    }

    operator const T &() const
    {
        return value;
    }

    const T & get() const
    {
        return value;
    }

    template<typename U>
    void operator=(const U & v)
    {
        assign(v);
    }

    virtual void assign(const T & v)
    {
        value = v;
    }

    /**
     * Like `assign()`, but also marks the setting as changed from its
     * default, as reading it from a file does.
     */
    void override(const T & v)
    {
        overridden = true;
        assign(v);
    }

    void set(const std::string & str) override final;

    std::string to_string() const override;

    nlohmann::json toJSON() const override;
};

template<>
std::string BaseSetting<std::string>::parse(const std::string & str) const;
template<>
std::string BaseSetting<std::string>::to_string() const;
template<>
bool BaseSetting<bool>::parse(const std::string & str) const;
template<>
std::string BaseSetting<bool>::to_string() const;

template<typename T>
class Setting : public BaseSetting<T>
{
public:

    Setting(
        Config * options,
        const T & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {})
        : BaseSetting<T>(def, name, description, aliases)
    {
        options->addSetting(this);
    }

    void operator=(const T & v)
    {
        this->assign(v);
    }
};

/**
 * A directory or file name. Values are made absolute and normalised,
 * so "/var//cache/papers/" becomes "/var/cache/papers". Empty values
 * are rejected.
 */
class PathSetting : public BaseSetting<Path>
{
public:

    PathSetting(
        Config * options,
        const Path & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {});

    Path parse(const std::string & str) const override;

    void operator=(const Path & v)
    {
        this->assign(v);
    }
};

} // namespace papercache
