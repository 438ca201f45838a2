#pragma once
///@file

#include <map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "chunkcache/util/types.hh"

namespace chunkcache {

/**
 * Settings are typed members of a `Config`. Each one registers itself
 * with its owner on construction, so a `Config` subclass only needs to
 * declare them:
 *
 *   struct CodecConfig : Config
 *   {
 *       Setting<std::string> method{this, "br", "chunk-compression", "Codec applied to each chunk."};
 *   };
 *
 * Values arrive as strings, from `chunkcache.conf` (through
 * `applyConfig()`), from `$CHUNKCACHE_CONFIG` or from `--option`.
 * Assignments to names nobody has declared yet are kept and applied
 * once a setting of that name shows up.
 */

/**
 * One named, typed, documented option. Values always arrive as
 * strings; subclasses parse them.
 */
class AbstractSetting
{
    friend class Config;

public:
    const std::string name;
    /**
     * Indentation-stripped, newline-terminated.
     */
    const std::string description;

    /**
     * Set once any source assigns a value.
     */
    bool overridden = false;

protected:
    AbstractSetting(const std::string & name, const std::string & description);

    virtual ~AbstractSetting() = default;

    /**
     * `append` is only passed for `extra-<name>` assignments, and only
     * to settings that are `isAppendable()`.
     */
    virtual void set(const std::string & str, bool append) = 0;
    virtual bool isAppendable() const = 0;
    virtual std::string to_string() const = 0;
    virtual nlohmann::json toJSON() const = 0;
};

class AbstractConfig
{
protected:
    /**
     * Assignments to names no setting has claimed yet.
     */
    StringMap unknownSettings;

public:
    struct SettingInfo
    {
        std::string value;
        std::string description;
    };

    virtual ~AbstractConfig() = default;

    /**
     * Assign `value` to the setting `name`. `extra-<name>` appends to
     * a list setting instead.
     *
     * @return whether a setting of that name exists.
     * @throws UsageError if `value` does not parse.
     */
    virtual bool set(const std::string & name, const std::string & value) = 0;

    /**
     * Add every setting (or every overridden one) to `res`.
     */
    virtual void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const = 0;

    virtual void resetOverridden() = 0;

    virtual nlohmann::json toJSON() = 0;

    /**
     * The current values, in `chunkcache.conf` syntax.
     */
    virtual std::string toKeyValue() = 0;

    /**
     * Apply a configuration file. `path` is used in error messages and
     * as the base of relative `include`s. Unknown names are remembered.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    void warnUnknownSettings();

    void reapplyUnknownSettings();
};

class Config : public AbstractConfig
{
    std::map<std::string, AbstractSetting *> byName;

public:
    void addSetting(AbstractSetting * setting);

    bool set(const std::string & name, const std::string & value) override;
    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const override;
    void resetOverridden() override;
    nlohmann::json toJSON() override;
    std::string toKeyValue() override;
};

/**
 * A setting of type `T`: an integer type (which accepts a `K`, `M`,
 * `G` or `T` suffix), `bool`, `std::string` or `Strings` (the only
 * appendable one).
 */
template<typename T>
class Setting : public AbstractSetting
{
protected:
    T value;
    const T defaultValue;

    virtual T parse(const std::string & str) const;

public:
    Setting(Config * owner, const T & def, const std::string & name, const std::string & description)
        : AbstractSetting(name, description)
        , value(def)
        , defaultValue(def)
    {
        owner->addSetting(this);
    }

    const T & get() const
    {
        return value;
    }

    operator const T &() const
    {
        return value;
    }

    void assign(const T & v)
    {
        value = v;
    }

    void operator=(const T & v)
    {
        value = v;
    }

    void set(const std::string & str, bool append = false) override final;
    bool isAppendable() const override final;
    std::string to_string() const override;
    nlohmann::json toJSON() const override;
};

/**
 * A non-empty path, canonicalised when parsed.
 */
class PathSetting : public Setting<Path>
{
public:
    using Setting<Path>::Setting;
    using Setting<Path>::operator=;

    Path parse(const std::string & str) const override;
};

} // namespace chunkcache
