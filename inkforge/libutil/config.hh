#pragma once
///@file

#include "inkforge/libutil/json.hh"
#include "inkforge/libutil/types.hh"

#include <cassert>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace inkforge {

/**
 * Runtime configuration: a set of uniquely named, typed settings. Settings
 * register themselves with the `Config` that owns them, so declaring a member
 * `Setting<T> foo{this, default, "foo", "description"}` is all it takes.
 *
 * The file format is line based:
 *
 *     # comment
 *     worker-count = 4
 *     extra-prebaked-cargo-contract-versions = 4.1.1
 *     include conf.d/limits.conf
 *     !include local.conf
 *
 * `extra-NAME` appends to list settings; `!include` tolerates a missing file.
 */

struct ApplyConfigOptions
{
    /**
     * The configuration file the value comes from, if any. Relative paths in
     * path-valued settings and `include` lines resolve against its directory.
     */
    std::optional<Path> path = std::nullopt;
};

class AbstractSetting;

class Config
{
    StringMap unknownSettings;
    std::map<std::string, AbstractSetting *> _settings;

public:
    Config() = default;
    virtual ~Config() = default;

    Config(const Config &) = delete;
    Config & operator=(const Config &) = delete;

    /**
     * Sets the value referenced by `name` to `value`. Returns true if the
     * setting is known, false otherwise. Unknown settings are remembered so
     * they can be reported by `warnUnknownSettings`.
     */
    bool set(
        const std::string & name,
        const std::string & value,
        const ApplyConfigOptions & options = {}
    );

    void addSetting(AbstractSetting * setting);

    /**
     * Parse `contents` and apply every line. `options.path` is needed for
     * `include` lines and relative paths.
     */
    void applyConfig(const std::string & contents, const ApplyConfigOptions & options = {});

    /**
     * Read and apply a configuration file.
     */
    void applyConfigFile(const Path & path);

    void warnUnknownSettings();

    /**
     * Every setting rendered as it would be written in a configuration file.
     */
    JSON toJSON() const;
};

class AbstractSetting
{
    friend class Config;

public:

    const std::string name;
    const std::string description;

    bool overridden = false;

protected:

    AbstractSetting(
        const std::string & name,
        const std::string & description);

    virtual ~AbstractSetting() = default;

    virtual void set(const std::string & value, bool append = false, const ApplyConfigOptions & options = {}) = 0;

    /**
     * Whether `extra-NAME` may be used, i.e. `append` may be true.
     */
    virtual bool isAppendable() = 0;

    virtual std::string to_string() const = 0;

    bool isOverridden() const { return overridden; }
};

/**
 * A setting of type T.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;
    const T defaultValue;

    virtual T parse(const std::string & str, const ApplyConfigOptions & options) const;

    /**
     * Only list types support `append`; the default implementation asserts
     * it is false.
     */
    virtual void appendOrSet(T newValue, bool append, const ApplyConfigOptions & options);

public:

    BaseSetting(const T & def,
        const std::string & name,
        const std::string & description)
        : AbstractSetting(name, description)
        , value(def)
        , defaultValue(def)
    { }

    operator const T &() const { return value; }
    const T & get() const { return value; }
    template<typename U>
    void operator =(const U & v) { assign(v); }
    virtual void assign(const T & v) { value = v; }

    void set(const std::string & str, bool append = false, const ApplyConfigOptions & options = {}) override final;

    /**
     * Specialized for the list types to mark them appendable.
     */
    struct trait;

    bool isAppendable() override final;

    std::string to_string() const override;
};

template<typename T>
class Setting : public BaseSetting<T>
{
public:
    Setting(Config * options,
        const T & def,
        const std::string & name,
        const std::string & description)
        : BaseSetting<T>(def, name, description)
    {
        options->addSetting(this);
    }

    void operator =(const T & v) { this->assign(v); }
};

/**
 * A special setting for absolute paths. Relative values are resolved against
 * the directory of the configuration file that sets them.
 */
class PathSetting : public BaseSetting<Path>
{
public:
    PathSetting(Config * options,
        const Path & def,
        const std::string & name,
        const std::string & description)
        : BaseSetting<Path>(def, name, description)
    {
        options->addSetting(this);
    }

    Path parse(const std::string & str, const ApplyConfigOptions & options) const override;

    void operator =(const Path & v) { this->assign(v); }
};

/**
 * A byte count, written with an optional K/M/G/T binary suffix.
 */
class ByteSizeSetting : public BaseSetting<uint64_t>
{
public:
    ByteSizeSetting(Config * options,
        uint64_t def,
        const std::string & name,
        const std::string & description)
        : BaseSetting<uint64_t>(def, name, description)
    {
        options->addSetting(this);
    }

    uint64_t parse(const std::string & str, const ApplyConfigOptions & options) const override;

    std::string to_string() const override;

    void operator =(uint64_t v) { this->assign(v); }
};

template<> struct BaseSetting<Strings>::trait
{
    static constexpr bool appendable = true;
};
template<> struct BaseSetting<StringSet>::trait
{
    static constexpr bool appendable = true;
};

template<typename T>
struct BaseSetting<T>::trait
{
    static constexpr bool appendable = false;
};

template<> std::string BaseSetting<std::string>::parse(const std::string & str, const ApplyConfigOptions & options) const;
template<> std::string BaseSetting<std::string>::to_string() const;
template<> bool BaseSetting<bool>::parse(const std::string & str, const ApplyConfigOptions & options) const;
template<> std::string BaseSetting<bool>::to_string() const;
template<> Strings BaseSetting<Strings>::parse(const std::string & str, const ApplyConfigOptions & options) const;
template<> void BaseSetting<Strings>::appendOrSet(Strings newValue, bool append, const ApplyConfigOptions & options);
template<> std::string BaseSetting<Strings>::to_string() const;
template<> StringSet BaseSetting<StringSet>::parse(const std::string & str, const ApplyConfigOptions & options) const;
template<> void BaseSetting<StringSet>::appendOrSet(StringSet newValue, bool append, const ApplyConfigOptions & options);
template<> std::string BaseSetting<StringSet>::to_string() const;

extern template class BaseSetting<unsigned int>;
extern template class BaseSetting<uint64_t>;
extern template class BaseSetting<bool>;
extern template class BaseSetting<std::string>;
extern template class BaseSetting<Strings>;
extern template class BaseSetting<StringSet>;

}
