#include "inkforge/libutil/config.hh"
#include "inkforge/libutil/config-impl.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/strings.hh"

#include <type_traits>

namespace inkforge {

bool Config::set(const std::string & name, const std::string & value, const ApplyConfigOptions & options)
{
    bool append = false;
    auto i = _settings.find(name);
    if (i == _settings.end()) {
        if (name.starts_with("extra-")) {
            i = _settings.find(std::string(name, 6));
            if (i == _settings.end() || !i->second->isAppendable()) {
                unknownSettings.insert_or_assign(name, value);
                return false;
            }
            append = true;
        } else {
            unknownSettings.insert_or_assign(name, value);
            return false;
        }
    }
    i->second->set(value, append, options);
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    _settings.emplace(setting->name, setting);

    if (auto i = unknownSettings.find(setting->name); i != unknownSettings.end()) {
        setting->set(std::move(i->second));
        unknownSettings.erase(i);
    }
}

void Config::warnUnknownSettings()
{
    for (const auto & s : unknownSettings)
        printTaggedWarning("unknown setting '%s'", s.first);
}

JSON Config::toJSON() const
{
    auto res = JSON::object();
    for (auto & [name, setting] : _settings) {
        res.emplace(name, setting->to_string());
    }
    return res;
}

using ConfigLines = std::vector<std::pair<std::string, std::string>>;

/**
 * Collect the `name = value` lines of `contents`, expanding includes in
 * place so later lines override earlier ones across files.
 */
static void parseConfig(const std::string & contents, const Path * file, ConfigLines & lines)
{
    auto where = file ? *file : std::string("<command line>");

    for (auto & raw : tokenizeString<std::vector<std::string>>(contents, "\n")) {
        auto line = trim(raw.substr(0, raw.find('#')));
        if (line.empty()) {
            continue;
        }

        if (line.starts_with("include ") || line.starts_with("!include ")) {
            bool optional = line[0] == '!';
            auto target = trim(line.substr(line.find(' ')));
            if (target.find_first_of(" \t") != std::string::npos) {
                throw UsageError("illegal include line '%1%' in '%2%'", line, where);
            }
            if (!file) {
                throw UsageError("can only include configuration '%1%' from files", target);
            }
            auto included = absPath(target, dirOf(*file));
            if (!pathExists(included)) {
                if (optional) {
                    debug("optional configuration file '%s' does not exist", included);
                    continue;
                }
                throw Error("file '%1%' included from '%2%' not found", included, *file);
            }
            parseConfig(readFile(included), &included, lines);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw UsageError("illegal configuration line '%1%' in '%2%'", line, where);
        }
        auto name = trim(line.substr(0, eq));
        if (name.empty() || name.find_first_of(" \t") != std::string::npos) {
            throw UsageError("illegal configuration line '%1%' in '%2%'", line, where);
        }
        lines.emplace_back(std::move(name), trim(line.substr(eq + 1)));
    }
}

void Config::applyConfig(const std::string & contents, const ApplyConfigOptions & options)
{
    ConfigLines lines;
    parseConfig(contents, options.path ? &*options.path : nullptr, lines);

    // relative paths resolve against the file that was asked for, even when
    // the line came from an include
    for (auto & [name, value] : lines) {
        set(name, value, options);
    }
}

void Config::applyConfigFile(const Path & path)
{
    auto absolute = absPath(path);
    applyConfig(readFile(absolute), ApplyConfigOptions{.path = absolute});
}

AbstractSetting::AbstractSetting(
    const std::string & name,
    const std::string & description)
    : name(name)
    , description(description)
{
}

template<> std::string BaseSetting<std::string>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    return str;
}

template<> std::string BaseSetting<std::string>::to_string() const
{
    return value;
}

template<> bool BaseSetting<bool>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    else if (str == "false" || str == "no" || str == "0")
        return false;
    else
        throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
}

template<> std::string BaseSetting<bool>::to_string() const
{
    return value ? "true" : "false";
}

template<> Strings BaseSetting<Strings>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    return tokenizeString<Strings>(str);
}

template<> void BaseSetting<Strings>::appendOrSet(Strings newValue, bool append, const ApplyConfigOptions & options)
{
    if (!append) value.clear();
    value.insert(value.end(), std::make_move_iterator(newValue.begin()),
                              std::make_move_iterator(newValue.end()));
}

template<> std::string BaseSetting<Strings>::to_string() const
{
    return concatStringsSep(" ", value);
}

template<> StringSet BaseSetting<StringSet>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    return tokenizeString<StringSet>(str);
}

template<> void BaseSetting<StringSet>::appendOrSet(StringSet newValue, bool append, const ApplyConfigOptions & options)
{
    if (!append) value.clear();
    value.insert(std::make_move_iterator(newValue.begin()), std::make_move_iterator(newValue.end()));
}

template<> std::string BaseSetting<StringSet>::to_string() const
{
    return concatStringsSep(" ", value);
}

template class BaseSetting<unsigned int>;
template class BaseSetting<uint64_t>;
template class BaseSetting<bool>;
template class BaseSetting<std::string>;
template class BaseSetting<Strings>;
template class BaseSetting<StringSet>;

Path PathSetting::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    if (str == "") {
        throw UsageError("setting '%s' is a path and paths cannot be empty", name);
    } else if (options.path) {
        return absPath(str, dirOf(*options.path));
    } else {
        return absPath(str);
    }
}

uint64_t ByteSizeSetting::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    try {
        return string2IntWithUnitPrefix<uint64_t>(str);
    } catch (UsageError &) {
        throw UsageError("setting '%s' should be a byte count like '512M' or '8G', not '%s'", name, str);
    }
}

std::string ByteSizeSetting::to_string() const
{
    return showByteSize(value);
}

}
