#pragma once
///@file
/// String formatting on top of `boost::format`. Every log line and error
/// message in inkforge goes through `fmt` or `HintFmt`.

#include <iostream>
#include <string>
#include <boost/format.hpp>
#include "inkforge/libutil/ansicolor.hh"

// instantiated once, in fmt.cc
extern template class boost::basic_format<char>;

namespace inkforge {

/**
 * `HintFmt` arguments are highlighted like this unless wrapped in
 * `Uncolored`.
 */
template<class T>
struct Magenta
{
    Magenta(const T & s) : value(s) {}
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Magenta<T> & y)
{
    return out << ANSI_MAGENTA << y.value << ANSI_NORMAL;
}

/**
 * An argument that is interpolated as is. Used for text that already carries
 * its own markup, such as the message of a wrapped error.
 */
template<class T>
struct Uncolored
{
    Uncolored(const T & s) : value(s) {}
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Uncolored<T> & y)
{
    return out << ANSI_NORMAL << y.value;
}

namespace fmt_internal {

/**
 * Argument count mismatches are reported by the callers, everything else
 * boost can detect throws.
 */
inline void setExceptions(boost::format & fmt)
{
    fmt.exceptions(
        boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit
    );
}

inline void feed(boost::format & fmt, const auto & value)
{
    fmt % Magenta(value);
}

template<class T>
inline void feed(boost::format & fmt, const Uncolored<T> & value)
{
    fmt % value.value;
}

[[noreturn]] void badFormat(const char * who, const std::string & format, size_t nargs);

}

/**
 * Format `fs` with `args`. A single argument is returned unchanged, so
 * text that merely contains `%` (a URL, a stage's output) is safe to pass.
 * A malformed format string is a bug and terminates the process.
 */
inline std::string fmt(const std::string & s)
{
    return s;
}

inline std::string fmt(const char * s)
{
    return s;
}

template<typename... Args>
inline std::string fmt(const std::string & fs, const Args &... args)
{
    try {
        boost::format f(fs);
        fmt_internal::setExceptions(f);
        (f % ... % args);
        return f.str();
    } catch (boost::io::format_error &) {
        fmt_internal::badFormat("fmt", fs, sizeof...(args));
    }
}

/**
 * A message for humans: the arguments are highlighted, and the argument count
 * must match the format string exactly.
 */
class HintFmt
{
private:
    boost::format fmt;

public:
    /**
     * Use `literal` as the message without interpreting `%`.
     */
    HintFmt(const std::string & literal);

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
    {
        try {
            fmt = boost::format(format);
            fmt_internal::setExceptions(fmt);
        } catch (boost::io::format_error &) {
            fmt_internal::badFormat("HintFmt", format, sizeof...(args));
        }
        if (fmt.expected_args() != static_cast<int>(sizeof...(args))) {
            fmt_internal::badFormat("HintFmt", format, sizeof...(args));
        }
        (fmt_internal::feed(fmt, args), ...);
    }

    HintFmt(const HintFmt & hf) : fmt(hf.fmt) {}

    HintFmt & operator=(HintFmt const & rhs) = default;

    std::string str() const
    {
        return fmt.str();
    }
};

extern template HintFmt::HintFmt(const std::string &, const Uncolored<std::string> &s);
extern template HintFmt::HintFmt(const std::string &, const std::string &s);

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

}
