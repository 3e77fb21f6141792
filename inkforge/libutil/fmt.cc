#include "inkforge/libutil/fmt.hh" // IWYU pragma: keep

template class boost::basic_format<char>;

namespace inkforge {

template HintFmt::HintFmt(const std::string &, const Uncolored<std::string> &s);
template HintFmt::HintFmt(const std::string &, const std::string &s);

HintFmt::HintFmt(const std::string & literal) : HintFmt("%s", Uncolored(literal)) {}

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

namespace fmt_internal {

void badFormat(const char * who, const std::string & format, size_t nargs)
{
    std::cerr << who << " received incorrect format arguments. Original format string: '"
              << format << "'; number of arguments: " << nargs << "\n";
    std::terminate();
}

}

}
