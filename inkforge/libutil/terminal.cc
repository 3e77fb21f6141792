#include "inkforge/libutil/terminal.hh"

#include <cstdlib>
#include <unistd.h>

namespace inkforge {

static bool hasEnv(const char * name)
{
    return getenv(name) != nullptr;
}

bool isOutputARealTerminal(StandardOutputStream fileno)
{
    auto term = getenv("TERM");
    return isatty(int(fileno)) && term && std::string_view(term) != "dumb";
}

bool shouldANSI(StandardOutputStream fileno)
{
    auto compute = [](StandardOutputStream fileno) -> bool {
        bool mustNotColour = hasEnv("NO_COLOR") || hasEnv("NOCOLOR");
        bool shouldForce = hasEnv("CLICOLOR_FORCE") || hasEnv("FORCE_COLOR");
        return !mustNotColour && (shouldForce || isOutputARealTerminal(fileno));
    };
    static bool cached[2] = {compute(StandardOutputStream::Stdout), compute(StandardOutputStream::Stderr)};
    return cached[int(fileno) - 1];
}

std::string filterANSIEscapes(std::string_view s, bool filterAll)
{
    std::string t;
    t.reserve(s.size());
    auto i = s.begin();

    while (i != s.end()) {
        if (*i == '\e') {
            std::string e;
            e += *i++;

            if (i != s.end() && *i == '[') {
                e += *i++;
                char last = 0;
                while (i != s.end() && *i >= 0x20 && *i <= 0x3f) e += *i++;
                if (i != s.end() && *i >= 0x40 && *i <= 0x7e) e += last = *i++;
                if (!filterAll && last == 'm')
                    t += e;
            } else if (i != s.end() && *i == ']') {
                // OSC sequences end in ST or BEL and are never kept
                ++i;
                while (i != s.end() && *i != '\a' && *i != '\e') ++i;
                if (i != s.end() && *i == '\a') ++i;
                else if (i != s.end() && ++i != s.end() && *i == '\\') ++i;
            } else if (i != s.end() && *i >= 0x40 && *i <= 0x5f) {
                ++i;
            }
        } else if (*i == '\t') {
            i++;
            t += ' ';
            while (t.size() % 8) t += ' ';
        } else if (*i == '\r' || *i == '\a') {
            // do nothing for now
            i++;
        } else {
            t += *i++;
        }
    }

    return t;
}

}
