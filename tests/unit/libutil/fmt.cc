#include "inkforge/libutil/fmt.hh"
#include "inkforge/libutil/ansicolor.hh"

#include <gtest/gtest.h>

namespace inkforge {

TEST(fmt, plainFormatting)
{
    ASSERT_EQ(fmt("session '%s' got slot %d", "abc", 2), "session 'abc' got slot 2");
    ASSERT_EQ(fmt("%1%/%2%.json", "/var/lib/inkforge/state/sessions", "abc"),
              "/var/lib/inkforge/state/sessions/abc.json");
    // a lone format string is taken literally
    ASSERT_EQ(fmt("100%"), "100%");
}

TEST(HintFmt, highlightsArguments)
{
    ASSERT_EQ(HintFmt("%s").str(), "%s");
    ASSERT_EQ(HintFmt("stage '%s'", "compile").str(), "stage '" ANSI_MAGENTA "compile" ANSI_NORMAL "'");
    ASSERT_EQ(HintFmt("%s", Uncolored(std::string("fetch"))).str(), "fetch");
}

TEST(HintFmt, wrongArgumentCountDies)
{
    ASSERT_DEATH(HintFmt("%s %s", 1), "HintFmt received incorrect");
    ASSERT_DEATH(HintFmt("%s", 1, 2), "HintFmt received incorrect");
}

}
