#include "inkforge/libutil/async.hh"
#include "inkforge/libutil/cgroup.hh"
#include "inkforge/libutil/file-system.hh"

#include <gtest/gtest.h>

namespace inkforge {

TEST(destroyCgroup, missingCgroupIsNotAnError)
{
    AsyncIoRoot aio;
    auto dir = createTempDir();
    AutoDelete cleanup(dir);

    ASSERT_FALSE(aio.blockOn(destroyCgroup("inkforge-flipper-1", dir + "/inkforge-flipper-1")));
}

TEST(destroyCgroup, rejectsPlainDirectories)
{
    AsyncIoRoot aio;
    auto dir = createTempDir();
    AutoDelete cleanup(dir);

    ASSERT_THROW(aio.blockOn(destroyCgroup("inkforge-flipper-1", dir)), Error);
    ASSERT_TRUE(pathExists(dir));
}

}
