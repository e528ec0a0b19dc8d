#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(cverify::build_info::git_commit.empty());
    EXPECT_FALSE(cverify::build_info::git_commit_short.empty());
    EXPECT_FALSE(cverify::build_info::version.empty());
}

TEST(BuildInfoTest, GitInfoMatchesConstants)
{
    constexpr auto info = cverify::build_info::get_git_info();
    EXPECT_EQ(info.version, cverify::build_info::version);
    EXPECT_EQ(info.commit, cverify::build_info::git_commit);
    EXPECT_EQ(info.dirty, cverify::build_info::git_dirty);
}
