#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(mlprogress::build_info::git_commit.empty());
    EXPECT_FALSE(mlprogress::build_info::git_commit_short.empty());
    EXPECT_FALSE(mlprogress::build_info::version.empty());
}

TEST(BuildInfoTest, GitInfoMatchesConstants)
{
    constexpr auto info = mlprogress::build_info::get_git_info();
    EXPECT_EQ(info.commit, mlprogress::build_info::git_commit);
    EXPECT_EQ(info.dirty, mlprogress::build_info::git_dirty);
}
