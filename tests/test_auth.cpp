#include <gtest/gtest.h>

#include "auth.hpp"

#include <map>
#include <string>

using namespace adatp;

namespace
{
std::map<std::string, UserRecord> users()
{
    return {{"alice", UserRecord{"s3cret", "admin"}}, {"bob", UserRecord{"hunter2", "user"}}};
}
}  // namespace

TEST(StaticAuthorizer, AcceptsKnownCredentials)
{
    StaticAuthorizer auth(users());
    EXPECT_EQ(auth.user_count(), 2u);

    AuthDecision d = auth.authorize("alice", "s3cret");
    EXPECT_TRUE(d.authorized);
    EXPECT_EQ(d.user_id, "alice");
    EXPECT_EQ(d.role, "admin");

    EXPECT_EQ(auth.authorize("bob", "hunter2").role, "user");
}

TEST(StaticAuthorizer, RejectsWrongPasswordAndUnknownUser)
{
    StaticAuthorizer auth(users());

    AuthDecision wrong = auth.authorize("alice", "S3cret");
    EXPECT_FALSE(wrong.authorized);
    EXPECT_TRUE(wrong.user_id.empty());

    EXPECT_FALSE(auth.authorize("mallory", "s3cret").authorized);
    EXPECT_FALSE(auth.authorize("", "").authorized);
}

TEST(StaticAuthorizer, EmptyStoreRejectsEveryone)
{
    StaticAuthorizer auth(std::map<std::string, UserRecord>{});
    EXPECT_EQ(auth.user_count(), 0u);
    EXPECT_FALSE(auth.authorize("alice", "s3cret").authorized);
}
