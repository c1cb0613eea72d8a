#include <gtest/gtest.h>
#include "judge/authenticator.hpp"

using namespace std;
using namespace bridge;

TEST(AuthenticatorTest, KeyTable) {
    key_authenticator auth({{"judge-1", "secret-1"}, {"judge-2", "secret-2"}});
    EXPECT_TRUE(auth.authenticate("judge-1", "secret-1"));
    EXPECT_TRUE(auth.authenticate("judge-2", "secret-2"));
    EXPECT_FALSE(auth.authenticate("judge-1", "secret-2"));
    EXPECT_FALSE(auth.authenticate("judge-1", "secret-10"));
    EXPECT_FALSE(auth.authenticate("judge-1", ""));
    EXPECT_FALSE(auth.authenticate("judge-3", "secret-1"));
    EXPECT_FALSE(auth.authenticate("", ""));
}
