#include "unit-tests.hpp"

using namespace ndeploy;
using namespace ndeploy::tests;

TEST_F(UnitTest, Account_Derive_PrefixesMasterAccount)
{
    const auto accounts = account::derive("alice.testnet");

    EXPECT_EQ(accounts.main, "alice.testnet");
    EXPECT_EQ(accounts.token, "token.alice.testnet");
    EXPECT_EQ(accounts.htlc, "htlc.alice.testnet");
}

TEST_F(UnitTest, Account_Derive_IsDeterministic)
{
    for(const std::string wallet : {"alice.testnet", "bob.near", "a1-b_2.testnet", "dev-1700000000000-12345678901234"})
    {
        const auto first = account::derive(wallet);
        const auto second = account::derive(wallet);

        EXPECT_EQ(first, second);
        EXPECT_EQ(first.token, "token." + wallet);
        EXPECT_EQ(first.htlc, "htlc." + wallet);
        EXPECT_NE(first.token, first.htlc);
        EXPECT_NE(first.main, first.token);
    }
}

TEST_F(UnitTest, Account_IsValidAccountId_AcceptsNearAccountIds)
{
    EXPECT_TRUE(account::isValidAccountId("alice.testnet"));
    EXPECT_TRUE(account::isValidAccountId("token.alice.testnet"));
    EXPECT_TRUE(account::isValidAccountId("a1-b_2.near"));
    EXPECT_TRUE(account::isValidAccountId("ab"));
    EXPECT_TRUE(account::isValidAccountId(std::string(64, 'a')));
}

TEST_F(UnitTest, Account_IsValidAccountId_RejectsMalformedIds)
{
    EXPECT_FALSE(account::isValidAccountId(""));
    EXPECT_FALSE(account::isValidAccountId("a"));
    EXPECT_FALSE(account::isValidAccountId(std::string(65, 'a')));
    EXPECT_FALSE(account::isValidAccountId("Alice.testnet"));
    EXPECT_FALSE(account::isValidAccountId("alice..testnet"));
    EXPECT_FALSE(account::isValidAccountId(".alice"));
    EXPECT_FALSE(account::isValidAccountId("alice."));
    EXPECT_FALSE(account::isValidAccountId("-alice.testnet"));
    EXPECT_FALSE(account::isValidAccountId("alice--bob.testnet"));
    EXPECT_FALSE(account::isValidAccountId("alice bob"));
}

TEST_F(UnitTest, Account_ValidateAccountReference_ReportsKind)
{
    const auto ok = account::validateAccountReference("bob.testnet");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, "bob.testnet");

    const auto empty = account::validateAccountReference("");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().kind, Error::Kind::INVALID_ACCOUNT_REFERENCE);

    const auto malformed = account::validateAccountReference("Bob!");
    ASSERT_FALSE(malformed.has_value());
    EXPECT_EQ(malformed.error().kind, Error::Kind::INVALID_ACCOUNT_REFERENCE);
    EXPECT_EQ(malformed.error().account, "Bob!");
}
