#pragma once

#include <string>
#include <string_view>

#include "error.hpp"

namespace ndeploy::account
{
    /**
     * Subaccount prefixes of the project's account topology.
     * Each contract lives on `<prefix>.<master account>`.
     */
    inline constexpr std::string_view TOKEN_PREFIX = "token";
    inline constexpr std::string_view HTLC_PREFIX = "htlc";

    inline constexpr std::size_t MIN_ACCOUNT_ID_LEN = 2;
    inline constexpr std::size_t MAX_ACCOUNT_ID_LEN = 64;

    struct AccountSet
    {
        std::string main;
        std::string token;
        std::string htlc;

        bool operator==(const AccountSet &) const = default;
    };

    std::string subaccount(std::string_view prefix, const std::string & master);

    /**
     * @brief Derives the main, token and htlc accounts from the master wallet identity.
     * 
     * @param wallet_identity The master account, e.g. "alice.testnet".
     * @return The derived account set.
     */
    AccountSet derive(const std::string & wallet_identity);

    /**
     * @brief Checks an account id against the NEAR account id rules.
     * 
     * Ids are 2 to 64 characters long and made of lowercase alphanumeric parts separated by '.',
     * where a part may contain single '-' or '_' separators between alphanumeric runs.
     */
    bool isValidAccountId(std::string_view account_id);

    /**
     * @brief Validates an account id supplied explicitly by the operator.
     * 
     * @return The account id, or INVALID_ACCOUNT_REFERENCE if it is empty or malformed.
     */
    Result<std::string> validateAccountReference(const std::string & account_id);
}
