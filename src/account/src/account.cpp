#include "account.hpp"

#include <regex>

namespace ndeploy::account
{
    std::string subaccount(std::string_view prefix, const std::string & master)
    {
        std::string out;
        out.reserve(prefix.size() + 1 + master.size());
        out.append(prefix);
        out.push_back('.');
        out.append(master);
        return out;
    }

    AccountSet derive(const std::string & wallet_identity)
    {
        return AccountSet{
            .main = wallet_identity,
            .token = subaccount(TOKEN_PREFIX, wallet_identity),
            .htlc = subaccount(HTLC_PREFIX, wallet_identity)
        };
    }

    bool isValidAccountId(std::string_view account_id)
    {
        if(account_id.size() < MIN_ACCOUNT_ID_LEN || account_id.size() > MAX_ACCOUNT_ID_LEN)
        {
            return false;
        }

        static const std::regex account_id_regex(R"(^(([a-z0-9]+[-_])*[a-z0-9]+\.)*([a-z0-9]+[-_])*[a-z0-9]+$)");
        return std::regex_match(account_id.begin(), account_id.end(), account_id_regex);
    }

    Result<std::string> validateAccountReference(const std::string & account_id)
    {
        if(account_id.empty())
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_ACCOUNT_REFERENCE,
                .message = "Account id is empty"
            });
        }

        if(!isValidAccountId(account_id))
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_ACCOUNT_REFERENCE,
                .message = fmt::format("'{}' is not a valid account id", account_id),
                .account = account_id
            });
        }

        return account_id;
    }
}
