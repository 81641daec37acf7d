#include <sdbsplit/store-client.hpp>

#include <cctype>

namespace sdbsplit
{

const std::string countAttribute("Count");

std::string toString(const FailureKind kind)
{
    switch (kind)
    {
        case FailureKind::RemoteRejected: return "remote rejected";
        case FailureKind::TransportFailure: return "transport failure";
        case FailureKind::Inconsistent: return "inconsistent response";
    }
    return "unknown";
}

std::string Failure::describe() const
{
    std::string s(toString(kind) + ": " + message);

    if (httpStatus) s += " (HTTP " + std::to_string(httpStatus) + ")";
    if (!errorCode.empty()) s += " [" + errorCode + "]";
    if (!requestId.empty()) s += " request " + requestId;
    if (!query.empty()) s += " for query: " + query;

    return s;
}

boost::optional<std::uint64_t> countValue(const QueryResult& result)
{
    for (const Record& item : result.items)
    {
        const auto it(item.attributes.find(countAttribute));
        if (it == item.attributes.end()) continue;

        const std::string& value(it->second);
        if (value.empty() || value.size() > 19) return boost::none;

        for (const char c : value)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
            {
                return boost::none;
            }
        }

        return static_cast<std::uint64_t>(std::stoull(value));
    }

    return boost::none;
}

Outcome<std::uint64_t> StoreClient::countAll(const WhereClause& where)
{
    std::uint64_t total(0);
    Token token;

    do
    {
        Outcome<QueryResult> page(count(where, Limit(), token));
        if (!page) return page.failure();

        const auto n(countValue(page.value()));
        if (!n)
        {
            return Failure(
                    FailureKind::Inconsistent,
                    "Count response without a " + countAttribute + " value");
        }

        total += *n;
        token = page.value().nextToken;
    }
    while (token);

    return total;
}

} // namespace sdbsplit
