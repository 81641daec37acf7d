#include <sdbsplit/unique.hpp>

namespace sdbsplit
{

ValueCounts uniqueValueCounts(
        StoreClient& client,
        const WhereClause& where,
        const std::string& attribute)
{
    ValueCounts counts;
    Token token;

    do
    {
        const QueryResult page(
                client.select(where, maxSelectLimit, token).value());

        for (const Record& item : page.items)
        {
            const auto it(item.attributes.find(attribute));
            if (it != item.attributes.end()) ++counts[it->second];
        }

        token = page.nextToken;
    }
    while (token);

    return counts;
}

} // namespace sdbsplit
