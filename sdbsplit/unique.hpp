#pragma once

#include <cstdint>
#include <map>
#include <string>

#include <sdbsplit/store-client.hpp>

namespace sdbsplit
{

using ValueCounts = std::map<std::string, std::uint64_t>;

// Pages through every item matching the where clause and counts how often
// each value of one attribute occurs.  Items without the attribute are not
// counted.  Throws a StoreError if any page fails.
ValueCounts uniqueValueCounts(
        StoreClient& client,
        const WhereClause& where,
        const std::string& attribute);

} // namespace sdbsplit
