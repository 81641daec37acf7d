#include <sdbsplit/query.hpp>

#include <algorithm>
#include <cctype>

namespace sdbsplit
{

namespace
{

bool isPlain(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

} // unnamed namespace

std::string quoteDomain(const std::string& domain)
{
    if (!domain.empty() && std::all_of(domain.begin(), domain.end(), isPlain))
    {
        return domain;
    }

    std::string quoted("`");
    for (const char c : domain)
    {
        if (c == '`') quoted += "``";
        else quoted.push_back(c);
    }
    quoted += "`";
    return quoted;
}

std::string buildQuery(
        const std::string& domain,
        const WhereClause& where,
        const QueryPlan& plan)
{
    std::string query(plan.isCount ? "SELECT COUNT(*) FROM " : "SELECT * FROM ");
    query += quoteDomain(domain);

    if (where && !where->empty()) query += " WHERE " + *where;
    if (plan.limit && *plan.limit) query += " LIMIT " + std::to_string(*plan.limit);

    return query;
}

} // namespace sdbsplit
