#include <sdbsplit/split-reader.hpp>

#include <algorithm>
#include <iostream>

namespace sdbsplit
{

SplitReader::SplitReader(
        const Split& split,
        std::unique_ptr<StoreClient> client,
        const WhereClause& where,
        const std::uint64_t pageSize)
    : m_split(split)
    , m_client(std::move(client))
    , m_state(State::Created)
    , m_items()
    , m_cursor(0)
{
    if (!m_client) throw std::invalid_argument("No store client supplied");
    if (!pageSize) throw std::invalid_argument("Page size must be positive");

    materialize(where, std::min(pageSize, maxSelectLimit));
}

void SplitReader::materialize(
        const WhereClause& where,
        const std::uint64_t pageSize)
{
    m_state = State::Materializing;

    const std::uint64_t length(m_split.length());
    Token token(m_split.token());

    if (length) m_items.reserve(length);

    while (m_items.size() < length)
    {
        const std::uint64_t remaining(length - m_items.size());

        QueryResult page(
                m_client->select(
                    where,
                    std::min(pageSize, remaining),
                    token).value());

        for (Record& item : page.items)
        {
            if (m_items.size() == length) break;
            m_items.push_back(std::move(item));
        }

        token = page.nextToken;
        if (!token) break;
    }

    if (m_items.size() < length)
    {
        std::cerr << "Split " << m_split.toString() << " ended early: " <<
            m_items.size() << " of " << length << " records" << std::endl;
    }

    m_state = State::Iterating;
}

bool SplitReader::next(std::string& key, Attributes& attributes)
{
    if (m_state != State::Iterating) return false;

    if (m_cursor < m_split.length() && m_cursor < m_items.size())
    {
        const Record& item(m_items[m_cursor++]);
        key = item.key;
        attributes = item.attributes;
        return true;
    }

    m_state = State::Exhausted;
    return false;
}

float SplitReader::progress() const
{
    const std::uint64_t length(m_split.length());

    if (m_cursor == length) return 0.0f;
    return std::min(1.0f, m_cursor / static_cast<float>(length));
}

void SplitReader::close()
{
    m_client.reset();
    m_state = State::Closed;
}

} // namespace sdbsplit
