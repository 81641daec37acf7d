#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <sdbsplit/defs.hpp>
#include <sdbsplit/split.hpp>
#include <sdbsplit/store-client.hpp>

namespace sdbsplit
{

// Reads the records of one split.  Construction pulls the whole split into
// memory with paged SELECT queries starting at the split's token, which is
// bounded by the split size.  Records are then handed out one at a time.
//
// The reader owns its store client: one connection per split.
class SplitReader
{
public:
    enum class State
    {
        Created,
        Materializing,
        Iterating,
        Exhausted,
        Closed
    };

    // Throws a StoreError if any SELECT fails, so a reader never exposes a
    // partially materialized split.
    SplitReader(
            const Split& split,
            std::unique_ptr<StoreClient> client,
            const WhereClause& where = WhereClause(),
            std::uint64_t pageSize = maxSelectLimit);

    // Assigns the next record to the output slots.  Returns false, without
    // touching them, once the split is exhausted or the reader is closed.
    bool next(std::string& key, Attributes& attributes);

    // cursor / length, except that a fully consumed split reports 0.
    float progress() const;

    std::uint64_t position() const { return m_cursor; }
    std::size_t materialized() const { return m_items.size(); }

    const Split& split() const { return m_split; }
    State state() const { return m_state; }

    // Releases the store client.  Safe to call more than once.
    void close();

private:
    void materialize(const WhereClause& where, std::uint64_t pageSize);

    const Split m_split;
    std::unique_ptr<StoreClient> m_client;

    State m_state;
    Records m_items;
    std::uint64_t m_cursor;
};

} // namespace sdbsplit
