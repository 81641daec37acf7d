#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <sdbsplit/defs.hpp>

namespace sdbsplit
{

class SplitFormatError : public std::runtime_error
{
public:
    SplitFormatError(std::string message)
        : std::runtime_error(message)
    { }
};

// One contiguous row range [startRow, endRow) of a domain, together with
// the continuation token that starts it.  An empty token starts at the
// beginning of the domain.
class Split
{
public:
    Split(std::uint64_t startRow, std::uint64_t endRow, Token token = Token());

    std::uint64_t startRow() const { return m_startRow; }
    std::uint64_t endRow() const { return m_endRow; }
    const Token& token() const { return m_token; }

    std::uint64_t length() const { return m_endRow - m_startRow; }

    // Layout: startRow and endRow as 8-byte big-endian integers, then the
    // token as a 2-byte big-endian length followed by its UTF-8 bytes.  The
    // literal text "NULL" stands for the empty token.
    Data serialize() const;
    static Split deserialize(const Data& data);

    std::string toString() const;

    bool operator==(const Split& other) const
    {
        return
            m_startRow == other.m_startRow &&
            m_endRow == other.m_endRow &&
            m_token == other.m_token;
    }

    bool operator!=(const Split& other) const { return !(*this == other); }

private:
    std::uint64_t m_startRow;
    std::uint64_t m_endRow;
    Token m_token;
};

} // namespace sdbsplit
