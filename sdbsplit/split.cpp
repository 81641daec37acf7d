#include <sdbsplit/split.hpp>

#include <limits>

namespace sdbsplit
{

namespace
{
    const std::string nullToken("NULL");

    void pushU64(Data& data, std::uint64_t v)
    {
        for (int shift(56); shift >= 0; shift -= 8)
        {
            data.push_back(static_cast<char>((v >> shift) & 0xFF));
        }
    }

    class Cursor
    {
    public:
        Cursor(const Data& data) : m_data(data), m_pos(0) { }

        std::uint64_t u64() { return take(8); }
        std::uint16_t u16() { return static_cast<std::uint16_t>(take(2)); }

        std::string str(std::size_t size)
        {
            need(size);
            const std::string s(m_data.data() + m_pos, size);
            m_pos += size;
            return s;
        }

        bool done() const { return m_pos == m_data.size(); }

    private:
        std::uint64_t take(std::size_t bytes)
        {
            need(bytes);
            std::uint64_t v(0);
            for (std::size_t i(0); i < bytes; ++i)
            {
                v = (v << 8) | static_cast<unsigned char>(m_data[m_pos++]);
            }
            return v;
        }

        void need(std::size_t bytes) const
        {
            if (m_data.size() - m_pos < bytes)
            {
                throw SplitFormatError(
                        "Truncated split: needed " + std::to_string(bytes) +
                        " bytes at offset " + std::to_string(m_pos) +
                        " of " + std::to_string(m_data.size()));
            }
        }

        const Data& m_data;
        std::size_t m_pos;
    };
}

Split::Split(
        const std::uint64_t startRow,
        const std::uint64_t endRow,
        const Token token)
    : m_startRow(startRow)
    , m_endRow(endRow)
    , m_token(token)
{
    if (endRow < startRow)
    {
        throw std::invalid_argument(
                "Invalid split range: " + std::to_string(startRow) + " to " +
                std::to_string(endRow));
    }
}

Data Split::serialize() const
{
    const std::string& token(m_token ? *m_token : nullToken);

    if (token.size() > std::numeric_limits<std::uint16_t>::max())
    {
        throw SplitFormatError(
                "Token too long to serialize: " +
                std::to_string(token.size()) + " bytes");
    }

    Data data;
    data.reserve(18 + token.size());

    pushU64(data, m_startRow);
    pushU64(data, m_endRow);

    data.push_back(static_cast<char>((token.size() >> 8) & 0xFF));
    data.push_back(static_cast<char>(token.size() & 0xFF));
    data.insert(data.end(), token.begin(), token.end());

    return data;
}

Split Split::deserialize(const Data& data)
{
    Cursor cursor(data);

    const std::uint64_t startRow(cursor.u64());
    const std::uint64_t endRow(cursor.u64());
    const std::string token(cursor.str(cursor.u16()));

    if (!cursor.done())
    {
        throw SplitFormatError("Trailing bytes after serialized split");
    }

    if (endRow < startRow)
    {
        throw SplitFormatError(
                "Serialized split ends before it starts: " +
                std::to_string(startRow) + " to " + std::to_string(endRow));
    }

    if (token == nullToken) return Split(startRow, endRow);
    return Split(startRow, endRow, token);
}

std::string Split::toString() const
{
    return
        "startRow=" + std::to_string(m_startRow) +
        ", endRow=" + std::to_string(m_endRow) +
        ", splitToken=" + (m_token ? *m_token : nullToken);
}

} // namespace sdbsplit
