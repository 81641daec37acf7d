#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include <sdbsplit/defs.hpp>

namespace sdbsplit
{

// Writes records as comma-delimited lines.
//
// Without headers each line is the key followed by every attribute value in
// attribute-name order.  With headers, a header line is written first; the
// first header names the key column and each further header selects the
// attribute for its column, left empty when a record lacks it.
class CsvWriter
{
public:
    CsvWriter(
            std::ostream& out,
            std::vector<std::string> headers = std::vector<std::string>());

    void write(const std::string& key, const Attributes& attributes);
    void write(const Record& record) { write(record.key, record.attributes); }

    std::size_t rows() const { return m_rows; }

    // Quotes a field containing a comma, quote, CR or LF, doubling any
    // embedded quotes.
    static std::string escape(const std::string& field);

private:
    void writeLine(const std::vector<std::string>& fields);

    std::ostream& m_out;
    const std::vector<std::string> m_headers;
    std::size_t m_rows;
};

} // namespace sdbsplit
