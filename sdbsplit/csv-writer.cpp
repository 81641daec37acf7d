#include <sdbsplit/csv-writer.hpp>

#include <stdexcept>

namespace sdbsplit
{

CsvWriter::CsvWriter(std::ostream& out, std::vector<std::string> headers)
    : m_out(out)
    , m_headers(headers)
    , m_rows(0)
{
    if (!m_headers.empty()) writeLine(m_headers);
}

void CsvWriter::write(const std::string& key, const Attributes& attributes)
{
    std::vector<std::string> fields(1, key);

    if (m_headers.empty())
    {
        for (const auto& a : attributes) fields.push_back(a.second);
    }
    else
    {
        for (std::size_t i(1); i < m_headers.size(); ++i)
        {
            const auto it(attributes.find(m_headers[i]));
            fields.push_back(it != attributes.end() ? it->second : "");
        }
    }

    writeLine(fields);
    ++m_rows;
}

void CsvWriter::writeLine(const std::vector<std::string>& fields)
{
    for (std::size_t i(0); i < fields.size(); ++i)
    {
        if (i) m_out << ',';
        m_out << escape(fields[i]);
    }
    m_out << '\n';

    if (!m_out) throw std::runtime_error("Failed to write CSV output");
}

std::string CsvWriter::escape(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string quoted("\"");
    for (const char c : field)
    {
        if (c == '"') quoted += "\"\"";
        else quoted.push_back(c);
    }
    quoted += "\"";
    return quoted;
}

} // namespace sdbsplit
