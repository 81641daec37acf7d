#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace sdbsplit
{

class FileError : public std::runtime_error
{
public:
    enum class Kind
    {
        NotFound,
        NotADirectory,
        Io
    };

    FileError(Kind kind, std::string message)
        : std::runtime_error(message)
        , m_kind(kind)
    { }

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

// Concatenates every regular file directly inside the input directory, in
// file name order, into the output file.  The output file itself is skipped
// if it lives inside the input directory.  Returns the number of files
// merged.
std::size_t mergeFiles(const std::string& inputDir, const std::string& output);

} // namespace sdbsplit
