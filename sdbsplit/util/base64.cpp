#include <sdbsplit/util/base64.hpp>

#include <stdexcept>

namespace sdbsplit
{

namespace
{
    const std::string vals(
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/");

    int indexOf(const char c)
    {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }

    std::string encode(std::vector<uint8_t> input)
    {
        const std::size_t fullSteps(input.size() / 3);
        const std::size_t remainder(input.size() % 3);
        while (input.size() % 3) input.push_back(0);

        const uint8_t* pos(input.data());
        const uint8_t* end(input.data() + fullSteps * 3);

        std::string output(fullSteps * 4, '_');
        std::size_t outIndex(0);

        const uint32_t mask(0x3F);

        while (pos != end)
        {
            uint32_t chunk((*pos) << 16 | *(pos + 1) << 8 | *(pos + 2));

            output[outIndex++] = vals[(chunk >> 18) & mask];
            output[outIndex++] = vals[(chunk >> 12) & mask];
            output[outIndex++] = vals[(chunk >>  6) & mask];
            output[outIndex++] = vals[chunk & mask];

            pos += 3;
        }

        if (remainder)
        {
            uint32_t chunk(*(pos) << 16 | *(pos + 1) << 8 | *(pos + 2));

            output.push_back(vals[(chunk >> 18) & mask]);
            output.push_back(vals[(chunk >> 12) & mask]);
            if (remainder == 2) output.push_back(vals[(chunk >> 6) & mask]);
        }

        while (output.size() % 4) output.push_back('=');

        return output;
    }
}

std::string encodeBase64(const std::vector<uint8_t>& input)
{
    return encode(input);
}

std::string encodeBase64(const std::string& input)
{
    return encode(std::vector<uint8_t>(input.begin(), input.end()));
}

std::string decodeBase64(const std::string& input)
{
    std::string output;
    output.reserve(input.size() / 4 * 3);

    uint32_t chunk(0);
    std::size_t bits(0);

    for (const char c : input)
    {
        if (c == '=') break;
        if (c == '\r' || c == '\n') continue;

        const int v(indexOf(c));
        if (v < 0)
        {
            throw std::runtime_error(
                    std::string("Invalid base64 character: ") + c);
        }

        chunk = (chunk << 6) | static_cast<uint32_t>(v);
        bits += 6;

        if (bits >= 8)
        {
            bits -= 8;
            output.push_back(static_cast<char>((chunk >> bits) & 0xFF));
        }
    }

    return output;
}

} // namespace sdbsplit
