#include "visionmcp/util/base64.hpp"

namespace visionmcp::util::base64
{

static const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string encode(const std::vector<uint8_t>& bytes)
{
    std::string encoded;
    encoded.reserve(((bytes.size() + 2) / 3) * 4);
    int val = 0, valb = -6;
    for (uint8_t c : bytes)
    {
        val = (val << 8) + c;
        valb += 8;
        while (valb >= 0)
        {
            encoded.push_back(base64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
        val &= 0xFFF;
    }
    if (valb > -6)
        encoded.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (encoded.size() % 4)
        encoded.push_back('=');
    return encoded;
}

std::vector<uint8_t> decode(const std::string& encoded)
{
    static const std::string chars = base64_chars;
    std::vector<uint8_t> out;
    out.reserve(encoded.size() / 4 * 3);
    int val = 0, valb = -8;
    for (char c : encoded)
    {
        auto pos = chars.find(c);
        if (pos == std::string::npos)
            break;
        val = (val << 6) + static_cast<int>(pos);
        valb += 6;
        if (valb >= 0)
        {
            out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
        val &= 0xFFFF;
    }
    return out;
}

} // namespace visionmcp::util::base64
