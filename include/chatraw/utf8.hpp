#pragma once

#include <string>
#include <vector>

namespace chatraw
{
namespace utf8
{

// Byte offsets of every code point start in s, followed by s.size().
// Stray continuation bytes are grouped with the preceding code point.
inline std::vector<size_t> codePointOffsets(const std::string& s)
{
    std::vector<size_t> offsets;
    offsets.reserve(s.size() + 1);
    for (size_t i = 0; i < s.size(); ++i)
    {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (i == 0 || (c & 0xC0) != 0x80)
        {
            offsets.push_back(i);
        }
    }
    offsets.push_back(s.size());
    return offsets;
}

inline size_t length(const std::string& s)
{
    return s.empty() ? 0 : codePointOffsets(s).size() - 1;
}

// First maxCodePoints code points of s
inline std::string prefix(const std::string& s, size_t maxCodePoints)
{
    const auto offsets = codePointOffsets(s);
    const size_t count = s.empty() ? 0 : offsets.size() - 1;
    if (count <= maxCodePoints)
    {
        return s;
    }
    return s.substr(0, offsets[maxCodePoints]);
}

} // namespace utf8
} // namespace chatraw
