#include "chatraw/retrieval/chunker.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/utf8.hpp"
#include <algorithm>
#include <stdexcept>

namespace chatraw
{
namespace retrieval
{

namespace
{

const char* const kWhitespace = " \t\n\r\f\v";

} // namespace

std::vector<std::string> Chunker::chunk(const std::string& text, int chunk_size, int overlap)
{
    if (chunk_size <= 0)
    {
        throw std::invalid_argument("chunk_size must be positive, got " + std::to_string(chunk_size));
    }
    overlap = std::max(0, overlap);

    std::vector<std::string> chunks;
    std::string current;
    size_t currentLength = 0;

    auto flush = [&chunks](const std::string& buffer) {
        std::string trimmed = trim(buffer);
        if (trimmed.empty())
        {
            return false;
        }
        chunks.push_back(std::move(trimmed));
        return true;
    };

    for (const auto& rawParagraph : splitParagraphs(text))
    {
        const std::string paragraph = trim(rawParagraph);
        if (paragraph.empty())
        {
            continue;
        }

        const size_t paragraphLength = utf8::length(paragraph);

        if (paragraphLength > static_cast<size_t>(chunk_size))
        {
            if (flush(current))
            {
                current.clear();
                currentLength = 0;
            }
            auto pieces = forceSplit(paragraph, chunk_size, overlap);
            chunks.insert(chunks.end(), pieces.begin(), pieces.end());
            continue;
        }

        if (currentLength + paragraphLength > static_cast<size_t>(chunk_size))
        {
            if (flush(current))
            {
                if (overlap > 0 && currentLength > static_cast<size_t>(overlap))
                {
                    const auto offsets = utf8::codePointOffsets(current);
                    current = current.substr(offsets[currentLength - overlap]) + " ";
                    currentLength = static_cast<size_t>(overlap) + 1;
                }
                else
                {
                    current.clear();
                    currentLength = 0;
                }
            }
        }

        current += paragraph;
        current += "\n\n";
        currentLength += paragraphLength + 2;
    }

    flush(current);

    if (chunks.empty() && !text.empty())
    {
        chunks = forceSplit(text, chunk_size, overlap);
    }

    ServerLogger::logDebug("Chunked %zu bytes into %zu chunks (size %d, overlap %d)",
                           text.size(), chunks.size(), chunk_size, overlap);
    return chunks;
}

std::vector<std::string> Chunker::forceSplit(const std::string& text, int chunk_size, int overlap)
{
    if (chunk_size <= 0)
    {
        throw std::invalid_argument("chunk_size must be positive, got " + std::to_string(chunk_size));
    }

    const size_t size = static_cast<size_t>(chunk_size);
    const size_t stride = static_cast<size_t>(std::max(1, chunk_size - std::max(0, overlap)));

    const auto offsets = utf8::codePointOffsets(text);
    const size_t length = text.empty() ? 0 : offsets.size() - 1;

    std::vector<std::string> pieces;
    for (size_t start = 0; start < length; start += stride)
    {
        const size_t end = std::min(start + size, length);
        pieces.push_back(text.substr(offsets[start], offsets[end] - offsets[start]));
    }
    return pieces;
}

std::string Chunker::trim(const std::string& text)
{
    const size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos)
    {
        return "";
    }
    const size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::vector<std::string> Chunker::splitParagraphs(const std::string& text)
{
    std::vector<std::string> paragraphs;
    size_t start = 0;
    while (true)
    {
        const size_t separator = text.find("\n\n", start);
        if (separator == std::string::npos)
        {
            paragraphs.push_back(text.substr(start));
            break;
        }
        paragraphs.push_back(text.substr(start, separator - start));
        start = separator + 2;
    }
    return paragraphs;
}

} // namespace retrieval
} // namespace chatraw
