#ifndef CHATRAW_CHUNKER_HPP
#define CHATRAW_CHUNKER_HPP

#include "../export.hpp"
#include <string>
#include <vector>

namespace chatraw
{
namespace retrieval
{

/**
 * @brief Splits document text into bounded, overlapping chunks
 *
 * Paragraphs (separated by blank lines) are packed into chunks of at most
 * chunk_size code points. A paragraph that alone exceeds chunk_size is cut
 * into fixed windows advancing by chunk_size - overlap. Each packed chunk
 * carries the last overlap code points of the previous one.
 */
class CHATRAW_SERVER_API Chunker
{
public:
    /**
     * @brief Split text into chunks
     *
     * @param text UTF-8 input
     * @param chunk_size Maximum chunk length in code points, must be positive
     * @param overlap Code points shared by consecutive chunks, clamped so the window advances by at least one
     * @return Chunks in document order, empty for empty input
     * @throws std::invalid_argument when chunk_size <= 0
     */
    static std::vector<std::string> chunk(const std::string& text, int chunk_size, int overlap);

    /**
     * @brief Cut text into consecutive windows of chunk_size code points
     */
    static std::vector<std::string> forceSplit(const std::string& text, int chunk_size, int overlap);

    static std::string trim(const std::string& text);

private:
    static std::vector<std::string> splitParagraphs(const std::string& text);
};

} // namespace retrieval
} // namespace chatraw

#endif // CHATRAW_CHUNKER_HPP
