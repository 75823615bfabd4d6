#ifndef CHATRAW_FRAME_PARSER_HPP
#define CHATRAW_FRAME_PARSER_HPP

#include "../export.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace chatraw
{
namespace relay
{

enum class FrameKind
{
    Delta,      // Carries answer and/or reasoning text
    Done,       // The [DONE] sentinel
    Skip        // Not a data line, undecodable, or nothing to relay
};

struct Frame
{
    FrameKind kind = FrameKind::Skip;
    std::string content;
    std::string reasoning;
};

/**
 * @brief Parser for server-sent-event lines of an OpenAI-compatible chat stream
 *
 * Never throws: anything it cannot use is reported as FrameKind::Skip.
 */
class CHATRAW_SERVER_API FrameParser
{
public:
    /**
     * @brief Parse one line of the stream
     * @param line Line without its terminating newline
     * @param include_reasoning Whether reasoning fields are read from the delta
     */
    static Frame parse(const std::string& line, bool include_reasoning);

    /**
     * @brief Extract answer and reasoning text from a delta or message object
     */
    static Frame fromMessage(const nlohmann::json& message, bool include_reasoning);

    // Delta fields checked for reasoning text, in priority order
    static const std::vector<std::string>& reasoningFields();
};

/**
 * @brief Splits a byte stream into newline-terminated lines
 */
class CHATRAW_SERVER_API LineBuffer
{
public:
    // Appends data and returns the lines it completed
    std::vector<std::string> feed(const char* data, size_t size);

    // Returns the unterminated remainder, if any, and clears it
    std::optional<std::string> flush();

private:
    std::string pending_;
};

} // namespace relay
} // namespace chatraw

#endif // CHATRAW_FRAME_PARSER_HPP
