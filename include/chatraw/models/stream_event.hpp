#ifndef CHATRAW_STREAM_EVENT_HPP
#define CHATRAW_STREAM_EVENT_HPP

#include "../export.hpp"
#include "../retrieval/candidate.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace chatraw
{

struct ChatIdEvent
{
    std::string chat_id;
};

struct ContentDeltaEvent
{
    std::string content;
};

struct ThinkingDeltaEvent
{
    std::string thinking;
};

struct ReferencesEvent
{
    std::vector<retrieval::Candidate> references;
};

struct ErrorEvent
{
    std::string error;
};

struct DoneEvent
{
};

/**
 * @brief One event of the normalized stream sent to the caller
 *
 * A successful stream ends with exactly one DoneEvent, a failed one with exactly one ErrorEvent.
 */
using StreamEvent = std::variant<ChatIdEvent, ContentDeltaEvent, ThinkingDeltaEvent, ReferencesEvent, ErrorEvent, DoneEvent>;

CHATRAW_SERVER_API nlohmann::json referencesToJson(const std::vector<retrieval::Candidate>& references);

CHATRAW_SERVER_API nlohmann::json eventToJson(const StreamEvent& event);

// Serialized event followed by '\n'
CHATRAW_SERVER_API std::string eventToNdjson(const StreamEvent& event);

inline bool isTerminal(const StreamEvent& event)
{
    return std::holds_alternative<DoneEvent>(event) || std::holds_alternative<ErrorEvent>(event);
}

} // namespace chatraw

#endif // CHATRAW_STREAM_EVENT_HPP
