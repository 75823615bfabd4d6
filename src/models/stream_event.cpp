#include "chatraw/models/stream_event.hpp"
#include <cmath>
#include <type_traits>

namespace chatraw
{

nlohmann::json referencesToJson(const std::vector<retrieval::Candidate>& references)
{
    nlohmann::json items = nlohmann::json::array();
    for (const auto& reference : references)
    {
        // Two decimals, rounded in double precision
        const double score = std::round(static_cast<double>(reference.score) * 100.0) / 100.0;
        items.push_back({{"content", reference.content}, {"score", score}});
    }
    return items;
}

nlohmann::json eventToJson(const StreamEvent& event)
{
    return std::visit(
        [](const auto& e) -> nlohmann::json {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ChatIdEvent>)
                return {{"chat_id", e.chat_id}};
            else if constexpr (std::is_same_v<T, ContentDeltaEvent>)
                return {{"content", e.content}};
            else if constexpr (std::is_same_v<T, ThinkingDeltaEvent>)
                return {{"thinking", e.thinking}};
            else if constexpr (std::is_same_v<T, ReferencesEvent>)
                return {{"references", referencesToJson(e.references)}};
            else if constexpr (std::is_same_v<T, ErrorEvent>)
                return {{"error", e.error}};
            else
                return {{"done", true}};
        },
        event);
}

std::string eventToNdjson(const StreamEvent& event)
{
    // Invalid UTF-8 from a provider is replaced with U+FFFD
    return eventToJson(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

} // namespace chatraw
