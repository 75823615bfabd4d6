#ifndef CHATRAW_STREAM_RELAY_HPP
#define CHATRAW_STREAM_RELAY_HPP

#include "../export.hpp"
#include "../http_client.hpp"
#include "../models/chat_models.hpp"
#include "../models/stream_event.hpp"
#include "../provider_config.hpp"
#include "../retrieval/candidate.hpp"
#include "../server_config.hpp"
#include "chat_store.hpp"
#include <functional>
#include <string>
#include <vector>

namespace chatraw
{
namespace relay
{

enum class RelayState
{
    Connecting,
    Streaming,
    Completing,
    Completed,  // done was emitted
    Failed,     // error was emitted
    Cancelled   // the event sink went away; nothing more was emitted or stored
};

/**
 * @brief Receives normalized stream events
 * @return false when the consumer is gone, which aborts the upstream transfer
 */
using EventSink = std::function<bool(const StreamEvent& event)>;

/**
 * @brief Everything needed to run one assistant turn
 */
struct RelayTurn
{
    std::string chatId;
    std::string userMessage;                        // Original user text, used for the chat title
    std::vector<ChatMessage> messages;              // Full conversation sent upstream
    bool enableThinking = false;
    std::vector<retrieval::Candidate> references;
};

struct RelayResult
{
    std::string answer;
    std::string thinking;
    std::vector<retrieval::Candidate> references;
};

/**
 * @brief Drives a chat completion call and relays its output
 *
 * Streaming turns re-emit answer and reasoning deltas as they arrive and end
 * with exactly one done or error event. The assistant message is stored only
 * after the provider finished and produced a non-empty answer.
 */
class CHATRAW_SERVER_API StreamRelay
{
public:
    StreamRelay(IHttpTransport& transport, ProviderConfig provider, IChatStore& chats,
                ChatSettings settings = ChatSettings(), long connectTimeoutMs = 10000, long timeoutMs = 300000);

    bool isConfigured() const { return provider_.isConfigured(); }

    /**
     * @brief Run a streaming turn
     * @return The terminal state: Completed, Failed or Cancelled
     */
    RelayState stream(const RelayTurn& turn, const EventSink& sink);

    /**
     * @brief Run a non-streaming turn
     * @throws ProviderError on any failure; nothing is stored in that case
     */
    RelayResult complete(const RelayTurn& turn);

    // Stored form of an assistant answer, wrapping reasoning in <think> tags when present
    static std::string composeMessage(const std::string& answer, const std::string& thinking);

    // Chat title derived from the first user message
    static std::string titleFor(const std::string& message);

private:
    HttpRequest buildRequest(const RelayTurn& turn, bool stream) const;

    // Stores the answer and retitles young chats
    void persist(const RelayTurn& turn, const std::string& answer, const std::string& thinking);

    IHttpTransport& transport_;
    ProviderConfig provider_;
    IChatStore& chats_;
    ChatSettings settings_;
    long connectTimeoutMs_;
    long timeoutMs_;
};

} // namespace relay
} // namespace chatraw

#endif // CHATRAW_STREAM_RELAY_HPP
