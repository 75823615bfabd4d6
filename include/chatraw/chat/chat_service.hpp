#pragma once

#include "../export.hpp"
#include "../models/chat_models.hpp"
#include "../relay/chat_store.hpp"
#include "../relay/stream_relay.hpp"
#include "../retrieval/embedding_client.hpp"
#include "../retrieval/rerank_fusion.hpp"
#include "../retrieval/retrieval_settings.hpp"
#include "../retrieval/similarity_ranker.hpp"
#include <string>
#include <vector>

namespace chatraw
{

/**
 * @brief Reference block prepended to the user question
 */
struct RagContext
{
    std::string text;                                   // Empty when nothing relevant was found
    std::vector<retrieval::Candidate> references;       // Scores rounded to two decimals
};

struct ChatResult
{
    std::string chat_id;
    relay::RelayResult reply;

    nlohmann::json to_json() const;
};

/**
 * @brief Runs one chat turn: stores the user message, retrieves context,
 * assembles the conversation and hands it to the relay
 */
class CHATRAW_SERVER_API ChatService
{
public:
    ChatService(relay::IChatStore& chats,
                retrieval::EmbeddingClient& embeddings,
                const retrieval::SimilarityRanker& ranker,
                retrieval::RerankFusion& fusion,
                relay::StreamRelay& relay,
                ProviderCapability chatCapability,
                retrieval::RetrievalSettings settings = retrieval::RetrievalSettings());

    /**
     * @brief Store the user message, creating a "New Chat" when chat_id is empty
     * @return The prepared turn without retrieval context
     * @throws std::invalid_argument when chat_id names an unknown chat
     */
    relay::RelayTurn prepare(const ChatRequest& request);

    /**
     * @brief Embed the query, rank stored chunks and render the reference block
     */
    RagContext buildRagContext(const std::string& query, const retrieval::RetrievalSettings& settings);

    /**
     * @brief Final user message content: optional web page block, optional
     * reference block, then the question; an image part is added for vision models
     */
    nlohmann::json buildUserContent(const ChatRequest& request, const RagContext& context) const;

    /**
     * @brief Stream a chat turn: emits chat_id first, then the relay's events
     */
    relay::RelayState streamChat(const ChatRequest& request, const relay::EventSink& sink);

    /**
     * @brief Non-streaming chat turn
     * @throws ProviderError when the provider call fails
     */
    ChatResult completeChat(const ChatRequest& request);

    static std::string renderReferences(const std::vector<retrieval::Candidate>& references);

private:
    relay::RelayTurn assemble(const ChatRequest& request);

    relay::IChatStore& chats_;
    retrieval::EmbeddingClient& embeddings_;
    const retrieval::SimilarityRanker& ranker_;
    retrieval::RerankFusion& fusion_;
    relay::StreamRelay& relay_;
    ProviderCapability chatCapability_;
    retrieval::RetrievalSettings settings_;
};

} // namespace chatraw
