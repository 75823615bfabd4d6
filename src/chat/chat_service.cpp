#include "chatraw/chat/chat_service.hpp"
#include "chatraw/logger.hpp"
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace chatraw
{

namespace
{

float roundScore(float score)
{
    return std::round(score * 100.0f) / 100.0f;
}

} // namespace

nlohmann::json ChatResult::to_json() const
{
    nlohmann::json j;
    j["chat_id"] = chat_id;
    j["content"] = reply.answer;
    j["thinking"] = reply.thinking;
    j["references"] = referencesToJson(reply.references);
    return j;
}

ChatService::ChatService(relay::IChatStore& chats,
                         retrieval::EmbeddingClient& embeddings,
                         const retrieval::SimilarityRanker& ranker,
                         retrieval::RerankFusion& fusion,
                         relay::StreamRelay& relay,
                         ProviderCapability chatCapability,
                         retrieval::RetrievalSettings settings)
    : chats_(chats), embeddings_(embeddings), ranker_(ranker), fusion_(fusion), relay_(relay),
      chatCapability_(chatCapability), settings_(settings)
{
}

relay::RelayTurn ChatService::prepare(const ChatRequest& request)
{
    relay::RelayTurn turn;
    turn.userMessage = request.message;
    turn.enableThinking = request.enable_thinking;

    if (request.chat_id.empty())
    {
        turn.chatId = chats_.createChat("New Chat").id;
        ServerLogger::logDebug("Created chat %s", turn.chatId.c_str());
    }
    else if (!chats_.hasChat(request.chat_id))
    {
        throw std::invalid_argument("Chat not found: " + request.chat_id);
    }
    else
    {
        turn.chatId = request.chat_id;
    }

    const relay::MessageRecord stored = chats_.addMessage(turn.chatId, "user", request.message);

    for (const auto& record : chats_.getMessages(turn.chatId))
    {
        if (record.id == stored.id)
        {
            continue;
        }
        turn.messages.emplace_back(record.role, record.content);
    }
    return turn;
}

std::string ChatService::renderReferences(const std::vector<retrieval::Candidate>& references)
{
    if (references.empty())
    {
        return "";
    }

    std::string context = "Here are relevant references:\n\n";
    for (size_t i = 0; i < references.size(); ++i)
    {
        char header[64];
        std::snprintf(header, sizeof(header), "[Reference %zu] (Relevance: %.2f)\n", i + 1,
                      static_cast<double>(references[i].score));
        context += header;
        context += references[i].content;
        context += "\n\n";
    }
    context += "Please answer based on the above references. If there's no relevant information, answer based on your knowledge.\n\n";
    return context;
}

RagContext ChatService::buildRagContext(const std::string& query, const retrieval::RetrievalSettings& settings)
{
    RagContext context;

    if (!embeddings_.isConfigured())
    {
        ServerLogger::logDebug("RAG requested but no embedding provider is configured");
        return context;
    }

    const std::vector<float> queryVector = embeddings_.embedOne(query);
    if (queryVector.empty())
    {
        ServerLogger::logWarning("Query embedding failed, answering without references");
        return context;
    }

    const auto candidates = ranker_.search(queryVector, settings.scoreThreshold,
                                           retrieval::SimilarityRanker::poolSizeFor(settings.topK));
    if (candidates.empty())
    {
        return context;
    }

    for (auto& reference : fusion_.fuse(query, candidates, settings.topK))
    {
        reference.score = roundScore(reference.score);
        context.references.push_back(std::move(reference));
    }

    context.text = renderReferences(context.references);
    ServerLogger::logDebug("RAG context built with %zu references", context.references.size());
    return context;
}

nlohmann::json ChatService::buildUserContent(const ChatRequest& request, const RagContext& context) const
{
    std::string finalMessage = request.message;
    if (!context.text.empty())
    {
        finalMessage = context.text + "User question: " + request.message;
    }
    if (request.web_content && !request.web_content->empty())
    {
        finalMessage = "Here is web page content provided by the user for reference (source: " +
                       request.web_url.value_or("") + "):\n---\n" + *request.web_content + "\n---\n\n" +
                       finalMessage;
    }

    if (request.image_base64 && !request.image_base64->empty())
    {
        if (chatCapability_.vision)
        {
            return nlohmann::json::array({
                {{"type", "text"}, {"text", finalMessage}},
                {{"type", "image_url"}, {"image_url", {{"url", "data:image/jpeg;base64," + *request.image_base64}}}},
            });
        }
        ServerLogger::logDebug("Ignoring image: chat model has no vision capability");
    }

    return finalMessage;
}

relay::RelayTurn ChatService::assemble(const ChatRequest& request)
{
    relay::RelayTurn turn = prepare(request);

    RagContext context;
    if (request.use_rag)
    {
        context = buildRagContext(request.message, settings_);
    }

    turn.messages.emplace_back("user", buildUserContent(request, context));
    turn.references = std::move(context.references);
    return turn;
}

relay::RelayState ChatService::streamChat(const ChatRequest& request, const relay::EventSink& sink)
{
    relay::RelayTurn turn;
    try
    {
        turn = assemble(request);
    }
    catch (const std::exception& ex)
    {
        ServerLogger::logError("Cannot start chat turn: %s", ex.what());
        sink(ErrorEvent{ex.what()});
        return relay::RelayState::Failed;
    }

    if (!sink(ChatIdEvent{turn.chatId}))
    {
        return relay::RelayState::Cancelled;
    }
    return relay_.stream(turn, sink);
}

ChatResult ChatService::completeChat(const ChatRequest& request)
{
    relay::RelayTurn turn = assemble(request);

    ChatResult result;
    result.chat_id = turn.chatId;
    result.reply = relay_.complete(turn);
    return result;
}

} // namespace chatraw
