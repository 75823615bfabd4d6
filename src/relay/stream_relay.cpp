#include "chatraw/relay/stream_relay.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/provider_errors.hpp"
#include "chatraw/relay/frame_parser.hpp"
#include "chatraw/utf8.hpp"

namespace chatraw
{
namespace relay
{

namespace
{

const size_t kTitleLength = 30;

} // namespace

StreamRelay::StreamRelay(IHttpTransport& transport, ProviderConfig provider, IChatStore& chats,
                         ChatSettings settings, long connectTimeoutMs, long timeoutMs)
    : transport_(transport), provider_(std::move(provider)), chats_(chats), settings_(settings),
      connectTimeoutMs_(connectTimeoutMs), timeoutMs_(timeoutMs)
{
}

std::string StreamRelay::composeMessage(const std::string& answer, const std::string& thinking)
{
    if (thinking.empty())
    {
        return answer;
    }
    return "<think>\n" + thinking + "\n</think>\n\n" + answer;
}

std::string StreamRelay::titleFor(const std::string& message)
{
    if (utf8::length(message) > kTitleLength)
    {
        return utf8::prefix(message, kTitleLength) + "...";
    }
    return message;
}

HttpRequest StreamRelay::buildRequest(const RelayTurn& turn, bool stream) const
{
    ChatCompletionRequest payload;
    payload.model = provider_.modelId;
    payload.messages = turn.messages;
    payload.temperature = settings_.temperature;
    payload.top_p = settings_.topP;
    payload.max_tokens = provider_.maxOutput;
    payload.stream = stream;
    payload.enable_thinking = turn.enableThinking;

    HttpRequest request;
    request.url = provider_.endpoint("/chat/completions");
    request.body = payload.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    request.headers = jsonHeaders(provider_.apiKey);
    request.connectTimeoutMs = connectTimeoutMs_;
    request.timeoutMs = timeoutMs_;
    return request;
}

void StreamRelay::persist(const RelayTurn& turn, const std::string& answer, const std::string& thinking)
{
    chats_.addMessage(turn.chatId, "assistant", composeMessage(answer, thinking));

    if (chats_.countMessages(turn.chatId) <= 2)
    {
        chats_.updateChatTitle(turn.chatId, titleFor(turn.userMessage));
    }
}

RelayState StreamRelay::stream(const RelayTurn& turn, const EventSink& sink)
{
    RelayState state = RelayState::Connecting;

    auto fail = [&sink, &state](const std::string& message) {
        ServerLogger::logError("Chat stream failed: %s", message.c_str());
        state = RelayState::Failed;
        sink(ErrorEvent{message});
        return state;
    };

    if (!provider_.isConfigured())
    {
        return fail("Chat model not configured");
    }

    std::string answer;
    std::string thinking;
    LineBuffer lines;
    bool doneSeen = false;
    bool sinkGone = false;
    std::string callbackError;

    auto handleLine = [&](const std::string& line) {
        Frame frame = FrameParser::parse(line, turn.enableThinking);
        if (frame.kind == FrameKind::Done)
        {
            doneSeen = true;
            return true;
        }
        if (frame.kind == FrameKind::Skip)
        {
            return true;
        }

        if (!frame.reasoning.empty())
        {
            thinking += frame.reasoning;
            if (!sink(ThinkingDeltaEvent{frame.reasoning}))
                return false;
        }
        if (!frame.content.empty())
        {
            answer += frame.content;
            if (!sink(ContentDeltaEvent{frame.content}))
                return false;
        }
        return true;
    };

    auto onData = [&](const char* data, size_t size) {
        state = RelayState::Streaming;
        if (doneSeen)
        {
            return true;
        }

        try
        {
            for (const auto& line : lines.feed(data, size))
            {
                if (!handleLine(line))
                {
                    sinkGone = true;
                    return false;
                }
                if (doneSeen)
                {
                    break;
                }
            }
        }
        catch (const std::exception& ex)
        {
            callbackError = ex.what();
            return false;
        }
        return true;
    };

    HttpResponse response = transport_.postStream(buildRequest(turn, true), onData);

    if (sinkGone)
    {
        ServerLogger::logInfo("Client went away, aborted chat stream for %s", turn.chatId.c_str());
        return RelayState::Cancelled;
    }
    if (!callbackError.empty())
    {
        return fail(callbackError);
    }
    if (response.status == TransportStatus::Cancelled)
    {
        return RelayState::Cancelled;
    }
    if (response.status == TransportStatus::Timeout)
    {
        return fail("Request timeout");
    }
    if (response.status == TransportStatus::TransportError)
    {
        return fail(response.error_message);
    }
    if (!response.ok())
    {
        return fail("API error (" + std::to_string(response.status_code) + "): " + response.body);
    }

    if (!doneSeen)
    {
        auto rest = lines.flush();
        if (rest && !handleLine(*rest))
        {
            return RelayState::Cancelled;
        }
    }

    state = RelayState::Completing;
    if (!answer.empty())
    {
        try
        {
            persist(turn, answer, thinking);
        }
        catch (const std::exception& ex)
        {
            return fail(ex.what());
        }
    }

    if (!turn.references.empty() && !sink(ReferencesEvent{turn.references}))
    {
        return RelayState::Cancelled;
    }
    if (!sink(DoneEvent{}))
    {
        return RelayState::Cancelled;
    }

    ServerLogger::logDebug("Chat stream for %s completed: %zu answer bytes, %zu reasoning bytes",
                           turn.chatId.c_str(), answer.size(), thinking.size());
    return RelayState::Completed;
}

RelayResult StreamRelay::complete(const RelayTurn& turn)
{
    if (!provider_.isConfigured())
    {
        throw ProviderUnconfiguredError("Chat model not configured");
    }

    HttpResponse response = transport_.post(buildRequest(turn, false));

    if (response.status == TransportStatus::Timeout)
    {
        throw ProviderTimeoutError();
    }
    if (response.status != TransportStatus::Ok)
    {
        throw ProviderTransportError(response.error_message);
    }
    if (!response.ok())
    {
        throw ProviderHttpError(response.status_code, response.body);
    }

    nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("choices") || !body["choices"].is_array() ||
        body["choices"].empty() || !body["choices"][0].is_object() || !body["choices"][0].contains("message"))
    {
        throw ProviderError("Invalid response from chat provider", 502);
    }

    Frame message = FrameParser::fromMessage(body["choices"][0]["message"], turn.enableThinking);

    RelayResult result;
    result.answer = std::move(message.content);
    result.thinking = std::move(message.reasoning);
    result.references = turn.references;

    if (!result.answer.empty())
    {
        persist(turn, result.answer, result.thinking);
    }
    return result;
}

} // namespace relay
} // namespace chatraw
