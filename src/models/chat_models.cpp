#include "chatraw/models/chat_models.hpp"
#include "chatraw/logger.hpp"
#include <sstream>
#include <stdexcept>

namespace chatraw
{

namespace
{

std::optional<std::string> optionalString(const nlohmann::json& j, const char* field)
{
    if (!j.contains(field) || j[field].is_null())
    {
        return std::nullopt;
    }
    if (!j[field].is_string())
    {
        throw std::runtime_error(std::string("Field '") + field + "' must be a string");
    }
    return j[field].get<std::string>();
}

bool optionalBool(const nlohmann::json& j, const char* field, bool fallback)
{
    if (!j.contains(field) || j[field].is_null())
    {
        return fallback;
    }
    if (!j[field].is_boolean())
    {
        throw std::runtime_error(std::string("Field '") + field + "' must be a boolean");
    }
    return j[field].get<bool>();
}

} // namespace

// ChatMessage

bool ChatMessage::validate() const
{
    return !role.empty() && (content.is_string() || content.is_array());
}

nlohmann::json ChatMessage::to_json() const
{
    return nlohmann::json{{"role", role}, {"content", content}};
}

void ChatMessage::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw std::runtime_error("Message must be a JSON object");
    }
    if (!j.contains("role") || !j["role"].is_string())
    {
        throw std::runtime_error("Message must have a string role field");
    }
    role = j["role"].get<std::string>();

    content = "";
    if (j.contains("content") && !j["content"].is_null())
    {
        content = j["content"];
    }
}

std::string ChatMessage::text() const
{
    if (content.is_string())
    {
        return content.get<std::string>();
    }

    std::ostringstream builder;
    if (content.is_array())
    {
        for (const auto& part : content)
        {
            if (part.is_object() && part.value("type", "") == "text" && part.contains("text") && part["text"].is_string())
            {
                builder << part["text"].get<std::string>();
            }
        }
    }
    return builder.str();
}

// ChatCompletionRequest

bool ChatCompletionRequest::validate() const
{
    if (messages.empty())
    {
        ServerLogger::logDebug("Validation failed: chat completion without messages");
        return false;
    }
    for (const auto& message : messages)
    {
        if (!message.validate())
        {
            return false;
        }
    }
    return max_tokens > 0;
}

nlohmann::json ChatCompletionRequest::to_json() const
{
    nlohmann::json messages_array = nlohmann::json::array();
    for (const auto& message : messages)
    {
        messages_array.push_back(message.to_json());
    }

    nlohmann::json j;
    j["model"] = model;
    j["messages"] = messages_array;
    j["temperature"] = temperature;
    j["top_p"] = top_p;
    j["max_tokens"] = max_tokens;
    j["stream"] = stream;

    if (enable_thinking)
    {
        j["enable_thinking"] = true;
        if (stream)
        {
            j["stream_options"] = {{"include_reasoning", true}};
        }
    }
    return j;
}

void ChatCompletionRequest::from_json(const nlohmann::json& j)
{
    if (!j.contains("messages") || !j["messages"].is_array())
    {
        throw std::runtime_error("Missing or invalid 'messages' field - must be an array");
    }

    messages.clear();
    for (const auto& item : j["messages"])
    {
        ChatMessage message;
        message.from_json(item);
        messages.push_back(std::move(message));
    }

    if (j.contains("model") && j["model"].is_string())
        model = j["model"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        temperature = j["temperature"].get<double>();
    if (j.contains("top_p") && j["top_p"].is_number())
        top_p = j["top_p"].get<double>();
    if (j.contains("max_tokens") && j["max_tokens"].is_number_integer())
        max_tokens = j["max_tokens"].get<int>();
    stream = optionalBool(j, "stream", stream);
    enable_thinking = optionalBool(j, "enable_thinking", false);
}

// ChatRequest

bool ChatRequest::validate() const
{
    if (message.empty())
    {
        ServerLogger::logDebug("Validation failed: message is empty");
        return false;
    }
    return true;
}

nlohmann::json ChatRequest::to_json() const
{
    nlohmann::json j;
    j["chat_id"] = chat_id;
    j["message"] = message;
    j["use_rag"] = use_rag;
    j["enable_thinking"] = enable_thinking;
    if (image_base64)
        j["image_base64"] = *image_base64;
    if (web_content)
        j["web_content"] = *web_content;
    if (web_url)
        j["web_url"] = *web_url;
    return j;
}

void ChatRequest::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw std::runtime_error("Request body must be a JSON object");
    }
    if (!j.contains("message") || !j["message"].is_string())
    {
        throw std::runtime_error("Missing or invalid 'message' field - must be a string");
    }
    message = j["message"].get<std::string>();

    chat_id = optionalString(j, "chat_id").value_or("");
    use_rag = optionalBool(j, "use_rag", false);
    enable_thinking = optionalBool(j, "enable_thinking", false);
    image_base64 = optionalString(j, "image_base64");
    web_content = optionalString(j, "web_content");
    web_url = optionalString(j, "web_url");
}

} // namespace chatraw
