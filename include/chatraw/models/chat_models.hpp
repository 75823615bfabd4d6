#ifndef CHATRAW_CHAT_MODELS_HPP
#define CHATRAW_CHAT_MODELS_HPP

#include "../export.hpp"
#include "model_interface.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chatraw
{

/**
 * @brief One conversation message in OpenAI chat format
 *
 * content is either a string or an array of content parts (text and image_url).
 */
class CHATRAW_SERVER_API ChatMessage : public IModel
{
public:
    std::string role;
    nlohmann::json content = "";

    ChatMessage() = default;
    ChatMessage(std::string messageRole, nlohmann::json messageContent)
        : role(std::move(messageRole)), content(std::move(messageContent)) {}

    bool validate() const override;
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    // Text of the message with non-text parts left out
    std::string text() const;
};

/**
 * @brief Body of POST {base}/chat/completions
 */
class CHATRAW_SERVER_API ChatCompletionRequest : public IModel
{
public:
    std::string model;
    std::vector<ChatMessage> messages;
    double temperature = 0.7;
    double top_p = 0.9;
    int max_tokens = 4096;
    bool stream = true;
    bool enable_thinking = false;      // Adds enable_thinking and, when streaming, stream_options.include_reasoning

    bool validate() const override;
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Body of POST /api/chat
 */
class CHATRAW_SERVER_API ChatRequest : public IModel
{
public:
    std::string chat_id;               // Empty starts a new chat
    std::string message;
    bool use_rag = false;
    bool enable_thinking = false;
    std::optional<std::string> image_base64;
    std::optional<std::string> web_content;
    std::optional<std::string> web_url;

    bool validate() const override;
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

} // namespace chatraw

#endif // CHATRAW_CHAT_MODELS_HPP
