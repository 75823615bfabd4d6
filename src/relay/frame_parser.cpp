#include "chatraw/relay/frame_parser.hpp"
#include "chatraw/logger.hpp"

namespace chatraw
{
namespace relay
{

namespace
{

const char* const kWhitespace = " \t\r\n";

std::string trimmed(const std::string& text)
{
    const size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos)
    {
        return "";
    }
    const size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::string stringField(const nlohmann::json& object, const std::string& field)
{
    auto it = object.find(field);
    if (it != object.end() && it->is_string())
    {
        return it->get<std::string>();
    }
    return "";
}

} // namespace

const std::vector<std::string>& FrameParser::reasoningFields()
{
    static const std::vector<std::string> fields = {"reasoning_content", "reasoning", "thinking"};
    return fields;
}

Frame FrameParser::fromMessage(const nlohmann::json& message, bool include_reasoning)
{
    Frame frame;
    if (!message.is_object())
    {
        return frame;
    }

    frame.content = stringField(message, "content");

    if (include_reasoning)
    {
        for (const auto& field : reasoningFields())
        {
            std::string value = stringField(message, field);
            if (!value.empty())
            {
                frame.reasoning = std::move(value);
                break;
            }
        }
    }

    if (!frame.content.empty() || !frame.reasoning.empty())
    {
        frame.kind = FrameKind::Delta;
    }
    return frame;
}

Frame FrameParser::parse(const std::string& line, bool include_reasoning)
{
    const std::string text = trimmed(line);

    static const std::string prefix = "data:";
    if (text.compare(0, prefix.size(), prefix) != 0)
    {
        return Frame{};
    }

    const std::string data = trimmed(text.substr(prefix.size()));
    if (data == "[DONE]")
    {
        return Frame{FrameKind::Done, "", ""};
    }

    nlohmann::json chunk = nlohmann::json::parse(data, nullptr, false);
    if (chunk.is_discarded() || !chunk.is_object())
    {
        ServerLogger::logDebug("Skipping undecodable stream line: %s", data.c_str());
        return Frame{};
    }

    auto choices = chunk.find("choices");
    if (choices == chunk.end() || !choices->is_array() || choices->empty())
    {
        return Frame{};
    }

    const nlohmann::json& choice = (*choices)[0];
    if (!choice.is_object() || !choice.contains("delta"))
    {
        return Frame{};
    }
    return fromMessage(choice["delta"], include_reasoning);
}

std::vector<std::string> LineBuffer::feed(const char* data, size_t size)
{
    pending_.append(data, size);

    std::vector<std::string> lines;
    size_t start = 0;
    size_t newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos)
    {
        lines.push_back(pending_.substr(start, newline - start));
        start = newline + 1;
    }
    pending_.erase(0, start);
    return lines;
}

std::optional<std::string> LineBuffer::flush()
{
    if (pending_.empty())
    {
        return std::nullopt;
    }
    std::string rest;
    rest.swap(pending_);
    return rest;
}

} // namespace relay
} // namespace chatraw
