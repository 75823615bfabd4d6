#include "chatraw/relay/chat_store.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/store_utils.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace chatraw
{
namespace relay
{

nlohmann::json ChatRecord::to_json() const
{
    return nlohmann::json{{"id", id}, {"title", title}, {"created_at", createdAt}, {"updated_at", updatedAt}};
}

nlohmann::json MessageRecord::to_json() const
{
    return nlohmann::json{
        {"id", id}, {"chat_id", chatId}, {"role", role}, {"content", content}, {"created_at", createdAt}};
}

InMemoryChatStore::InMemoryChatStore(size_t max_chats) : maxChats_(std::max<size_t>(1, max_chats))
{
}

InMemoryChatStore::Conversation* InMemoryChatStore::find(const std::string& chatId)
{
    auto it = std::find_if(conversations_.begin(), conversations_.end(),
                           [&chatId](const Conversation& c) { return c.chat.id == chatId; });
    return it == conversations_.end() ? nullptr : &*it;
}

const InMemoryChatStore::Conversation* InMemoryChatStore::find(const std::string& chatId) const
{
    auto it = std::find_if(conversations_.begin(), conversations_.end(),
                           [&chatId](const Conversation& c) { return c.chat.id == chatId; });
    return it == conversations_.end() ? nullptr : &*it;
}

ChatRecord InMemoryChatStore::createChat(const std::string& title)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (conversations_.size() >= maxChats_)
    {
        std::sort(conversations_.begin(), conversations_.end(),
                  [](const Conversation& a, const Conversation& b) { return a.sequence > b.sequence; });
        const size_t evicted = conversations_.size() - (maxChats_ - 1);
        conversations_.resize(maxChats_ - 1);
        ServerLogger::logDebug("Evicted %zu old chats", evicted);
    }

    Conversation conversation;
    conversation.chat.id = generateUuid();
    conversation.chat.title = title;
    conversation.chat.createdAt = currentIsoTimestamp();
    conversation.chat.updatedAt = conversation.chat.createdAt;
    conversation.sequence = ++nextSequence_;
    conversations_.push_back(conversation);
    return conversation.chat;
}

bool InMemoryChatStore::hasChat(const std::string& chatId) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return find(chatId) != nullptr;
}

std::vector<ChatRecord> InMemoryChatStore::listChats() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<const Conversation*> ordered;
    for (const auto& conversation : conversations_)
    {
        ordered.push_back(&conversation);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const Conversation* a, const Conversation* b) { return a->sequence > b->sequence; });

    std::vector<ChatRecord> chats;
    for (const auto* conversation : ordered)
    {
        chats.push_back(conversation->chat);
    }
    return chats;
}

bool InMemoryChatStore::deleteChat(const std::string& chatId)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(conversations_.begin(), conversations_.end(),
                           [&chatId](const Conversation& c) { return c.chat.id == chatId; });
    if (it == conversations_.end())
    {
        return false;
    }
    conversations_.erase(it);
    return true;
}

std::vector<MessageRecord> InMemoryChatStore::getMessages(const std::string& chatId) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Conversation* conversation = find(chatId);
    return conversation ? conversation->messages : std::vector<MessageRecord>();
}

MessageRecord InMemoryChatStore::addMessage(const std::string& chatId, const std::string& role,
                                            const std::string& content)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Conversation* conversation = find(chatId);
    if (!conversation)
    {
        throw std::invalid_argument("Unknown chat: " + chatId);
    }

    MessageRecord message{generateUuid(), chatId, role, content, currentIsoTimestamp()};
    conversation->messages.push_back(message);
    conversation->chat.updatedAt = message.createdAt;
    conversation->sequence = ++nextSequence_;
    return message;
}

size_t InMemoryChatStore::countMessages(const std::string& chatId) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Conversation* conversation = find(chatId);
    return conversation ? conversation->messages.size() : 0;
}

void InMemoryChatStore::updateChatTitle(const std::string& chatId, const std::string& title)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Conversation* conversation = find(chatId);
    if (!conversation)
    {
        return;
    }
    conversation->chat.title = title;
    conversation->chat.updatedAt = currentIsoTimestamp();
    conversation->sequence = ++nextSequence_;
}

} // namespace relay
} // namespace chatraw
