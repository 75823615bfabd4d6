#ifndef CHATRAW_CHAT_STORE_HPP
#define CHATRAW_CHAT_STORE_HPP

#include "../export.hpp"
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <vector>

namespace chatraw
{
namespace relay
{

struct ChatRecord
{
    std::string id;
    std::string title;
    std::string createdAt;
    std::string updatedAt;

    nlohmann::json to_json() const;
};

struct MessageRecord
{
    std::string id;
    std::string chatId;
    std::string role;
    std::string content;
    std::string createdAt;

    nlohmann::json to_json() const;
};

/**
 * @brief Conversation persistence used by the chat flow
 */
class CHATRAW_SERVER_API IChatStore
{
public:
    virtual ~IChatStore() = default;

    virtual ChatRecord createChat(const std::string& title) = 0;

    virtual bool hasChat(const std::string& chatId) const = 0;

    // Most recently updated first
    virtual std::vector<ChatRecord> listChats() const = 0;

    virtual bool deleteChat(const std::string& chatId) = 0;

    // Oldest first
    virtual std::vector<MessageRecord> getMessages(const std::string& chatId) const = 0;

    /**
     * @brief Append a message and touch the chat's update time
     * @throws std::invalid_argument if the chat does not exist
     */
    virtual MessageRecord addMessage(const std::string& chatId, const std::string& role, const std::string& content) = 0;

    virtual size_t countMessages(const std::string& chatId) const = 0;

    virtual void updateChatTitle(const std::string& chatId, const std::string& title) = 0;
};

/**
 * @brief Thread-safe in-process chat store
 *
 * Keeps at most max_chats conversations: creating a chat evicts the least
 * recently updated ones beyond max_chats - 1.
 */
class CHATRAW_SERVER_API InMemoryChatStore : public IChatStore
{
public:
    explicit InMemoryChatStore(size_t max_chats = 10);

    ChatRecord createChat(const std::string& title) override;
    bool hasChat(const std::string& chatId) const override;
    std::vector<ChatRecord> listChats() const override;
    bool deleteChat(const std::string& chatId) override;
    std::vector<MessageRecord> getMessages(const std::string& chatId) const override;
    MessageRecord addMessage(const std::string& chatId, const std::string& role, const std::string& content) override;
    size_t countMessages(const std::string& chatId) const override;
    void updateChatTitle(const std::string& chatId, const std::string& title) override;

private:
    struct Conversation
    {
        ChatRecord chat;
        std::vector<MessageRecord> messages;
        unsigned long long sequence = 0;       // Orders updates made within the same timestamp tick
    };

    Conversation* find(const std::string& chatId);
    const Conversation* find(const std::string& chatId) const;

    size_t maxChats_;
    unsigned long long nextSequence_ = 0;
    mutable std::shared_mutex mutex_;
    std::vector<Conversation> conversations_;
};

} // namespace relay
} // namespace chatraw

#endif // CHATRAW_CHAT_STORE_HPP
