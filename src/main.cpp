#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "chatraw/chat/chat_service.hpp"
#include "chatraw/http_client.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/relay/chat_store.hpp"
#include "chatraw/relay/stream_relay.hpp"
#include "chatraw/retrieval/chunk_store.hpp"
#include "chatraw/retrieval/document_service.hpp"
#include "chatraw/retrieval/embedding_client.hpp"
#include "chatraw/retrieval/rerank_fusion.hpp"
#include "chatraw/retrieval/similarity_ranker.hpp"
#include "chatraw/routes/chat_route.hpp"
#include "chatraw/routes/chats_route.hpp"
#include "chatraw/routes/documents_route.hpp"
#include "chatraw/routes/health_status_route.hpp"
#include "chatraw/routes/server_logs_route.hpp"
#include "chatraw/routes/verify_provider_route.hpp"
#include "chatraw/server.hpp"
#include "chatraw/server_config.hpp"

using namespace chatraw;

// Global flag for graceful shutdown
std::atomic<bool> keep_running{true};

void signal_handler(int /*signal*/)
{
    keep_running = false;
}

int main(int argc, char *argv[])
{
    ServerConfig config;
    if (!config.loadFromArgs(argc, argv))
    {
        if (config.helpOrVersionShown)
        {
            return 0;
        }
        std::cerr << "Failed to load configuration. Use --help for usage." << std::endl;
        return 1;
    }

    if (!config.validate())
    {
        std::cerr << "Invalid configuration." << std::endl;
        return 1;
    }

    auto &logger = ServerLogger::instance();
    logger.setLevel(ServerLogger::parseLevel(config.logLevel));
    logger.setQuietMode(config.quietMode);
    if (!config.logFile.empty() && !logger.setLogFile(config.logFile))
    {
        std::cerr << "Cannot open log file " << config.logFile << std::endl;
        return 1;
    }

    if (!config.quietMode)
    {
        config.printSummary();
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    CurlHttpClient http;
    http.init();

    retrieval::InMemoryChunkStore chunkStore;
    relay::InMemoryChatStore chatStore;

    const long connectMs = config.http.connectTimeoutMs;
    retrieval::EmbeddingClient embeddings(http, config.embeddingProvider, connectMs, config.http.embeddingTimeoutS * 1000);
    retrieval::RerankFusion fusion(http, config.rerankProvider, connectMs, config.http.rerankTimeoutS * 1000);
    retrieval::SimilarityRanker ranker(chunkStore, config.retrieval);
    relay::StreamRelay relay(http, config.chatProvider, chatStore, config.chat, connectMs, config.http.chatTimeoutS * 1000);

    retrieval::DocumentService documents(chunkStore, embeddings, config.retrieval);
    ChatService chat(chatStore, embeddings, ranker, fusion, relay, config.chatProvider.capability, config.rag);

    if (!config.chatProvider.isConfigured())
    {
        ServerLogger::logWarning("Chat provider is not configured; /api/chat will report an error");
    }
    if (!config.embeddingProvider.isConfigured())
    {
        ServerLogger::logWarning("Embedding provider is not configured; documents are stored without embeddings");
    }

    Server server(config.port, config.host);
    if (!server.init())
    {
        ServerLogger::logError("Failed to start server on %s:%s", config.host.c_str(), config.port.c_str());
        http.shutdown();
        return 1;
    }

    server.addRoute(std::make_unique<HealthStatusRoute>(config, documents));
    server.addRoute(std::make_unique<ChatRoute>(chat, config.stream));
    server.addRoute(std::make_unique<DocumentsRoute>(documents, config.rag));
    server.addRoute(std::make_unique<ChatsRoute>(chatStore));
    server.addRoute(std::make_unique<ServerLogsRoute>());
    server.addRoute(std::make_unique<VerifyProviderRoute>(http, config));

    std::thread serverThread([&server]()
                             { server.run(); });

    ServerLogger::logInfo("ChatRaw Server ready on http://%s:%s", config.host.c_str(), config.port.c_str());

    while (keep_running)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    ServerLogger::logInfo("Shutting down");
    server.stop();
    if (serverThread.joinable())
    {
        serverThread.join();
    }

    // In-flight requests still use the services and the transport below
    server.waitForConnections();
    http.shutdown();
    return 0;
}
