#include "chatraw/server_config.hpp"
#include "chatraw/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace chatraw
{
    namespace
    {
        void loadProvider(const YAML::Node &node, ProviderConfig &provider)
        {
            if (node["api_url"])
                provider.apiUrl = node["api_url"].as<std::string>();
            if (node["api_key"])
                provider.apiKey = node["api_key"].as<std::string>();
            if (node["model_id"])
                provider.modelId = node["model_id"].as<std::string>();
            if (node["context_length"])
                provider.contextLength = node["context_length"].as<int>();
            if (node["max_output"])
                provider.maxOutput = node["max_output"].as<int>();
            if (node["capability"])
            {
                auto capability = node["capability"];
                if (capability["vision"])
                    provider.capability.vision = capability["vision"].as<bool>();
                if (capability["reasoning"])
                    provider.capability.reasoning = capability["reasoning"].as<bool>();
                if (capability["tools"])
                    provider.capability.tools = capability["tools"].as<bool>();
            }
        }

        void printProvider(const char *name, const ProviderConfig &provider)
        {
            std::cout << "  " << name << ": ";
            if (!provider.isConfigured())
            {
                std::cout << "Not configured" << std::endl;
                return;
            }
            std::cout << provider.modelId << " @ " << provider.apiUrl
                      << (provider.apiKey.empty() ? "" : " (key: ****)") << std::endl;
        }

        bool tryLoad(ServerConfig &config, const std::string &path)
        {
            std::ifstream file(path);
            if (!file.good())
                return false;
            file.close();

            if (!config.loadFromFile(path))
                return false;

            config.currentConfigFilePath = std::filesystem::absolute(path).string();
            ServerLogger::instance().info("Loaded configuration from " + config.currentConfigFilePath);
            return true;
        }
    } // namespace

    bool ServerConfig::loadFromArgs(int argc, char *argv[])
    {
        // Check for config files in this order:
        // 1. Local working directory (config.yaml)
        // 2. User home directory (~/.chatraw/config.yaml)
        // An explicit -c/--config is applied on top while parsing the arguments.
        bool configLoaded = tryLoad(*this, "config.yaml");

        if (!configLoaded)
        {
            const char *homeDir = std::getenv("HOME");
            if (homeDir)
            {
                configLoaded = tryLoad(*this, std::string(homeDir) + "/.chatraw/config.yaml");
            }
        }

        if (!configLoaded)
        {
            ServerLogger::instance().info("No configuration file found, using default settings");
        }

        // Process command line arguments (they can override config file settings)
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];

            if ((arg == "-p" || arg == "--port") && i + 1 < argc)
            {
                port = argv[++i];
            }
            else if ((arg == "--host") && i + 1 < argc)
            {
                host = argv[++i];
            }
            else if ((arg == "-c" || arg == "--config") && i + 1 < argc)
            {
                std::string configFile = argv[++i];
                if (!loadFromFile(configFile))
                {
                    return false;
                }
                currentConfigFilePath = std::filesystem::absolute(configFile).string();
                ServerLogger::instance().info("Loaded configuration from " + configFile);
            }
            else if ((arg == "--log-level") && i + 1 < argc)
            {
                logLevel = argv[++i];
            }
            else if ((arg == "--log-file") && i + 1 < argc)
            {
                logFile = argv[++i];
            }
            else if (arg == "--quiet")
            {
                quietMode = true;
            }
            else if (arg == "--no-stream")
            {
                stream = false;
            }
            else if (arg == "-h" || arg == "--help")
            {
                printHelp();
                helpOrVersionShown = true;
                return false;
            }
            else if (arg == "-v" || arg == "--version")
            {
                printVersion();
                helpOrVersionShown = true;
                return false;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
        }

        return true;
    }

    bool ServerConfig::loadFromFile(const std::string &configFile)
    {
        try
        {
            YAML::Node config = YAML::LoadFile(configFile);

            if (config["server"])
            {
                auto server = config["server"];
                if (server["port"])
                    port = server["port"].as<std::string>();
                if (server["host"])
                    host = server["host"].as<std::string>();
                if (server["stream"])
                    stream = server["stream"].as<bool>();
            }

            if (config["logging"])
            {
                auto logging = config["logging"];
                if (logging["level"])
                    logLevel = logging["level"].as<std::string>();
                if (logging["file"])
                    logFile = logging["file"].as<std::string>();
                if (logging["quiet_mode"])
                    quietMode = logging["quiet_mode"].as<bool>();
            }

            if (config["providers"])
            {
                auto providers = config["providers"];
                if (providers["chat"])
                    loadProvider(providers["chat"], chatProvider);
                if (providers["embedding"])
                    loadProvider(providers["embedding"], embeddingProvider);
                if (providers["rerank"])
                    loadProvider(providers["rerank"], rerankProvider);
            }

            if (config["chat"])
            {
                auto chatNode = config["chat"];
                if (chatNode["temperature"])
                    chat.temperature = chatNode["temperature"].as<double>();
                if (chatNode["top_p"])
                    chat.topP = chatNode["top_p"].as<double>();
            }

            if (config["rag"])
            {
                auto ragNode = config["rag"];
                if (ragNode["chunk_size"])
                    rag.chunkSize = ragNode["chunk_size"].as<int>();
                if (ragNode["chunk_overlap"])
                    rag.chunkOverlap = ragNode["chunk_overlap"].as<int>();
                if (ragNode["top_k"])
                    rag.topK = ragNode["top_k"].as<int>();
                if (ragNode["score_threshold"])
                    rag.scoreThreshold = ragNode["score_threshold"].as<float>();
            }

            if (config["retrieval"])
            {
                auto retrievalNode = config["retrieval"];
                if (retrievalNode["page_size"])
                    retrieval.pageSize = retrievalNode["page_size"].as<int>();
                if (retrievalNode["max_candidates"])
                    retrieval.maxCandidates = retrievalNode["max_candidates"].as<int>();
                if (retrievalNode["embedding_batch_size"])
                    retrieval.embeddingBatchSize = retrievalNode["embedding_batch_size"].as<int>();
            }

            if (config["http"])
            {
                auto httpNode = config["http"];
                if (httpNode["connect_timeout_ms"])
                    http.connectTimeoutMs = httpNode["connect_timeout_ms"].as<long>();
                if (httpNode["chat_timeout_s"])
                    http.chatTimeoutS = httpNode["chat_timeout_s"].as<long>();
                if (httpNode["embedding_timeout_s"])
                    http.embeddingTimeoutS = httpNode["embedding_timeout_s"].as<long>();
                if (httpNode["rerank_timeout_s"])
                    http.rerankTimeoutS = httpNode["rerank_timeout_s"].as<long>();
            }

            return true;
        }
        catch (const YAML::Exception &e)
        {
            std::cerr << "Error parsing config file " << configFile << ": " << e.what() << std::endl;
            return false;
        }
    }

    bool ServerConfig::validate() const
    {
        try
        {
            int portNum = std::stoi(port);
            if (portNum < 1 || portNum > 65535)
            {
                std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
                return false;
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Error: Invalid port number: " << port << std::endl;
            return false;
        }

        if (logLevel != "DEBUG" && logLevel != "INFO" && logLevel != "WARN" && logLevel != "WARNING" && logLevel != "ERROR")
        {
            std::cerr << "Error: Invalid log level: " << logLevel << std::endl;
            return false;
        }

        if (rag.chunkSize <= 0)
        {
            std::cerr << "Error: rag.chunk_size must be positive" << std::endl;
            return false;
        }
        if (rag.chunkOverlap < 0)
        {
            std::cerr << "Error: rag.chunk_overlap cannot be negative" << std::endl;
            return false;
        }
        if (rag.topK <= 0)
        {
            std::cerr << "Error: rag.top_k must be positive" << std::endl;
            return false;
        }
        if (rag.scoreThreshold < -1.0f || rag.scoreThreshold > 1.0f)
        {
            std::cerr << "Error: rag.score_threshold must be between -1 and 1" << std::endl;
            return false;
        }

        if (retrieval.pageSize <= 0 || retrieval.maxCandidates <= 0 || retrieval.embeddingBatchSize <= 0)
        {
            std::cerr << "Error: retrieval page_size, max_candidates and embedding_batch_size must be positive" << std::endl;
            return false;
        }

        if (http.connectTimeoutMs <= 0 || http.chatTimeoutS <= 0 || http.embeddingTimeoutS <= 0 || http.rerankTimeoutS <= 0)
        {
            std::cerr << "Error: HTTP timeouts must be positive" << std::endl;
            return false;
        }

        return true;
    }

    void ServerConfig::printSummary() const
    {
        std::cout << "=== ChatRaw Server Configuration ===" << std::endl;
        std::cout << "Server:" << std::endl;
        std::cout << "  Port: " << port << std::endl;
        std::cout << "  Host: " << host << std::endl;
        std::cout << "  Streaming: " << (stream ? "Enabled" : "Disabled") << std::endl;

        std::cout << "\nLogging:" << std::endl;
        std::cout << "  Level: " << logLevel << std::endl;
        std::cout << "  File: " << (logFile.empty() ? "Console" : logFile) << std::endl;

        std::cout << "\nProviders:" << std::endl;
        printProvider("Chat", chatProvider);
        printProvider("Embedding", embeddingProvider);
        printProvider("Rerank", rerankProvider);

        std::cout << "\nRAG:" << std::endl;
        std::cout << "  Chunk Size: " << rag.chunkSize << " (overlap " << rag.chunkOverlap << ")" << std::endl;
        std::cout << "  Top K: " << rag.topK << std::endl;
        std::cout << "  Score Threshold: " << rag.scoreThreshold << std::endl;
        std::cout << "  Page Size: " << retrieval.pageSize << ", Max Candidates: " << retrieval.maxCandidates << std::endl;

        std::cout << "\nTimeouts:" << std::endl;
        std::cout << "  Connect: " << http.connectTimeoutMs << "ms" << std::endl;
        std::cout << "  Chat: " << http.chatTimeoutS << "s, Embedding: " << http.embeddingTimeoutS
                  << "s, Rerank: " << http.rerankTimeoutS << "s" << std::endl;
        std::cout << "====================================" << std::endl;
    }

    void ServerConfig::printHelp()
    {
        std::cout << "ChatRaw Server v1.0.0 - Retrieval-augmented chat relay\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    chatraw-server [OPTIONS]\n\n";
        std::cout << "OPTIONS:\n";
        std::cout << "    -p, --port PORT           Server port (default: 8080)\n";
        std::cout << "    --host HOST               Server host (default: 0.0.0.0)\n";
        std::cout << "    -c, --config FILE         Load configuration from YAML file\n";
        std::cout << "    --no-stream               Answer chat requests with a single JSON object\n";
        std::cout << "    --log-level LEVEL         Log level: DEBUG, INFO, WARN, ERROR (default: INFO)\n";
        std::cout << "    --log-file FILE           Also write log lines to FILE\n";
        std::cout << "    --quiet                   Suppress INFO messages on the console\n";
        std::cout << "    -h, --help                Show this help message\n";
        std::cout << "    -v, --version             Show version information\n\n";
        std::cout << "Configuration is read from ./config.yaml or ~/.chatraw/config.yaml when present.\n";
    }

    void ServerConfig::printVersion()
    {
        std::cout << "ChatRaw Server v1.0.0\n";
        std::cout << "Retrieval-augmented chat relay for OpenAI-compatible providers\n";
    }

} // namespace chatraw
