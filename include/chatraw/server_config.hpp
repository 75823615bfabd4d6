#pragma once

#include <string>
#include "export.hpp"
#include "provider_config.hpp"
#include "retrieval/retrieval_settings.hpp"

namespace chatraw
{

/**
 * @brief Generation defaults applied to every chat request
 */
struct ChatSettings
{
    double temperature = 0.7;
    double topP = 0.9;
};

/**
 * @brief Timeouts for outbound provider calls
 */
struct HttpTimeouts
{
    long connectTimeoutMs = 10000;
    long chatTimeoutS = 300;
    long embeddingTimeoutS = 60;
    long rerankTimeoutS = 30;
};

/**
 * @brief Server startup configuration
 */
struct CHATRAW_SERVER_API ServerConfig
{
    // Basic server settings
    std::string port = "8080";
    std::string host = "0.0.0.0";
    bool stream = true;               // Stream chat answers as NDJSON; false answers one JSON object

    // Logging configuration
    std::string logLevel = "INFO";    // DEBUG, INFO, WARN, ERROR
    std::string logFile = "";         // Empty means console only
    bool quietMode = false;           // Suppress routine operational messages

    // Providers
    ProviderConfig chatProvider;
    ProviderConfig embeddingProvider;
    ProviderConfig rerankProvider;

    ChatSettings chat;
    retrieval::RetrievalSettings rag;
    retrieval::RetrievalTuning retrieval;
    HttpTimeouts http;

    // Internal flags
    bool helpOrVersionShown = false;  // Tracks if help/version was displayed

    std::string currentConfigFilePath;

    ServerConfig() = default;

    /**
     * @brief Load configuration from the default locations and command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return True if configuration was loaded successfully
     */
    bool loadFromArgs(int argc, char* argv[]);

    /**
     * @brief Load configuration from YAML file
     * @param configFile Path to configuration file
     * @return True if configuration was loaded successfully
     */
    bool loadFromFile(const std::string& configFile);

    /**
     * @brief Validate the configuration
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Print configuration summary (API keys are masked)
     */
    void printSummary() const;

    static void printHelp();

    static void printVersion();
};

} // namespace chatraw
