#include "chatraw/models/rerank_model.hpp"
#include <stdexcept>

namespace chatraw
{

bool RerankRequest::validate() const
{
    return !query.empty() && !documents.empty();
}

nlohmann::json RerankRequest::to_json() const
{
    nlohmann::json j;
    j["model"] = model;
    j["query"] = query;
    j["documents"] = documents;
    j["return_documents"] = return_documents;
    return j;
}

void RerankRequest::from_json(const nlohmann::json& j)
{
    if (!j.contains("query") || !j["query"].is_string())
    {
        throw std::runtime_error("Missing or invalid 'query' field - must be a string");
    }
    query = j["query"].get<std::string>();

    if (!j.contains("documents") || !j["documents"].is_array())
    {
        throw std::runtime_error("Missing or invalid 'documents' field - must be an array of strings");
    }
    documents = j["documents"].get<std::vector<std::string>>();

    if (j.contains("model") && j["model"].is_string())
    {
        model = j["model"].get<std::string>();
    }
    if (j.contains("return_documents") && j["return_documents"].is_boolean())
    {
        return_documents = j["return_documents"].get<bool>();
    }
}

bool RerankResponse::validate() const
{
    return !results.empty();
}

nlohmann::json RerankResponse::to_json() const
{
    nlohmann::json items = nlohmann::json::array();
    for (const auto& result : results)
    {
        items.push_back({{"index", result.index}, {"relevance_score", result.score}});
    }
    return nlohmann::json{{"results", items}};
}

void RerankResponse::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw std::runtime_error("Rerank response must be a JSON object");
    }

    const nlohmann::json* items = nullptr;
    if (j.contains("results") && j["results"].is_array())
    {
        items = &j["results"];
    }
    else if (j.contains("data") && j["data"].is_array())
    {
        items = &j["data"];
    }
    else
    {
        throw std::runtime_error("Rerank response without a 'results' or 'data' array");
    }

    results.clear();
    for (const auto& item : *items)
    {
        if (!item.contains("index") || !item["index"].is_number_integer())
        {
            throw std::runtime_error("Rerank result without an integer 'index'");
        }

        RerankResult result;
        result.index = item["index"].get<int>();
        if (item.contains("score") && item["score"].is_number())
        {
            result.score = item["score"].get<float>();
        }
        else if (item.contains("relevance_score") && item["relevance_score"].is_number())
        {
            result.score = item["relevance_score"].get<float>();
        }
        results.push_back(result);
    }
}

} // namespace chatraw
