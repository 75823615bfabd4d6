#include "chatraw/models/embedding_model.hpp"
#include <algorithm>
#include <stdexcept>

namespace chatraw
{

bool EmbeddingRequest::validate() const
{
    return !input.empty();
}

nlohmann::json EmbeddingRequest::to_json() const
{
    nlohmann::json j;
    j["model"] = model;
    j["input"] = input;
    return j;
}

void EmbeddingRequest::from_json(const nlohmann::json& j)
{
    if (j.contains("model") && j["model"].is_string())
    {
        model = j["model"].get<std::string>();
    }

    if (!j.contains("input") || !j["input"].is_array())
    {
        throw std::runtime_error("Missing or invalid 'input' field - must be an array of strings");
    }
    input = j["input"].get<std::vector<std::string>>();
}

void EmbeddingData::from_json(const nlohmann::json& j)
{
    // A missing, null or non-numeric vector leaves the embedding empty; the item still keeps its index
    embedding.clear();
    if (j.contains("embedding") && j["embedding"].is_array())
    {
        const auto& values = j["embedding"];
        const bool numeric = std::all_of(values.begin(), values.end(),
                                         [](const nlohmann::json& value) { return value.is_number(); });
        if (numeric)
        {
            embedding = values.get<std::vector<float>>();
        }
    }

    if (j.contains("index"))
    {
        if (!j["index"].is_number_integer())
        {
            throw std::runtime_error("Field 'index' must be an integer");
        }
        index = j["index"].get<int>();
    }
}

bool EmbeddingResponse::validate() const
{
    return !data.empty();
}

nlohmann::json EmbeddingResponse::to_json() const
{
    nlohmann::json data_array = nlohmann::json::array();
    for (const auto& item : data)
    {
        data_array.push_back({{"object", "embedding"}, {"embedding", item.embedding}, {"index", item.index}});
    }

    nlohmann::json j;
    j["object"] = "list";
    j["data"] = data_array;
    j["model"] = model;
    return j;
}

void EmbeddingResponse::from_json(const nlohmann::json& j)
{
    if (!j.is_object() || !j.contains("data") || !j["data"].is_array())
    {
        throw std::runtime_error("Embedding response without a 'data' array");
    }

    data.clear();
    int position = 0;
    for (const auto& item : j["data"])
    {
        EmbeddingData embedding_data;
        embedding_data.index = position++;
        embedding_data.from_json(item);
        data.push_back(std::move(embedding_data));
    }

    if (j.contains("model") && j["model"].is_string())
    {
        model = j["model"].get<std::string>();
    }
}

} // namespace chatraw
