#ifndef CHATRAW_EMBEDDING_MODEL_HPP
#define CHATRAW_EMBEDDING_MODEL_HPP

#include "model_interface.hpp"
#include <string>
#include <vector>

namespace chatraw
{

/**
 * @brief Body of POST {base}/embeddings
 */
class EmbeddingRequest : public IModel
{
public:
    std::string model;
    std::vector<std::string> input;

    bool validate() const override;
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct EmbeddingData
{
    std::vector<float> embedding;
    int index = 0;

    void from_json(const nlohmann::json& j);
};

/**
 * @brief Provider answer to an embeddings request
 *
 * Items are kept in the order the provider listed them; callers reorder by index.
 */
class EmbeddingResponse : public IModel
{
public:
    std::vector<EmbeddingData> data;
    std::string model;

    bool validate() const override;
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

} // namespace chatraw

#endif // CHATRAW_EMBEDDING_MODEL_HPP
