#ifndef CHATRAW_RERANK_MODEL_HPP
#define CHATRAW_RERANK_MODEL_HPP

#include "model_interface.hpp"
#include <string>
#include <vector>

namespace chatraw
{

/**
 * @brief Body of POST {base}/rerank
 */
class RerankRequest : public IModel
{
public:
    std::string model;
    std::string query;
    std::vector<std::string> documents;
    bool return_documents = false;

    bool validate() const override;
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct RerankResult
{
    int index = 0;
    float score = 0.0f;
};

/**
 * @brief Rerank provider answer
 *
 * Accepts results under "results" or "data" and the score under "score" or "relevance_score".
 */
class RerankResponse : public IModel
{
public:
    std::vector<RerankResult> results;

    bool validate() const override;
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

} // namespace chatraw

#endif // CHATRAW_RERANK_MODEL_HPP
