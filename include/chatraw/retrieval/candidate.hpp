#ifndef CHATRAW_CANDIDATE_HPP
#define CHATRAW_CANDIDATE_HPP

#include <string>
#include <utility>

namespace chatraw
{
namespace retrieval
{

/**
 * @brief A retrieved chunk and its score
 *
 * The score is a cosine similarity or, after reranking, the rerank relevance score.
 */
struct Candidate
{
    std::string content;
    float score = 0.0f;

    Candidate() = default;
    Candidate(std::string text, float value) : content(std::move(text)), score(value) {}

    bool operator==(const Candidate& other) const
    {
        return content == other.content && score == other.score;
    }
};

} // namespace retrieval
} // namespace chatraw

#endif // CHATRAW_CANDIDATE_HPP
