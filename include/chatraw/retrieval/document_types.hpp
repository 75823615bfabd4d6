#ifndef CHATRAW_DOCUMENT_TYPES_HPP
#define CHATRAW_DOCUMENT_TYPES_HPP

#include "../export.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace chatraw
{
namespace retrieval
{

/**
 * @brief Body of POST /api/documents
 *
 * content is the already-extracted document text.
 */
struct CHATRAW_SERVER_API UploadDocumentRequest
{
    std::string filename;
    std::string content;

    void from_json(const nlohmann::json& j);
    bool validate() const;
};

/**
 * @brief Outcome of ingesting one document
 */
struct CHATRAW_SERVER_API IngestResult
{
    bool success = false;
    std::string error_message;
    std::string document_id;
    size_t chunk_count = 0;
    size_t embedded_count = 0;                 // Chunks stored with an embedding

    nlohmann::json to_json() const;
};

} // namespace retrieval
} // namespace chatraw

#endif // CHATRAW_DOCUMENT_TYPES_HPP
