#include "chatraw/retrieval/document_types.hpp"
#include "chatraw/logger.hpp"
#include <stdexcept>

namespace chatraw
{
namespace retrieval
{

void UploadDocumentRequest::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw std::runtime_error("Request body must be a JSON object");
    }
    if (!j.contains("filename") || !j["filename"].is_string())
    {
        throw std::runtime_error("Missing or invalid 'filename' field - must be a string");
    }
    if (!j.contains("content") || !j["content"].is_string())
    {
        throw std::runtime_error("Missing or invalid 'content' field - must be a string");
    }

    filename = j["filename"].get<std::string>();
    content = j["content"].get<std::string>();
}

bool UploadDocumentRequest::validate() const
{
    if (filename.empty())
    {
        ServerLogger::logDebug("Validation failed: filename is empty");
        return false;
    }
    return true;
}

nlohmann::json IngestResult::to_json() const
{
    nlohmann::json j;
    j["success"] = success;
    j["document_id"] = document_id;
    j["chunks"] = chunk_count;
    j["embedded"] = embedded_count;
    if (!success)
    {
        j["error"] = error_message;
    }
    return j;
}

} // namespace retrieval
} // namespace chatraw
