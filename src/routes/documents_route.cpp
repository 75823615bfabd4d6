#include "chatraw/routes/documents_route.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/utils.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chatraw
{
    thread_local std::string DocumentsRoute::current_method_;
    thread_local std::string DocumentsRoute::current_path_;

    namespace
    {
        const std::string kDocumentsPath = "/api/documents";
    }

    DocumentsRoute::DocumentsRoute(retrieval::DocumentService &service, retrieval::RetrievalSettings settings)
        : service_(service), settings_(settings)
    {
    }

    bool DocumentsRoute::match(const std::string &method, const std::string &path)
    {
        bool matches = false;
        if (path == kDocumentsPath)
        {
            matches = method == "POST" || method == "GET";
        }
        else if (method == "DELETE" && path.compare(0, kDocumentsPath.size() + 1, kDocumentsPath + "/") == 0)
        {
            matches = path.size() > kDocumentsPath.size() + 1 && path.find('/', kDocumentsPath.size() + 1) == std::string::npos;
        }

        if (matches)
        {
            current_method_ = method;
            current_path_ = path;
        }
        return matches;
    }

    void DocumentsRoute::handle(SocketType sock, const std::string &body)
    {
        if (current_method_ == "POST")
        {
            handleUpload(sock, body);
        }
        else if (current_method_ == "GET")
        {
            handleList(sock);
        }
        else
        {
            handleDelete(sock, current_path_.substr(kDocumentsPath.size() + 1));
        }
    }

    void DocumentsRoute::handleUpload(SocketType sock, const std::string &body)
    {
        retrieval::UploadDocumentRequest request;
        try
        {
            request.from_json(json::parse(body));
        }
        catch (const json::parse_error &)
        {
            send_response(sock, 400, make_error_body("Invalid JSON in request body", "invalid_request_error").dump());
            return;
        }
        catch (const std::runtime_error &ex)
        {
            send_response(sock, 400, make_error_body(ex.what(), "invalid_request_error").dump());
            return;
        }

        if (!request.validate())
        {
            send_response(sock, 400, make_error_body("Filename is required", "invalid_request_error").dump());
            return;
        }

        ServerLogger::logInfo("Ingesting document %s (%zu bytes)", request.filename.c_str(), request.content.size());

        bool clientConnected = begin_streaming_response(sock, 200, {{"Content-Type", "application/x-ndjson"}});

        // Ingestion runs to the end even if the uploader disconnects
        auto progress = [sock, &clientConnected](const json &event) {
            if (clientConnected)
            {
                clientConnected = send_stream_chunk(sock, StreamChunk(event.dump(-1, ' ', false, json::error_handler_t::replace) + "\n"));
            }
        };

        retrieval::IngestResult result = service_.ingest(request.filename, request.content, settings_, progress);
        if (!result.success)
        {
            progress({{"status", "error"}, {"error", result.error_message}});
        }

        if (clientConnected)
        {
            send_stream_chunk(sock, StreamChunk("", true));
        }
    }

    void DocumentsRoute::handleList(SocketType sock)
    {
        json documents = json::array();
        for (const auto &summary : service_.list())
        {
            documents.push_back(summary.to_json());
        }
        send_response(sock, 200, documents.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    void DocumentsRoute::handleDelete(SocketType sock, const std::string &documentId)
    {
        if (!service_.remove(documentId))
        {
            send_response(sock, 404, make_error_body("Document not found: " + documentId, "invalid_request_error").dump());
            return;
        }
        send_response(sock, 200, json{{"success", true}}.dump());
    }

} // namespace chatraw
