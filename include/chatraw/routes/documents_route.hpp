#ifndef CHATRAW_DOCUMENTS_ROUTE_HPP
#define CHATRAW_DOCUMENTS_ROUTE_HPP

#include "route_interface.hpp"
#include "../retrieval/document_service.hpp"
#include "../retrieval/retrieval_settings.hpp"
#include <string>

namespace chatraw {

    /**
     * @brief Document endpoints
     *
     * POST /api/documents streams ingestion progress as NDJSON,
     * GET /api/documents lists documents, DELETE /api/documents/{id} removes one.
     */
    class DocumentsRoute : public IRoute {
    public:
        DocumentsRoute(retrieval::DocumentService& service, retrieval::RetrievalSettings settings);

        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const std::string& body) override;

    private:
        void handleUpload(SocketType sock, const std::string& body);
        void handleList(SocketType sock);
        void handleDelete(SocketType sock, const std::string& documentId);

        // Set by match() for the handle() call that follows on the same thread
        static thread_local std::string current_method_;
        static thread_local std::string current_path_;

        retrieval::DocumentService& service_;
        retrieval::RetrievalSettings settings_;
    };

} // namespace chatraw

#endif // CHATRAW_DOCUMENTS_ROUTE_HPP
