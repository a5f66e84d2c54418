#include <httplib.h>
#include "BatchIndexWriter.hpp"
#include "DocumentRegistry.hpp"
#include "EmbeddingClient.hpp"
#include "Errors.hpp"
#include "IngestionOrchestrator.hpp"
#include "PDFLayoutReader.hpp"
#include "PDFProcessingPool.hpp"
#include "QueryLog.hpp"
#include "SearchService.hpp"
#include "ServiceConfig.hpp"
#include "VectorStore.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace {

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    // Invalid UTF-8 from queries or PDF text is replaced rather than failing the response
    res.set_content(body.dump(2, ' ', false, json::error_handler_t::replace), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    json body;
    body["error"] = message;
    send_json(res, status, body);
}

bool param_is_true(const httplib::Request& req, const char* name) {
    if (!req.has_param(name)) return false;
    std::string v = req.get_param_value(name);
    return v == "1" || v == "true" || v == "yes";
}

// Shared by GET (query string) and POST (JSON body) search
SearchRequest search_request_from_json(const json& j) {
    SearchRequest request;
    if (!j.contains("query") || !j["query"].is_string()) {
        throw std::invalid_argument("'query' must be a string");
    }
    request.query = j["query"].get<std::string>();
    request.max_results = j.value("max_results", 10);
    if (j.contains("document_id") && !j["document_id"].is_null()) {
        request.filters.document_id = j["document_id"].get<std::string>();
    }
    if (j.contains("section") && !j["section"].is_null()) {
        request.filters.section = j["section"].get<std::string>();
    }
    if (j.contains("chunk_type") && !j["chunk_type"].is_null()) {
        std::string name = j["chunk_type"].get<std::string>();
        request.filters.chunk_type = chunk_type_from_string(name);
        if (!request.filters.chunk_type) {
            throw std::invalid_argument("unknown chunk_type '" + name + "'");
        }
    }
    return request;
}

void run_search(const SearchService& search, const json& params, httplib::Response& res) {
    try {
        SearchRequest request = search_request_from_json(params);
        send_json(res, 200, search.search(request));
    } catch (const StoreUnavailable& e) {
        send_error(res, 503, e.what());
    } catch (const DimensionMismatch& e) {
        std::cerr << "[Server] Embedding model and store disagree: " << e.what() << std::endl;
        send_error(res, 500, e.what());
    } catch (const std::invalid_argument& e) {
        send_error(res, 400, e.what());
    } catch (const json::exception& e) {
        send_error(res, 400, std::string("bad search parameters: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "[Server] Search failed: " << e.what() << std::endl;
        send_error(res, 500, e.what());
    }
}

// Builds the ingestion input from the upload: JSON text/sections or layout, multipart file, or raw PDF body
IngestionRequest ingestion_request_from_upload(const std::string& document_id, const httplib::Request& req) {
    IngestionRequest request;
    request.document_id = document_id;

    std::string content_type = req.get_header_value("Content-Type");
    if (content_type.find("application/json") != std::string::npos) {
        json body = json::parse(req.body);
        if (body.contains("full_text")) {
            request.full_text = body["full_text"].get<std::string>();
            request.sections = sections_from_json(body.value("sections", json()));
        } else if (body.contains("layout")) {
            request.layout = PDFLayoutReader::parse_layout_json(body["layout"]);
        } else {
            throw std::invalid_argument("JSON upload needs 'full_text' or 'layout'");
        }
    } else if (content_type.find("multipart/form-data") != std::string::npos) {
        if (!req.form.has_file("file")) {
            throw std::invalid_argument("multipart upload needs a 'file' part");
        }
        request.pdf_bytes = req.form.get_file("file").content;
    } else {
        request.pdf_bytes = req.body;
    }
    return request;
}

int status_code_for(const IngestionResult& result) {
    if (result.success) return 200;
    if (result.rejected || result.cancelled) return 409;
    return 422;
}

}

int main(int argc, char** argv) {
    std::string config_path = argc > 1 ? argv[1] : "config/paperindex.json";

    std::cout << "[Main] Initializing paperindex...\n";

    ServiceConfig config;
    try {
        config = ServiceConfig::load(config_path);
    } catch (const std::exception& e) {
        std::cerr << "[Main] Invalid configuration " << config_path << ": " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<EmbeddingClient> embedder;
    try {
        embedder = make_embedding_client(config.embedding);
    } catch (const std::exception& e) {
        std::cerr << "[Main] Could not create embedding client: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[Main] Embedding model " << embedder->model_name()
              << " (dimension " << embedder->dimension() << ")\n";

    const std::string data_dir = config.storage.data_dir;

    VectorStore store(embedder->dimension());
    try {
        store.load(data_dir + "/vectors.bin");
    } catch (const std::exception& e) {
        // Searches report 503 until the snapshot is repaired or re-ingested
        std::cerr << "[Main] Vector snapshot unusable: " << e.what() << std::endl;
        store.set_available(false);
    }

    DocumentRegistry registry;
    registry.load(data_dir + "/documents.json");

    QueryLog query_log(data_dir + "/search_queries.jsonl");

    BatchIndexWriter batch_writer(
        store,
        registry,
        data_dir,
        config.storage.flush_batch_size,
        std::chrono::seconds(config.storage.flush_interval_seconds)
    );

    PDFLayoutReader layout_reader(config.extraction);
    layout_reader.cleanup_temp_files();

    IngestionOrchestrator orchestrator(layout_reader, *embedder, store, registry, config, &batch_writer);
    PDFProcessingPool processing_pool(config.server.processing_workers, orchestrator);

    SearchService search(store, *embedder, &query_log, config.server.max_results_cap);

    httplib::Server svr;

    // CORS middleware - Add CORS headers to all responses
    svr.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    // Handle CORS preflight requests
    svr.Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    // GET /search?q=...&max_results=&document_id=&section=&chunk_type=
    svr.Get("/search", [&](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("q")) {
            send_error(res, 400, "Missing 'q' parameter");
            return;
        }
        json params;
        params["query"] = req.get_param_value("q");
        try {
            if (req.has_param("max_results")) {
                params["max_results"] = std::stoi(req.get_param_value("max_results"));
            }
        } catch (const std::exception&) {
            send_error(res, 400, "max_results must be an integer");
            return;
        }
        for (const char* key : {"document_id", "section", "chunk_type"}) {
            if (req.has_param(key)) params[key] = req.get_param_value(key);
        }
        run_search(search, params, res);
    });

    svr.Post("/search", [&](const httplib::Request& req, httplib::Response& res) {
        json params;
        try {
            params = json::parse(req.body);
        } catch (const json::parse_error& e) {
            send_error(res, 400, std::string("invalid JSON: ") + e.what());
            return;
        }
        run_search(search, params, res);
    });

    // POST /documents/<id>/process[?async=true]
    svr.Post(R"(/documents/([^/]+)/process)", [&](const httplib::Request& req, httplib::Response& res) {
        std::string document_id = req.matches[1];

        IngestionRequest request;
        try {
            request = ingestion_request_from_upload(document_id, req);
        } catch (const std::exception& e) {
            send_error(res, 400, e.what());
            return;
        }

        std::future<IngestionResult> future = processing_pool.submit(std::move(request));

        if (param_is_true(req, "async")) {
            json body;
            body["document_id"] = document_id;
            body["status"] = "queued";
            send_json(res, 202, body);
            return;
        }

        try {
            IngestionResult result = future.get();
            send_json(res, status_code_for(result), ingestion_result_to_json(result));
        } catch (const std::exception& e) {
            std::cerr << "[Server] Processing " << document_id << " failed: " << e.what() << std::endl;
            send_error(res, 500, e.what());
        }
    });

    // Cancels a queued or running ingestion
    svr.Delete(R"(/documents/([^/]+)/process)", [&](const httplib::Request& req, httplib::Response& res) {
        std::string document_id = req.matches[1];
        size_t signalled = processing_pool.cancel(document_id);
        if (signalled == 0) {
            send_error(res, 404, "no ingestion in progress for " + document_id);
            return;
        }
        json body;
        body["document_id"] = document_id;
        body["cancelled_jobs"] = signalled;
        send_json(res, 200, body);
    });

    svr.Get("/documents", [&](const httplib::Request&, httplib::Response& res) {
        json body = json::array();
        for (const auto& doc : registry.list()) {
            json item;
            item["id"] = doc.id;
            item["status"] = to_string(doc.status);
            item["title"] = doc.title ? json(*doc.title) : json(nullptr);
            item["chunk_count"] = doc.chunk_count;
            body.push_back(item);
        }
        send_json(res, 200, body);
    });

    // GET /documents/<id>[?text=true]
    svr.Get(R"(/documents/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
        std::string document_id = req.matches[1];
        auto doc = registry.get(document_id);
        if (!doc) {
            send_error(res, 404, "unknown document " + document_id);
            return;
        }
        json body = document_to_json(*doc, param_is_true(req, "text"));
        body["in_flight"] = orchestrator.in_flight(document_id);
        send_json(res, 200, body);
    });

    // GET /documents/<id>/chunks[?embedding=true]
    svr.Get(R"(/documents/([^/]+)/chunks)", [&](const httplib::Request& req, httplib::Response& res) {
        std::string document_id = req.matches[1];
        bool with_embedding = param_is_true(req, "embedding");
        json chunks = json::array();
        for (const auto& chunk : store.chunks_for(document_id)) {
            chunks.push_back(chunk_to_json(chunk, with_embedding));
        }
        json body;
        body["document_id"] = document_id;
        body["chunk_count"] = chunks.size();
        body["chunks"] = chunks;
        send_json(res, 200, body);
    });

    svr.Delete(R"(/documents/([^/]+)/chunks)", [&](const httplib::Request& req, httplib::Response& res) {
        std::string document_id = req.matches[1];
        if (orchestrator.in_flight(document_id)) {
            send_error(res, 409, "ingestion in progress for " + document_id);
            return;
        }
        json body;
        body["document_id"] = document_id;
        body["deleted"] = orchestrator.delete_document(document_id);
        send_json(res, 200, body);
    });

    // POST /embed {"text": "..."}
    svr.Post("/embed", [&](const httplib::Request& req, httplib::Response& res) {
        try {
            json params = json::parse(req.body);
            if (!params.contains("text") || !params["text"].is_string()) {
                send_error(res, 400, "'text' must be a string");
                return;
            }
            std::vector<float> vec = embedder->embed(params["text"].get<std::string>());
            json body;
            body["model"] = embedder->model_name();
            body["dimension"] = vec.size();
            body["embedding"] = vec;
            send_json(res, 200, body);
        } catch (const json::exception& e) {
            send_error(res, 400, std::string("invalid JSON: ") + e.what());
        } catch (const std::exception& e) {
            std::cerr << "[Server] Embedding failed: " << e.what() << std::endl;
            send_error(res, 502, e.what());
        }
    });

    // Forces a snapshot of the vector store and registry
    svr.Post("/flush", [&](const httplib::Request&, httplib::Response& res) {
        if (!batch_writer.flush_now()) {
            send_error(res, 500, "snapshot write failed");
            return;
        }
        json body;
        body["flushed"] = true;
        send_json(res, 200, body);
    });

    // Stats endpoint for monitoring
    svr.Get("/stats", [&](const httplib::Request&, httplib::Response& res) {
        auto pool_stats = processing_pool.get_stats();
        auto batch_stats = batch_writer.get_stats();
        auto ingest_stats = orchestrator.get_stats();

        json stats_json;
        stats_json["processing_pool"] = {
            {"active_workers", pool_stats.active_workers},
            {"queue_size", pool_stats.queue_size},
            {"completed_tasks", pool_stats.completed_tasks},
            {"failed_tasks", pool_stats.failed_tasks},
            {"rejected_tasks", pool_stats.rejected_tasks},
            {"cancelled_tasks", pool_stats.cancelled_tasks}
        };
        stats_json["batch_writer"] = {
            {"documents_queued", batch_stats.documents_queued},
            {"documents_flushed", batch_stats.documents_flushed},
            {"batches_flushed", batch_stats.batches_flushed},
            {"failed_flushes", batch_stats.failed_flushes},
            {"avg_batch_time_ms", batch_stats.avg_batch_time_ms},
            {"current_queue_size", batch_stats.current_queue_size}
        };
        stats_json["ingestion"] = {
            {"indexed", ingest_stats.indexed},
            {"failed", ingest_stats.failed},
            {"rejected", ingest_stats.rejected},
            {"cancelled", ingest_stats.cancelled}
        };
        stats_json["vector_store"] = {
            {"documents", store.document_count()},
            {"chunks", store.chunk_count()},
            {"dimension", store.dimension()}
        };
        stats_json["documents"] = registry.status_counts();
        stats_json["embedding_model"] = embedder->model_name();

        send_json(res, 200, stats_json);
    });

    std::cout << "======================================" << std::endl;
    std::cout << "   paperindex" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "API Endpoints:" << std::endl;
    std::cout << "  - POST   /documents/<id>/process (PDF body or JSON)" << std::endl;
    std::cout << "  - DELETE /documents/<id>/process" << std::endl;
    std::cout << "  - GET    /documents[/<id>[/chunks]]" << std::endl;
    std::cout << "  - DELETE /documents/<id>/chunks" << std::endl;
    std::cout << "  - GET    /search?q=<query>  |  POST /search" << std::endl;
    std::cout << "  - POST   /embed" << std::endl;
    std::cout << "  - POST   /flush" << std::endl;
    std::cout << "  - GET    /stats" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "Listening on " << config.server.host << ":" << config.server.port << std::endl;

    if (!svr.listen(config.server.host.c_str(), config.server.port)) {
        std::cerr << "Failed to start server!" << std::endl;
        return 1;
    }

    return 0;
}
