#include "EmbeddingClient.hpp"
#include "Errors.hpp"
#include "VectorMath.hpp"
#include <cctype>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::uint64_t fnv1a(const std::string& s) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c >= 128) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

bool is_blank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

}

std::vector<std::vector<float>> EmbeddingClient::embed_batch(const std::vector<std::string>& texts) const {
    std::vector<std::vector<float>> vectors;
    vectors.reserve(texts.size());
    for (const auto& text : texts) {
        vectors.push_back(embed(text));
    }
    return vectors;
}

HashingEmbeddingClient::HashingEmbeddingClient(std::size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("embedding dimension must be positive");
    }
}

std::vector<float> HashingEmbeddingClient::embed(const std::string& text) const {
    std::vector<float> vec(dimension_, 0.0f);
    std::vector<std::string> tokens = tokenize(text);

    auto add_feature = [&](const std::string& feature, float weight) {
        std::uint64_t h = fnv1a(feature);
        std::size_t bucket = static_cast<std::size_t>(h % dimension_);
        float sign = (h >> 63) ? -1.0f : 1.0f;
        vec[bucket] += sign * weight;
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        add_feature(tokens[i], 1.0f);
        if (i + 1 < tokens.size()) {
            add_feature(tokens[i] + " " + tokens[i + 1], 0.5f);
        }
    }

    normalize_vector(vec);
    return vec;
}

HttpEmbeddingClient::HttpEmbeddingClient(const EmbeddingConfig& config) : config_(config) {}

std::vector<float> HttpEmbeddingClient::embed(const std::string& text) const {
    // Some servers reject an empty prompt; the zero vector is a valid embedding for it
    if (is_blank(text)) {
        return std::vector<float>(config_.dimension, 0.0f);
    }

    httplib::Client cli(config_.host, config_.port);
    cli.set_connection_timeout(config_.timeout_seconds, 0);
    cli.set_read_timeout(config_.timeout_seconds, 0);

    json request;
    request["model"] = config_.model;
    request["prompt"] = text;

    auto res = cli.Post(config_.path, request.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    if (!res) {
        throw std::runtime_error("embedding request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("embedding server returned HTTP " + std::to_string(res->status));
    }

    json body = json::parse(res->body);
    if (!body.contains("embedding") || !body["embedding"].is_array()) {
        throw std::runtime_error("embedding response has no 'embedding' array");
    }

    std::vector<float> vec = body["embedding"].get<std::vector<float>>();
    if (vec.size() != config_.dimension) {
        throw DimensionMismatch("model returned " + std::to_string(vec.size()) +
                                " dimensions, expected " + std::to_string(config_.dimension));
    }
    return vec;
}

std::unique_ptr<EmbeddingClient> make_embedding_client(const EmbeddingConfig& config) {
    if (config.provider == "http") {
        std::cout << "[Embedding] Using HTTP model '" << config.model << "' at "
                  << config.host << ":" << config.port << config.path << std::endl;
        return std::make_unique<HttpEmbeddingClient>(config);
    }
    std::cout << "[Embedding] Using hashing model (" << config.dimension << " dims)" << std::endl;
    return std::make_unique<HashingEmbeddingClient>(config.dimension);
}
