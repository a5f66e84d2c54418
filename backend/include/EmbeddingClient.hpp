#pragma once
// EmbeddingClient.hpp
// Narrow interface to the text embedding model, plus the two providers:
// a deterministic feature-hashing model and an Ollama-style HTTP model.

#include <memory>
#include <string>
#include <vector>
#include "ServiceConfig.hpp"

class EmbeddingClient {
public:
    virtual ~EmbeddingClient() = default;

    // Vector of exactly dimension() floats; throws std::runtime_error on failure
    virtual std::vector<float> embed(const std::string& text) const = 0;

    // One vector per text, same order. The default embeds one at a time.
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const;

    virtual std::size_t dimension() const = 0;
    virtual std::string model_name() const = 0;
};

/**
 * HashingEmbeddingClient: signed feature hashing of lowercase word tokens
 * and word bigrams into a fixed number of buckets, L2-normalized.
 * Deterministic across runs and platforms; empty text maps to the zero vector.
 */
class HashingEmbeddingClient : public EmbeddingClient {
public:
    explicit HashingEmbeddingClient(std::size_t dimension = 384);

    std::vector<float> embed(const std::string& text) const override;
    std::size_t dimension() const override { return dimension_; }
    std::string model_name() const override { return "hashing-" + std::to_string(dimension_); }

private:
    std::size_t dimension_;
};

// POSTs {"model", "prompt"} to the configured path and reads {"embedding": [...]}
class HttpEmbeddingClient : public EmbeddingClient {
public:
    explicit HttpEmbeddingClient(const EmbeddingConfig& config);

    std::vector<float> embed(const std::string& text) const override;
    std::size_t dimension() const override { return config_.dimension; }
    std::string model_name() const override { return config_.model; }

private:
    EmbeddingConfig config_;
};

// Provider chosen by config.provider ("hashing" | "http")
std::unique_ptr<EmbeddingClient> make_embedding_client(const EmbeddingConfig& config);
