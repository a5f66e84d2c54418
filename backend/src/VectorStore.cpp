#include "VectorStore.hpp"
#include "Errors.hpp"
#include "VectorMath.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

const char kMagic[4] = {'P', 'I', 'V', 'S'};
const std::uint32_t kFormatVersion = 1;

void write_u32(std::ofstream& out, std::uint32_t v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

void write_i32(std::ofstream& out, std::int32_t v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

void write_u64(std::ofstream& out, std::uint64_t v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

void write_string(std::ofstream& out, const std::string& s) {
    write_u32(out, static_cast<std::uint32_t>(s.size()));
    out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

template <typename T>
T read_pod(std::ifstream& in) {
    T v{};
    in.read(reinterpret_cast<char*>(&v), sizeof(T));
    if (!in.good()) {
        throw std::runtime_error("truncated vector snapshot");
    }
    return v;
}

std::string read_string(std::ifstream& in) {
    std::uint32_t len = read_pod<std::uint32_t>(in);
    std::string s(len, '\0');
    if (len > 0) {
        in.read(&s[0], len);
        if (!in.good()) {
            throw std::runtime_error("truncated vector snapshot");
        }
    }
    return s;
}

struct Candidate {
    double score;
    const Chunk* chunk;
};

}

VectorStore::VectorStore(std::size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("vector store dimension must be positive");
    }
}

void VectorStore::check_dimension(const std::vector<float>& vec, const std::string& what) const {
    if (vec.size() != dimension_) {
        throw DimensionMismatch(what + " has " + std::to_string(vec.size()) +
                                " dimensions, store expects " + std::to_string(dimension_));
    }
}

void VectorStore::store(const Chunk& chunk) {
    check_dimension(chunk.embedding, "chunk " + chunk.chunk_id());

    std::unique_lock<std::shared_mutex> lock(mutex_);
    documents_[chunk.document_id][chunk.ordinal] = chunk;
    ++version_;
}

std::size_t VectorStore::delete_all(const std::string& document_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = documents_.find(document_id);
    if (it == documents_.end()) return 0;

    std::size_t removed = it->second.size();
    documents_.erase(it);
    ++version_;
    return removed;
}

void VectorStore::replace_document(const std::string& document_id, const std::vector<Chunk>& chunks) {
    // Validate and build outside the lock, then swap
    std::map<int, Chunk> replacement;
    for (const auto& chunk : chunks) {
        if (chunk.document_id != document_id) {
            throw std::invalid_argument("chunk " + chunk.chunk_id() + " does not belong to " + document_id);
        }
        check_dimension(chunk.embedding, "chunk " + chunk.chunk_id());
        replacement[chunk.ordinal] = chunk;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (replacement.empty()) {
        documents_.erase(document_id);
    } else {
        documents_[document_id].swap(replacement);
    }
    ++version_;
}

std::vector<ScoredChunk> VectorStore::search(const std::vector<float>& query, int k,
                                             const SearchFilters& filters) const {
    if (!available_) {
        throw StoreUnavailable("vector store is unavailable");
    }
    check_dimension(query, "query vector");
    if (k <= 0) return {};

    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Candidate> candidates;
    auto consider = [&](const std::map<int, Chunk>& chunks) {
        for (const auto& [ordinal, chunk] : chunks) {
            if (filters.section && chunk.section != *filters.section) continue;
            if (filters.chunk_type && chunk.type != *filters.chunk_type) continue;
            candidates.push_back({cosine_similarity(query, chunk.embedding), &chunk});
        }
    };

    if (filters.document_id) {
        auto it = documents_.find(*filters.document_id);
        if (it != documents_.end()) consider(it->second);
    } else {
        for (const auto& [doc_id, chunks] : documents_) consider(chunks);
    }

    auto ranked_before = [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.chunk->ordinal != b.chunk->ordinal) return a.chunk->ordinal < b.chunk->ordinal;
        return a.chunk->document_id < b.chunk->document_id;
    };

    std::size_t limit = std::min(candidates.size(), static_cast<std::size_t>(k));
    std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(limit),
                      candidates.end(), ranked_before);

    std::vector<ScoredChunk> results;
    results.reserve(limit);
    for (std::size_t i = 0; i < limit; ++i) {
        results.push_back({*candidates[i].chunk, candidates[i].score});
    }
    return results;
}

std::vector<Chunk> VectorStore::chunks_for(const std::string& document_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Chunk> out;
    auto it = documents_.find(document_id);
    if (it == documents_.end()) return out;
    for (const auto& [ordinal, chunk] : it->second) out.push_back(chunk);
    return out;
}

bool VectorStore::has_document(const std::string& document_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return documents_.count(document_id) > 0;
}

std::size_t VectorStore::document_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return documents_.size();
}

std::size_t VectorStore::chunk_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& [doc_id, chunks] : documents_) total += chunks.size();
    return total;
}

bool VectorStore::save(const std::string& path) const {
    std::string temp_path = path + ".tmp";
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "[VectorStore] Error: Could not open file for writing: " << temp_path << std::endl;
        return false;
    }

    std::size_t written = 0;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::uint64_t count = 0;
        for (const auto& [doc_id, chunks] : documents_) count += chunks.size();

        out.write(kMagic, sizeof(kMagic));
        write_u32(out, kFormatVersion);
        write_u64(out, dimension_);
        write_u64(out, count);

        for (const auto& [doc_id, chunks] : documents_) {
            for (const auto& [ordinal, chunk] : chunks) {
                write_string(out, chunk.document_id);
                write_i32(out, chunk.ordinal);
                write_string(out, chunk.section);
                write_string(out, chunk.text);
                out.put(static_cast<char>(chunk.type));
                write_i32(out, chunk.page ? *chunk.page : -1);
                out.write(reinterpret_cast<const char*>(chunk.embedding.data()),
                          static_cast<std::streamsize>(dimension_ * sizeof(float)));
                ++written;
            }
        }
    }

    out.flush();
    if (!out.good()) {
        std::cerr << "[VectorStore] Error: Write failed for: " << temp_path << std::endl;
        out.close();
        std::remove(temp_path.c_str());
        return false;
    }
    out.close();

    // Atomic rename
    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        std::cerr << "[VectorStore] Error: Could not rename temp file" << std::endl;
        return false;
    }

    std::cout << "[VectorStore] Saved " << written << " chunks to " << path << std::endl;
    return true;
}

bool VectorStore::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cout << "[VectorStore] No snapshot at " << path << ", starting empty" << std::endl;
        return false;
    }

    char magic[4];
    in.read(magic, sizeof(magic));
    if (!in.good() || !std::equal(magic, magic + 4, kMagic)) {
        throw std::runtime_error("not a vector snapshot: " + path);
    }
    std::uint32_t format = read_pod<std::uint32_t>(in);
    if (format != kFormatVersion) {
        throw std::runtime_error("unsupported vector snapshot version " + std::to_string(format));
    }
    std::uint64_t dimension = read_pod<std::uint64_t>(in);
    if (dimension != dimension_) {
        throw DimensionMismatch("snapshot has " + std::to_string(dimension) +
                                " dimensions, store expects " + std::to_string(dimension_));
    }
    std::uint64_t count = read_pod<std::uint64_t>(in);

    std::map<std::string, std::map<int, Chunk>> loaded;
    for (std::uint64_t i = 0; i < count; ++i) {
        Chunk chunk;
        chunk.document_id = read_string(in);
        chunk.ordinal = read_pod<std::int32_t>(in);
        chunk.section = read_string(in);
        chunk.text = read_string(in);
        auto type = read_pod<std::uint8_t>(in);
        if (type > static_cast<std::uint8_t>(ChunkType::Reference)) {
            throw std::runtime_error("corrupt chunk type in vector snapshot");
        }
        chunk.type = static_cast<ChunkType>(type);
        std::int32_t page = read_pod<std::int32_t>(in);
        if (page >= 0) chunk.page = page;
        chunk.embedding.resize(dimension_);
        in.read(reinterpret_cast<char*>(chunk.embedding.data()),
                static_cast<std::streamsize>(dimension_ * sizeof(float)));
        if (!in.good()) {
            throw std::runtime_error("truncated vector snapshot");
        }
        int ordinal = chunk.ordinal;
        std::string doc_id = chunk.document_id;
        loaded[doc_id][ordinal] = std::move(chunk);
    }

    std::size_t docs = loaded.size();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        documents_.swap(loaded);
        ++version_;
    }

    std::cout << "[VectorStore] Loaded " << count << " chunks for " << docs << " documents" << std::endl;
    return true;
}
