// =============================================================================
// Service Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "DocumentModel.hpp"
#include "ServiceConfig.hpp"

namespace fs = std::filesystem;

namespace {

fs::path write_temp_file(const std::string& name, const std::string& contents) {
    fs::path path = fs::temp_directory_path() / ("paperindex_" + name);
    std::ofstream out(path);
    out << contents;
    return path;
}

}

TEST(ServiceConfigTest, DefaultsAreValid) {
    ServiceConfig config;

    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.chunking.chunk_size, 1000u);
    EXPECT_EQ(config.chunking.chunk_overlap, 200u);
    EXPECT_EQ(config.chunking.min_chunk_size, 200u);
    EXPECT_EQ(config.extraction.timeout_seconds, 60);
    EXPECT_EQ(config.embedding.provider, "hashing");
    EXPECT_EQ(config.embedding.dimension, 384u);
    EXPECT_EQ(config.server.max_results_cap, 50);
}

TEST(ServiceConfigTest, FromJsonOverridesOnlyGivenKeys) {
    nlohmann::json j = {
        {"chunking", {{"chunk_size", 500}, {"chunk_overlap", 50}}},
        {"embedding", {{"provider", "http"}, {"model", "nomic-embed-text"}, {"dimension", 768}}},
        {"server", {{"port", 9090}, {"host", nullptr}}}
    };

    ServiceConfig config = ServiceConfig::from_json(j);

    EXPECT_EQ(config.chunking.chunk_size, 500u);
    EXPECT_EQ(config.chunking.chunk_overlap, 50u);
    EXPECT_EQ(config.chunking.min_chunk_size, 200u);
    EXPECT_EQ(config.embedding.provider, "http");
    EXPECT_EQ(config.embedding.model, "nomic-embed-text");
    EXPECT_EQ(config.embedding.dimension, 768u);
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_DOUBLE_EQ(config.layout.gap_density_ratio, 0.15);
}

TEST(ServiceConfigTest, InconsistentValuesThrow) {
    EXPECT_THROW(ServiceConfig::from_json({{"chunking", {{"chunk_overlap", 1000}}}}), std::invalid_argument);
    EXPECT_THROW(ServiceConfig::from_json({{"chunking", {{"min_chunk_size", 2000}}}}), std::invalid_argument);
    EXPECT_THROW(ServiceConfig::from_json({{"embedding", {{"provider", "magic"}}}}), std::invalid_argument);
    EXPECT_THROW(ServiceConfig::from_json({{"embedding", {{"dimension", 0}}}}), std::invalid_argument);
    EXPECT_THROW(ServiceConfig::from_json({{"layout", {{"band_start", 0.8}}}}), std::invalid_argument);
    EXPECT_THROW(ServiceConfig::from_json({{"extraction", {{"timeout_seconds", 0}}}}), std::invalid_argument);
    EXPECT_THROW(ServiceConfig::from_json({{"server", {{"max_results_cap", 0}}}}), std::invalid_argument);
}

TEST(ServiceConfigTest, WrongTypeIsAnError) {
    EXPECT_THROW(ServiceConfig::from_json({{"server", {{"port", "eighty"}}}}), nlohmann::json::exception);
}

TEST(ServiceConfigTest, MissingFileKeepsDefaults) {
    ServiceConfig config = ServiceConfig::load((fs::temp_directory_path() / "paperindex_no_such_config.json").string());
    EXPECT_EQ(config.server.port, 8080);
}

TEST(ServiceConfigTest, MalformedFileKeepsDefaults) {
    fs::path path = write_temp_file("malformed_config.json", "{ not json");

    ServiceConfig config = ServiceConfig::load(path.string());

    EXPECT_EQ(config.chunking.chunk_size, 1000u);
    fs::remove(path);
}

TEST(ServiceConfigTest, LoadsFile) {
    fs::path path = write_temp_file("config.json",
        R"({"storage": {"data_dir": "/tmp/paperindex_data", "flush_batch_size": 2}})");

    ServiceConfig config = ServiceConfig::load(path.string());

    EXPECT_EQ(config.storage.data_dir, "/tmp/paperindex_data");
    EXPECT_EQ(config.storage.flush_batch_size, 2u);
    EXPECT_EQ(config.storage.flush_interval_seconds, 30);
    fs::remove(path);
}

// -----------------------------------------------------------------------------
// Caller-supplied sections
// -----------------------------------------------------------------------------

TEST(SectionsFromJsonTest, AcceptsObjectAndArrayForms) {
    auto from_array = sections_from_json(nlohmann::json::array({
        {{"name", "abstract"}, {"text", "We study."}},
        {{"name", "results"}, {"text", "It works."}}
    }));
    ASSERT_EQ(from_array.size(), 2u);
    EXPECT_EQ(from_array[0].name, "abstract");
    EXPECT_EQ(from_array[1].text, "It works.");
    EXPECT_FALSE(from_array[0].offset.has_value());

    auto from_object = sections_from_json({{"introduction", "Intro."}});
    ASSERT_EQ(from_object.size(), 1u);
    EXPECT_EQ(from_object[0].name, "introduction");
    EXPECT_EQ(from_object[0].text, "Intro.");

    EXPECT_TRUE(sections_from_json(nullptr).empty());
}

TEST(SectionsFromJsonTest, RejectsOtherShapes) {
    EXPECT_THROW(sections_from_json("just text"), std::invalid_argument);
    EXPECT_THROW(sections_from_json(42), std::invalid_argument);
}

TEST(DocumentModelTest, EnumNamesRoundTrip) {
    EXPECT_EQ(to_string(DocumentStatus::Indexed), "indexed");
    EXPECT_EQ(document_status_from_string("failed"), DocumentStatus::Failed);
    EXPECT_FALSE(document_status_from_string("bogus").has_value());
    EXPECT_EQ(chunk_type_from_string("reference"), ChunkType::Reference);
    EXPECT_FALSE(chunk_type_from_string("paragraph").has_value());
}
