// =============================================================================
// Chunker Tests
// =============================================================================

#include <gtest/gtest.h>
#include "Chunker.hpp"

namespace {

// "Sentence number n is here." repeated, roughly 27 characters each
std::string sentences(int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
        if (!text.empty()) text += ' ';
        text += "Sentence number " + std::to_string(i) + " is here.";
    }
    return text;
}

Section section(const std::string& name, const std::string& text,
                std::optional<std::size_t> offset = std::nullopt) {
    Section s;
    s.name = name;
    s.text = text;
    s.offset = offset;
    return s;
}

}

class ChunkerTest : public ::testing::Test {
protected:
    Chunker chunker;
};

TEST_F(ChunkerTest, ChunksRespectLengthBounds) {
    std::string text = sentences(200);
    auto chunks = chunker.chunk("doc", {section("introduction", text)}, text);

    ASSERT_GT(chunks.size(), 1u);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_LE(chunks[i].text.size(), 1000u);
        if (i + 1 < chunks.size()) {
            EXPECT_GE(chunks[i].text.size(), 200u) << "chunk " << i;
        }
    }
}

TEST_F(ChunkerTest, InteriorChunksEndAtSentenceBoundaries) {
    std::string text = sentences(200);
    auto chunks = chunker.chunk("doc", {section("introduction", text)}, text);

    ASSERT_GT(chunks.size(), 1u);
    for (size_t i = 0; i + 1 < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].text.back(), '.') << "chunk " << i;
    }
}

TEST_F(ChunkerTest, ConsecutiveWindowsOverlap) {
    std::string text = sentences(200);
    auto windows = chunker.windows(text);

    ASSERT_GT(windows.size(), 1u);
    for (size_t i = 1; i < windows.size(); ++i) {
        EXPECT_LT(windows[i].first, windows[i - 1].second);
        EXPECT_GT(windows[i].first, windows[i - 1].first);
    }
}

TEST_F(ChunkerTest, HardCutWithoutSentenceBreaks) {
    ChunkingConfig config;
    config.chunk_size = 50;
    config.chunk_overlap = 10;
    config.min_chunk_size = 20;
    Chunker small(config);

    auto windows = small.windows(std::string(120, 'a'));

    ASSERT_EQ(windows.size(), 3u);
    EXPECT_EQ(windows[0], (std::pair<std::size_t, std::size_t>(0, 50)));
    EXPECT_EQ(windows[1], (std::pair<std::size_t, std::size_t>(40, 90)));
    EXPECT_EQ(windows[2], (std::pair<std::size_t, std::size_t>(80, 120)));
}

TEST_F(ChunkerTest, CutsNeverSplitMultibyteCharacters) {
    ChunkingConfig config;
    config.chunk_size = 100;
    config.chunk_overlap = 20;
    config.min_chunk_size = 20;
    Chunker small(config);

    // "a" then two-byte "é" sequences starting at odd offsets, so byte 100 is mid-character
    std::string text = "a";
    for (int i = 0; i < 80; ++i) text += "\xC3\xA9";

    auto windows = small.windows(text);
    ASSERT_EQ(windows.size(), 2u);
    EXPECT_EQ(windows[0], (std::pair<std::size_t, std::size_t>(0, 99)));
    EXPECT_EQ(windows[1], (std::pair<std::size_t, std::size_t>(79, 161)));

    auto chunks = small.chunk("doc", {section("introduction", text)}, text);
    ASSERT_EQ(chunks.size(), 2u);
    for (const auto& chunk : chunks) {
        EXPECT_NE(static_cast<unsigned char>(chunk.text.front()) & 0xC0, 0x80) << "chunk " << chunk.ordinal;
        EXPECT_NO_THROW(chunk_to_json(chunk).dump()) << "chunk " << chunk.ordinal;
    }
}

TEST_F(ChunkerTest, PrefersSentenceBreakOverHardCut) {
    ChunkingConfig config;
    config.chunk_size = 50;
    config.chunk_overlap = 10;
    config.min_chunk_size = 20;
    Chunker small(config);

    std::string text = std::string(30, 'x') + ". " + std::string(40, 'y') + ". " + std::string(30, 'z');
    auto windows = small.windows(text);

    ASSERT_FALSE(windows.empty());
    EXPECT_EQ(windows[0].first, 0u);
    EXPECT_EQ(windows[0].second, 31u);
}

TEST_F(ChunkerTest, OrdinalsRunAcrossSections) {
    std::string intro = sentences(60);
    std::string methods = sentences(60);
    auto chunks = chunker.chunk("doc", {section("introduction", intro), section("methodology", methods)},
                                intro + "\n\n" + methods);

    ASSERT_GT(chunks.size(), 2u);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].ordinal, static_cast<int>(i));
        EXPECT_EQ(chunks[i].document_id, "doc");
    }
    EXPECT_EQ(chunks.front().section, "introduction");
    EXPECT_EQ(chunks.back().section, "methodology");
    EXPECT_EQ(chunks[3].chunk_id(), "doc-3");
}

TEST_F(ChunkerTest, SameInputGivesIdenticalChunks) {
    std::string text = sentences(150);
    std::vector<Section> sections = {section("abstract", sentences(10)), section("results", text)};

    auto first = chunker.chunk("doc", sections, text);
    auto second = chunker.chunk("doc", sections, text);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].ordinal, second[i].ordinal);
        EXPECT_EQ(first[i].text, second[i].text);
        EXPECT_EQ(first[i].section, second[i].section);
    }
}

TEST_F(ChunkerTest, BlankSectionsAreSkipped) {
    auto chunks = chunker.chunk("doc", {section("abstract", "  \n "), section("results", "Short result.")},
                                "Short result.");

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].ordinal, 0);
    EXPECT_EQ(chunks[0].section, "results");
    EXPECT_EQ(chunks[0].text, "Short result.");
}

TEST_F(ChunkerTest, FallsBackToFullTextWhenSectionsAreEmpty) {
    auto chunks = chunker.chunk("doc", {}, "Only the full text.");

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].section, "unclassified");
    EXPECT_EQ(chunks[0].text, "Only the full text.");
}

TEST_F(ChunkerTest, NothingToChunk) {
    EXPECT_TRUE(chunker.chunk("doc", {}, "").empty());
    EXPECT_TRUE(chunker.chunk("doc", {section("abstract", "")}, "   ").empty());
}

TEST_F(ChunkerTest, PagesComeFromSectionOffsets) {
    const std::string full_text = "page one text.\n\npage two text.";
    std::vector<std::size_t> page_offsets = {0, 16};

    auto chunks = chunker.chunk("doc",
                                {section("introduction", "page one text.", 0),
                                 section("results", "page two text.", 16),
                                 section("appendix", "supplied by caller")},
                                full_text, page_offsets);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].page, 1);
    EXPECT_EQ(chunks[1].page, 2);
    EXPECT_FALSE(chunks[2].page.has_value());
}

TEST_F(ChunkerTest, ChunkTypeFollowsSection) {
    EXPECT_EQ(Chunker::type_for_section("references"), ChunkType::Reference);
    EXPECT_EQ(Chunker::type_for_section("table_2"), ChunkType::Table);
    EXPECT_EQ(Chunker::type_for_section("methodology"), ChunkType::Text);

    auto chunks = chunker.chunk("doc", {section("references", "[1] Someone. 2020.")}, "");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].type, ChunkType::Reference);
}
