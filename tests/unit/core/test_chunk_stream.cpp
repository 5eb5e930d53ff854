/**
 * @file test_chunk_stream.cpp
 * @brief Unit tests for chunk_stream
 */

#include <gtest/gtest.h>

#include <chunk_relay/core/byte_source.h>
#include <chunk_relay/core/checksum.h>
#include <chunk_relay/core/chunk_stream.h>

#include "test_fixtures.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace chunk_relay::test {

class ChunkStreamTest : public ::testing::Test {
protected:
    static constexpr std::size_t chunk_size = chunk_config::min_chunk_size;

    auto drain(chunk_stream& stream) -> std::vector<stream_chunk> {
        std::vector<stream_chunk> chunks;
        for (;;) {
            auto next = stream.next();
            EXPECT_TRUE(next.has_value()) << next.error().message;
            if (!next || !next.value()) {
                break;
            }
            chunks.push_back(std::move(*next.value()));
        }
        return chunks;
    }

    static void expect_contiguous(const std::vector<stream_chunk>& chunks, uint64_t total) {
        uint64_t offset = 0;
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            EXPECT_EQ(chunks[i].descriptor.sequence_number, i);
            EXPECT_EQ(chunks[i].descriptor.offset, offset);
            EXPECT_EQ(chunks[i].descriptor.length, chunks[i].data.size());
            EXPECT_EQ(chunks[i].last, i + 1 == chunks.size());
            offset += chunks[i].descriptor.length;
        }
        EXPECT_EQ(offset, total);
    }
};

// =============================================================================
// Creation
// =============================================================================

TEST_F(ChunkStreamTest, Create_NullSource) {
    auto stream = chunk_stream::create(nullptr, chunk_config(chunk_size));
    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, error_code::invalid_configuration);
}

TEST_F(ChunkStreamTest, Create_ChunkSizeTooSmall) {
    auto stream = chunk_stream::create(pattern_source(10), chunk_config(512));
    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, error_code::invalid_chunk_size);
}

TEST_F(ChunkStreamTest, Create_ChunkSizeTooLarge) {
    auto stream =
        chunk_stream::create(pattern_source(10), chunk_config(chunk_config::max_chunk_size + 1));
    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, error_code::invalid_chunk_size);
}

TEST_F(ChunkStreamTest, Create_DeclaredSizeOverLimit) {
    chunk_config config(chunk_size);
    config.max_object_size = 4096;
    auto stream = chunk_stream::create(pattern_source(5000), config);
    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, error_code::object_too_large);
}

// =============================================================================
// Chunking
// =============================================================================

TEST_F(ChunkStreamTest, SizedSource_ProducesCeilChunks) {
    const std::size_t size = chunk_size * 5 + 100;
    auto stream = chunk_stream::create(pattern_source(size), chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());

    auto chunks = drain(*stream.value());
    ASSERT_EQ(chunks.size(), 6u);
    expect_contiguous(chunks, size);
    EXPECT_EQ(chunks.back().size(), 100u);
    EXPECT_TRUE(stream.value()->is_finished());
    EXPECT_EQ(stream.value()->chunks_produced(), 6u);
    EXPECT_EQ(stream.value()->bytes_produced(), size);
}

TEST_F(ChunkStreamTest, SizedSource_ExactMultiple) {
    const std::size_t size = chunk_size * 4;
    auto stream = chunk_stream::create(pattern_source(size), chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());

    auto chunks = drain(*stream.value());
    ASSERT_EQ(chunks.size(), 4u);
    expect_contiguous(chunks, size);
}

TEST_F(ChunkStreamTest, EmptySource_NoChunks) {
    auto stream = chunk_stream::create(pattern_source(0), chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());

    auto next = stream.value()->next();
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(next.value().has_value());
    EXPECT_TRUE(stream.value()->is_finished());
    EXPECT_EQ(stream.value()->total_size().value_or(1), 0u);
}

TEST_F(ChunkStreamTest, UnsizedSource_ShortReadsAreCoalesced) {
    const std::size_t size = chunk_size * 3 + 7;
    auto stream = chunk_stream::create(std::make_unique<trickle_source>(size, 100),
                                       chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());
    EXPECT_FALSE(stream.value()->total_size().has_value());

    auto chunks = drain(*stream.value());
    ASSERT_EQ(chunks.size(), 4u);
    expect_contiguous(chunks, size);
    EXPECT_EQ(stream.value()->total_size().value_or(0), size);
}

TEST_F(ChunkStreamTest, UnsizedSource_ExactMultipleMarksLastChunk) {
    const std::size_t size = chunk_size * 2;
    auto stream = chunk_stream::create(std::make_unique<trickle_source>(size, chunk_size),
                                       chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());

    auto chunks = drain(*stream.value());
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_TRUE(chunks.back().last);
}

TEST_F(ChunkStreamTest, ChunkBytesMatchSource) {
    const std::size_t size = chunk_size * 2 + 33;
    auto stream = chunk_stream::create(pattern_source(size), chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());

    std::vector<std::byte> joined;
    for (auto& chunk : drain(*stream.value())) {
        joined.insert(joined.end(), chunk.data.begin(), chunk.data.end());
    }
    EXPECT_EQ(joined, make_pattern(size));
}

TEST_F(ChunkStreamTest, ExhaustedStreamKeepsReturningEnd) {
    auto stream = chunk_stream::create(pattern_source(10), chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());
    (void)drain(*stream.value());

    for (int i = 0; i < 3; ++i) {
        auto next = stream.value()->next();
        ASSERT_TRUE(next.has_value());
        EXPECT_FALSE(next.value().has_value());
    }
}

// =============================================================================
// Integrity
// =============================================================================

TEST_F(ChunkStreamTest, Integrity_CRC32Digest) {
    chunk_config config(chunk_size);
    config.verify_integrity = true;
    auto stream = chunk_stream::create(pattern_source(chunk_size + 10), config);
    ASSERT_TRUE(stream.has_value());

    for (auto& chunk : drain(*stream.value())) {
        ASSERT_TRUE(chunk.descriptor.checksum.has_value());
        EXPECT_EQ(chunk.descriptor.checksum->size(), 8u);
        EXPECT_TRUE(checksum::verify(checksum_algorithm::crc32, chunk.data,
                                     *chunk.descriptor.checksum)
                        .has_value());
    }
}

TEST_F(ChunkStreamTest, Integrity_SHA256Digest) {
    chunk_config config(chunk_size);
    config.verify_integrity = true;
    config.algorithm = checksum_algorithm::sha256;
    auto stream = chunk_stream::create(pattern_source(100), config);
    ASSERT_TRUE(stream.has_value());

    auto chunks = drain(*stream.value());
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].descriptor.checksum.value_or(""), checksum::sha256(chunks[0].data));
}

TEST_F(ChunkStreamTest, Integrity_DisabledLeavesNoDigest) {
    auto stream = chunk_stream::create(pattern_source(100), chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());

    auto chunks = drain(*stream.value());
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_FALSE(chunks[0].descriptor.checksum.has_value());
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(ChunkStreamTest, DeclaredSourceEndsEarly_ShortRead) {
    auto input = std::make_unique<std::istringstream>(std::string(chunk_size + 10, 'x'));
    auto source = std::make_unique<stream_source>(std::move(input), chunk_size * 3);
    auto stream = chunk_stream::create(std::move(source), chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());

    auto first = stream.value()->next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first.value().has_value());

    auto second = stream.value()->next();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::short_read);
    ASSERT_TRUE(stream.value()->failure().has_value());

    // Failure is sticky
    auto third = stream.value()->next();
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error().code, error_code::short_read);
}

TEST_F(ChunkStreamTest, DeclaredSourceProducesMore_Overrun) {
    auto input = std::make_unique<std::istringstream>(std::string(200, 'x'));
    auto source = std::make_unique<stream_source>(std::move(input), 100);
    auto stream = chunk_stream::create(std::move(source), chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());

    auto next = stream.value()->next();
    ASSERT_FALSE(next.has_value());
    EXPECT_EQ(next.error().code, error_code::source_overrun);
}

TEST_F(ChunkStreamTest, SourceErrorMidStream_ShortRead) {
    auto stream = chunk_stream::create(std::make_unique<failing_source>(chunk_size + 50),
                                       chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());

    auto first = stream.value()->next();
    ASSERT_TRUE(first.has_value());

    auto second = stream.value()->next();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::short_read);
}

TEST_F(ChunkStreamTest, UnsizedSourceOverLimit_ObjectTooLarge) {
    chunk_config config(chunk_size);
    config.max_object_size = chunk_size * 2;
    auto stream =
        chunk_stream::create(std::make_unique<trickle_source>(chunk_size * 4, chunk_size), config);
    ASSERT_TRUE(stream.has_value());

    std::optional<error> failure;
    for (int i = 0; i < 5 && !failure; ++i) {
        auto next = stream.value()->next();
        if (!next) {
            failure = next.error();
        }
    }
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->code, error_code::object_too_large);
}

// =============================================================================
// File source
// =============================================================================

TEST_F(ChunkStreamTest, FileSource_SizedFromDisk) {
    auto path = std::filesystem::temp_directory_path() / "chunk_relay_stream_test.bin";
    {
        auto data = make_pattern(chunk_size * 2 + 1);
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
    }

    auto source = stream_source::open_file(path);
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(source.value()->size_hint().value_or(0), chunk_size * 2 + 1);

    auto stream = chunk_stream::create(std::move(source.value()), chunk_config(chunk_size));
    ASSERT_TRUE(stream.has_value());
    auto chunks = drain(*stream.value());
    EXPECT_EQ(chunks.size(), 3u);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_F(ChunkStreamTest, FileSource_Missing) {
    auto source = stream_source::open_file("/nonexistent/chunk_relay/file.bin");
    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::source_read_error);
}

}  // namespace chunk_relay::test
