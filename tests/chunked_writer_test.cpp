#include "fake_transport.hpp"

#include <core/chunked_writer.hpp>
#include <gtest/gtest.h>

#include <numeric>
#include <vector>

using namespace accessory;
using accessory::testing::FakeTransport;

static_assert(chunk_count(0, 20) == 0);
static_assert(chunk_count(20, 20) == 1);
static_assert(chunk_count(21, 20) == 2);
static_assert(chunk_count(1000, 185) == 6);
static_assert(chunk_count(10, 0) == 0);

namespace {

std::vector<uint8_t> make_payload(size_t size) {
    std::vector<uint8_t> payload(size);
    std::iota(payload.begin(), payload.end(), uint8_t{0});
    return payload;
}

} // namespace

TEST(ChunkedWriterTest, SplitsToMaximumWriteSize) {
    FakeTransport transport;
    transport.max_write = 185;
    ChunkedWriter writer(transport);

    auto payload = make_payload(1000);
    EXPECT_EQ(writer.write("/dev", "/dev/rx", payload), Error::None);

    ASSERT_EQ(transport.writes.size(), 6u);
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(transport.writes[i].bytes.size(), 185u);
    }
    EXPECT_EQ(transport.writes[5].bytes.size(), 85u);
    EXPECT_EQ(writer.iterations(), 6u);

    // Chunks go out in order and reassemble to the payload
    std::vector<uint8_t> reassembled;
    for (const auto& w : transport.writes) {
        EXPECT_EQ(w.device, "/dev");
        EXPECT_EQ(w.channel, "/dev/rx");
        reassembled.insert(reassembled.end(), w.bytes.begin(), w.bytes.end());
    }
    EXPECT_EQ(reassembled, payload);
}

TEST(ChunkedWriterTest, PayloadThatFitsIsOneWrite) {
    FakeTransport transport;
    ChunkedWriter writer(transport);

    auto payload = make_payload(20);
    EXPECT_EQ(writer.write("/dev", "/dev/rx", payload), Error::None);
    ASSERT_EQ(transport.writes.size(), 1u);
    EXPECT_EQ(transport.writes[0].bytes, payload);
}

TEST(ChunkedWriterTest, EmptyPayloadWritesNothing) {
    FakeTransport transport;
    ChunkedWriter writer(transport);

    EXPECT_EQ(writer.write("/dev", "/dev/rx", {}), Error::None);
    EXPECT_TRUE(transport.writes.empty());
    EXPECT_EQ(writer.iterations(), 0u);
}

TEST(ChunkedWriterTest, UnknownWriteSizeIsTransportError) {
    FakeTransport transport;
    transport.max_write = 0;
    ChunkedWriter writer(transport);

    auto payload = make_payload(10);
    EXPECT_EQ(writer.write("/dev", "/dev/rx", payload), Error::TransportError);
    EXPECT_TRUE(transport.writes.empty());
    EXPECT_EQ(transport.failed_writes, 0);
}

TEST(ChunkedWriterTest, FailedChunkStopsTheRest) {
    FakeTransport transport;
    transport.max_write = 10;
    transport.fail_write_after = 2;
    ChunkedWriter writer(transport);

    auto payload = make_payload(50);
    EXPECT_EQ(writer.write("/dev", "/dev/rx", payload), Error::TransportError);

    // Two accepted, one refused, nothing retried or sent after it
    EXPECT_EQ(transport.writes.size(), 2u);
    EXPECT_EQ(transport.failed_writes, 1);
    EXPECT_EQ(writer.iterations(), 2u);
}

TEST(ChunkedWriterTest, IterationsAccumulateUntilReset) {
    FakeTransport transport;
    transport.max_write = 4;
    ChunkedWriter writer(transport);

    auto payload = make_payload(8);
    writer.write("/dev", "/dev/rx", payload);
    writer.write("/dev", "/dev/rx", payload);
    EXPECT_EQ(writer.iterations(), 4u);

    writer.reset();
    EXPECT_EQ(writer.iterations(), 0u);
}
