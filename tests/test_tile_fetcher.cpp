#include <gtest/gtest.h>

#include "TileFetcher.hpp"
#include "CancellationToken.hpp"
#include "FakeImageryClient.hpp"

using namespace rasterdl;
using rasterdl::test::FakeImageryClient;
using rasterdl::test::synthetic_window;

class TileFetcherTest : public ::testing::Test {
protected:
    FakeImageryClient client{40, 30};
    TileFetcher fetcher{client, "COPERNICUS/S2/20200101T100000_T33TUM", client.spec().data_type};
    CancellationToken token;
    TileDescriptor tile{2, 10, 20, 5, 25};
};

TEST_F(TileFetcherTest, SuccessCarriesDecodedWindow) {
    TileResult result = fetcher.fetch(tile, "B1", token, 1);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.tile, tile);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_TRUE((result.data() == synthetic_window(tile.window(), 30)).all());
}

TEST_F(TileFetcherTest, TransientErrorBecomesTransientFailure) {
    client.inject(tile, FakeImageryClient::Fault::TRANSIENT);

    TileResult result = fetcher.fetch(tile, "B1", token, 3);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, FailureKind::TRANSIENT);
    EXPECT_EQ(result.attempts, 3);
}

TEST_F(TileFetcherTest, PermanentErrorBecomesPermanentFailure) {
    client.inject(tile, FakeImageryClient::Fault::PERMANENT);

    TileResult result = fetcher.fetch(tile, "B1", token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, FailureKind::PERMANENT);
}

TEST_F(TileFetcherTest, OversizeResponseIsPermanent) {
    client.set_payload_ceiling(100);

    TileResult result = fetcher.fetch(tile, "B1", token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, FailureKind::PERMANENT);
    EXPECT_NE(result.error().detail.find("less than or equal to"), std::string::npos);
}

TEST_F(TileFetcherTest, CorruptPayloadBecomesDecodeFailure) {
    client.inject(tile, FakeImageryClient::Fault::CORRUPT);

    TileResult result = fetcher.fetch(tile, "B1", token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, FailureKind::DECODE);
}

TEST_F(TileFetcherTest, WrongShapeBecomesDecodeFailure) {
    client.inject(tile, FakeImageryClient::Fault::WRONG_SHAPE);

    TileResult result = fetcher.fetch(tile, "B1", token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, FailureKind::DECODE);
}

TEST_F(TileFetcherTest, WrongSampleTypeBecomesDecodeFailure) {
    client.inject(tile, FakeImageryClient::Fault::WRONG_TYPE);

    TileResult result = fetcher.fetch(tile, "B1", token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, FailureKind::DECODE);
    EXPECT_NE(result.error().detail.find("expected float32"), std::string::npos);
}

TEST_F(TileFetcherTest, ZippedPayloadIsDecoded) {
    client.set_zip_payloads(true);

    TileResult result = fetcher.fetch(tile, "B1", token);

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE((result.data() == synthetic_window(tile.window(), 30)).all());
}

TEST_F(TileFetcherTest, CancelledTokenSkipsRequest) {
    token.cancel();

    TileResult result = fetcher.fetch(tile, "B1", token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, FailureKind::CANCELLED);
    EXPECT_EQ(client.total_calls(), 0);
}

TEST_F(TileFetcherTest, UnexpectedExceptionsPropagate) {
    client.inject(tile, FakeImageryClient::Fault::THROW_OTHER);

    EXPECT_THROW(fetcher.fetch(tile, "B1", token), std::out_of_range);
}
