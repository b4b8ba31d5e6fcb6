#include <gtest/gtest.h>

#include "TileDecoder.hpp"
#include "FakeImageryClient.hpp"

using namespace rasterdl;
using rasterdl::test::encode_geotiff;
using rasterdl::test::synthetic_window;
using rasterdl::test::zip_entries;
using rasterdl::test::zip_payload;

TEST(TileDecoderTest, DecodesGeoTiff) {
    TileDecoder decoder;
    PixelWindow window{10, 14, 20, 27};
    RasterArray expected = synthetic_window(window, 100);

    RasterArray decoded = decoder.decode(encode_geotiff(expected), 4, 7, DataType::FLOAT64);

    ASSERT_EQ(decoded.rows(), 4);
    ASSERT_EQ(decoded.cols(), 7);
    EXPECT_TRUE((decoded == expected).all());
    EXPECT_EQ(decoded(0, 0), 10 * 100 + 20);
}

TEST(TileDecoderTest, DecodesZippedGeoTiff) {
    TileDecoder decoder;
    RasterArray expected = synthetic_window(PixelWindow{0, 3, 0, 5}, 5);
    std::vector<std::uint8_t> zipped = zip_payload(encode_geotiff(expected), "download.B4.tif");

    ASSERT_TRUE(TileDecoder::is_zip(zipped));
    RasterArray decoded = decoder.decode(zipped, 3, 5, DataType::FLOAT64);

    EXPECT_TRUE((decoded == expected).all());
}

TEST(TileDecoderTest, ZipEntryWithoutExtensionIsUsed) {
    TileDecoder decoder;
    RasterArray expected = synthetic_window(PixelWindow{0, 2, 0, 2}, 2);

    RasterArray decoded = decoder.decode(zip_payload(encode_geotiff(expected), "band"), 2, 2, DataType::FLOAT64);

    EXPECT_TRUE((decoded == expected).all());
}

TEST(TileDecoderTest, TiffEntryIsPreferredOverOtherFiles) {
    TileDecoder decoder;
    RasterArray expected = synthetic_window(PixelWindow{0, 2, 0, 3}, 3);
    std::vector<std::uint8_t> notes = {'n', 'o', 't', 'e', 's'};

    std::vector<std::uint8_t> zipped = zip_entries({
        {"manifest_notiff", notes},
        {"download.B1.tiff", encode_geotiff(expected)}
    });
    RasterArray decoded = decoder.decode(zipped, 2, 3, DataType::FLOAT64);

    EXPECT_TRUE((decoded == expected).all());
}

TEST(TileDecoderTest, RecognisesZipSignature) {
    EXPECT_TRUE(TileDecoder::is_zip({'P', 'K', 0x03, 0x04, 0x00}));
    EXPECT_FALSE(TileDecoder::is_zip({'I', 'I', 42, 0}));
    EXPECT_FALSE(TileDecoder::is_zip({'P', 'K'}));
}

TEST(TileDecoderTest, EmptyPayloadFails) {
    TileDecoder decoder;
    EXPECT_THROW(decoder.decode({}, 1, 1, DataType::FLOAT64), DecodeError);
}

TEST(TileDecoderTest, GarbagePayloadFails) {
    TileDecoder decoder;
    std::vector<std::uint8_t> garbage = {'<', 'h', 't', 'm', 'l', '>', 'o', 'o', 'p', 's'};
    EXPECT_THROW(decoder.decode(garbage, 1, 1, DataType::FLOAT64), DecodeError);
}

TEST(TileDecoderTest, ShapeMismatchFails) {
    TileDecoder decoder;
    std::vector<std::uint8_t> payload = encode_geotiff(synthetic_window(PixelWindow{0, 4, 0, 4}, 4));

    try {
        decoder.decode(payload, 5, 4, DataType::FLOAT64);
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_NE(std::string(e.what()).find("expected 5x4"), std::string::npos);
    }
}

TEST(TileDecoderTest, ZipWithoutRasterFails) {
    TileDecoder decoder;
    std::vector<std::uint8_t> text = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_THROW(decoder.decode(zip_payload(text, "readme.txt"), 1, 1, DataType::FLOAT64), DecodeError);
}

// ============================================================================
// Sample types
// ============================================================================

TEST(TileDecoderTest, NativeSampleTypesAreAccepted) {
    TileDecoder decoder;
    RasterArray expected = synthetic_window(PixelWindow{0, 3, 0, 4}, 4);

    for (DataType type : {DataType::UINT8, DataType::UINT16, DataType::INT16, DataType::UINT32,
                          DataType::INT32, DataType::FLOAT32, DataType::FLOAT64}) {
        RasterArray decoded = decoder.decode(encode_geotiff(expected, type), 3, 4, type);
        EXPECT_TRUE((decoded == expected).all()) << data_type_name(type);
    }
}

TEST(TileDecoderTest, SignedBytesKeepTheirSign) {
    TileDecoder decoder;
    RasterArray expected(1, 4);
    expected << -128.0, -1.0, 0.0, 127.0;

    RasterArray decoded = decoder.decode(encode_geotiff(expected, DataType::INT8), 1, 4, DataType::INT8);

    EXPECT_TRUE((decoded == expected).all());
}

TEST(TileDecoderTest, SampleTypeMismatchFails) {
    TileDecoder decoder;
    std::vector<std::uint8_t> payload = encode_geotiff(synthetic_window(PixelWindow{0, 4, 0, 7}, 7),
                                                       DataType::FLOAT64);

    try {
        decoder.decode(payload, 4, 7, DataType::UINT16);
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_NE(std::string(e.what()).find("expected uint16"), std::string::npos);
    }
    EXPECT_THROW(decoder.decode(payload, 4, 7, DataType::FLOAT32), DecodeError);
}
