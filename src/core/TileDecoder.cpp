/**
 * @file TileDecoder.cpp
 * @brief GDAL in-memory decoding of tile payloads
 */

#include "TileDecoder.hpp"
#include <gdal_priv.h>
#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>

namespace rasterdl {

namespace {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

// Exposes a byte buffer as a /vsimem/ file for the lifetime of the object
class MemoryFile {
public:
    MemoryFile(const std::vector<std::uint8_t>& bytes, const char* extension) {
        static std::atomic<unsigned long> counter{0};
        path_ = "/vsimem/rasterdl_tile_" + std::to_string(counter.fetch_add(1)) + extension;
        VSILFILE* fp = VSIFileFromMemBuffer(path_.c_str(),
                                            const_cast<GByte*>(bytes.data()),
                                            static_cast<vsi_l_offset>(bytes.size()),
                                            FALSE);
        if (!fp) {
            throw DecodeError("could not map payload into GDAL memory file");
        }
        VSIFCloseL(fp);
    }

    ~MemoryFile() {
        VSIUnlink(path_.c_str());
    }

    MemoryFile(const MemoryFile&) = delete;
    MemoryFile& operator=(const MemoryFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Keeps GDAL from printing errors we report ourselves
struct QuietErrors {
    QuietErrors() { CPLPushErrorHandler(CPLQuietErrorHandler); }
    ~QuietErrors() { CPLPopErrorHandler(); }
};

std::string last_gdal_error() {
    const char* msg = CPLGetLastErrorMsg();
    return (msg && *msg) ? std::string(msg) : std::string("unknown GDAL error");
}

bool has_extension(const std::string& name, const char* extension) {
    const size_t length = std::strlen(extension);
    return name.size() > length && EQUAL(name.c_str() + name.size() - length, extension);
}

// Signed bytes predate GDT_Int8 and are flagged on a Byte band
bool is_signed_byte(GDALRasterBand* band) {
    const char* pixel_type = band->GetMetadataItem("PIXELTYPE", "IMAGE_STRUCTURE");
    return band->GetRasterDataType() == GDT_Byte && pixel_type && EQUAL(pixel_type, "SIGNEDBYTE");
}

bool stored_as(DataType expected, GDALRasterBand* band) {
    const GDALDataType actual = band->GetRasterDataType();
    switch (expected) {
        case DataType::UINT8:   return actual == GDT_Byte && !is_signed_byte(band);
#if GDAL_VERSION_NUM >= GDAL_COMPUTE_VERSION(3, 7, 0)
        case DataType::INT8:    return actual == GDT_Int8 || is_signed_byte(band);
#else
        case DataType::INT8:    return is_signed_byte(band);
#endif
        case DataType::UINT16:  return actual == GDT_UInt16;
        case DataType::INT16:   return actual == GDT_Int16;
        case DataType::UINT32:  return actual == GDT_UInt32;
        case DataType::INT32:   return actual == GDT_Int32;
        case DataType::FLOAT32: return actual == GDT_Float32;
        case DataType::FLOAT64: return actual == GDT_Float64;
    }
    return false;
}

// First raster entry of a zip archive, as the service packs one file per band
std::string first_zip_entry(const std::string& zip_path) {
    const std::string vsi_zip = "/vsizip/" + zip_path;
    char** entries = VSIReadDir(vsi_zip.c_str());
    if (!entries) {
        throw DecodeError("zip payload has no entries");
    }

    std::string chosen;
    for (int i = 0; entries[i] != nullptr; ++i) {
        std::string entry = entries[i];
        if (has_extension(entry, ".tif") || has_extension(entry, ".tiff")) {
            chosen = entry;
            break;
        }
        if (chosen.empty() && i == 0) {
            chosen = entry;
        }
    }
    CSLDestroy(entries);

    if (chosen.empty()) {
        throw DecodeError("zip payload has no entries");
    }
    return vsi_zip + "/" + chosen;
}

} // namespace

TileDecoder::TileDecoder() : logger_("TileDecoder") {
    static std::once_flag gdal_registered;
    std::call_once(gdal_registered, [] { GDALAllRegister(); });
}

bool TileDecoder::is_zip(const std::vector<std::uint8_t>& payload) {
    return payload.size() >= 4 &&
           payload[0] == 'P' && payload[1] == 'K' && payload[2] == 0x03 && payload[3] == 0x04;
}

RasterArray TileDecoder::decode(const std::vector<std::uint8_t>& payload,
                                std::int64_t rows, std::int64_t cols, DataType type) const {
    if (payload.empty()) {
        throw DecodeError("empty payload");
    }

    QuietErrors quiet;
    const bool zipped = is_zip(payload);
    MemoryFile file(payload, zipped ? ".zip" : ".tif");
    const std::string open_path = zipped ? first_zip_entry(file.path()) : file.path();

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(open_path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        throw DecodeError("payload is not a readable raster: " + last_gdal_error());
    }

    if (dataset->GetRasterCount() < 1) {
        throw DecodeError("payload holds no raster band");
    }

    const std::int64_t width = dataset->GetRasterXSize();
    const std::int64_t height = dataset->GetRasterYSize();
    if (height != rows || width != cols) {
        throw DecodeError("payload is " + std::to_string(height) + "x" + std::to_string(width) +
                          ", expected " + std::to_string(rows) + "x" + std::to_string(cols));
    }

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (!stored_as(type, band)) {
        throw DecodeError(std::string("payload holds ") + GDALGetDataTypeName(band->GetRasterDataType()) +
                          " samples, expected " + data_type_name(type));
    }

    RasterArray data(rows, cols);
    CPLErr err = band->RasterIO(GF_Read, 0, 0, static_cast<int>(cols), static_cast<int>(rows),
                                data.data(), static_cast<int>(cols), static_cast<int>(rows),
                                GDT_Float64, 0, 0, nullptr);
    if (err != CE_None) {
        throw DecodeError("failed to read samples: " + last_gdal_error());
    }
    if (is_signed_byte(band)) {
        data = (data > 127.0).select(data - 256.0, data);
    }

    logger_.trace("Decoded " + std::to_string(payload.size()) + " byte " +
                  (zipped ? "zip" : "GeoTIFF") + " payload into " +
                  std::to_string(rows) + "x" + std::to_string(cols) + " samples");

    return data;
}

} // namespace rasterdl
