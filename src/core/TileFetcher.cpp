/**
 * @file TileFetcher.cpp
 * @brief Implementation of the single-tile fetch
 */

#include "TileFetcher.hpp"
#include "CancellationToken.hpp"

namespace rasterdl {

TileFetcher::TileFetcher(ImageryClient& client, std::string image, DataType data_type,
                         std::chrono::milliseconds timeout)
    : client_(client), image_(std::move(image)), data_type_(data_type), timeout_(timeout),
      logger_("TileFetcher") {
}

TileResult TileFetcher::fetch(const TileDescriptor& tile, const std::string& band,
                              const CancellationToken& token, int attempt) const {
    if (token.is_cancelled()) {
        return TileResult::failure(tile, FailureKind::CANCELLED, "download cancelled", attempt);
    }

    std::vector<std::uint8_t> payload;
    try {
        logger_.debug("Requesting " + tile.to_string() + " of " + image_ + "/" + band +
                      " (attempt " + std::to_string(attempt) + ")");
        payload = client_.fetch_region(image_, band, tile.window(), timeout_, token);
    } catch (const CancelledError& e) {
        return TileResult::failure(tile, FailureKind::CANCELLED, e.what(), attempt);
    } catch (const TransientError& e) {
        return TileResult::failure(tile, FailureKind::TRANSIENT, e.what(), attempt);
    } catch (const PermanentError& e) {
        return TileResult::failure(tile, FailureKind::PERMANENT, e.what(), attempt);
    } catch (const DecodeError& e) {
        return TileResult::failure(tile, FailureKind::DECODE, e.what(), attempt);
    }

    try {
        RasterArray data = decoder_.decode(payload, tile.rows(), tile.cols(), data_type_);
        return TileResult::success(tile, std::move(data), attempt);
    } catch (const DecodeError& e) {
        return TileResult::failure(tile, FailureKind::DECODE, e.what(), attempt);
    }
}

} // namespace rasterdl
