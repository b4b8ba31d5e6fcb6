/**
 * @file RasterDownloader.cpp
 * @brief Main implementation of the tiled band downloader
 */

#include "raster_downloader.hpp"
#include "ImageryClient.hpp"
#include "CancellationToken.hpp"
#include "TilePlanner.hpp"
#include "TileFetcher.hpp"
#include "ParallelDispatcher.hpp"
#include "ArrayAssembler.hpp"
#include "Logger.hpp"
#include <chrono>
#include <exception>
#include <string>

namespace rasterdl {

// ============================================================================
// RasterDownloader::Impl - Private implementation
// ============================================================================

class RasterDownloader::Impl {
public:
    Impl(std::shared_ptr<ImageryClient> client, const DownloadConfig& config)
        : client_(std::move(client)), config_(config), logger_("RasterDownloader") {
        if (!client_) {
            throw ConfigurationError("an imagery client is required");
        }
        config_.validate();
    }

    const DownloadOutcome& download(const std::string& image, const std::string& band,
                                    std::int64_t max_bytes, int concurrency, int max_retries,
                                    const CancellationToken& token) {
        DownloadConfig effective = config_;
        effective.max_bytes = max_bytes;
        effective.concurrency = concurrency;
        effective.max_retries = max_retries;
        effective.validate();

        auto start_time = std::chrono::steady_clock::now();

        logger_.info("Downloading band " + band + " of " + image + " via " + client_->name());
        RasterSpec raster = describe(image, band);

        TileGrid grid = planner_.plan(raster, effective.max_bytes);
        logger_.info("Dividing band in " + std::to_string(grid.size()) + " tiles");

        // A new attempt replaces the previous results only once it has a plan
        last_grid_ = grid;
        last_outcome_.reset();

        TileFetcher fetcher(*client_, image, raster.data_type, effective.request_timeout);
        ParallelDispatcher dispatcher(fetcher, effective.retry_backoff);
        ArrayAssembler assembler(raster, grid.size());

        // Tiles are copied into place as they arrive so that at most
        // `concurrency` buffers are alive at once
        const ProgressCallback& progress = effective.progress;
        auto on_terminal = [&assembler, &progress](TileResult& result, size_t done, size_t total) {
            if (assembler.write(result)) {
                result.data() = RasterArray();
            }
            if (progress) {
                progress(done, total);
            }
        };

        std::vector<TileResult> results =
            dispatcher.run(grid, band, effective.concurrency, effective.max_retries, token, on_terminal);

        DownloadOutcome outcome = assembler.finish(results);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        const std::string timing = " in " + std::to_string(elapsed.count()) + " ms";

        if (outcome.complete()) {
            logger_.info("Downloaded " + std::to_string(raster.height) + "x" + std::to_string(raster.width) +
                         " " + data_type_name(raster.data_type) + " band" + timing);
        } else {
            logger_.warning("Download finished with " + std::to_string(outcome.failed_tiles.size()) +
                            " of " + std::to_string(outcome.tile_count) + " tiles failed" + timing);
            for (const auto& failed : outcome.failed_tiles) {
                logger_.detailed("  " + failed.tile.to_string() + " " + failure_kind_name(failed.kind) +
                                 ": " + failed.detail);
            }
        }

        last_outcome_ = std::move(outcome);
        return *last_outcome_;
    }

    const DownloadConfig& config() const { return config_; }

    void update_config(const DownloadConfig& config) {
        config.validate();
        config_ = config;
    }

    const std::optional<DownloadOutcome>& last_outcome() const { return last_outcome_; }
    const std::optional<TileGrid>& last_grid() const { return last_grid_; }

private:
    // Any failure to describe the band means the band cannot be downloaded
    RasterSpec describe(const std::string& image, const std::string& band) {
        RasterSpec raster;
        try {
            raster = client_->get_raster_spec(image, band);
        } catch (const UnavailableError&) {
            throw;
        } catch (const std::exception& e) {
            throw UnavailableError("could not describe band " + band + " of " + image + ": " + e.what());
        }

        if (raster.height <= 0 || raster.width <= 0 || raster.pixel_bytes <= 0) {
            throw UnavailableError("upstream reported no usable dimensions for band " + band + " of " + image +
                                   " (" + std::to_string(raster.height) + "x" + std::to_string(raster.width) +
                                   ", " + std::to_string(raster.pixel_bytes) + " bytes per pixel)");
        }
        return raster;
    }

    std::shared_ptr<ImageryClient> client_;
    DownloadConfig config_;
    TilePlanner planner_;
    Logger logger_;

    std::optional<DownloadOutcome> last_outcome_;
    std::optional<TileGrid> last_grid_;
};

// ============================================================================
// RasterDownloader - Public interface
// ============================================================================

namespace {
const std::optional<RasterArray> kNoArray;
const std::vector<FailedTile> kNoFailures;
} // namespace

RasterDownloader::RasterDownloader(std::shared_ptr<ImageryClient> client, const DownloadConfig& config)
    : impl_(std::make_unique<Impl>(std::move(client), config)) {
}

RasterDownloader::~RasterDownloader() = default;

const DownloadOutcome& RasterDownloader::download(const std::string& image, const std::string& band) {
    CancellationToken never_cancelled;
    return download(image, band, never_cancelled);
}

const DownloadOutcome& RasterDownloader::download(const std::string& image, const std::string& band,
                                                  const CancellationToken& token) {
    const DownloadConfig& config = impl_->config();
    return impl_->download(image, band, config.max_bytes, config.concurrency, config.max_retries, token);
}

const DownloadOutcome& RasterDownloader::download(const std::string& image, const std::string& band,
                                                  std::int64_t max_bytes, int concurrency, int max_retries) {
    CancellationToken never_cancelled;
    return impl_->download(image, band, max_bytes, concurrency, max_retries, never_cancelled);
}

const DownloadOutcome& RasterDownloader::download(const std::string& image, const std::string& band,
                                                  std::int64_t max_bytes, int concurrency, int max_retries,
                                                  const CancellationToken& token) {
    return impl_->download(image, band, max_bytes, concurrency, max_retries, token);
}

const std::optional<RasterArray>& RasterDownloader::last_array() const {
    const auto& outcome = impl_->last_outcome();
    return outcome ? outcome->array : kNoArray;
}

const std::vector<FailedTile>& RasterDownloader::last_failed_tiles() const {
    const auto& outcome = impl_->last_outcome();
    return outcome ? outcome->failed_tiles : kNoFailures;
}

const std::optional<DownloadOutcome>& RasterDownloader::last_outcome() const {
    return impl_->last_outcome();
}

const std::optional<TileGrid>& RasterDownloader::last_grid() const {
    return impl_->last_grid();
}

const DownloadConfig& RasterDownloader::get_config() const {
    return impl_->config();
}

void RasterDownloader::update_config(const DownloadConfig& config) {
    impl_->update_config(config);
}

} // namespace rasterdl
