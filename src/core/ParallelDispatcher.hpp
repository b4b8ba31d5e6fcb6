/**
 * @file ParallelDispatcher.hpp
 * @brief Runs tile fetches on a bounded worker pool
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "raster_downloader.hpp"
#include "TileFetcher.hpp"
#include "CancellationToken.hpp"
#include "Logger.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace rasterdl {

/**
 * @brief Bounded-concurrency scheduler of tile fetches
 *
 * A pool of at most `concurrency` threads pulls tiles from a shared queue.
 * A transient failure puts the same tile back on the queue until it has
 * been tried 1 + max_retries times; permanent and decode failures are final
 * at once. Every tile ends with exactly one result, and the results come
 * back ordered by tile index whatever the completion order.
 *
 * Cancellation stops workers from pulling new tiles, turns every tile
 * without a terminal result into a CANCELLED failure and discards results
 * that arrive afterwards.
 */
class ParallelDispatcher {
public:
    /**
     * @brief Called on a worker thread when a tile reaches its terminal state
     *
     * Invoked exactly once per tile finalised before cancellation, never
     * concurrently for the same tile. The observer may move the tile data
     * out of the result.
     */
    using TerminalObserver = std::function<void(TileResult& result, size_t done, size_t total)>;

    explicit ParallelDispatcher(const TileFetcher& fetcher,
                                std::chrono::milliseconds retry_backoff = std::chrono::milliseconds(300));

    /**
     * @brief Fetch every tile of a grid
     *
     * Returns once every tile is terminal and all workers have been joined.
     *
     * @throws ConfigurationError if concurrency < 1 or max_retries < 0
     */
    std::vector<TileResult> run(const TileGrid& grid, const std::string& band,
                                int concurrency, int max_retries,
                                const CancellationToken& token,
                                const TerminalObserver& on_terminal = {}) const;

    std::vector<TileResult> run(const TileGrid& grid, const std::string& band,
                                int concurrency, int max_retries) const;

    std::chrono::milliseconds retry_backoff() const { return retry_backoff_; }

private:
    const TileFetcher& fetcher_;
    std::chrono::milliseconds retry_backoff_;
    Logger logger_;

    TileResult fetch_guarded(const TileDescriptor& tile, const std::string& band,
                             const CancellationToken& token, int attempt) const;
};

} // namespace rasterdl
