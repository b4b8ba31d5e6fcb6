/**
 * @file EarthEngineClient.cpp
 * @brief Implementation of the Earth Engine REST client
 */

#include "EarthEngineClient.hpp"
#include "CancellationToken.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <sstream>

using json = nlohmann::json;

namespace rasterdl {

namespace {

// Callback for curl to append response data
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* buffer = static_cast<std::vector<std::uint8_t>*>(userp);
    auto* bytes = static_cast<std::uint8_t*>(contents);
    buffer->insert(buffer->end(), bytes, bytes + total_size);
    return total_size;
}

// Aborts the transfer once the caller cancels
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return (token && token->is_cancelled()) ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

bool is_transient_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
    }
}

// Proto3 JSON renders 64-bit integers as strings
std::int64_t json_int(const json& obj, const char* key, std::int64_t fallback = 0) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (it->is_number()) return it->get<std::int64_t>();
    if (it->is_string()) return std::stoll(it->get<std::string>());
    return fallback;
}

double json_double(const json& obj, const char* key, double fallback = 0.0) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) return std::stod(it->get<std::string>());
    return fallback;
}

void ensure_curl_initialized() {
    static std::once_flag curl_initialized;
    std::call_once(curl_initialized, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

EarthEngineClient::EarthEngineClient() : EarthEngineClient(Config{}) {
}

EarthEngineClient::EarthEngineClient(const Config& config)
    : config_(config), logger_("EarthEngineClient") {
    ensure_curl_initialized();
}

std::string EarthEngineClient::asset_name(const std::string& image) const {
    if (image.rfind("projects/", 0) == 0) {
        return image;
    }
    return "projects/" + config_.project + "/assets/" + image;
}

std::string EarthEngineClient::endpoint(const std::string& asset, const std::string& method) const {
    std::string url = config_.base_url + "/" + config_.api_version + "/" + asset;
    if (!method.empty()) {
        url += ":" + method;
    }
    return url;
}

HttpDisposition EarthEngineClient::classify_http_status(long status) {
    if (status >= 200 && status < 300) {
        return HttpDisposition::OK;
    }
    switch (status) {
        case 408:  // request timeout
        case 429:  // rate limited
        case 500:
        case 502:
        case 503:
        case 504:
            return HttpDisposition::TRANSIENT;
        default:
            return HttpDisposition::PERMANENT;
    }
}

std::string EarthEngineClient::extract_error_message(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        auto error = parsed.find("error");
        if (error != parsed.end() && error->is_object()) {
            auto message = error->find("message");
            if (message != error->end() && message->is_string()) {
                return message->get<std::string>();
            }
        }
    }

    constexpr size_t kMaxRawLength = 200;
    return body.size() > kMaxRawLength ? body.substr(0, kMaxRawLength) + "..." : body;
}

RasterSpec EarthEngineClient::parse_raster_spec(const std::string& asset_json, const std::string& band) {
    json asset = json::parse(asset_json, nullptr, false);
    if (asset.is_discarded() || !asset.is_object()) {
        throw UnavailableError("asset metadata is not valid JSON");
    }

    auto bands = asset.find("bands");
    if (bands == asset.end() || !bands->is_array()) {
        throw UnavailableError("asset metadata lists no bands");
    }

    for (const auto& entry : *bands) {
        if (!entry.is_object() || entry.value("id", std::string()) != band) continue;

        try {
            const json& grid = entry.at("grid");
            const json& dimensions = grid.at("dimensions");

            RasterSpec spec;
            spec.height = json_int(dimensions, "height");
            spec.width = json_int(dimensions, "width");
            if (spec.height <= 0 || spec.width <= 0) {
                throw UnavailableError("band " + band + " reports no pixel dimensions");
            }

            spec.data_type = DataType::FLOAT64;
            auto data_type = entry.find("dataType");
            if (data_type != entry.end()) {
                const std::string precision = data_type->value("precision", std::string("DOUBLE"));
                if (precision == "INT") {
                    double min_value = 0.0, max_value = 0.0;
                    auto range = data_type->find("range");
                    if (range != data_type->end()) {
                        min_value = json_double(*range, "min");
                        max_value = json_double(*range, "max");
                    }
                    spec.data_type = integer_type_for_range(min_value, max_value);
                } else if (precision == "FLOAT") {
                    spec.data_type = DataType::FLOAT32;
                }
            }
            spec.pixel_bytes = pixel_bytes(spec.data_type);

            GeoTransform geo;
            auto affine = grid.find("affineTransform");
            if (affine != grid.end()) {
                geo.coefficients = {json_double(*affine, "translateX"),
                                    json_double(*affine, "scaleX"),
                                    json_double(*affine, "shearX"),
                                    json_double(*affine, "translateY"),
                                    json_double(*affine, "shearY"),
                                    json_double(*affine, "scaleY")};
            }
            geo.crs = grid.value("crsCode", std::string());
            spec.geo = geo;

            return spec;
        } catch (const json::exception& e) {
            throw UnavailableError("malformed grid for band " + band + ": " + e.what());
        } catch (const std::logic_error& e) {
            throw UnavailableError("malformed dimensions for band " + band + ": " + e.what());
        }
    }

    throw UnavailableError("image does not contain band " + band);
}

std::string EarthEngineClient::build_pixels_request(const std::string& band, const GeoTransform& geo,
                                                    const PixelWindow& window) {
    const GeoTransform shifted = geo.shifted_to(window.row_start, window.col_start);
    const auto& c = shifted.coefficients;

    json grid = {
        {"dimensions", {{"width", window.cols()}, {"height", window.rows()}}},
        {"affineTransform", {
            {"translateX", c[0]}, {"scaleX", c[1]}, {"shearX", c[2]},
            {"translateY", c[3]}, {"shearY", c[4]}, {"scaleY", c[5]}
        }}
    };
    if (!shifted.crs.empty()) {
        grid["crsCode"] = shifted.crs;
    }

    json request = {
        {"fileFormat", "GEO_TIFF"},
        {"bandIds", json::array({band})},
        {"grid", grid}
    };
    return request.dump();
}

EarthEngineClient::HttpResponse EarthEngineClient::perform(const std::string& url,
                                                           const std::string* post_body,
                                                           long timeout_ms,
                                                           const CancellationToken* token) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw PermanentError("Failed to initialize curl");
    }

    HttpResponse response;
    std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
    auto add_header = [&headers](const std::string& header) {
        curl_slist* appended = curl_slist_append(headers.get(), header.c_str());
        if (!appended) {
            throw PermanentError("Failed to build request headers");
        }
        headers.release();
        headers.reset(appended);
    };

    if (!config_.access_token.empty()) {
        add_header("Authorization: Bearer " + config_.access_token);
    }
    if (!config_.project.empty()) {
        add_header("x-goog-user-project: " + config_.project);
    }

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_seconds));
    curl_easy_setopt(handle, CURLOPT_USERAGENT, config_.user_agent.c_str());

    if (post_body) {
        add_header("Content-Type: application/json");
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }
    if (headers) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    }
    if (token) {
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(token));
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(handle);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw CancelledError("transfer aborted: download cancelled");
    }
    if (res != CURLE_OK) {
        std::string message = "curl request failed: " + std::string(curl_easy_strerror(res));
        if (is_transient_curl_error(res)) {
            throw TransientError(message);
        }
        throw PermanentError(message);
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    logger_.trace("HTTP " + std::to_string(response.status) + " for " + url + " (" +
                  std::to_string(response.body.size()) + " bytes)");
    return response;
}

RasterSpec EarthEngineClient::get_raster_spec(const std::string& image, const std::string& band) {
    return describe(image, band, nullptr);
}

RasterSpec EarthEngineClient::describe(const std::string& image, const std::string& band,
                                       const CancellationToken* token) {
    const std::string asset = asset_name(image);
    logger_.info("Retrieving band info for " + asset + "/" + band);

    HttpResponse response;
    try {
        response = perform(endpoint(asset), nullptr, config_.metadata_timeout_seconds * 1000L, token);
    } catch (const CancelledError&) {
        throw;
    } catch (const RasterDownloadError& e) {
        throw UnavailableError("metadata request for " + asset + " failed: " + e.what());
    }

    const std::string body(response.body.begin(), response.body.end());
    if (classify_http_status(response.status) != HttpDisposition::OK) {
        throw UnavailableError("HTTP " + std::to_string(response.status) + " for " + asset + ": " +
                               extract_error_message(body));
    }

    RasterSpec spec = parse_raster_spec(body, band);
    {
        std::lock_guard<std::mutex> lock(grids_mutex_);
        grids_[{asset, band}] = *spec.geo;
    }

    logger_.info("Band " + band + ": " + std::to_string(spec.height) + "x" + std::to_string(spec.width) +
                 " " + data_type_name(spec.data_type) + " pixels");
    return spec;
}

GeoTransform EarthEngineClient::grid_for(const std::string& image, const std::string& band,
                                         const CancellationToken& token) {
    const std::string asset = asset_name(image);
    {
        std::lock_guard<std::mutex> lock(grids_mutex_);
        auto it = grids_.find({asset, band});
        if (it != grids_.end()) {
            return it->second;
        }
    }

    try {
        return *describe(image, band, &token).geo;
    } catch (const UnavailableError& e) {
        throw PermanentError(std::string("band grid unknown: ") + e.what());
    }
}

std::vector<std::uint8_t> EarthEngineClient::fetch_region(const std::string& image,
                                                          const std::string& band,
                                                          const PixelWindow& window,
                                                          std::chrono::milliseconds timeout,
                                                          const CancellationToken& token) {
    if (window.rows() <= 0 || window.cols() <= 0) {
        throw PermanentError("empty pixel window requested");
    }

    const GeoTransform geo = grid_for(image, band, token);
    const std::string body = build_pixels_request(band, geo, window);
    const std::string url = endpoint(asset_name(image), "getPixels");

    HttpResponse response = perform(url, &body, static_cast<long>(timeout.count()), &token);

    switch (classify_http_status(response.status)) {
        case HttpDisposition::OK:
            return std::move(response.body);
        case HttpDisposition::TRANSIENT:
            throw TransientError("HTTP " + std::to_string(response.status) + ": " +
                                 extract_error_message(std::string(response.body.begin(), response.body.end())));
        case HttpDisposition::PERMANENT:
            break;
    }
    throw PermanentError("HTTP " + std::to_string(response.status) + ": " +
                         extract_error_message(std::string(response.body.begin(), response.body.end())));
}

} // namespace rasterdl
