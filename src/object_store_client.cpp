/**
 * @file object_store_client.cpp
 * @brief Supabase Storage REST client built on libcurl and jsoncpp.
 */

#include "object_store_client.hpp"
#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <format>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace {

std::once_flag gCurlInit;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::string writeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::optional<Json::Value> parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string escapeObjectPath(const std::string& path) {
    std::string escaped;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string segment = path.substr(start, end - start);
        char* out = curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size()));
        if (!out) {
            throw std::runtime_error("Failed to escape URL path");
        }
        escaped += out;
        curl_free(out);
        if (end == path.size()) {
            break;
        }
        escaped += '/';
        start = end + 1;
    }
    return escaped;
}

ObjectStoreError parseErrorResponse(long httpStatus, const std::string& body) {
    ObjectStoreError error{httpStatus, std::format("HTTP {}", httpStatus)};
    auto json = parseJson(body);
    if (!json || !json->isObject()) {
        if (!body.empty()) {
            error.message = body;
        }
        return error;
    }
    // The service reports its own status in the body, e.g. a 400 carrying statusCode "404".
    const Json::Value& statusCode = (*json)["statusCode"];
    if (statusCode.isString()) {
        try {
            error.status = std::stol(statusCode.asString());
        } catch (const std::exception&) {
            error.status = httpStatus;
        }
    } else if (statusCode.isInt()) {
        error.status = statusCode.asInt();
    }
    if ((*json)["message"].isString()) {
        error.message = (*json)["message"].asString();
    } else if ((*json)["error"].isString()) {
        error.message = (*json)["error"].asString();
    }
    return error;
}

std::expected<std::vector<ObjectInfo>, ObjectStoreError> parseObjectListing(long httpStatus, const std::string& body) {
    auto json = parseJson(body);
    if (!json || !json->isArray()) {
        return std::unexpected(ObjectStoreError{httpStatus, "Malformed listing response"});
    }

    std::vector<ObjectInfo> objects;
    for (const auto& item : *json) {
        if (!item.isObject()) {
            continue;
        }
        ObjectInfo info;
        info.name = item.get("name", "").asString();
        if (item["id"].isString()) {
            info.id = item["id"].asString();
        }
        const Json::Value& metadata = item["metadata"];
        if (metadata.isObject() && metadata["size"].isUInt64()) {
            info.size = metadata["size"].asUInt64();
        }
        if (item["created_at"].isString()) {
            info.createdAt = item["created_at"].asString();
        }
        objects.push_back(std::move(info));
    }
    return objects;
}

bool ObjectStoreError::notFound() const {
    if (status == 404) {
        return true;
    }
    std::string lowered = message;
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });
    return lowered.find("not found") != std::string::npos;
}

HttpObjectStoreClient::HttpObjectStoreClient(const RemoteStorageConfig& config)
    : timeoutSeconds(config.timeoutSeconds) {
    if (!config.url || config.url->empty() || !config.key || config.key->empty()) {
        throw std::invalid_argument("Remote storage url and key are required");
    }
    std::string url = *config.url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    baseUrl = url + "/storage/v1";
    apiKey = *config.key;

    std::call_once(gCurlInit, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    });
}

std::expected<HttpObjectStoreClient::Response, ObjectStoreError>
HttpObjectStoreClient::perform(const std::string& method,
                               const std::string& path,
                               const std::string& body,
                               const std::vector<std::string>& extraHeaders) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return std::unexpected(ObjectStoreError{0, "Failed to initialize CURL"});
    }

    std::string url = std::format("{}/{}", baseUrl, escapeObjectPath(path));

    curl_slist* rawHeaders = nullptr;
    std::vector<std::string> headers = {
        std::format("Authorization: Bearer {}", apiKey),
        std::format("apikey: {}", apiKey),
    };
    headers.insert(headers.end(), extraHeaders.begin(), extraHeaders.end());
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(rawHeaders, header.c_str());
        if (!appended) {
            curl_slist_free_all(rawHeaders);
            return std::unexpected(ObjectStoreError{0, "Failed to build request headers"});
        }
        rawHeaders = appended;
    }
    std::unique_ptr<curl_slist, SlistDeleter> headerList(rawHeaders);

    Response response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(ObjectStoreError{0, std::format("{} {} timed out after {}s", method, path, timeoutSeconds)});
    }
    if (res != CURLE_OK) {
        return std::unexpected(ObjectStoreError{0, std::format("{} {} failed: {}", method, path, curl_easy_strerror(res))});
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status < 200 || response.status >= 300) {
        return std::unexpected(parseErrorResponse(response.status, response.body));
    }
    return response;
}

std::expected<void, ObjectStoreError> HttpObjectStoreClient::getBucket(const std::string& bucket) {
    auto response = perform("GET", std::format("bucket/{}", bucket), {}, {});
    if (!response) {
        return std::unexpected(response.error());
    }
    return {};
}

std::expected<void, ObjectStoreError> HttpObjectStoreClient::createBucket(const std::string& bucket, const BucketPolicy& policy) {
    Json::Value request;
    request["id"] = bucket;
    request["name"] = bucket;
    request["public"] = policy.isPublic;
    request["file_size_limit"] = Json::Value::UInt64(policy.fileSizeLimit);
    request["allowed_mime_types"] = Json::Value(Json::arrayValue);
    for (const auto& mime : policy.allowedMimeTypes) {
        request["allowed_mime_types"].append(mime);
    }

    auto response = perform("POST", "bucket", writeJson(request), {"Content-Type: application/json"});
    if (!response) {
        return std::unexpected(response.error());
    }
    return {};
}

std::expected<void, ObjectStoreError> HttpObjectStoreClient::upload(const std::string& bucket,
                                                                    const std::string& key,
                                                                    const std::string& data,
                                                                    const std::string& contentType,
                                                                    bool upsert) {
    auto response = perform("POST", std::format("object/{}/{}", bucket, key), data,
                            {std::format("Content-Type: {}", contentType),
                             std::format("x-upsert: {}", upsert ? "true" : "false"),
                             "cache-control: max-age=3600"});
    if (!response) {
        return std::unexpected(response.error());
    }
    return {};
}

std::expected<std::vector<ObjectInfo>, ObjectStoreError> HttpObjectStoreClient::list(const std::string& bucket,
                                                                                     const std::string& prefix,
                                                                                     const ListOptions& options) {
    Json::Value request;
    request["prefix"] = prefix;
    request["limit"] = options.limit;
    request["offset"] = options.offset;
    request["sortBy"]["column"] = options.sortColumn;
    request["sortBy"]["order"] = options.descending ? "desc" : "asc";

    auto response = perform("POST", std::format("object/list/{}", bucket), writeJson(request),
                            {"Content-Type: application/json"});
    if (!response) {
        return std::unexpected(response.error());
    }

    return parseObjectListing(response->status, response->body);
}

std::expected<std::string, ObjectStoreError> HttpObjectStoreClient::download(const std::string& bucket, const std::string& key) {
    auto response = perform("GET", std::format("object/{}/{}", bucket, key), {}, {});
    if (!response) {
        return std::unexpected(response.error());
    }
    return std::move(response->body);
}

std::unique_ptr<ObjectStoreClient> makeHttpObjectStoreClient(const RemoteStorageConfig& config) {
    return std::make_unique<HttpObjectStoreClient>(config);
}
