/**
 * @file object_store_client.hpp
 * @brief Client interface for the remote object storage service.
 *
 * The object storage backend talks to the service only through this interface,
 * so tests can substitute an in-memory store. The HTTP implementation speaks
 * the Supabase Storage REST API.
 *
 * @note Requires libcurl and jsoncpp.
 */

#ifndef OBJECT_STORE_CLIENT_HPP
#define OBJECT_STORE_CLIENT_HPP

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "backup_config.hpp"

/**
 * @brief Failure reported by the storage service or the transport.
 *
 * A status of 0 means the request never produced a response (connection
 * failure or timeout).
 */
struct ObjectStoreError {
    long status = 0;
    std::string message;

    /**
     * @brief True for a 404 status or a message saying "not found".
     */
    bool notFound() const;
};

/**
 * @brief Provisioning policy for a new container.
 */
struct BucketPolicy {
    bool isPublic = false;
    std::uint64_t fileSizeLimit = 0;
    std::vector<std::string> allowedMimeTypes;
};

/**
 * @brief Listing options; sorting is by the given column.
 */
struct ListOptions {
    int limit = 100;
    int offset = 0;
    std::string sortColumn = "created_at";
    bool descending = true;
};

/**
 * @brief One listed object. Folder placeholders carry no id.
 */
struct ObjectInfo {
    std::string name;
    std::optional<std::string> id;
    std::optional<std::uint64_t> size;
    std::string createdAt;
};

/**
 * @brief Interface for object storage services.
 */
class ObjectStoreClient {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ObjectStoreClient() = default;

    /**
     * @brief Checks that a container exists.
     */
    virtual std::expected<void, ObjectStoreError> getBucket(const std::string& bucket) = 0;

    /**
     * @brief Creates a container with the given policy.
     */
    virtual std::expected<void, ObjectStoreError> createBucket(const std::string& bucket, const BucketPolicy& policy) = 0;

    /**
     * @brief Uploads an object.
     *
     * @param bucket Container name.
     * @param key Object key (e.g. "<ownerId>/<filename>").
     * @param data Object bytes.
     * @param contentType Content-Type stored with the object.
     * @param upsert Overwrite an existing object at the same key.
     */
    virtual std::expected<void, ObjectStoreError> upload(const std::string& bucket,
                                                         const std::string& key,
                                                         const std::string& data,
                                                         const std::string& contentType,
                                                         bool upsert) = 0;

    /**
     * @brief Lists the objects directly under a prefix.
     */
    virtual std::expected<std::vector<ObjectInfo>, ObjectStoreError> list(const std::string& bucket,
                                                                          const std::string& prefix,
                                                                          const ListOptions& options) = 0;

    /**
     * @brief Downloads an object's bytes.
     */
    virtual std::expected<std::string, ObjectStoreError> download(const std::string& bucket, const std::string& key) = 0;
};

/**
 * @brief Creates the client for a remote configuration; may throw.
 */
using ObjectStoreClientFactory = std::function<std::unique_ptr<ObjectStoreClient>(const RemoteStorageConfig&)>;

/**
 * @brief Supabase Storage REST client over libcurl.
 *
 * Every request is bounded by the configured timeout.
 */
class HttpObjectStoreClient : public ObjectStoreClient {
public:
    /**
     * @brief Constructs a client for the configured service.
     *
     * @param config Remote settings; url and key must be present.
     * @throws std::invalid_argument If url or key is missing.
     */
    explicit HttpObjectStoreClient(const RemoteStorageConfig& config);

    std::expected<void, ObjectStoreError> getBucket(const std::string& bucket) override;
    std::expected<void, ObjectStoreError> createBucket(const std::string& bucket, const BucketPolicy& policy) override;
    std::expected<void, ObjectStoreError> upload(const std::string& bucket,
                                                 const std::string& key,
                                                 const std::string& data,
                                                 const std::string& contentType,
                                                 bool upsert) override;
    std::expected<std::vector<ObjectInfo>, ObjectStoreError> list(const std::string& bucket,
                                                                  const std::string& prefix,
                                                                  const ListOptions& options) override;
    std::expected<std::string, ObjectStoreError> download(const std::string& bucket, const std::string& key) override;

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    std::expected<Response, ObjectStoreError> perform(const std::string& method,
                                                      const std::string& path,
                                                      const std::string& body,
                                                      const std::vector<std::string>& extraHeaders);

    std::string baseUrl;  ///< "<url>/storage/v1".
    std::string apiKey;   ///< Access key sent as bearer token and apikey.
    long timeoutSeconds;  ///< Per-request timeout.
};

/**
 * @brief Maps a non-2xx response to an error.
 *
 * A JSON body may carry the service's own status (e.g. a 400 with statusCode
 * "404") and a message or error text. Any other non-empty body becomes the
 * message as is.
 *
 * @param httpStatus HTTP status of the response.
 * @param body Response body.
 * @return ObjectStoreError The error.
 */
ObjectStoreError parseErrorResponse(long httpStatus, const std::string& body);

/**
 * @brief Parses an object listing body (a JSON array of objects).
 *
 * A missing metadata.size leaves size empty; a missing id marks a folder
 * placeholder. Non-object entries are skipped.
 */
std::expected<std::vector<ObjectInfo>, ObjectStoreError> parseObjectListing(long httpStatus, const std::string& body);

/**
 * @brief Percent-encodes each '/'-separated segment of an object path.
 *
 * @throws std::runtime_error If libcurl cannot encode a segment.
 */
std::string escapeObjectPath(const std::string& path);

/**
 * @brief Default factory producing an HttpObjectStoreClient.
 */
std::unique_ptr<ObjectStoreClient> makeHttpObjectStoreClient(const RemoteStorageConfig& config);

#endif // OBJECT_STORE_CLIENT_HPP
