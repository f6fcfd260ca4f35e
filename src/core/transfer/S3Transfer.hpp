#pragma once

#include "TransferCapability.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/HttpClient.hpp"

#include <exception>
#include <string>
#include <vector>

namespace collector::core {
class Config;
}

namespace collector::core::transfer {

struct S3Options {
    std::string endpoint{"https://s3.amazonaws.com"};
    std::string region{"us-east-1"};
    int timeoutMs{30000};
    int connectTimeoutMs{10000};
    bool verifyChecksum{true};

    static S3Options fromConfig(const Config& config);
};

struct S3Location {
    std::string bucket;
    std::string prefix;

    /**
     * Parse "s3://bucket/prefix"
     * @throws FatalTransferError on a malformed locator
     */
    static S3Location parse(const std::string& locator);
};

struct S3ListingPage {
    std::vector<TransferItem> items;
    bool truncated{false};
    std::string nextContinuationToken;
};

/**
 * Receives an object body chunk by chunk on libcurl's thread: writes it,
 * hashes it and reports the byte count. An exception from any of these
 * is held (and the transfer aborted) instead of unwinding through
 * libcurl; rethrowIfFailed() raises it once the request has returned.
 */
class S3BodySink {
public:
    S3BodySink(DestinationWriter& destination, const BytesCallback& onBytes, bool verify);

    S3BodySink(const S3BodySink&) = delete;
    S3BodySink& operator=(const S3BodySink&) = delete;

    // @return false to abort the transfer
    bool consume(const char* data, size_t size);
    void rethrowIfFailed() const;

    uint64_t received() const { return m_received; }
    bool failed() const { return static_cast<bool>(m_failure); }

    // Finalizes the digest; call once
    std::string hexDigest();

private:
    DestinationWriter& m_destination;
    const BytesCallback& m_onBytes;
    bool m_verify;
    utils::Digest m_digest;
    uint64_t m_received{0};
    std::exception_ptr m_failure;
};

/**
 * Anonymous access to a public S3 bucket (ListObjectsV2 + GET), as used
 * for open dataset mirrors. Item keys are full "s3://bucket/key" locators.
 */
class S3Transfer : public TransferCapability {
public:
    explicit S3Transfer(S3Options options,
                        utils::HttpClient& http = utils::HttpClient::instance());

    std::vector<TransferItem> listItems(const tasks::JobSpec& spec) override;
    uint64_t fetchItem(const TransferItem& item, DestinationWriter& destination,
                       const BytesCallback& onBytes) override;

    /**
     * Parse one ListObjectsV2 response body of `bucket`. Relative paths
     * are taken below `prefix`; directory markers are skipped.
     * @throws TransientTransferError if the body is not a listing
     */
    static S3ListingPage parseListing(const std::string& xml, const std::string& bucket,
                                      const std::string& prefix);

    std::string objectUrl(const std::string& bucket, const std::string& key) const;

private:
    utils::HttpOptions requestOptions() const;
    std::string listUrl(const S3Location& location, const std::string& continuationToken) const;

    S3Options m_options;
    utils::HttpClient& m_http;
};

} // namespace collector::core::transfer
