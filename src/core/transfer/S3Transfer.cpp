#include "S3Transfer.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <pugixml.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <map>

namespace collector::core::transfer {

using utils::StringUtils;

namespace {

const std::string kScheme = "s3://";

bool isPlainMd5(const std::string& etag) {
    return etag.size() == 32 &&
           std::all_of(etag.begin(), etag.end(), [](unsigned char c) { return std::isxdigit(c); });
}

std::string describe(const utils::HttpResponse& response) {
    if (response.transportError) {
        return response.error;
    }
    return "HTTP " + std::to_string(response.statusCode);
}

} // namespace

// -- S3Options --

S3Options S3Options::fromConfig(const Config& config) {
    S3Options options;
    options.endpoint = config.get<std::string>("s3.endpoint", options.endpoint);
    options.region = config.get<std::string>("s3.region", options.region);
    options.timeoutMs = config.get<int>("s3.timeoutMs", options.timeoutMs);
    options.connectTimeoutMs = config.get<int>("s3.connectTimeoutMs", options.connectTimeoutMs);
    options.verifyChecksum = config.get<bool>("downloads.verifyChecksum", options.verifyChecksum);

    while (StringUtils::endsWith(options.endpoint, "/")) {
        options.endpoint.pop_back();
    }
    return options;
}

// -- S3Location --

S3Location S3Location::parse(const std::string& locator) {
    if (!StringUtils::startsWith(locator, kScheme)) {
        throw FatalTransferError("Not an S3 locator: " + locator);
    }

    std::string rest = locator.substr(kScheme.size());
    auto slash = rest.find('/');

    S3Location location;
    location.bucket = rest.substr(0, slash);
    if (slash != std::string::npos) {
        location.prefix = rest.substr(slash + 1);
    }

    if (location.bucket.empty()) {
        throw FatalTransferError("S3 locator has no bucket: " + locator);
    }
    return location;
}

// -- S3BodySink --

S3BodySink::S3BodySink(DestinationWriter& destination, const BytesCallback& onBytes, bool verify)
    : m_destination(destination)
    , m_onBytes(onBytes)
    , m_verify(verify)
    , m_digest(utils::Digest::md5()) {
}

bool S3BodySink::consume(const char* data, size_t size) {
    if (m_failure) {
        return false;
    }

    try {
        m_destination.write(data, size);
        if (m_verify) {
            m_digest.update(data, size);
        }
        m_received += size;
        if (m_onBytes) {
            m_onBytes(size);
        }
    } catch (const std::exception&) {
        m_failure = std::current_exception();
        return false;
    }
    return true;
}

void S3BodySink::rethrowIfFailed() const {
    if (m_failure) {
        std::rethrow_exception(m_failure);
    }
}

std::string S3BodySink::hexDigest() {
    return m_digest.hexDigest();
}

// -- S3Transfer --

S3Transfer::S3Transfer(S3Options options, utils::HttpClient& http)
    : m_options(std::move(options))
    , m_http(http) {
}

utils::HttpOptions S3Transfer::requestOptions() const {
    utils::HttpOptions options = m_http.defaultOptions();
    options.timeoutMs = m_options.timeoutMs;
    options.connectTimeoutMs = m_options.connectTimeoutMs;
    return options;
}

std::string S3Transfer::objectUrl(const std::string& bucket, const std::string& key) const {
    // Escape each path segment, keep the separators
    std::vector<std::string> segments = StringUtils::split(key, '/');
    for (auto& segment : segments) {
        segment = utils::HttpClient::urlEncode(segment);
    }
    std::string encoded = StringUtils::join(segments, "/");
    if (StringUtils::endsWith(key, "/")) {
        encoded += "/";
    }
    return m_options.endpoint + "/" + bucket + "/" + encoded;
}

std::string S3Transfer::listUrl(const S3Location& location, const std::string& continuationToken) const {
    std::map<std::string, std::string> params{
        {"list-type", "2"},
        {"prefix", location.prefix}
    };
    if (!continuationToken.empty()) {
        params["continuation-token"] = continuationToken;
    }
    return m_options.endpoint + "/" + location.bucket + "?" + utils::HttpClient::buildQueryString(params);
}

S3ListingPage S3Transfer::parseListing(const std::string& xml, const std::string& bucket,
                                       const std::string& prefix) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());
    if (!result) {
        throw TransientTransferError(std::string("Malformed listing: ") + result.description());
    }

    pugi::xml_node root = doc.child("ListBucketResult");
    if (!root) {
        throw TransientTransferError("Listing response has no ListBucketResult");
    }

    S3ListingPage page;
    for (pugi::xml_node content : root.children("Contents")) {
        std::string key = content.child("Key").text().get();
        if (key.empty() || StringUtils::endsWith(key, "/")) {
            continue;
        }

        TransferItem item;
        item.key = kScheme + bucket + "/" + key;
        item.relativePath = StringUtils::startsWith(key, prefix) ? key.substr(prefix.size()) : key;

        pugi::xml_node sizeNode = content.child("Size");
        if (sizeNode) {
            item.size = sizeNode.text().as_ullong();
        }

        std::string etag = content.child("ETag").text().get();
        etag.erase(std::remove(etag.begin(), etag.end(), '"'), etag.end());
        if (isPlainMd5(etag)) {
            item.checksum = StringUtils::toLower(etag);
        }

        page.items.push_back(std::move(item));
    }

    page.truncated = std::string(root.child("IsTruncated").text().get()) == "true";
    page.nextContinuationToken = root.child("NextContinuationToken").text().get();
    if (page.truncated && page.nextContinuationToken.empty()) {
        throw TransientTransferError("Truncated listing without continuation token");
    }
    return page;
}

std::vector<TransferItem> S3Transfer::listItems(const tasks::JobSpec& spec) {
    S3Location location = S3Location::parse(spec.source);
    if (!location.prefix.empty() && !StringUtils::endsWith(location.prefix, "/")) {
        location.prefix += "/";
    }

    std::vector<TransferItem> items;
    std::string continuationToken;

    do {
        const std::string url = listUrl(location, continuationToken);
        utils::HttpResponse response = m_http.get(url, requestOptions());

        if (!response.isSuccess()) {
            const std::string message = "Listing s3://" + location.bucket + "/" + location.prefix +
                                        " failed: " + describe(response);
            if (response.isRetryable()) {
                throw TransientTransferError(message);
            }
            throw FatalTransferError(message);
        }

        S3ListingPage page = parseListing(response.body, location.bucket, location.prefix);
        items.insert(items.end(),
                     std::make_move_iterator(page.items.begin()),
                     std::make_move_iterator(page.items.end()));
        continuationToken = page.truncated ? page.nextContinuationToken : std::string();

    } while (!continuationToken.empty());

    LOG_DEBUG("Listed {} objects under s3://{}/{}", items.size(), location.bucket, location.prefix);
    return items;
}

uint64_t S3Transfer::fetchItem(const TransferItem& item, DestinationWriter& destination,
                               const BytesCallback& onBytes) {
    const S3Location object = S3Location::parse(item.key);
    const std::string url = objectUrl(object.bucket, object.prefix);

    const bool verify = m_options.verifyChecksum && item.checksum.has_value();
    S3BodySink sink(destination, onBytes, verify);

    utils::HttpResponse response = m_http.stream(url, [&sink](const char* data, size_t size) {
        return sink.consume(data, size);
    }, requestOptions());

    sink.rethrowIfFailed();
    const uint64_t received = sink.received();

    if (!response.isSuccess()) {
        const std::string message = "GET " + item.key + " failed: " + describe(response);
        if (response.isRetryable()) {
            throw TransientTransferError(message);
        }
        throw FatalTransferError(message);
    }

    if (item.size && received != *item.size) {
        throw TransientTransferError("Short read for " + item.key + ": " + std::to_string(received) +
                                     " of " + std::to_string(*item.size) + " bytes");
    }

    if (verify) {
        std::string actual = sink.hexDigest();
        if (actual != *item.checksum) {
            throw TransientTransferError("Checksum mismatch for " + item.key + " (expected " +
                                         *item.checksum + ", got " + actual + ")");
        }
    }

    return received;
}

} // namespace collector::core::transfer
