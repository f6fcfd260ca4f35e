#pragma once

/**
 * TransferCapability.hpp
 *
 * Boundary between the task engine and whatever actually moves bytes.
 * Implementations report failures by throwing TransientTransferError
 * (worth retrying) or FatalTransferError (give up on the task).
 */

#include "../tasks/TaskState.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace collector::core::transfer {

class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message) : std::runtime_error(message) {}
};

class TransientTransferError : public TransferError {
public:
    explicit TransientTransferError(const std::string& message) : TransferError(message) {}
};

class FatalTransferError : public TransferError {
public:
    explicit FatalTransferError(const std::string& message) : TransferError(message) {}
};

/**
 * One unit of work. `key` is the item's identity at the source,
 * `relativePath` where it lands below the job destination.
 */
struct TransferItem {
    std::string key;
    std::string relativePath;
    std::optional<uint64_t> size;
    std::optional<std::string> checksum; // hex MD5 when the source offers one
};

/**
 * Byte sink for one item. Writers are single-use: open, write..., then
 * exactly one of commit() or abort(). Every failure is a FatalTransferError.
 */
class DestinationWriter {
public:
    virtual ~DestinationWriter() = default;

    virtual void open(const std::filesystem::path& target) = 0;
    virtual void write(const char* data, size_t size) = 0;
    virtual void commit() = 0;
    virtual void abort() noexcept = 0;
};

using DestinationWriterPtr = std::unique_ptr<DestinationWriter>;
using WriterFactory = std::function<DestinationWriterPtr()>;

/**
 * Called with the number of bytes just written for the item in flight.
 */
using BytesCallback = std::function<void(uint64_t bytes)>;

class TransferCapability {
public:
    virtual ~TransferCapability() = default;

    /**
     * Enumerate the items of a job
     */
    virtual std::vector<TransferItem> listItems(const tasks::JobSpec& spec) = 0;

    /**
     * Transfer one item into `destination` (already opened on the target
     * path). Does not commit or abort the writer.
     * @return Bytes transferred
     */
    virtual uint64_t fetchItem(const TransferItem& item, DestinationWriter& destination,
                               const BytesCallback& onBytes) = 0;
};

using TransferCapabilityPtr = std::shared_ptr<TransferCapability>;

/**
 * Chooses a capability for a job (by source locator)
 */
using TransferFactory = std::function<TransferCapabilityPtr(const tasks::JobSpec& spec)>;

} // namespace collector::core::transfer
