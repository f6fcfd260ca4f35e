#pragma once

#include "TransferCapability.hpp"

#include <filesystem>

namespace collector::core::transfer {

/**
 * Mirrors a local directory tree. Source locators are "file:///dir" or a
 * plain directory path.
 */
class LocalTransfer : public TransferCapability {
public:
    explicit LocalTransfer(size_t chunkSize = 64 * 1024);

    std::vector<TransferItem> listItems(const tasks::JobSpec& spec) override;
    uint64_t fetchItem(const TransferItem& item, DestinationWriter& destination,
                       const BytesCallback& onBytes) override;

    static std::filesystem::path sourceRoot(const std::string& locator);

private:
    size_t m_chunkSize;
};

} // namespace collector::core::transfer
