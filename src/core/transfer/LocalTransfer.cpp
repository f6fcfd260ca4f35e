#include "LocalTransfer.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace collector::core::transfer {

namespace fs = std::filesystem;
using utils::StringUtils;

LocalTransfer::LocalTransfer(size_t chunkSize)
    : m_chunkSize(std::max<size_t>(chunkSize, 1)) {
}

fs::path LocalTransfer::sourceRoot(const std::string& locator) {
    const std::string scheme = "file://";
    if (StringUtils::startsWith(locator, scheme)) {
        return fs::path(locator.substr(scheme.size()));
    }
    return fs::path(locator);
}

std::vector<TransferItem> LocalTransfer::listItems(const tasks::JobSpec& spec) {
    const fs::path root = sourceRoot(spec.source);

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw FatalTransferError("Source directory not found: " + root.string());
    }

    std::vector<TransferItem> items;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        throw TransientTransferError("Cannot list " + root.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw TransientTransferError("Listing interrupted in " + root.string() + ": " + ec.message());
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        TransferItem item;
        item.key = it->path().string();
        item.relativePath = it->path().lexically_relative(root).generic_string();
        auto size = it->file_size(ec);
        if (!ec) {
            item.size = size;
        }
        items.push_back(std::move(item));
    }

    std::sort(items.begin(), items.end(), [](const TransferItem& a, const TransferItem& b) {
        return a.relativePath < b.relativePath;
    });

    LOG_DEBUG("Listed {} files under {}", items.size(), root.string());
    return items;
}

uint64_t LocalTransfer::fetchItem(const TransferItem& item, DestinationWriter& destination,
                                  const BytesCallback& onBytes) {
    std::error_code ec;
    if (!fs::exists(item.key, ec)) {
        throw FatalTransferError("Source file disappeared: " + item.key);
    }

    std::ifstream in(item.key, std::ios::binary);
    if (!in.is_open()) {
        throw TransientTransferError("Cannot open " + item.key);
    }

    std::vector<char> buffer(m_chunkSize);
    uint64_t total = 0;

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = in.gcount();
        if (count <= 0) {
            break;
        }
        destination.write(buffer.data(), static_cast<size_t>(count));
        total += static_cast<uint64_t>(count);
        if (onBytes) {
            onBytes(static_cast<uint64_t>(count));
        }
    }

    if (in.bad()) {
        throw TransientTransferError("Read error on " + item.key);
    }

    return total;
}

} // namespace collector::core::transfer
