#pragma once

#include "TransferCapability.hpp"

#include <filesystem>
#include <fstream>

namespace collector::core::transfer {

/**
 * Writes into "<target>.part" and renames over the target on commit,
 * so a target path only ever holds a complete item.
 */
class FileDestinationWriter : public DestinationWriter {
public:
    FileDestinationWriter() = default;
    ~FileDestinationWriter() override;

    void open(const std::filesystem::path& target) override;
    void write(const char* data, size_t size) override;
    void commit() override;
    void abort() noexcept override;

    uint64_t bytesWritten() const { return m_bytesWritten; }

    static std::filesystem::path partPathFor(const std::filesystem::path& target);

private:
    std::filesystem::path m_target;
    std::filesystem::path m_partPath;
    std::ofstream m_file;
    uint64_t m_bytesWritten{0};
    bool m_finished{false};
};

} // namespace collector::core::transfer
