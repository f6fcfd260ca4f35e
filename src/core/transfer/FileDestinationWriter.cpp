#include "FileDestinationWriter.hpp"
#include "../Logger.hpp"

#include <system_error>

namespace collector::core::transfer {

namespace fs = std::filesystem;

FileDestinationWriter::~FileDestinationWriter() {
    if (!m_partPath.empty() && !m_finished) {
        abort();
    }
}

fs::path FileDestinationWriter::partPathFor(const fs::path& target) {
    fs::path part = target;
    part += ".part";
    return part;
}

void FileDestinationWriter::open(const fs::path& target) {
    m_target = target;
    m_partPath = partPathFor(target);
    m_bytesWritten = 0;
    m_finished = false;

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw FatalTransferError("Cannot create directory " + target.parent_path().string() +
                                     ": " + ec.message());
        }
    }

    m_file.open(m_partPath, std::ios::binary | std::ios::trunc);
    if (!m_file.is_open()) {
        throw FatalTransferError("Failed to open output file " + m_partPath.string());
    }
}

void FileDestinationWriter::write(const char* data, size_t size) {
    if (!m_file.is_open()) {
        throw FatalTransferError("Write to unopened destination " + m_target.string());
    }

    m_file.write(data, static_cast<std::streamsize>(size));
    if (!m_file) {
        throw FatalTransferError("Write failed for " + m_partPath.string());
    }
    m_bytesWritten += size;
}

void FileDestinationWriter::commit() {
    m_file.close();
    if (m_file.fail()) {
        throw FatalTransferError("Flush failed for " + m_partPath.string());
    }

    std::error_code ec;
    fs::rename(m_partPath, m_target, ec);
    if (ec) {
        throw FatalTransferError("Cannot move " + m_partPath.string() + " into place: " + ec.message());
    }
    m_finished = true;
}

void FileDestinationWriter::abort() noexcept {
    if (m_file.is_open()) {
        m_file.close();
    }

    std::error_code ec;
    fs::remove(m_partPath, ec);
    if (ec) {
        Logger::instance().warn("Could not remove partial file {}: {}", m_partPath.string(), ec.message());
    }
    m_finished = true;
}

} // namespace collector::core::transfer
