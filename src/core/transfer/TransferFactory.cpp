#include "TransferFactory.hpp"
#include "FileDestinationWriter.hpp"
#include "LocalTransfer.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

namespace collector::core::transfer {

using utils::StringUtils;

TransferFactory makeTransferFactory(const S3Options& s3Options) {
    return [s3Options](const tasks::JobSpec& spec) -> TransferCapabilityPtr {
        const std::string& source = spec.source;

        if (StringUtils::startsWith(source, "s3://")) {
            return std::make_shared<S3Transfer>(s3Options);
        }

        auto scheme = source.find("://");
        if (scheme == std::string::npos || StringUtils::startsWith(source, "file://")) {
            return std::make_shared<LocalTransfer>();
        }

        Logger::instance().warn("No transfer capability for '{}'", source);
        throw FatalTransferError("Unsupported source scheme: " + source.substr(0, scheme));
    };
}

WriterFactory makeFileWriterFactory() {
    return [] { return std::make_unique<FileDestinationWriter>(); };
}

} // namespace collector::core::transfer
