#pragma once

#include "TransferCapability.hpp"
#include "S3Transfer.hpp"

namespace collector::core::transfer {

/**
 * Default capability selection by source locator:
 *   s3://...          -> S3Transfer
 *   file://... / path -> LocalTransfer
 * Any other scheme ("http://", "ftp://", ...) is rejected with a
 * FatalTransferError when the job runs.
 */
TransferFactory makeTransferFactory(const S3Options& s3Options);

/**
 * Writers that land items on the local filesystem
 */
WriterFactory makeFileWriterFactory();

} // namespace collector::core::transfer
