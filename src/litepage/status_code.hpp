//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_STATUS_CODE_HPP
#define LITEPAGE_STATUS_CODE_HPP

#include <batteries/status.hpp>

namespace litepage {

enum struct StatusCode {
  kOk = 0,
  kCorruptPageType = 1,
  kCorruptVarintTruncated = 2,
  kCorruptVarintOverflow = 3,
  kCorruptSerialType = 4,
  kCorruptPageSize = 5,
  kCorruptUnallocatedRegion = 6,
  kCorruptCellPointer = 7,
  kCorruptFreeblockOffset = 8,
  kCorruptRecordHeader = 9,
  kRightmostPointerNotApplicable = 10,
  kCompletionTypeMismatch = 11,
  kCompletionPending = 12,
  kFileLockConflict = 13,
  kRecordHeaderBufferTooSmall = 14,
};

bool initialize_status_codes();

::batt::Status make_status(StatusCode code);

/** \brief Returns true iff `status` is one of the "corrupt database" codes; these indicate that
 * bytes read from storage violate a structural invariant of the file format, and are never
 * retryable.
 */
bool status_is_corruption(const ::batt::Status& status);

}  // namespace litepage

#endif  // LITEPAGE_STATUS_CODE_HPP
