//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/status_code.hpp>
//

#include <batteries/status.hpp>

#include <array>

namespace litepage {

#define CODE_WITH_MSG_(code, msg)                                                                  \
  {                                                                                                \
    code, msg " (" #code ")"                                                                       \
  }

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool initialize_status_codes()
{
  static bool const initialized = batt::Status::register_codes<StatusCode>({
      CODE_WITH_MSG_(StatusCode::kOk, "Ok"),  // 0
      CODE_WITH_MSG_(StatusCode::kCorruptPageType,
                     "Corrupt database: invalid B-tree page type"),  // 1
      CODE_WITH_MSG_(StatusCode::kCorruptVarintTruncated,
                     "Corrupt database: varint is truncated"),  // 2
      CODE_WITH_MSG_(StatusCode::kCorruptVarintOverflow,
                     "Corrupt database: varint overflows 64 bits"),  // 3
      CODE_WITH_MSG_(StatusCode::kCorruptSerialType,
                     "Corrupt database: invalid record serial type (10 or 11)"),  // 4
      CODE_WITH_MSG_(StatusCode::kCorruptPageSize,
                     "Corrupt database: invalid page size in database header"),  // 5
      CODE_WITH_MSG_(StatusCode::kCorruptUnallocatedRegion,
                     "Corrupt database: cell pointer array overlaps the cell content area"),  // 6
      CODE_WITH_MSG_(StatusCode::kCorruptCellPointer,
                     "Corrupt database: cell pointer is outside the page"),  // 7
      CODE_WITH_MSG_(StatusCode::kCorruptFreeblockOffset,
                     "Corrupt database: freeblock offset is outside the page"),  // 8
      CODE_WITH_MSG_(StatusCode::kCorruptRecordHeader,
                     "Corrupt database: record header is malformed"),  // 9
      CODE_WITH_MSG_(StatusCode::kRightmostPointerNotApplicable,
                     "Leaf pages do not have a rightmost child pointer"),  // 10
      CODE_WITH_MSG_(StatusCode::kCompletionTypeMismatch,
                     "The Completion passed to this operation is of the wrong type"),  // 11
      CODE_WITH_MSG_(StatusCode::kCompletionPending,
                     "The Completion is still pending and this IO has no work left that could "
                     "resolve it"),  // 12
      CODE_WITH_MSG_(StatusCode::kFileLockConflict,
                     "The file is already locked"),  // 13
      CODE_WITH_MSG_(StatusCode::kRecordHeaderBufferTooSmall,
                     "Not enough space in the destination buffer to pack record header"),  // 14
  });
  return initialized;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
::batt::Status make_status(StatusCode code)
{
  initialize_status_codes();

  return ::batt::Status{code};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool status_is_corruption(const ::batt::Status& status)
{
  static const std::array<StatusCode, 9> kCorruptCodes = {
      StatusCode::kCorruptPageType,           StatusCode::kCorruptVarintTruncated,
      StatusCode::kCorruptVarintOverflow,     StatusCode::kCorruptSerialType,
      StatusCode::kCorruptPageSize,           StatusCode::kCorruptUnallocatedRegion,
      StatusCode::kCorruptCellPointer,        StatusCode::kCorruptFreeblockOffset,
      StatusCode::kCorruptRecordHeader,
  };

  for (StatusCode code : kCorruptCodes) {
    if (status == make_status(code)) {
      return true;
    }
  }
  return false;
}

}  // namespace litepage
