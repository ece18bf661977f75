//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/file.hpp>
//

#include <litepage/logging.hpp>

#include <batteries/assert.hpp>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status require_completion_type(const Completion& completion, CompletionType expected)
{
  if (completion.type() != expected) {
    LITEPAGE_LOG_WARNING() << "Completion type does not match the submitted operation;"
                           << BATT_INSPECT(completion.type()) << BATT_INSPECT(expected);
    return make_status(StatusCode::kCompletionTypeMismatch);
  }
  return OkStatus();
}

}  // namespace litepage
