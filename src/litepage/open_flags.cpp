//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/open_flags.hpp>
//

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, OpenFlags t)
{
  out << "OpenFlags{";
  if (t.contains(OpenFlags::kCreate)) {
    out << "Create,";
  }
  if (t.contains(OpenFlags::kReadOnly)) {
    out << "ReadOnly,";
  }
  return out << "}";
}

}  // namespace litepage
