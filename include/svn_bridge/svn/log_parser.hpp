#pragma once

#include <svn_bridge/core/result.hpp>
#include <svn_bridge/svn/model.hpp>

#include <string_view>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// ParseLogXml — extract `svn log --xml [--verbose]` output.
//
// Input:  <log><logentry revision="5">
//           <author>alice</author><date>...</date>
//           <paths><path action="M" copyfrom-path="/a" copyfrom-rev="3">/trunk/a</path></paths>
//           <msg>...</msg>
//         </logentry></log>
//
// - author defaults to "unknown"; the message is read from <msg>, then
//   <message> (first non-empty wins).
// - path actions outside A/D/M/R become Modified.
// - entries are sorted newest first regardless of report order;
//   start_revision/end_revision are the min/max revision (0 when empty).
// Empty input or no <logentry> → empty result. Malformed XML → Parse error.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<LogResult, Error> ParseLogXml(std::string_view xml);

} // namespace svn_bridge
