#pragma once

#include <svn_bridge/core/result.hpp>
#include <svn_bridge/svn/model.hpp>

#include <string_view>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// ParseStatusXml — extract `svn status --xml` output.
//
// Input:  <status><target path="."><entry path="a.txt">
//           <wc-status item="modified" props="none">
//             <commit revision="3"><author/><date/></commit>
//             <lock><owner/><comment/><created/></lock>
//           </wc-status></entry>
//           <against revision="5"/></target>
//         <changelist name="cl"><entry .../></changelist></status>
//
// Empty or whitespace input, or a report without <target>, is an empty
// result (revision 0), not an error. Malformed XML → ErrorCategory::Parse.
// base_path is echoed as StatusResult::path.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<StatusResult, Error> ParseStatusXml(
    std::string_view xml, std::string_view base_path);

} // namespace svn_bridge
