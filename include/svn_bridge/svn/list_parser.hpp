#pragma once

#include <svn_bridge/core/result.hpp>
#include <svn_bridge/svn/model.hpp>

#include <string_view>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// ParseListXml — extract `svn list --xml -v` output.
//
// Input:  <lists><list path="https://host/repo/trunk">
//           <entry kind="file"><name>a.txt</name><size>12</size>
//             <commit revision="3"><author/><date/></commit></entry>
//         </list></lists>
//
// A bare <list> root is accepted as well. kind defaults to File; size is
// kept for files only. Entries without an explicit <path> get
// "<list path>/<name>". Empty input or no <list> → empty result.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ListResult, Error> ParseListXml(std::string_view xml);

} // namespace svn_bridge
