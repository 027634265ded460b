#pragma once

#include <svn_bridge/core/result.hpp>
#include <svn_bridge/svn/model.hpp>

#include <string_view>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// ParseInfoXml — extract `svn info --xml` output for a single node.
//
// Input:  <info><entry kind="dir" path="." revision="12">
//           <url>...</url>
//           <repository><root>...</root><uuid>...</uuid></repository>
//           <wc-info><wcroot-abspath>/home/me/wc</wcroot-abspath></wc-info>
//           <commit revision="11"><author/><date/></commit>
//         </entry></info>
//
// Unlike status and log there is no meaningful empty result: empty input,
// a root other than <info>, or an <info> without <entry> all fail with
// ErrorCategory::EmptyInput. Unknown kinds map to NodeKind::Dir.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<InfoResult, Error> ParseInfoXml(std::string_view xml);

} // namespace svn_bridge
