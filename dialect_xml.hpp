#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "dialect.hpp"

// -----------------------------------------------------------------------------
// Dialect files:
//
//   <dialect base="markdown">
//     <tag name="a" open="" close="" block="false" indent="">
//       <attr key="text" open="[" close="]"/>
//       <attr key="href" open="(" close=")"/>
//     </tag>
//   </dialect>
//
// base="markdown" (default) overrides the built-in table entry by entry,
// base="empty" starts from nothing. Write newlines and tabs as &#10; / &#9;.
// -----------------------------------------------------------------------------

namespace sax2md {

    std::expected<Dialect, std::string> parse_dialect(std::string_view xml);
    std::expected<Dialect, std::string> load_dialect(const std::string& path);

}
