#pragma once
// ConfigLoader.hpp – Parses a Tiki XML configuration file into a Config.
//
//   <TikiConfig>
//     <Parser marker="*" fence="```" frontmatter_limit="10"/>
//     <Render collapse_marker="[+]" color="auto">
//       <Style role="current" sgr="30;103"/>
//     </Render>
//   </TikiConfig>
//
// Every element and attribute is optional; omitted values keep the defaults
// from Types.hpp.

#include "Errors.hpp"
#include "Types.hpp"

#include <filesystem>
#include <string_view>

namespace tiki {

// Loads a Config from the given XML file path.
// Throws ConfigLoadError on any parse or validation failure.
Config loadConfig(const std::filesystem::path& xml_path);

// Same, from an in-memory XML document.
Config loadConfigString(std::string_view xml);

} // namespace tiki
