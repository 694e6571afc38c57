#pragma once

#include <string>

#ifndef PAWKIT_VERSION
#define PAWKIT_VERSION "unknown"
#endif

namespace pawkit {

// Compare dot-separated versions component by component. Missing components
// count as 0 ("1.2" == "1.2.0"); non-numeric components count as 0.
// Returns <0, 0 or >0.
int compare_versions(const std::string& a, const std::string& b);

} // namespace pawkit
