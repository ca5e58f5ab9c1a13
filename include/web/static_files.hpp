#pragma once

#include <string>

namespace web {

// Landing page returned for every non-API, non-asset path.
const std::string& index_html();

} // namespace web
