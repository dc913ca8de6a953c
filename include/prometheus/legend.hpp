#pragma once

#include <string>

#include "prometheus/query_model.hpp"

namespace sshprom {

// Series display name. An empty template renders k="v" pairs joined by ", "
// in label-name order, or "value" for an empty label set. Otherwise each
// {{name}} / {{ name }} with a known label is substituted; unknown
// placeholders stay verbatim.
std::string FormatLegend(const Labels &labels, const std::string &format);

} // namespace sshprom
