#include "prometheus/legend.hpp"

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace sshprom {

namespace {

// Double-quotes a label value with C-style escapes.
std::string QuoteValue(const std::string &value) {
  std::string out = "\"";
  for (char c : value) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out += c;
    }
  }
  out += '"';
  return out;
}

std::string LabelSetText(const Labels &labels) {
  if (labels.empty()) {
    return "value";
  }
  std::string out;
  for (const auto &[k, v] : labels) {
    if (!out.empty()) {
      out += ", ";
    }
    out += fmt::format("{}={}", k, QuoteValue(v));
  }
  return out;
}

} // namespace

std::string FormatLegend(const Labels &labels, const std::string &format) {
  if (format.empty()) {
    return LabelSetText(labels);
  }

  std::string out;
  out.reserve(format.size());
  std::size_t pos = 0;
  while (pos < format.size()) {
    const auto open = format.find("{{", pos);
    if (open == std::string::npos) {
      break;
    }
    const auto close = format.find("}}", open + 2);
    if (close == std::string::npos) {
      break;
    }
    out.append(format, pos, open - pos);
    std::string name = format.substr(open + 2, close - open - 2);
    stringutil::trim(name);
    if (auto it = labels.find(name); it != labels.end()) {
      out += it->second;
    } else {
      out.append(format, open, close + 2 - open);
    }
    pos = close + 2;
  }
  out.append(format, pos, std::string::npos);
  return out;
}

} // namespace sshprom
