#pragma once

// Lets a struct field hold an arbitrary sub-document as nlohmann::json,
// decoded through the unmarshaler() schema node.

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

#include "type_desc.hpp"

namespace jsonv {

template <>
struct json_unmarshaler<nlohmann::json> {
  static bool unmarshal(nlohmann::json& dst, std::string_view raw, std::string& err) {
    dst = nlohmann::json::parse(raw.begin(), raw.end(), /*callback=*/nullptr, /*allow_exceptions=*/false,
                                /*ignore_comments=*/false);
    if (dst.is_discarded()) {
      dst = nullptr;
      err = "Invalid JSON value";
      return false;
    }
    return true;
  }
};

} // namespace jsonv
