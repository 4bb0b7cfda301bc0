#pragma once

// Lets a struct field hold an arbitrary sub-document as a Json::Value,
// decoded through the unmarshaler() schema node.

#include <json/json.h>

#include <memory>
#include <string>
#include <string_view>

#include "type_desc.hpp"

namespace jsonv {

template <>
struct json_unmarshaler<Json::Value> {
  static bool unmarshal(Json::Value& dst, std::string_view raw, std::string& err) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["allowComments"] = false;
    builder["allowTrailingCommas"] = false;
    builder["strictRoot"] = false;

    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    if (!reader->parse(raw.data(), raw.data() + raw.size(), &dst, &errs)) {
      dst = Json::Value();
      err = errs.empty() ? std::string("Invalid JSON value") : errs;
      return false;
    }
    return true;
  }
};

} // namespace jsonv
