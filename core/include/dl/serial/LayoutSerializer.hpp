#pragma once
#include "dl/layout/LayoutTree.hpp"

#include <string>

#include <rapidjson/document.h>

namespace dl {

// Field-tagged JSON form of a layout tree:
//   {"version":"1.0","root":<node>|null}
//   leaf:  {"type":"leaf","panel":{"id":N,"activeTabIndex":N,
//           "tabs":[{"id":N,"title":"..","content":N}, ...]}}
//   split: {"type":"split","direction":"horizontal"|"vertical",
//           "ratios":[..],"children":[<node>, ...]}
std::string serializeLayout(const LayoutTree& tree);

// Returns false on malformed input or a tree that breaks an invariant
// (duplicate ids, empty panels, bad ratios). `out` is untouched on failure.
bool deserializeLayout(const std::string& json, LayoutTree& out);

// Same as deserializeLayout but for an already-parsed "root" value.
bool layoutFromJson(const rapidjson::Value& root, LayoutTree& out);

} // namespace dl
