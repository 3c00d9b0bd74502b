#pragma once

#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_rails {

// Argument name -> caller-supplied value. Values are JSON so that clients
// may send numbers or booleans; they are stringified on substitution.
using Variables = std::map<std::string, nlohmann::json>;

// ---------------------------------------------------------------------------
// Template rendering.
//
// Three passes, always in this order:
//   1. {{#if name}}...{{/if}} blocks keep their body when `name` is truthy
//      and vanish otherwise. Blocks do not nest.
//   2. {{key}} is replaced by the string form of variables[key]. The
//      replacement text is not scanned again.
//   3. Any {{...}} left over is deleted.
//
// Never fails: anything that is not a well-formed marker is left alone in
// passes 1-2 and removed by pass 3 if it looks like a marker.
// ---------------------------------------------------------------------------
std::string RenderTemplate(std::string_view template_text,
                           const Variables& variables);

// Falsy: missing, null, false, "", or one of the sentinel defaults
// "auto-detect" and "general".
bool IsTruthy(const Variables& variables, const std::string& name);

// Strings as-is, null as "", everything else as compact JSON.
std::string StringifyValue(const nlohmann::json& value);

} // namespace mcp_rails
