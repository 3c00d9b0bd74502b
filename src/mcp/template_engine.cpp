#include <mcp_rails/mcp/template_engine.hpp>

#include <optional>
#include <utility>

namespace mcp_rails {

namespace {

constexpr std::string_view kIfOpen = "{{#if";
constexpr std::string_view kIfClose = "{{/if}}";
constexpr std::string_view kMarkerOpen = "{{";
constexpr std::string_view kMarkerClose = "}}";

constexpr const char* kSentinelAutoDetect = "auto-detect";
constexpr const char* kSentinelGeneral = "general";

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\f' || c == '\v';
}

bool IsWordChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

struct IfOpenMarker {
    std::string name;
    size_t body_start;
};

// Match "{{#if <whitespace>+<word chars>+}}" starting exactly at pos.
std::optional<IfOpenMarker> MatchIfOpen(std::string_view text, size_t pos) {
    if (text.compare(pos, kIfOpen.size(), kIfOpen) != 0) {
        return std::nullopt;
    }
    size_t i = pos + kIfOpen.size();

    const size_t space_start = i;
    while (i < text.size() && IsSpace(text[i])) ++i;
    if (i == space_start) return std::nullopt;

    const size_t name_start = i;
    while (i < text.size() && IsWordChar(text[i])) ++i;
    if (i == name_start) return std::nullopt;

    if (text.compare(i, kMarkerClose.size(), kMarkerClose) != 0) {
        return std::nullopt;
    }
    return IfOpenMarker{std::string(text.substr(name_start, i - name_start)),
                        i + kMarkerClose.size()};
}

// Pass 1: collapse {{#if name}}body{{/if}} to body or "".
std::string ProcessConditionals(std::string_view text, const Variables& variables) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find(kIfOpen, pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }

        auto marker = MatchIfOpen(text, open);
        const auto close = marker
            ? text.find(kIfClose, marker->body_start)
            : std::string_view::npos;
        if (!marker || close == std::string_view::npos) {
            // Not a block; keep the brace and resume scanning after it.
            out.append(text.substr(pos, open + 1 - pos));
            pos = open + 1;
            continue;
        }

        out.append(text.substr(pos, open - pos));
        if (IsTruthy(variables, marker->name)) {
            out.append(text.substr(marker->body_start, close - marker->body_start));
        }
        pos = close + kIfClose.size();
    }
    return out;
}

// Pass 2: single left-to-right pass over {{key}} markers.
std::string ReplaceVariables(std::string_view text, const Variables& variables) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find(kMarkerOpen, pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        const auto key_start = open + kMarkerOpen.size();
        const auto close = text.find(kMarkerClose, key_start);
        if (close == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }

        auto it = variables.find(std::string(text.substr(key_start, close - key_start)));
        if (it == variables.end()) {
            out.append(text.substr(pos, open + 1 - pos));
            pos = open + 1;
            continue;
        }

        out.append(text.substr(pos, open - pos));
        out.append(StringifyValue(it->second));
        pos = close + kMarkerClose.size();
    }
    return out;
}

// Pass 3: drop every "{{X}}" where X is one or more non-'}' characters.
std::string CleanupRemainingMarkers(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, kMarkerOpen.size(), kMarkerOpen) == 0) {
            size_t j = i + kMarkerOpen.size();
            while (j < text.size() && text[j] != '}') ++j;
            if (j > i + kMarkerOpen.size() &&
                text.compare(j, kMarkerClose.size(), kMarkerClose) == 0) {
                i = j + kMarkerClose.size();
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

} // anonymous namespace

std::string StringifyValue(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

bool IsTruthy(const Variables& variables, const std::string& name) {
    auto it = variables.find(name);
    if (it == variables.end()) {
        return false;
    }
    const auto& value = it->second;
    if (value.is_null() || (value.is_boolean() && !value.get<bool>())) {
        return false;
    }
    const auto text = StringifyValue(value);
    return !text.empty() && text != kSentinelAutoDetect && text != kSentinelGeneral;
}

std::string RenderTemplate(std::string_view template_text,
                           const Variables& variables) {
    auto result = ProcessConditionals(template_text, variables);
    result = ReplaceVariables(result, variables);
    return CleanupRemainingMarkers(result);
}

} // namespace mcp_rails
