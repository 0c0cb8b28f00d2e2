#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbridge {

// ---------- Handshake ----------

struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && title == o.title && version == o.version;
    }
};

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> resources;
    std::optional<nlohmann::json> prompts;
    std::optional<nlohmann::json> logging;
    std::optional<nlohmann::json> experimental;

    /// True when the server promised notifications/tools/list_changed.
    [[nodiscard]] bool tools_list_changed() const {
        return tools && tools->is_object() && tools->value("listChanged", false);
    }
};

struct ClientCapabilities {
    std::optional<nlohmann::json> roots;
    std::optional<nlohmann::json> sampling;
    std::optional<nlohmann::json> experimental;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

// ---------- Tools ----------

/// One callable operation a server advertised in tools/list.
struct Capability {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json::object();
    std::optional<nlohmann::json> annotations;

    bool operator==(const Capability& o) const {
        return name == o.name && title == o.title && description == o.description
               && input_schema == o.input_schema && annotations == o.annotations;
    }
};

/// Result payload of tools/call.
struct ToolResult {
    nlohmann::json content = nlohmann::json::array();
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    /// Concatenated text of all "text" content items, newline separated.
    [[nodiscard]] std::string text() const;

    bool operator==(const ToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const Implementation& i);
void from_json(const nlohmann::json& j, Implementation& i);

void to_json(nlohmann::json& j, const ServerCapabilities& c);
void from_json(const nlohmann::json& j, ServerCapabilities& c);

void to_json(nlohmann::json& j, const ClientCapabilities& c);

void from_json(const nlohmann::json& j, InitializeResult& r);

void to_json(nlohmann::json& j, const Capability& c);
void from_json(const nlohmann::json& j, Capability& c);

void to_json(nlohmann::json& j, const ToolResult& r);
void from_json(const nlohmann::json& j, ToolResult& r);

} // namespace toolbridge
