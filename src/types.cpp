#include "toolbridge/types.hpp"
#include "toolbridge/error.hpp"

namespace toolbridge {

namespace {

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->get<T>();
}

} // anonymous namespace

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& i) {
    j = {{"name", i.name}, {"version", i.version}};
    if (i.title) j["title"] = *i.title;
}

void from_json(const nlohmann::json& j, Implementation& i) {
    i.name = j.at("name").get<std::string>();
    i.version = j.value("version", "");
    read_optional(j, "title", i.title);
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& c) {
    j = nlohmann::json::object();
    if (c.tools) j["tools"] = *c.tools;
    if (c.resources) j["resources"] = *c.resources;
    if (c.prompts) j["prompts"] = *c.prompts;
    if (c.logging) j["logging"] = *c.logging;
    if (c.experimental) j["experimental"] = *c.experimental;
}

void from_json(const nlohmann::json& j, ServerCapabilities& c) {
    if (j.contains("tools")) c.tools = j.at("tools");
    if (j.contains("resources")) c.resources = j.at("resources");
    if (j.contains("prompts")) c.prompts = j.at("prompts");
    if (j.contains("logging")) c.logging = j.at("logging");
    if (j.contains("experimental")) c.experimental = j.at("experimental");
}

void to_json(nlohmann::json& j, const ClientCapabilities& c) {
    j = nlohmann::json::object();
    if (c.roots) j["roots"] = *c.roots;
    if (c.sampling) j["sampling"] = *c.sampling;
    if (c.experimental) j["experimental"] = *c.experimental;
}

void from_json(const nlohmann::json& j, InitializeResult& r) {
    r.protocol_version = j.at("protocolVersion").get<std::string>();
    r.capabilities = j.at("capabilities").get<ServerCapabilities>();
    r.server_info = j.at("serverInfo").get<Implementation>();
    read_optional(j, "instructions", r.instructions);
}

// ---------- Capability ----------

void to_json(nlohmann::json& j, const Capability& c) {
    j = {{"name", c.name}, {"inputSchema", c.input_schema}};
    if (c.title) j["title"] = *c.title;
    if (c.description) j["description"] = *c.description;
    if (c.annotations) j["annotations"] = *c.annotations;
}

void from_json(const nlohmann::json& j, Capability& c) {
    c.name = j.at("name").get<std::string>();
    read_optional(j, "title", c.title);
    read_optional(j, "description", c.description);
    c.input_schema = j.contains("inputSchema") ? j.at("inputSchema") : nlohmann::json::object();
    if (j.contains("annotations")) c.annotations = j.at("annotations");
}

// ---------- ToolResult ----------

std::string ToolResult::text() const {
    std::string out;
    if (!content.is_array()) return out;
    for (const auto& item : content) {
        if (!item.is_object() || item.value("type", "") != "text") continue;
        if (!out.empty()) out += '\n';
        out += item.value("text", "");
    }
    return out;
}

void to_json(nlohmann::json& j, const ToolResult& r) {
    j = {{"content", r.content}, {"isError", r.is_error}};
    if (r.structured_content) j["structuredContent"] = *r.structured_content;
}

void from_json(const nlohmann::json& j, ToolResult& r) {
    r.content = j.contains("content") ? j.at("content") : nlohmann::json::array();
    if (!r.content.is_array()) {
        throw ParseError("tool result 'content' must be an array");
    }
    if (j.contains("structuredContent")) r.structured_content = j.at("structuredContent");
    r.is_error = j.value("isError", false);
}

} // namespace toolbridge
