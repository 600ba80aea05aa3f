#pragma once

#include "../log.hpp"
#include "../protocol/protocol_client.hpp"
#include "../protocol/types.hpp"
#include "../types.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vine {
namespace engine {

/**
 * @brief Cached list of the server's tools.
 *
 * refresh() replaces the whole cache atomically: a failed refresh
 * (transport error or malformed list) leaves the previous cache
 * untouched. Descriptors keep the order the server listed them in.
 *
 * @threadsafety All public methods are thread-safe. Reads use shared
 * locks; refresh() takes an exclusive lock only to swap in the new list.
 */
class ToolCatalog {
public:
    explicit ToolCatalog(std::shared_ptr<protocol::ProtocolClient> client)
        : client_(std::move(client)) {}

    /**
     * @brief Issue one tools/list call and replace the cache on success
     *
     * @return Number of tools now cached
     */
    Expected<size_t> refresh() {
        auto result = client_->call("tools/list");
        if (!result) {
            LOG4CPLUS_WARN(log::engine_logger(), "tools/list failed: " << result.error().to_string());
            return tl::unexpected(result.error());
        }

        auto parsed = parse_tool_list(*result);
        if (!parsed) {
            LOG4CPLUS_WARN(log::engine_logger(), "Rejected tools/list result: " << parsed.error().to_string());
            return tl::unexpected(parsed.error());
        }

        std::unordered_map<std::string, size_t> index;
        for (size_t i = 0; i < parsed->size(); ++i) {
            index.emplace((*parsed)[i].name, i);
        }

        size_t count = parsed->size();
        {
            std::unique_lock lock(mutex_);
            tools_ = std::move(*parsed);
            index_ = std::move(index);
        }
        LOG4CPLUS_INFO(log::engine_logger(), "Tool catalog holds " << count << " tool(s)");
        return count;
    }

    /**
     * @brief Model-facing function descriptors, one per cached tool:
     *        {"type":"function","function":{name,description,parameters}}
     */
    nlohmann::json describe_for_model() const {
        std::shared_lock lock(mutex_);
        nlohmann::json schemas = nlohmann::json::array();
        for (const auto& tool : tools_) {
            schemas.push_back(build_schema_json(tool));
        }
        return schemas;
    }

    /// Exact, case-sensitive lookup.
    Expected<protocol::ToolDescriptor> lookup(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = index_.find(name);
        if (it == index_.end()) {
            return tl::unexpected(Error{ErrorCode::ToolNotFound, "Tool not found: " + name});
        }
        return tools_[it->second];
    }

    bool contains(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return index_.count(name) > 0;
    }

    std::vector<protocol::ToolDescriptor> tools() const {
        std::shared_lock lock(mutex_);
        return tools_;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return tools_.size();
    }

    /**
     * @brief Validate and convert a tools/list result
     *
     * A missing "tools" field is an empty list. Anything else malformed
     * (non-array list, non-object entry, missing or duplicate name,
     * non-object inputSchema) is a ProtocolError.
     */
    static Expected<std::vector<protocol::ToolDescriptor>> parse_tool_list(const nlohmann::json& result) {
        std::vector<protocol::ToolDescriptor> tools;
        if (!result.is_object()) {
            return tl::unexpected(Error{ErrorCode::ProtocolError, "tools/list result must be an object"});
        }
        if (!result.contains("tools") || result["tools"].is_null()) {
            return tools;
        }
        if (!result["tools"].is_array()) {
            return tl::unexpected(Error{ErrorCode::ProtocolError, "tools/list 'tools' field must be an array"});
        }

        std::unordered_map<std::string, bool> seen;
        for (const auto& tool_json : result["tools"]) {
            if (!tool_json.is_object()) {
                return tl::unexpected(Error{
                    ErrorCode::ProtocolError,
                    "Malformed tools/list response: tool entry is not a JSON object"
                });
            }
            if (!tool_json.contains("name") || !tool_json["name"].is_string() ||
                tool_json["name"].get<std::string>().empty()) {
                return tl::unexpected(Error{
                    ErrorCode::ProtocolError,
                    "Malformed tools/list response: tool entry has no name",
                    tool_json.dump()
                });
            }

            protocol::ToolDescriptor def;
            def.name = tool_json["name"].get<std::string>();
            if (seen.count(def.name) > 0) {
                return tl::unexpected(Error{
                    ErrorCode::ProtocolError,
                    "Malformed tools/list response: duplicate tool name",
                    def.name
                });
            }
            seen.emplace(def.name, true);

            if (tool_json.contains("description") && tool_json["description"].is_string()) {
                def.description = tool_json["description"].get<std::string>();
            }

            if (tool_json.contains("inputSchema") && !tool_json["inputSchema"].is_null()) {
                if (!tool_json["inputSchema"].is_object()) {
                    return tl::unexpected(Error{
                        ErrorCode::ProtocolError,
                        "Malformed tools/list response: inputSchema must be an object",
                        def.name
                    });
                }
                def.input_schema = tool_json["inputSchema"];
            } else {
                def.input_schema = nlohmann::json{
                    {"type", "object"},
                    {"properties", nlohmann::json::object()},
                    {"required", nlohmann::json::array()}
                };
            }
            tools.push_back(std::move(def));
        }
        return tools;
    }

private:
    static nlohmann::json build_schema_json(const protocol::ToolDescriptor& tool) {
        return nlohmann::json{
            {"type", "function"},
            {"function", {
                {"name", tool.name},
                {"description", tool.description},
                {"parameters", tool.input_schema}
            }}
        };
    }

    std::shared_ptr<protocol::ProtocolClient> client_;
    std::vector<protocol::ToolDescriptor> tools_;
    std::unordered_map<std::string, size_t> index_;
    mutable std::shared_mutex mutex_;
};

} // namespace engine
} // namespace vine
