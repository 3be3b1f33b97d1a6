#pragma once

#include <mcp_guard/core/result.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_guard {

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
    std::string default_value;  // used when an optional argument is absent
};

struct PromptDefinition {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
    std::string template_text;

    // {name, description, arguments[]} as returned by prompts/list.
    [[nodiscard]] nlohmann::json ListJson() const;
};

struct PromptCatalogConfig {
    bool enabled = false;
    bool include_defaults = true;
    std::vector<std::string> exclude_defaults;
    std::vector<PromptDefinition> custom;
};

// The built-in prompts: code-review, api-documentation, debug-assistant,
// test-generator.
[[nodiscard]] std::vector<PromptDefinition> DefaultPrompts();

// Expand {{#if name}}...{{/if}} blocks (kept when the argument is present,
// non-empty and not "false"), then {{name}} placeholders. Unknown
// placeholders render as empty text. Blocks do not nest.
[[nodiscard]] std::string RenderTemplate(std::string_view text,
                                         const std::map<std::string, std::string>& args);

// ---------------------------------------------------------------------------
// PromptCatalog - prompt templates served by prompts/list and prompts/get.
//
// Custom prompts replace defaults of the same name. Descriptions pass
// through the description sanitizer.
// ---------------------------------------------------------------------------
class PromptCatalog {
public:
    explicit PromptCatalog(PromptCatalogConfig config);

    [[nodiscard]] bool Enabled() const noexcept { return enabled_; }
    [[nodiscard]] const std::vector<PromptDefinition>& Prompts() const noexcept {
        return prompts_;
    }
    [[nodiscard]] const PromptDefinition* Find(const std::string& name) const;

    // {description, messages:[{role:"user", content:{type:"text", text}}]}
    // NotFound for unknown prompts, Validation for missing arguments.
    [[nodiscard]] Result<nlohmann::json, Error> Get(const std::string& name,
                                                    const nlohmann::json& arguments) const;

private:
    bool enabled_;
    std::vector<PromptDefinition> prompts_;
};

} // namespace mcp_guard
