#include <mcp_guard/mcp/prompt_catalog.hpp>

#include <mcp_guard/core/log.hpp>
#include <mcp_guard/security/description_sanitizer.hpp>

#include <algorithm>
#include <cctype>

namespace mcp_guard {

namespace {

constexpr std::string_view kIfOpen = "{{#if ";
constexpr std::string_view kIfClose = "{{/if}}";

std::string Trim(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

bool Truthy(const std::map<std::string, std::string>& args, const std::string& name) {
    auto it = args.find(name);
    return it != args.end() && !it->second.empty() && it->second != "false";
}

std::string ExpandConditionals(std::string_view text,
                               const std::map<std::string, std::string>& args) {
    std::string out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find(kIfOpen, pos);
        if (open == std::string_view::npos) break;
        const auto name_end = text.find("}}", open + kIfOpen.size());
        if (name_end == std::string_view::npos) break;
        const auto close = text.find(kIfClose, name_end + 2);
        if (close == std::string_view::npos) break;

        out.append(text.substr(pos, open - pos));
        const auto name = Trim(text.substr(open + kIfOpen.size(),
                                           name_end - open - kIfOpen.size()));
        if (Truthy(args, name)) {
            out.append(text.substr(name_end + 2, close - name_end - 2));
        }
        pos = close + kIfClose.size();
    }
    if (pos < text.size()) {
        out.append(text.substr(pos));
    }
    return out;
}

std::string ExpandPlaceholders(const std::string& text,
                               const std::map<std::string, std::string>& args) {
    std::string out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find("{{", pos);
        if (open == std::string::npos) break;
        const auto close = text.find("}}", open + 2);
        if (close == std::string::npos) break;
        out.append(text, pos, open - pos);
        const auto name = Trim(std::string_view(text).substr(open + 2, close - open - 2));
        auto it = args.find(name);
        if (it != args.end()) {
            out.append(it->second);
        }
        pos = close + 2;
    }
    if (pos < text.size()) {
        out.append(text, pos, std::string::npos);
    }
    return out;
}

std::string ArgumentText(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

PromptDefinition MakePrompt(std::string name, std::string description,
                            std::vector<PromptArgument> arguments, std::string text) {
    return PromptDefinition{std::move(name), std::move(description), std::move(arguments),
                            std::move(text)};
}

} // anonymous namespace

nlohmann::json PromptDefinition::ListJson() const {
    nlohmann::json args = nlohmann::json::array();
    for (const auto& a : arguments) {
        args.push_back({{"name", a.name}, {"description", a.description},
                        {"required", a.required}});
    }
    return {{"name", name}, {"description", description}, {"arguments", args}};
}

std::vector<PromptDefinition> DefaultPrompts() {
    std::vector<PromptDefinition> prompts;
    prompts.push_back(MakePrompt(
        "code-review",
        "Code review covering quality, security and performance",
        {{"language", "Programming language of the code under review", true, ""},
         {"focus", "Review focus: security, performance, maintainability or all", false,
          "all"}},
        "You are an experienced {{language}} reviewer. Review the code with a focus on "
        "{{focus}}.\n\n"
        "Report:\n"
        "1. Overall assessment\n"
        "2. Critical issues that must be fixed\n"
        "3. Concrete improvements with code examples\n"
        "4. Security findings\n"));
    prompts.push_back(MakePrompt(
        "api-documentation",
        "Generate API documentation from source code",
        {{"format", "Output format: openapi, markdown or jsdoc", false, "markdown"},
         {"include_examples", "Include usage examples (true/false)", false, ""}},
        "Write {{format}} documentation for the provided API.\n\n"
        "Describe every endpoint with its parameters, request and response shapes, "
        "status codes and authentication requirements.\n"
        "{{#if include_examples}}Add a usage example for each endpoint.\n{{/if}}"));
    prompts.push_back(MakePrompt(
        "debug-assistant",
        "Analyze a bug and propose fixes",
        {{"error_type", "Kind of error: runtime, compile, logic or performance", true, ""},
         {"context", "When and where the error occurs", false, ""}},
        "Help diagnose a {{error_type}} error.\n"
        "{{#if context}}Context: {{context}}\n{{/if}}"
        "\nExplain the likely root cause, how to confirm it, and the smallest fix.\n"));
    prompts.push_back(MakePrompt(
        "test-generator",
        "Generate unit tests for the given code",
        {{"test_framework", "Testing framework to target", true, ""},
         {"coverage_level", "Coverage level: basic, comprehensive or edge-cases", false,
          "comprehensive"}},
        "Write {{test_framework}} unit tests for the provided code at a "
        "{{coverage_level}} coverage level.\n"
        "Cover the main paths, error handling and boundary values.\n"));
    return prompts;
}

std::string RenderTemplate(std::string_view text,
                           const std::map<std::string, std::string>& args) {
    return ExpandPlaceholders(ExpandConditionals(text, args), args);
}

// ===========================================================================
// PromptCatalog
// ===========================================================================

PromptCatalog::PromptCatalog(PromptCatalogConfig config) : enabled_(config.enabled) {
    auto is_custom = [&](const std::string& name) {
        return std::any_of(config.custom.begin(), config.custom.end(),
                           [&](const PromptDefinition& p) { return p.name == name; });
    };
    auto is_excluded = [&](const std::string& name) {
        return std::find(config.exclude_defaults.begin(), config.exclude_defaults.end(),
                         name) != config.exclude_defaults.end();
    };

    if (config.include_defaults) {
        for (auto& prompt : DefaultPrompts()) {
            if (!is_excluded(prompt.name) && !is_custom(prompt.name)) {
                prompts_.push_back(std::move(prompt));
            }
        }
    }
    for (auto& prompt : config.custom) {
        if (Find(prompt.name) != nullptr) {
            LogWarn("prompts", "Duplicate custom prompt '" + prompt.name + "' ignored");
            continue;
        }
        prompt.description = SanitizeDescription(prompt.description);
        prompts_.push_back(std::move(prompt));
    }
}

const PromptDefinition* PromptCatalog::Find(const std::string& name) const {
    for (const auto& p : prompts_) {
        if (p.name == name) {
            return &p;
        }
    }
    return nullptr;
}

Result<nlohmann::json, Error> PromptCatalog::Get(const std::string& name,
                                                 const nlohmann::json& arguments) const {
    const auto* prompt = Find(name);
    if (prompt == nullptr) {
        return Result<nlohmann::json, Error>::Err(
            Error{"PromptCatalog::Get", "Prompt '" + name + "' not found",
                  ErrorCategory::NotFound});
    }

    std::map<std::string, std::string> values;
    if (arguments.is_object()) {
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            values[it.key()] = ArgumentText(it.value());
        }
    }
    for (const auto& arg : prompt->arguments) {
        auto it = values.find(arg.name);
        const bool present = it != values.end() && !it->second.empty();
        if (present) continue;
        if (arg.required) {
            return Result<nlohmann::json, Error>::Err(
                Error{"PromptCatalog::Get",
                      "Missing required argument '" + arg.name + "' for prompt '" + name + "'",
                      ErrorCategory::Validation});
        }
        if (!arg.default_value.empty()) {
            values[arg.name] = arg.default_value;
        }
    }

    nlohmann::json result = {
        {"description", prompt->description},
        {"messages", nlohmann::json::array({
            {{"role", "user"},
             {"content", {{"type", "text"},
                          {"text", RenderTemplate(prompt->template_text, values)}}}},
        })},
    };
    return Result<nlohmann::json, Error>::Ok(std::move(result));
}

} // namespace mcp_guard
