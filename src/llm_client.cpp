#include "llm_client.h"
#include "http_client.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace carebridge {

namespace {

constexpr size_t kMaxResponseWords = 120;
const char* kResourceTool = "offer_resources";

json resource_tool_definition() {
    json tool;
    tool["type"] = "function";
    tool["function"]["name"] = kResourceTool;
    tool["function"]["description"] =
        "Offer the person support contacts (hotlines, crisis lines) for their situation.";
    tool["function"]["parameters"] = {
        {"type", "object"},
        {"properties", {{"category", {{"type", "string"},
                                      {"enum", {"general", "crisis", "suicide", "self_harm", "abuse"}}}}}},
        {"required", json::array()}
    };
    return json::array({tool});
}

} // namespace

class LLMClient::Impl {
public:
    explicit Impl(const GenerationConfig& config) : config_(config) {
        is_ollama_ = config.endpoint.find("/api/chat") != std::string::npos;
    }

    Result<GeneratedResponse> generate(Phase phase, const std::vector<memory::ConversationMessage>& context) {
        Result<LLMResponse> raw = is_ollama_ ? generate_ollama_chat(phase, context)
                                             : generate_completion(phase, context);
        if (raw.is_error()) {
            LOG_LLM("Generation failed: " + raw.error().message);
            return raw.error();
        }

        GeneratedResponse out;
        out.text = clean_response(raw.value().content);
        for (const auto& call : raw.value().tool_calls) {
            if (call.name != kResourceTool) {
                LOG_LLM("Ignoring unknown tool call: " + call.name);
                continue;
            }
            out.resource_need = true;
            try {
                json args = json::parse(call.arguments.empty() ? "{}" : call.arguments);
                out.resource_category = args.value("category", "");
            } catch (const json::exception& e) {
                LOG_LLM(std::string("offer_resources arguments unparsable: ") + e.what());
            }
        }
        if (out.text.empty() && !out.resource_need) {
            return make_collaborator_error("generator returned no content");
        }
        return out;
    }

private:
    std::string system_prompt(Phase phase) const {
        std::string prompt = config_.system_prompt;
        std::string extra = LLMClient::phase_instruction(phase);
        if (!extra.empty()) {
            prompt += " " + extra;
        }
        return prompt;
    }

    Result<LLMResponse> generate_ollama_chat(Phase phase, const std::vector<memory::ConversationMessage>& context) {
        json messages = json::array();
        messages.push_back({{"role", "system"}, {"content", system_prompt(phase)}});
        for (const auto& msg : context) {
            messages.push_back({{"role", memory::role_name(msg.role)}, {"content", msg.content}});
        }

        json request;
        request["model"] = config_.model_name;
        request["messages"] = messages;
        request["temperature"] = config_.temperature;
        request["stream"] = false;
        if (phase == Phase::SupportLoop) {
            request["tools"] = resource_tool_definition();
        }

        LOG_LLM("Ollama chat request (" + std::to_string(messages.size()) + " messages, phase " +
                phase_name(phase) + ")");
        auto http = http_post_json(config_.endpoint, request.dump(), config_.timeout_ms,
                                   constants::generation::CONNECT_TIMEOUT_MS);
        if (http.is_error()) {
            return http.error();
        }
        if (http.value().status != 200) {
            return make_collaborator_error("generator returned HTTP " + std::to_string(http.value().status));
        }

        LLMResponse response;
        try {
            json response_json = json::parse(http.value().body);
            if (!response_json.contains("message")) {
                return make_parse_error("No message in Ollama response");
            }
            const json& message = response_json["message"];
            if (message.contains("content") && !message["content"].is_null()) {
                response.content = message["content"].get<std::string>();
            }
            if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
                int counter = 0;
                for (const auto& tool_call : message["tool_calls"]) {
                    ToolCall tc;
                    tc.id = tool_call.contains("id") && tool_call["id"].is_string()
                                ? tool_call["id"].get<std::string>()
                                : "call_" + std::to_string(++counter);
                    if (tool_call.contains("function")) {
                        const json& func = tool_call["function"];
                        tc.name = func.value("name", "");
                        if (func.contains("arguments")) {
                            // Ollama returns arguments as an object, OpenAI-style servers as a string
                            tc.arguments = func["arguments"].is_string() ? func["arguments"].get<std::string>()
                                                                         : func["arguments"].dump();
                        }
                    }
                    if (!tc.name.empty()) {
                        response.tool_calls.push_back(tc);
                    }
                }
            }
        } catch (const json::exception& e) {
            return make_parse_error("JSON parse error: " + std::string(e.what()));
        }
        return response;
    }

    Result<LLMResponse> generate_completion(Phase phase, const std::vector<memory::ConversationMessage>& context) {
        json request;
        request["prompt"] = build_prompt(phase, context);
        request["temperature"] = config_.temperature;
        request["stop"] = json::array({"\nUser:", "\nuser:"});
        request["stream"] = false;

        LOG_LLM(std::string("Completion request to: ") + config_.endpoint);
        auto http = http_post_json(config_.endpoint, request.dump(), config_.timeout_ms,
                                   constants::generation::CONNECT_TIMEOUT_MS);
        if (http.is_error()) {
            return http.error();
        }
        if (http.value().status != 200) {
            return make_collaborator_error("generator returned HTTP " + std::to_string(http.value().status));
        }

        LLMResponse response;
        try {
            json response_json = json::parse(http.value().body);
            if (!response_json.contains("content")) {
                return make_parse_error("No content in response");
            }
            response.content = response_json["content"].get<std::string>();
        } catch (const json::exception& e) {
            return make_parse_error("JSON parse error: " + std::string(e.what()));
        }
        return response;
    }

    std::string build_prompt(Phase phase, const std::vector<memory::ConversationMessage>& context) const {
        std::ostringstream oss;
        oss << system_prompt(phase) << "\n";
        for (const auto& msg : context) {
            if (msg.role == memory::MessageRole::User) {
                oss << "User: " << msg.content << "\n";
            } else if (msg.role == memory::MessageRole::Assistant) {
                oss << "Assistant: " << msg.content << "\n";
            }
        }
        oss << "Assistant:";
        return oss.str();
    }

    GenerationConfig config_;
    bool is_ollama_ = false;
};

LLMClient::LLMClient(const GenerationConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

LLMClient::~LLMClient() = default;

Result<GeneratedResponse> LLMClient::generate(Phase phase,
                                              const std::vector<memory::ConversationMessage>& sanitized_context) {
    return pimpl_->generate(phase, sanitized_context);
}

std::string LLMClient::phase_instruction(Phase phase) {
    switch (phase) {
        case Phase::Triage:
            return "Briefly acknowledge what the person shared and ask one open question "
                   "about what brought them here today.";
        case Phase::SupportLoop:
            return "Listen, reflect feelings back, and keep replies to two or three sentences.";
        case Phase::Resources:
            return "Introduce the support contacts that follow in one short, warm sentence.";
        default:
            return "";
    }
}

std::string LLMClient::clean_response(const std::string& response) {
    // Collapse all whitespace runs (including newlines) into single spaces
    std::string result;
    bool last_was_space = true;
    for (char c : response) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!last_was_space) {
                result += ' ';
                last_was_space = true;
            }
        } else {
            result += c;
            last_was_space = false;
        }
    }
    if (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }

    std::istringstream iss(result);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    if (words.size() <= kMaxResponseWords) {
        return result;
    }
    std::ostringstream oss;
    for (size_t i = 0; i < kMaxResponseWords; ++i) {
        if (i > 0) oss << " ";
        oss << words[i];
    }
    return oss.str();
}

} // namespace carebridge
