#include <orderbot/llm/ollama_provider.hpp>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <mutex>

namespace orderbot::llm {

using json = nlohmann::json;

namespace {

size_t append_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

Error status_error(long http_code, const std::string& model) {
    switch (http_code) {
        case 401:
        case 403:
            return Error(ErrorCode::AUTH_ERROR, "Ollama rejected the request");
        case 404:
            return Error(ErrorCode::MODEL_NOT_FOUND, "Ollama model not found: " + model);
        case 429:
            return Error(ErrorCode::RATE_LIMITED, "Ollama is rate limiting requests");
        default:
            return Error(ErrorCode::IO_ERROR, "Ollama returned HTTP " + std::to_string(http_code));
    }
}

/**
 * One blocking HTTP exchange on a reused handle. GET when body is null,
 * JSON POST otherwise.
 */
Result<std::string> exchange(CURL* curl, const std::string& url, const std::string* body,
                             long timeout_ms, const std::string& model) {
    curl_easy_reset(curl);

    std::string response;
    struct curl_slist* headers = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    }

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return Error(ErrorCode::TIMEOUT, "Ollama request to " + url + " timed out");
    }
    if (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST) {
        return Error(ErrorCode::PROVIDER_UNAVAILABLE,
            "Cannot connect to Ollama at " + url + ": " + curl_easy_strerror(res));
    }
    if (res != CURLE_OK) {
        return Error(ErrorCode::NETWORK_ERROR,
            "Ollama request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        return status_error(http_code, model);
    }
    return response;
}

const char* role_name(Message::Role role) {
    switch (role) {
        case Message::Role::SYSTEM: return "system";
        case Message::Role::USER: return "user";
        case Message::Role::ASSISTANT: return "assistant";
    }
    return "user";
}

}  // namespace

OllamaProvider::OllamaProvider(OllamaConfig config)
    : config_(std::move(config)) {}

OllamaProvider::~OllamaProvider() {
    shutdown();
}

ProviderInfo OllamaProvider::info() const {
    ProviderInfo pinfo;
    pinfo.name = "ollama";
    pinfo.model_id = config_.model;
    pinfo.is_local = true;
    pinfo.context_length = static_cast<size_t>(config_.context_length);
    return pinfo;
}

void OllamaProvider::open_handle() {
    static std::once_flag global_init;
    std::call_once(global_init, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    curl_ = curl_easy_init();
}

void OllamaProvider::close_handle() {
    if (curl_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_));
        curl_ = nullptr;
    }
}

Result<void> OllamaProvider::initialize() {
    if (ready_) {
        return Ok();
    }

    open_handle();
    if (!curl_) {
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to initialize CURL");
    }

    // The model list doubles as a reachability probe
    auto tags = exchange(static_cast<CURL*>(curl_), config_.host + "/api/tags",
                         nullptr, 5000L, config_.model);
    if (!tags.ok()) {
        close_handle();
        return tags.error();
    }
    if (!has_model(tags.value(), config_.model)) {
        close_handle();
        return Error(ErrorCode::MODEL_NOT_FOUND,
            "Model " + config_.model + " is not pulled; run: ollama pull " + config_.model);
    }

    ready_ = true;
    return Ok();
}

void OllamaProvider::shutdown() {
    close_handle();
    ready_ = false;
}

bool OllamaProvider::is_available() const {
    return ready_ && curl_ != nullptr;
}

std::string OllamaProvider::build_request_body(const CompletionRequest& request) const {
    json messages = json::array();
    if (!request.system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", request.system_prompt}});
    }
    for (const auto& msg : request.messages) {
        messages.push_back({{"role", role_name(msg.role)}, {"content", msg.content}});
    }

    json body = {
        {"model", config_.model},
        {"stream", false},
        {"messages", messages},
        {"options", {
            {"temperature", request.temperature},
            {"top_p", request.top_p},
            {"num_predict", request.max_tokens},
            {"num_ctx", config_.context_length}
        }}
    };
    if (request.json_mode) {
        body["format"] = "json";
    }
    if (config_.keep_alive) {
        body["keep_alive"] = "5m";
    }
    return body.dump();
}

Result<CompletionResult> OllamaProvider::parse_chat_response(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error(ErrorCode::PARSE_ERROR, "Ollama response is not a JSON object");
    }
    if (j.contains("error")) {
        return Error(ErrorCode::INTERNAL_ERROR, j["error"].is_string()
            ? j["error"].get<std::string>() : j["error"].dump());
    }

    const json message = j.value("message", json::object());
    if (!message.is_object() || !message.contains("content") || !message["content"].is_string()) {
        return Error(ErrorCode::PARSE_ERROR, "Ollama response has no message content");
    }

    CompletionResult result;
    result.content = message["content"].get<std::string>();
    result.prompt_tokens = j.value("prompt_eval_count", 0);
    result.completion_tokens = j.value("eval_count", 0);
    result.stop_reason = j.value("done_reason", std::string("stop"));
    return result;
}

bool OllamaProvider::has_model(const std::string& tags_body, const std::string& model) {
    json j = json::parse(tags_body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("models") || !j["models"].is_array()) {
        return false;
    }
    // Ollama reports untagged pulls as "<name>:latest"
    std::string wanted = model.find(':') == std::string::npos ? model + ":latest" : model;
    for (const auto& entry : j["models"]) {
        if (!entry.is_object()) continue;
        std::string name = entry.value("name", entry.value("model", std::string()));
        if (name == model || name == wanted) {
            return true;
        }
    }
    return false;
}

Result<CompletionResult> OllamaProvider::complete(const CompletionRequest& request) {
    if (!is_available()) {
        return Error(ErrorCode::PROVIDER_UNAVAILABLE, "Ollama provider not initialized");
    }

    auto started = std::chrono::steady_clock::now();
    std::string body = build_request_body(request);
    int timeout_ms = request.timeout_ms > 0 ? request.timeout_ms : config_.timeout_ms;

    auto response = exchange(static_cast<CURL*>(curl_), config_.host + "/api/chat",
                             &body, static_cast<long>(timeout_ms), config_.model);
    if (!response.ok()) {
        return response.error();
    }

    auto parsed = parse_chat_response(response.value());
    if (!parsed.ok()) {
        return parsed.error();
    }

    CompletionResult result = std::move(parsed.value());
    result.latency_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());
    return result;
}

Result<std::unique_ptr<OllamaProvider>> OllamaProvider::create(OllamaConfig config) {
    auto provider = std::make_unique<OllamaProvider>(std::move(config));
    auto init_result = provider->initialize();
    if (!init_result.ok()) {
        return init_result.error();
    }
    return std::move(provider);
}

Result<std::unique_ptr<OllamaProvider>> OllamaProvider::create_from_env() {
    OllamaConfig config;

    if (const char* host = std::getenv("ORDERBOT_OLLAMA_HOST")) {
        config.host = host;
    }
    if (const char* model = std::getenv("ORDERBOT_OLLAMA_MODEL")) {
        config.model = model;
    }

    return create(std::move(config));
}

}  // namespace orderbot::llm
