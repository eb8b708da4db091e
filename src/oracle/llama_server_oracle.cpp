#include "oracle/llama_server_oracle.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace deepdive {

LlamaServerOracle::LlamaServerOracle() : loaded_(false) {}

LlamaServerOracle::~LlamaServerOracle() {
    dispose();
}

std::map<std::string, std::string> LlamaServerOracle::auth_headers() const {
    std::map<std::string, std::string> headers;
    if (!config_.api_key.empty()) {
        headers["Authorization"] = "Bearer " + config_.api_key;
    }
    return headers;
}

void LlamaServerOracle::load(const OracleConfig& config) {
    if (config.endpoint.empty()) {
        throw OracleUnavailable("no oracle endpoint configured");
    }

    config_ = config;
    client_ = std::make_unique<net::HttpClient>(config.endpoint, config.timeout_ms);

    try {
        net::HttpResponse health = client_->get("/health", auth_headers());
        json status = json::parse(health.body, nullptr, false);
        if (!status.is_discarded() && status.is_object() &&
            status.value("status", "ok") != "ok") {
            throw OracleUnavailable("model server at " + config.endpoint + " reports status '" +
                                    status.value("status", "") + "'");
        }
    } catch (const net::HttpClientError& e) {
        client_.reset();
        std::ostringstream oss;
        oss << "cannot reach model server at " << config.endpoint << " (" << e.what()
            << "). Start llama-server with a GGUF model or set oracle.endpoint";
        throw OracleUnavailable(oss.str());
    }

    model_name_ = config.model;
    try {
        net::HttpResponse props = client_->get("/props", auth_headers());
        json body = json::parse(props.body, nullptr, false);
        if (model_name_.empty() && !body.is_discarded() && body.is_object() &&
            body.contains("model_path") && body["model_path"].is_string()) {
            model_name_ = body["model_path"].get<std::string>();
        }
    } catch (const net::HttpClientError& e) {
        Logger::get_instance().debug("Model server has no /props endpoint", {{"error", e.what()}});
    }

    loaded_ = true;
    Logger::get_instance().info("Language model connected", {
        {"endpoint", config.endpoint}, {"model", model_name_}, {"api_key", config.api_key}
    });
}

std::string LlamaServerOracle::build_completion_request(const std::string& prompt,
                                                        double temperature,
                                                        int max_tokens,
                                                        const std::vector<std::string>& stop) {
    json request;
    request["prompt"] = prompt;
    request["temperature"] = temperature;
    request["n_predict"] = max_tokens;
    request["cache_prompt"] = true;
    if (!stop.empty()) {
        request["stop"] = stop;
    }
    return request.dump();
}

std::string LlamaServerOracle::parse_completion_response(const std::string& body) {
    try {
        json response = json::parse(body);
        if (!response.is_object() || !response.contains("content") || !response["content"].is_string()) {
            throw OracleUnavailable("invalid completion response: missing 'content'");
        }
        return response["content"].get<std::string>();
    } catch (const json::exception& e) {
        throw OracleUnavailable(std::string("invalid completion response: ") + e.what());
    }
}

std::string LlamaServerOracle::complete(const std::string& prompt, double temperature, int max_tokens) {
    if (!loaded_ || !client_) {
        throw OracleUnavailable("oracle not loaded");
    }

    try {
        net::HttpResponse response = client_->post(
            "/completion",
            build_completion_request(prompt, temperature, max_tokens, config_.stop_sequences),
            auth_headers());
        return parse_completion_response(response.body);
    } catch (const net::HttpClientError& e) {
        throw OracleUnavailable(std::string("completion request failed: ") + e.what());
    }
}

OracleInfo LlamaServerOracle::get_info() const {
    return OracleInfo("llama.cpp server", "llama_server", model_name_, config_.context_size);
}

void LlamaServerOracle::dispose() noexcept {
    client_.reset();
    loaded_ = false;
}

} // namespace deepdive
