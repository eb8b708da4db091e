/**
 * @file llama_server_oracle.hpp
 * @brief LanguageOracle backed by a llama.cpp HTTP server
 *
 * Talks to the server's native endpoints:
 *   GET  /health      readiness probe used by load()
 *   GET  /props       optional model metadata
 *   POST /completion  {"prompt", "temperature", "n_predict", "stop"} -> {"content"}
 */

#ifndef DEEPDIVE_LLAMA_SERVER_ORACLE_HPP
#define DEEPDIVE_LLAMA_SERVER_ORACLE_HPP

#include "api/http_client.hpp"
#include "oracle/language_oracle.hpp"
#include <memory>
#include <string>
#include <vector>

namespace deepdive {

class LlamaServerOracle : public LanguageOracle {
public:
    LlamaServerOracle();
    ~LlamaServerOracle() override;

    void load(const OracleConfig& config) override;
    std::string complete(const std::string& prompt, double temperature, int max_tokens) override;
    OracleInfo get_info() const override;
    void dispose() noexcept override;
    bool is_loaded() const override { return loaded_; }

    /**
     * @brief JSON body for POST /completion
     */
    static std::string build_completion_request(const std::string& prompt,
                                                double temperature,
                                                int max_tokens,
                                                const std::vector<std::string>& stop);

    /**
     * @brief Generated text from a /completion response body
     *
     * @throws OracleUnavailable If the body is not JSON or has no "content"
     */
    static std::string parse_completion_response(const std::string& body);

private:
    OracleConfig config_;
    std::unique_ptr<net::HttpClient> client_;
    bool loaded_;
    std::string model_name_;

    std::map<std::string, std::string> auth_headers() const;
};

} // namespace deepdive

#endif // DEEPDIVE_LLAMA_SERVER_ORACLE_HPP
