#pragma once

#include <chrono>
#include <string>

#include "embedding/embedding_config.hpp"
#include "service/retrieval_service.hpp"
#include "util/log.hpp"

namespace kbengine {

class Config {
public:
    // Reads the environment. Throws ConfigurationError on malformed numeric or enum values.
    static Config load();

    const std::string& pg_host() const noexcept { return pg_host_; }
    const std::string& pg_port() const noexcept { return pg_port_; }
    const std::string& pg_database() const noexcept { return pg_database_; }
    const std::string& pg_user() const noexcept { return pg_user_; }
    const std::string& pg_password() const noexcept { return pg_password_; }
    const std::string& openai_api_key() const noexcept { return openai_api_key_; }
    const std::string& openai_base_url() const noexcept { return openai_base_url_; }
    const std::string& embedding_model() const noexcept { return embedding_model_; }
    int embedding_dimensions() const noexcept { return embedding_dimensions_; }
    std::chrono::milliseconds embedding_timeout() const noexcept { return embedding_timeout_; }
    FanoutFailurePolicy fanout_failure_policy() const noexcept { return fanout_failure_policy_; }
    int retry_max_attempts() const noexcept { return retry_max_attempts_; }
    bool parallel_fanout() const noexcept { return parallel_fanout_; }
    // Not applied by load(); pass to log::set_min_level.
    log::Level log_level() const noexcept { return log_level_; }

    // Returns libpq-compatible connection information string.
    std::string pg_conninfo() const;
    // Unvalidated; pass through resolve_embedding_config before use.
    EmbeddingConfig embedding_defaults() const;
    RetrievalSettings retrieval_settings() const;

private:
    Config() = default;

    std::string pg_host_;
    std::string pg_port_;
    std::string pg_database_;
    std::string pg_user_;
    std::string pg_password_;
    std::string openai_api_key_;
    std::string openai_base_url_;
    std::string embedding_model_;
    int embedding_dimensions_ = 0;
    std::chrono::milliseconds embedding_timeout_{0};
    FanoutFailurePolicy fanout_failure_policy_ = FanoutFailurePolicy::Degrade;
    int retry_max_attempts_ = 0;
    bool parallel_fanout_ = false;
    log::Level log_level_ = log::Level::Info;
};

}  // namespace kbengine
