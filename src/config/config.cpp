#include "config/config.hpp"

#include <cstdlib>
#include <sstream>

#include "core/errors.hpp"
#include "util/log.hpp"
#include "util/text.hpp"

namespace kbengine
{
    namespace
    {

        std::string env_or_default(const char *name, const char *default_value)
        {
            if (const char *value = std::getenv(name); value && *value)
            {
                return value;
            }
            return default_value;
        }

        int env_int(const char *name, int default_value, int min_value)
        {
            const std::string raw = env_or_default(name, "");
            if (raw.empty())
            {
                return default_value;
            }
            std::size_t consumed = 0;
            int value = 0;
            try
            {
                value = std::stoi(raw, &consumed);
            }
            catch (const std::exception &)
            {
                throw ConfigurationError(std::string{name} + " must be an integer, got '" + raw + "'");
            }
            if (consumed != raw.size() || value < min_value)
            {
                throw ConfigurationError(std::string{name} + " must be an integer >= " + std::to_string(min_value) +
                                         ", got '" + raw + "'");
            }
            return value;
        }

        bool env_bool(const char *name, bool default_value)
        {
            const std::string raw = text::to_lower_ascii(env_or_default(name, ""));
            if (raw.empty())
            {
                return default_value;
            }
            if (raw == "1" || raw == "true" || raw == "yes" || raw == "on")
            {
                return true;
            }
            if (raw == "0" || raw == "false" || raw == "no" || raw == "off")
            {
                return false;
            }
            throw ConfigurationError(std::string{name} + " must be a boolean, got '" + raw + "'");
        }

    } // namespace

    Config Config::load()
    {
        Config config;
        config.pg_host_ = env_or_default("PGHOST", "postgres");
        config.pg_port_ = env_or_default("PGPORT", "5432");
        config.pg_database_ = env_or_default("PGDATABASE", "chatbot");
        config.pg_user_ = env_or_default("PGUSER", "chatbot");
        config.pg_password_ = env_or_default("PGPASSWORD", "");
        config.openai_api_key_ = env_or_default("OPENAI_API_KEY", "");
        config.openai_base_url_ = env_or_default("OPENAI_BASE_URL", "https://api.openai.com/v1");
        config.embedding_model_ = env_or_default("EMBEDDING_MODEL", "text-embedding-3-small");
        config.embedding_dimensions_ = env_int("EMBEDDING_DIMENSIONS", 1536, 1);
        config.embedding_timeout_ = std::chrono::milliseconds{env_int("EMBEDDING_TIMEOUT_MS", 30000, 1)};
        config.fanout_failure_policy_ = parse_fanout_failure_policy(env_or_default("KB_FANOUT_FAILURE_POLICY", "degrade"));
        config.retry_max_attempts_ = env_int("KB_RETRY_MAX_ATTEMPTS", 3, 1);
        config.parallel_fanout_ = env_bool("KB_PARALLEL_FANOUT", false);
        config.log_level_ = log::parse_level(env_or_default("KB_LOG_LEVEL", "info"));

        if (config.openai_api_key_.empty())
        {
            log::warn("OPENAI_API_KEY is not set; embedding calls will fail until a key is supplied");
        }
        log::info("config loaded: embedding_model=" + config.embedding_model_ +
                  " dimensions=" + std::to_string(config.embedding_dimensions_));
        return config;
    }

    std::string Config::pg_conninfo() const
    {
        std::ostringstream oss;
        oss << "host=" << pg_host_;
        oss << " port=" << pg_port_;
        oss << " dbname=" << pg_database_;
        oss << " user=" << pg_user_;
        if (!pg_password_.empty())
        {
            oss << " password=" << pg_password_;
        }
        return oss.str();
    }

    EmbeddingConfig Config::embedding_defaults() const
    {
        return EmbeddingConfig{
            .model = embedding_model_,
            .dimensions = embedding_dimensions_,
            .api_key = openai_api_key_,
            .base_url = openai_base_url_,
        };
    }

    RetrievalSettings Config::retrieval_settings() const
    {
        RetrievalSettings settings;
        settings.embedding_defaults = embedding_defaults();
        settings.embedding_timeout = embedding_timeout_;
        settings.retry.max_attempts = retry_max_attempts_;
        settings.failure_policy = fanout_failure_policy_;
        settings.parallel_fanout = parallel_fanout_;
        return settings;
    }

} // namespace kbengine
