#include "embedding/openai_embedder.hpp"

#include <algorithm>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"

namespace kbengine
{

    namespace
    {

        struct ParsedItem
        {
            std::size_t index = 0;
            std::vector<float> embedding;
        };

        struct ParsedResponse
        {
            std::vector<ParsedItem> items;
            int total_tokens = 0;
        };

        void require_credential(const EmbeddingConfig &config)
        {
            if (config.api_key.empty())
            {
                throw ConfigurationError("embedding provider API key is not configured: OPENAI_API_KEY");
            }
        }

        HttpRequest build_request(const EmbeddingConfig &config, nlohmann::json input, const CallContext &context)
        {
            nlohmann::json body;
            body["model"] = config.model;
            body["input"] = std::move(input);
            body["dimensions"] = config.dimensions;

            std::string payload;
            try
            {
                payload = body.dump();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw InvalidOptionError(std::string{"embedding input is not valid UTF-8: "} + ex.what());
            }

            return HttpRequest{
                .method = "POST",
                .url = config.base_url + "/embeddings",
                .headers = {"Content-Type: application/json", "Authorization: Bearer " + config.api_key},
                .body = std::move(payload),
                .timeout = context.timeout,
                .cancellation = context.cancellation,
            };
        }

        HttpResponse send(const HttpTransport &transport, const HttpRequest &request)
        {
            try
            {
                return transport(request);
            }
            catch (const HttpTransportError &ex)
            {
                if (ex.timed_out())
                {
                    throw ProviderUnavailable(std::string{"embedding provider timed out: "} + ex.what());
                }
                throw ProviderUnavailable(std::string{"embedding provider unreachable: "} + ex.what());
            }
        }

        ParsedResponse parse_response(const HttpResponse &response, const EmbeddingConfig &config)
        {
            if (response.status < 200 || response.status >= 300)
            {
                throw ProviderError(response.status, response.body);
            }

            ParsedResponse parsed;
            try
            {
                const auto json = nlohmann::json::parse(response.body);
                if (!json.contains("data") || !json["data"].is_array() || json["data"].empty())
                {
                    throw ProviderError(response.status, "embedding response missing data: " + response.body);
                }
                for (const auto &item : json["data"])
                {
                    const auto &embedding_json = item.at("embedding");
                    if (!embedding_json.is_array())
                    {
                        throw ProviderError(response.status, "embedding format invalid: " + response.body);
                    }
                    ParsedItem parsed_item;
                    parsed_item.index = item.value("index", parsed.items.size());
                    parsed_item.embedding = embedding_json.get<std::vector<float>>();
                    if (parsed_item.embedding.size() != static_cast<std::size_t>(config.dimensions))
                    {
                        throw DimensionMismatchError(static_cast<std::size_t>(config.dimensions),
                                                     parsed_item.embedding.size());
                    }
                    parsed.items.push_back(std::move(parsed_item));
                }
                if (json.contains("usage") && json["usage"].contains("total_tokens"))
                {
                    parsed.total_tokens = json["usage"]["total_tokens"].get<int>();
                }
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw ProviderError(response.status,
                                    std::string{"failed to parse embedding response: "} + ex.what());
            }

            std::sort(parsed.items.begin(), parsed.items.end(),
                      [](const ParsedItem &lhs, const ParsedItem &rhs) { return lhs.index < rhs.index; });
            return parsed;
        }

    } // namespace

    OpenAiEmbedder::OpenAiEmbedder() : transport_(perform_http_request) {}

    OpenAiEmbedder::OpenAiEmbedder(HttpTransport transport) : transport_(std::move(transport)) {}

    EmbeddingResult OpenAiEmbedder::embed(const std::string &text,
                                          const EmbeddingConfig &config,
                                          const CallContext &context) const
    {
        require_credential(config);
        if (text.empty())
        {
            throw InvalidOptionError("cannot embed empty text");
        }

        const auto response = send(transport_, build_request(config, text, context));
        auto parsed = parse_response(response, config);

        return EmbeddingResult{
            .embedding = std::move(parsed.items.front().embedding),
            .token_count = parsed.total_tokens,
            .model = config.model,
        };
    }

    std::vector<EmbeddingResult> OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts,
                                                             const EmbeddingConfig &config,
                                                             const CallContext &context) const
    {
        require_credential(config);
        if (texts.empty())
        {
            return {};
        }
        for (const auto &text : texts)
        {
            if (text.empty())
            {
                throw InvalidOptionError("cannot embed empty text");
            }
        }

        const auto response = send(transport_, build_request(config, texts, context));
        auto parsed = parse_response(response, config);
        if (parsed.items.size() != texts.size())
        {
            throw ProviderError(response.status, "embedding response has " + std::to_string(parsed.items.size()) +
                                                     " items for " + std::to_string(texts.size()) + " inputs");
        }

        // The provider reports one aggregate usage figure; spread it evenly, rounding up.
        const int count = static_cast<int>(texts.size());
        const int tokens_per_item = (parsed.total_tokens + count - 1) / count;

        std::vector<EmbeddingResult> results;
        results.reserve(parsed.items.size());
        for (auto &item : parsed.items)
        {
            results.push_back(EmbeddingResult{
                .embedding = std::move(item.embedding),
                .token_count = tokens_per_item,
                .model = config.model,
            });
        }
        return results;
    }

} // namespace kbengine
