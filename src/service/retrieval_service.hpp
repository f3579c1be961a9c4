#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"
#include "embedding/embedder.hpp"
#include "net/cancellation.hpp"
#include "search/context_builder.hpp"
#include "service/retry.hpp"
#include "store/knowledge_repository.hpp"

namespace kbengine {

// What happens when one knowledge base (or one embedding model group) fails during fan-out.
enum class FanoutFailurePolicy {
    // Log it, count the affected bases as having no results, keep going.
    Degrade,
    // Propagate the error to the caller.
    Abort,
};

FanoutFailurePolicy parse_fanout_failure_policy(std::string_view value);

struct RetrievalSettings {
    EmbeddingConfig embedding_defaults;
    std::chrono::milliseconds embedding_timeout{30000};
    RetryPolicy retry;
    FanoutFailurePolicy failure_policy = FanoutFailurePolicy::Degrade;
    bool parallel_fanout = false;
};

inline constexpr std::size_t kMaxQueryLength = 1000;

struct KnowledgeContextOptions {
    std::string tenant_id;
    std::string query;
    // When set, only bases of these workspaces are searched. Ignored with explicit ids.
    std::vector<std::string> workspace_ids;
    // When set, exactly these bases are searched.
    std::vector<std::string> knowledge_base_ids;
    int top_k = 5;
    double threshold = 0.7;
    int max_context_length = 4000;
    bool include_source = true;
    ContextFormat format = ContextFormat::Markdown;
    std::optional<std::size_t> candidate_limit;
    EmbeddingOverrides embedding;
    // Per provider call; defaults to RetrievalSettings::embedding_timeout.
    std::optional<std::chrono::milliseconds> timeout;
    bool apply_query_gate = false;
};

struct KnowledgeContextResult {
    std::string context;
    std::vector<SearchResult> results;
    std::vector<std::string> knowledge_base_ids;
    bool has_context = false;
    // Bases skipped because embedding or candidate retrieval failed under the Degrade policy.
    std::vector<std::string> failed_knowledge_base_ids;
};

// Turns a user query into a ranked, length-bounded context across a tenant's knowledge bases.
class RetrievalService {
public:
    RetrievalService(KnowledgeRepository& repository,
                     const Embedder& embedder,
                     RetrievalSettings settings,
                     Sleeper sleeper = default_sleeper());

    // Throws InvalidOptionError, ConfigurationError, DimensionMismatchError and
    // OperationCancelled. Provider errors are thrown when nothing could be ranked or
    // the policy is Abort.
    KnowledgeContextResult get_context(const KnowledgeContextOptions& options,
                                       const CancellationToken* cancellation = nullptr) const;

private:
    struct Target {
        KnowledgeBase knowledge_base;
        EmbeddingConfig embedding_config;
    };

    std::vector<KnowledgeBase> resolve_knowledge_bases(const KnowledgeContextOptions& options) const;
    std::vector<SearchResult> search_knowledge_base(const Target& target,
                                                    const std::vector<float>& query_vector,
                                                    const KnowledgeContextOptions& options,
                                                    const CancellationToken* cancellation) const;

    KnowledgeRepository& repository_;
    const Embedder& embedder_;
    RetrievalSettings settings_;
    Sleeper sleeper_;
};

}  // namespace kbengine
