#include "service/retrieval_service.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iterator>
#include <unordered_map>
#include <utility>

#include "core/errors.hpp"
#include "search/query_gate.hpp"
#include "search/ranker.hpp"
#include "util/log.hpp"
#include "util/text.hpp"
#include "util/time.hpp"

namespace kbengine {
namespace {

// Errors that no degradation policy may hide.
bool is_fatal(const std::exception& error) {
    return dynamic_cast<const ConfigurationError*>(&error) != nullptr ||
           dynamic_cast<const DimensionMismatchError*>(&error) != nullptr ||
           dynamic_cast<const InvalidOptionError*>(&error) != nullptr ||
           dynamic_cast<const OperationCancelled*>(&error) != nullptr;
}

void validate_options(const KnowledgeContextOptions& options) {
    if (options.tenant_id.empty()) {
        throw InvalidOptionError("tenant_id must not be empty");
    }
    if (text::utf8_length(text::trim(options.query)) > kMaxQueryLength) {
        throw InvalidOptionError("search query must be at most 1000 characters");
    }
    validate(RankOptions{options.top_k, options.threshold, Metric::Cosine});
    if (options.max_context_length < kMinContextLength || options.max_context_length > kMaxContextLength) {
        throw InvalidOptionError("max context length must be between 100 and 16000, got " +
                                 std::to_string(options.max_context_length));
    }
}

bool in_workspaces(const KnowledgeBase& knowledge_base, const std::vector<std::string>& workspace_ids) {
    return knowledge_base.workspace_id &&
           std::find(workspace_ids.begin(), workspace_ids.end(), *knowledge_base.workspace_id) != workspace_ids.end();
}

std::vector<std::string> ids_of(const std::vector<KnowledgeBase>& bases) {
    std::vector<std::string> ids;
    ids.reserve(bases.size());
    for (const auto& knowledge_base : bases) {
        ids.push_back(knowledge_base.id);
    }
    return ids;
}

struct EmbeddingGroup {
    EmbeddingConfig config;
    std::vector<std::size_t> targets;
    std::vector<float> query_vector;
    bool failed = false;
};

}  // namespace

FanoutFailurePolicy parse_fanout_failure_policy(std::string_view value) {
    const std::string normalized = text::to_lower_ascii(text::trim(value));
    if (normalized == "degrade") {
        return FanoutFailurePolicy::Degrade;
    }
    if (normalized == "abort") {
        return FanoutFailurePolicy::Abort;
    }
    throw ConfigurationError("unknown fan-out failure policy: " + std::string{value});
}

RetrievalService::RetrievalService(KnowledgeRepository& repository,
                                   const Embedder& embedder,
                                   RetrievalSettings settings,
                                   Sleeper sleeper)
    : repository_(repository),
      embedder_(embedder),
      settings_(std::move(settings)),
      sleeper_(std::move(sleeper)) {}

std::vector<KnowledgeBase> RetrievalService::resolve_knowledge_bases(const KnowledgeContextOptions& options) const {
    if (!options.knowledge_base_ids.empty()) {
        std::unordered_map<std::string, KnowledgeBase> known;
        for (auto& knowledge_base : repository_.describe_knowledge_bases(options.knowledge_base_ids)) {
            known.emplace(knowledge_base.id, std::move(knowledge_base));
        }

        std::vector<KnowledgeBase> bases;
        for (const auto& id : options.knowledge_base_ids) {
            const bool duplicate = std::any_of(bases.begin(), bases.end(),
                                               [&](const KnowledgeBase& existing) { return existing.id == id; });
            if (duplicate) {
                continue;
            }
            auto it = known.find(id);
            if (it != known.end()) {
                bases.push_back(it->second);
            } else {
                KnowledgeBase unknown;
                unknown.id = id;
                unknown.tenant_id = options.tenant_id;
                bases.push_back(std::move(unknown));
            }
        }
        return bases;
    }

    auto bases = repository_.list_active_knowledge_bases(options.tenant_id);
    if (!options.workspace_ids.empty()) {
        bases.erase(std::remove_if(bases.begin(), bases.end(),
                                   [&](const KnowledgeBase& knowledge_base) {
                                       return !in_workspaces(knowledge_base, options.workspace_ids);
                                   }),
                    bases.end());
    }
    return bases;
}

std::vector<SearchResult> RetrievalService::search_knowledge_base(const Target& target,
                                                                  const std::vector<float>& query_vector,
                                                                  const KnowledgeContextOptions& options,
                                                                  const CancellationToken* cancellation) const {
    throw_if_cancelled(cancellation);
    const auto candidates =
        repository_.get_candidate_chunks(target.knowledge_base.id, &query_vector, options.candidate_limit);
    throw_if_cancelled(cancellation);

    auto results = rank(query_vector, candidates, RankOptions{options.top_k, options.threshold, Metric::Cosine});
    for (auto& result : results) {
        if (result.knowledge_base_id.empty()) {
            result.knowledge_base_id = target.knowledge_base.id;
        }
    }
    return results;
}

KnowledgeContextResult RetrievalService::get_context(const KnowledgeContextOptions& options,
                                                     const CancellationToken* cancellation) const {
    validate_options(options);
    const auto started = std::chrono::steady_clock::now();
    throw_if_cancelled(cancellation);

    KnowledgeContextResult response;
    const auto bases = resolve_knowledge_bases(options);
    if (bases.empty()) {
        return response;
    }
    response.knowledge_base_ids = ids_of(bases);

    // A blank query has nothing to search for; that is an empty result, not an error.
    if (text::trim(options.query).empty()) {
        return response;
    }
    if (options.apply_query_gate && !should_search_knowledge_base(options.query)) {
        log::info("knowledge search skipped by query gate: tenant=" + options.tenant_id);
        return response;
    }

    // Chunks of a base were embedded with its own model, so that model wins over request overrides.
    std::vector<Target> targets;
    targets.reserve(bases.size());
    for (const auto& knowledge_base : bases) {
        EmbeddingOverrides overrides = options.embedding;
        if (!knowledge_base.embedding_model.empty()) {
            overrides.model = knowledge_base.embedding_model;
        }
        targets.push_back(Target{knowledge_base, resolve_embedding_config(settings_.embedding_defaults, overrides)});
    }

    std::vector<EmbeddingGroup> groups;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const EmbeddingGroup& group) { return group.config == targets[i].embedding_config; });
        if (it == groups.end()) {
            groups.push_back(EmbeddingGroup{targets[i].embedding_config, {i}, {}, false});
        } else {
            it->targets.push_back(i);
        }
    }

    const CallContext call_context{options.timeout.value_or(settings_.embedding_timeout), cancellation};

    // One query embedding per model, shared by every base using that model.
    std::exception_ptr first_failure;
    for (auto& group : groups) {
        try {
            group.query_vector = with_retry(settings_.retry, sleeper_, cancellation,
                                            "query embedding (" + group.config.model + ")", [&]() {
                                                return embedder_.embed(options.query, group.config, call_context)
                                                    .embedding;
                                            });
        } catch (const std::exception& ex) {
            if (is_fatal(ex) || settings_.failure_policy == FanoutFailurePolicy::Abort) {
                throw;
            }
            log::error("query embedding failed for model " + group.config.model + ": " + ex.what());
            group.failed = true;
            if (!first_failure) {
                first_failure = std::current_exception();
            }
            for (const auto index : group.targets) {
                response.failed_knowledge_base_ids.push_back(targets[index].knowledge_base.id);
            }
        }
    }
    if (std::all_of(groups.begin(), groups.end(), [](const EmbeddingGroup& group) { return group.failed; })) {
        std::rethrow_exception(first_failure);
    }

    struct Job {
        std::size_t target;
        const std::vector<float>* query_vector;
    };
    std::vector<Job> jobs;
    for (const auto& group : groups) {
        if (group.failed) {
            continue;
        }
        for (const auto index : group.targets) {
            jobs.push_back(Job{index, &group.query_vector});
        }
    }
    std::sort(jobs.begin(), jobs.end(), [](const Job& lhs, const Job& rhs) { return lhs.target < rhs.target; });

    std::vector<std::future<std::vector<SearchResult>>> pending;
    if (settings_.parallel_fanout) {
        pending.reserve(jobs.size());
        for (const auto& job : jobs) {
            pending.push_back(std::async(std::launch::async, [this, &targets, &options, job, cancellation]() {
                return search_knowledge_base(targets[job.target], *job.query_vector, options, cancellation);
            }));
        }
    }

    std::vector<SearchResult> merged;
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        const auto& target = targets[jobs[i].target];
        try {
            auto results = settings_.parallel_fanout
                               ? pending[i].get()
                               : search_knowledge_base(target, *jobs[i].query_vector, options, cancellation);
            merged.insert(merged.end(), std::make_move_iterator(results.begin()),
                          std::make_move_iterator(results.end()));
        } catch (const std::exception& ex) {
            if (is_fatal(ex) || settings_.failure_policy == FanoutFailurePolicy::Abort) {
                throw;
            }
            log::error("knowledge base " + target.knowledge_base.id + " search failed: " + ex.what());
            response.failed_knowledge_base_ids.push_back(target.knowledge_base.id);
        }
    }

    std::stable_sort(merged.begin(), merged.end(), result_order);
    if (merged.size() > static_cast<std::size_t>(options.top_k)) {
        merged.resize(static_cast<std::size_t>(options.top_k));
    }

    throw_if_cancelled(cancellation);
    response.context = build_context(
        merged, ContextOptions{options.max_context_length, options.include_source, options.format});
    response.results = std::move(merged);
    response.has_context = !response.context.empty();

    log::info("knowledge context built: tenant=" + options.tenant_id +
              " bases=" + std::to_string(response.knowledge_base_ids.size()) +
              " failed=" + std::to_string(response.failed_knowledge_base_ids.size()) +
              " results=" + std::to_string(response.results.size()) +
              " context_chars=" + std::to_string(text::utf8_length(response.context)) +
              " elapsed_ms=" + std::to_string(time::elapsed_ms(started)));
    return response;
}

}  // namespace kbengine
