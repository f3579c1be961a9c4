#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "service/retrieval_service.hpp"
#include "store/memory_repository.hpp"
#include "support/test_fixtures.hpp"

using namespace kbengine;
using kbengine::testing::make_chunk;
using kbengine::testing::MockEmbedder;
using kbengine::testing::test_embedding_config;
using kbengine::testing::unit_with_cosine;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

namespace {

const std::vector<float> kQueryVector{1.0f, 0.0f};

EmbeddingResult query_embedding(const std::string& model = "text-embedding-3-small") {
    return EmbeddingResult{kQueryVector, 6, model};
}

class RetrievalServiceTest : public ::testing::Test {
protected:
    RetrievalServiceTest() {
        settings_.embedding_defaults = test_embedding_config();
        settings_.retry = RetryPolicy{3, std::chrono::milliseconds{0}, std::chrono::milliseconds{0}};
    }

    void add_base(const std::string& id,
                  const std::string& tenant,
                  const std::string& model = "",
                  std::optional<std::string> workspace = std::nullopt) {
        KnowledgeBase knowledge_base;
        knowledge_base.id = id;
        knowledge_base.tenant_id = tenant;
        knowledge_base.name = "Base " + id;
        knowledge_base.embedding_model = model;
        knowledge_base.workspace_id = std::move(workspace);
        repository_.add_knowledge_base(knowledge_base);
    }

    void add_document(const std::string& id,
                      const std::string& knowledge_base_id,
                      const std::string& title,
                      DocumentStatus status = DocumentStatus::Completed) {
        repository_.add_document(Document{id, knowledge_base_id, title, status});
    }

    void add_scored_chunk(const std::string& id,
                          const std::string& document_id,
                          int position,
                          const std::string& content,
                          double score) {
        repository_.add_chunk(make_chunk(id, document_id, position, content, unit_with_cosine(score)));
    }

    RetrievalService service() { return RetrievalService{repository_, embedder_, settings_, [](auto) {}}; }

    KnowledgeContextOptions options(const std::string& tenant, const std::string& query) const {
        KnowledgeContextOptions opts;
        opts.tenant_id = tenant;
        opts.query = query;
        return opts;
    }

    MemoryKnowledgeRepository repository_;
    MockEmbedder embedder_;
    RetrievalSettings settings_;
};

}  // namespace

TEST_F(RetrievalServiceTest, TenantWithoutKnowledgeBasesGetsEmptyContext) {
    EXPECT_CALL(embedder_, embed(_, _, _)).Times(0);

    const auto result = service().get_context(options("tenant-empty", "Qual o horário de atendimento?"));
    EXPECT_EQ(result.context, "");
    EXPECT_TRUE(result.results.empty());
    EXPECT_TRUE(result.knowledge_base_ids.empty());
    EXPECT_FALSE(result.has_context);
}

TEST_F(RetrievalServiceTest, RanksChunksAndExcludesBelowThreshold) {
    add_base("kb-1", "tenant-1");
    add_document("doc-1", "kb-1", "FAQ");
    add_scored_chunk("chunk-1", "doc-1", 0, "Atendemos de segunda a sexta.", 0.72);
    add_scored_chunk("chunk-2", "doc-1", 1, "O horário de atendimento é das 9h às 18h.", 0.91);
    add_scored_chunk("chunk-3", "doc-1", 2, "Aceitamos cartão de crédito.", 0.3);

    EXPECT_CALL(embedder_, embed("Qual o horário de atendimento?", _, _)).WillOnce(Return(query_embedding()));

    const auto result = service().get_context(options("tenant-1", "Qual o horário de atendimento?"));
    ASSERT_EQ(result.results.size(), 2u);
    EXPECT_EQ(result.results[0].chunk_id, "chunk-2");
    EXPECT_NEAR(result.results[0].score, 0.91, 1e-5);
    EXPECT_EQ(result.results[1].chunk_id, "chunk-1");
    EXPECT_EQ(result.results[0].knowledge_base_id, "kb-1");
    EXPECT_EQ(result.knowledge_base_ids, (std::vector<std::string>{"kb-1"}));
    EXPECT_TRUE(result.has_context);
    EXPECT_EQ(result.context,
              "### FAQ\nO horário de atendimento é das 9h às 18h.\n"
              "### FAQ\nAtendemos de segunda a sexta.\n");
}

TEST_F(RetrievalServiceTest, ContextStopsAtMaxLength) {
    add_base("kb-1", "tenant-1");
    add_document("doc-1", "kb-1", "Manual");
    add_scored_chunk("chunk-1", "doc-1", 0, std::string(80, 'a'), 0.95);
    add_scored_chunk("chunk-2", "doc-1", 1, std::string(80, 'b'), 0.9);

    EXPECT_CALL(embedder_, embed(_, _, _)).WillOnce(Return(query_embedding()));

    auto opts = options("tenant-1", "conteúdo do manual completo");
    opts.max_context_length = 100;
    opts.format = ContextFormat::Plain;
    opts.include_source = false;
    const auto result = service().get_context(opts);

    EXPECT_EQ(result.context, std::string(80, 'a') + "\n\n");
    EXPECT_LE(result.context.size(), 100u);
    EXPECT_EQ(result.results.size(), 2u);
    EXPECT_TRUE(result.has_context);
}

TEST_F(RetrievalServiceTest, FailingModelDegradesToPartialResults) {
    add_base("kb-a", "tenant-1", "model-a");
    add_base("kb-b", "tenant-1", "model-b");
    add_document("doc-a", "kb-a", "A");
    add_document("doc-b", "kb-b", "B");
    add_scored_chunk("chunk-a", "doc-a", 0, "resposta da base A", 0.9);
    add_scored_chunk("chunk-b", "doc-b", 0, "resposta da base B", 0.95);

    EXPECT_CALL(embedder_, embed(_, Field(&EmbeddingConfig::model, "model-a"), _))
        .WillOnce(Return(query_embedding("model-a")));
    EXPECT_CALL(embedder_, embed(_, Field(&EmbeddingConfig::model, "model-b"), _))
        .Times(3)
        .WillRepeatedly(Throw(ProviderError(429, "rate limited")));

    const auto result = service().get_context(options("tenant-1", "qual a resposta certa?"));
    ASSERT_EQ(result.results.size(), 1u);
    EXPECT_EQ(result.results[0].chunk_id, "chunk-a");
    EXPECT_EQ(result.knowledge_base_ids, (std::vector<std::string>{"kb-a", "kb-b"}));
    EXPECT_EQ(result.failed_knowledge_base_ids, (std::vector<std::string>{"kb-b"}));
    EXPECT_TRUE(result.has_context);
}

TEST_F(RetrievalServiceTest, AbortPolicyPropagatesPerModelFailure) {
    settings_.failure_policy = FanoutFailurePolicy::Abort;
    settings_.retry.max_attempts = 1;
    add_base("kb-a", "tenant-1", "model-a");
    add_base("kb-b", "tenant-1", "model-b");
    add_document("doc-a", "kb-a", "A");
    add_document("doc-b", "kb-b", "B");

    EXPECT_CALL(embedder_, embed(_, Field(&EmbeddingConfig::model, "model-a"), _))
        .WillRepeatedly(Return(query_embedding("model-a")));
    EXPECT_CALL(embedder_, embed(_, Field(&EmbeddingConfig::model, "model-b"), _))
        .WillOnce(Throw(ProviderError(429, "rate limited")));

    EXPECT_THROW(service().get_context(options("tenant-1", "qual a resposta certa?")), ProviderError);
}

TEST_F(RetrievalServiceTest, SharedQueryEmbeddingFailureIsFatal) {
    add_base("kb-1", "tenant-1");
    add_base("kb-2", "tenant-1");
    add_document("doc-1", "kb-1", "Um");
    add_document("doc-2", "kb-2", "Dois");

    EXPECT_CALL(embedder_, embed(_, _, _)).Times(3).WillRepeatedly(Throw(ProviderUnavailable("timeout")));

    EXPECT_THROW(service().get_context(options("tenant-1", "qual a resposta certa?")), ProviderUnavailable);
}

TEST_F(RetrievalServiceTest, QueryIsEmbeddedOncePerModel) {
    add_base("kb-1", "tenant-1");
    add_base("kb-2", "tenant-1");
    add_document("doc-1", "kb-1", "Um");
    add_document("doc-2", "kb-2", "Dois");
    add_scored_chunk("c1", "doc-1", 0, "um", 0.8);
    add_scored_chunk("c2", "doc-2", 0, "dois", 0.85);

    EXPECT_CALL(embedder_, embed(_, _, _)).Times(1).WillOnce(Return(query_embedding()));

    const auto result = service().get_context(options("tenant-1", "qual a resposta certa?"));
    ASSERT_EQ(result.results.size(), 2u);
    EXPECT_EQ(result.results[0].chunk_id, "c2");
    EXPECT_EQ(result.results[1].chunk_id, "c1");
}

TEST_F(RetrievalServiceTest, GlobalTopKLetsStrongBaseDominate) {
    add_base("kb-strong", "tenant-1");
    add_base("kb-weak", "tenant-1");
    add_document("doc-s", "kb-strong", "Forte");
    add_document("doc-w", "kb-weak", "Fraca");
    for (int i = 0; i < 4; ++i) {
        add_scored_chunk("s" + std::to_string(i), "doc-s", i, "forte " + std::to_string(i), 0.95 - i * 0.01);
    }
    add_scored_chunk("w0", "doc-w", 0, "fraca", 0.75);

    EXPECT_CALL(embedder_, embed(_, _, _)).WillOnce(Return(query_embedding()));

    auto opts = options("tenant-1", "qual a resposta certa?");
    opts.top_k = 3;
    const auto result = service().get_context(opts);
    ASSERT_EQ(result.results.size(), 3u);
    for (const auto& item : result.results) {
        EXPECT_EQ(item.knowledge_base_id, "kb-strong");
    }
}

TEST_F(RetrievalServiceTest, ExplicitKnowledgeBaseIdsWin) {
    add_base("kb-1", "tenant-1");
    add_base("kb-2", "tenant-1");
    add_document("doc-1", "kb-1", "Um");
    add_document("doc-2", "kb-2", "Dois");
    add_scored_chunk("c1", "doc-1", 0, "um", 0.9);
    add_scored_chunk("c2", "doc-2", 0, "dois", 0.9);

    EXPECT_CALL(embedder_, embed(_, _, _)).WillOnce(Return(query_embedding()));

    auto opts = options("tenant-1", "qual a resposta certa?");
    opts.knowledge_base_ids = {"kb-2", "kb-2"};
    const auto result = service().get_context(opts);
    EXPECT_EQ(result.knowledge_base_ids, (std::vector<std::string>{"kb-2"}));
    ASSERT_EQ(result.results.size(), 1u);
    EXPECT_EQ(result.results[0].chunk_id, "c2");
}

TEST_F(RetrievalServiceTest, OnlyActiveBasesWithCompletedDocumentsAreResolved) {
    add_base("kb-ok", "tenant-1");
    add_base("kb-pending", "tenant-1");
    add_base("kb-other-tenant", "tenant-2");
    add_base("kb-deleted", "tenant-1");
    add_document("doc-ok", "kb-ok", "Ok");
    add_document("doc-pending", "kb-pending", "Pendente", DocumentStatus::Processing);
    add_document("doc-other", "kb-other-tenant", "Outro");
    add_document("doc-deleted", "kb-deleted", "Removida");
    repository_.remove_knowledge_base("kb-deleted");

    EXPECT_CALL(embedder_, embed(_, _, _)).WillOnce(Return(query_embedding()));

    const auto result = service().get_context(options("tenant-1", "qual a resposta certa?"));
    EXPECT_EQ(result.knowledge_base_ids, (std::vector<std::string>{"kb-ok"}));
    EXPECT_FALSE(result.has_context);
}

TEST_F(RetrievalServiceTest, WorkspaceFilterNarrowsResolution) {
    add_base("kb-sales", "tenant-1", "", "ws-sales");
    add_base("kb-support", "tenant-1", "", "ws-support");
    add_document("doc-1", "kb-sales", "Vendas");
    add_document("doc-2", "kb-support", "Suporte");

    EXPECT_CALL(embedder_, embed(_, _, _)).WillOnce(Return(query_embedding()));

    auto opts = options("tenant-1", "qual a resposta certa?");
    opts.workspace_ids = {"ws-support"};
    const auto result = service().get_context(opts);
    EXPECT_EQ(result.knowledge_base_ids, (std::vector<std::string>{"kb-support"}));
}

TEST_F(RetrievalServiceTest, QueryGateSkipsSmallTalkWhenEnabled) {
    add_base("kb-1", "tenant-1");
    add_document("doc-1", "kb-1", "FAQ");
    EXPECT_CALL(embedder_, embed(_, _, _)).Times(0);

    auto opts = options("tenant-1", "Bom dia!");
    opts.apply_query_gate = true;
    const auto result = service().get_context(opts);
    EXPECT_FALSE(result.has_context);
    EXPECT_EQ(result.knowledge_base_ids, (std::vector<std::string>{"kb-1"}));
}

TEST_F(RetrievalServiceTest, BlankQueryIsAnEmptyResult) {
    EXPECT_CALL(embedder_, embed(_, _, _)).Times(0);

    for (const char* query : {"", "   ", "\n\t"}) {
        const auto empty = service().get_context(options("tenant-without-bases", query));
        EXPECT_EQ(empty.context, "");
        EXPECT_TRUE(empty.results.empty());
        EXPECT_TRUE(empty.knowledge_base_ids.empty());
        EXPECT_FALSE(empty.has_context);
    }

    add_base("kb-1", "tenant-1");
    add_document("doc-1", "kb-1", "FAQ");
    add_scored_chunk("c1", "doc-1", 0, "conteúdo", 0.95);
    const auto result = service().get_context(options("tenant-1", "  "));
    EXPECT_EQ(result.knowledge_base_ids, (std::vector<std::string>{"kb-1"}));
    EXPECT_TRUE(result.results.empty());
    EXPECT_FALSE(result.has_context);
}

TEST_F(RetrievalServiceTest, NothingAboveThresholdIsNotAnError) {
    add_base("kb-1", "tenant-1");
    add_document("doc-1", "kb-1", "FAQ");
    add_scored_chunk("c1", "doc-1", 0, "irrelevante", 0.2);
    EXPECT_CALL(embedder_, embed(_, _, _)).WillOnce(Return(query_embedding()));

    const auto result = service().get_context(options("tenant-1", "qual a resposta certa?"));
    EXPECT_TRUE(result.results.empty());
    EXPECT_EQ(result.context, "");
    EXPECT_FALSE(result.has_context);
}

TEST_F(RetrievalServiceTest, MissingCredentialIsFatal) {
    settings_.embedding_defaults.api_key.clear();
    add_base("kb-1", "tenant-1");
    add_document("doc-1", "kb-1", "FAQ");
    EXPECT_CALL(embedder_, embed(_, _, _)).Times(0);

    EXPECT_THROW(service().get_context(options("tenant-1", "qual a resposta certa?")), ConfigurationError);
}

TEST_F(RetrievalServiceTest, DimensionMismatchIsNeverDegraded) {
    add_base("kb-1", "tenant-1");
    add_document("doc-1", "kb-1", "FAQ");
    repository_.add_chunk(make_chunk("c1", "doc-1", 0, "três dimensões", {0.1f, 0.2f, 0.3f}));
    EXPECT_CALL(embedder_, embed(_, _, _)).WillOnce(Return(query_embedding()));

    EXPECT_THROW(service().get_context(options("tenant-1", "qual a resposta certa?")), DimensionMismatchError);
}

TEST_F(RetrievalServiceTest, RejectsInvalidOptions) {
    auto no_tenant = options("", "qual a resposta certa?");
    EXPECT_THROW(service().get_context(no_tenant), InvalidOptionError);

    auto long_query = options("tenant-1", std::string(1001, 'q'));
    EXPECT_THROW(service().get_context(long_query), InvalidOptionError);

    auto bad_top_k = options("tenant-1", "qual a resposta certa?");
    bad_top_k.top_k = 50;
    EXPECT_THROW(service().get_context(bad_top_k), InvalidOptionError);

    auto bad_length = options("tenant-1", "qual a resposta certa?");
    bad_length.max_context_length = 50;
    EXPECT_THROW(service().get_context(bad_length), InvalidOptionError);
}

TEST_F(RetrievalServiceTest, CancelledRequestStopsBeforeWork) {
    add_base("kb-1", "tenant-1");
    add_document("doc-1", "kb-1", "FAQ");
    EXPECT_CALL(embedder_, embed(_, _, _)).Times(0);

    CancellationToken token;
    token.cancel();
    EXPECT_THROW(service().get_context(options("tenant-1", "qual a resposta certa?"), &token), OperationCancelled);
}

TEST_F(RetrievalServiceTest, PassesTimeoutToEmbedder) {
    add_base("kb-1", "tenant-1");
    add_document("doc-1", "kb-1", "FAQ");
    EXPECT_CALL(embedder_, embed(_, _, Field(&CallContext::timeout, std::chrono::milliseconds{250})))
        .WillOnce(Return(query_embedding()));

    auto opts = options("tenant-1", "qual a resposta certa?");
    opts.timeout = std::chrono::milliseconds{250};
    service().get_context(opts);
}

TEST_F(RetrievalServiceTest, ParallelFanoutMatchesSequentialOrder) {
    settings_.parallel_fanout = true;
    for (int base = 0; base < 4; ++base) {
        const std::string kb = "kb-" + std::to_string(base);
        const std::string doc = "doc-" + std::to_string(base);
        add_base(kb, "tenant-1");
        add_document(doc, kb, "Doc " + std::to_string(base));
        add_scored_chunk("c" + std::to_string(base), doc, 0, "texto " + std::to_string(base), 0.8);
    }
    EXPECT_CALL(embedder_, embed(_, _, _)).WillOnce(Return(query_embedding()));

    auto opts = options("tenant-1", "qual a resposta certa?");
    opts.top_k = 10;
    const auto result = service().get_context(opts);
    ASSERT_EQ(result.results.size(), 4u);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(result.results[static_cast<std::size_t>(i)].chunk_id, "c" + std::to_string(i));
    }
}

namespace {

class FailingRepository : public MemoryKnowledgeRepository {
public:
    std::vector<Chunk> get_candidate_chunks(const std::string& knowledge_base_id,
                                            const std::vector<float>* query_vector,
                                            std::optional<std::size_t> limit) override {
        if (knowledge_base_id == "kb-broken") {
            throw std::runtime_error("connection reset");
        }
        return MemoryKnowledgeRepository::get_candidate_chunks(knowledge_base_id, query_vector, limit);
    }
};

}  // namespace

TEST(RetrievalServiceStoreFailureTest, CandidateFailureDegradesThatBaseOnly) {
    FailingRepository repository;
    KnowledgeBase broken;
    broken.id = "kb-broken";
    broken.tenant_id = "tenant-1";
    KnowledgeBase healthy;
    healthy.id = "kb-healthy";
    healthy.tenant_id = "tenant-1";
    repository.add_knowledge_base(broken);
    repository.add_knowledge_base(healthy);
    repository.add_document(Document{"doc-b", "kb-broken", "B", DocumentStatus::Completed});
    repository.add_document(Document{"doc-h", "kb-healthy", "H", DocumentStatus::Completed});
    repository.add_chunk(make_chunk("c-h", "doc-h", 0, "saudável", unit_with_cosine(0.9)));

    MockEmbedder embedder;
    EXPECT_CALL(embedder, embed(_, _, _)).WillOnce(Return(query_embedding()));

    RetrievalSettings settings;
    settings.embedding_defaults = test_embedding_config();
    const RetrievalService service{repository, embedder, settings, [](auto) {}};

    KnowledgeContextOptions opts;
    opts.tenant_id = "tenant-1";
    opts.query = "qual a resposta certa?";
    const auto result = service.get_context(opts);

    ASSERT_EQ(result.results.size(), 1u);
    EXPECT_EQ(result.results[0].chunk_id, "c-h");
    EXPECT_EQ(result.failed_knowledge_base_ids, (std::vector<std::string>{"kb-broken"}));
}
