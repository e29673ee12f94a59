#include <kbase/chunking/chunker.h>
#include <kbase/core/uuid.h>
#include <kbase/knowledge/knowledge_base_manager.h>
#include <kbase/search/similarity_engine.h>
#include <kbase/vector/dim_resolver.h>

#include <spdlog/spdlog.h>

#include <chrono>

namespace kbase::knowledge {

namespace {

constexpr size_t kFallbackLimit = 5;

constexpr const char* kModelMismatchHint =
    "embedding model mismatch: recreate the knowledge base to use a different model";

TimePoint now() {
    return std::chrono::system_clock::now();
}

} // namespace

KnowledgeBaseManager::KnowledgeBaseManager(
    std::shared_ptr<storage::IKnowledgeBaseRepository> repository,
    std::shared_ptr<storage::IVectorStore> store,
    std::shared_ptr<vector::EmbeddingProvider> embeddings,
    std::shared_ptr<vector::IModelCatalog> models, std::shared_ptr<KnowledgeEventListener> events,
    ManagerOptions options, std::shared_ptr<search::EnhancedRetrievalPipeline> pipeline)
    : repository_(std::move(repository)), store_(std::move(store)),
      embeddings_(std::move(embeddings)), models_(std::move(models)),
      events_(events ? std::move(events) : std::make_shared<KnowledgeEventListener>()),
      options_(std::move(options)),
      pipeline_(pipeline ? std::move(pipeline)
                         : std::make_shared<search::EnhancedRetrievalPipeline>()) {}

// =============================================================================
// Helpers
// =============================================================================

Result<KnowledgeBase> KnowledgeBaseManager::loadBase(const std::string& id) {
    auto found = repository_->get(id);
    if (!found) {
        return found.error();
    }
    if (!found.value()) {
        return Error{ErrorCode::NotFound, "knowledge base not found: " + id};
    }
    return std::move(*std::move(found).value());
}

std::optional<vector::ModelDescriptor>
KnowledgeBaseManager::resolveModel(const std::string& modelId) const {
    if (!models_) {
        return std::nullopt;
    }
    return models_->resolve(modelId);
}

Result<Embedding> KnowledgeBaseManager::embedFor(const KnowledgeBase& base,
                                                 const std::string& text) {
    auto model = resolveModel(base.model);
    if (!model) {
        return Error{ErrorCode::EmbeddingFailure,
                     "embedding model '" + base.model + "' is not configured"};
    }
    if (!embeddings_) {
        return Error{ErrorCode::EmbeddingFailure, "no embedding provider configured"};
    }
    return embeddings_->embed(text, *model);
}

Embedding KnowledgeBaseManager::fallbackVector(size_t dimensions) {
    if (options_.fallbackVector) {
        return options_.fallbackVector(dimensions);
    }
    std::lock_guard<std::mutex> lock(rngMutex_);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    Embedding vec(dimensions);
    for (auto& v : vec) {
        v = dist(rng_);
    }
    return vec;
}

Result<void> KnowledgeBaseManager::validateSettings(const KnowledgeBase& base) const {
    if (base.name.empty()) {
        return Error{ErrorCode::InvalidArgument, "knowledge base name must not be empty"};
    }
    if (base.model.empty()) {
        return Error{ErrorCode::InvalidArgument, "knowledge base needs an embedding model"};
    }
    if (base.dimensions == 0) {
        return Error{ErrorCode::InvalidConfig, "vector dimensions must be greater than zero"};
    }
    if (base.documentCount == 0) {
        return Error{ErrorCode::InvalidConfig, "document count must be greater than zero"};
    }
    if (base.threshold < -1.0 || base.threshold > 1.0) {
        return Error{ErrorCode::InvalidConfig, "similarity threshold must lie in [-1, 1]"};
    }
    return chunking::validate(chunking::ChunkingConfig{base.chunkSize, base.chunkOverlap});
}

// =============================================================================
// Knowledge bases
// =============================================================================

Result<KnowledgeBase> KnowledgeBaseManager::createKnowledgeBase(const KnowledgeBaseDraft& draft) {
    const auto& defaults = options_.defaults;

    KnowledgeBase base;
    base.id = core::generateUUID();
    base.name = draft.name;
    base.description = draft.description;
    base.model = draft.model;
    base.documentCount = draft.documentCount.value_or(defaults.documentCount);
    base.chunkSize = draft.chunkSize.value_or(defaults.chunkSize);
    base.chunkOverlap = draft.chunkOverlap.value_or(defaults.chunkOverlap);
    base.threshold = draft.threshold.value_or(defaults.threshold);

    if (draft.dimensions) {
        base.dimensions = *draft.dimensions;
    } else if (!base.model.empty()) {
        auto model = resolveModel(base.model);
        base.dimensions = (model && embeddings_) ? embeddings_->dimensionsOf(*model)
                                                 : vector::dimres::resolve_dim(base.model, {});
    }

    if (auto valid = validateSettings(base); !valid) {
        return valid.error();
    }

    base.createdAt = now();
    base.updatedAt = base.createdAt;

    if (auto r = repository_->put(base); !r) {
        return r.error();
    }
    events_->onKnowledgeBaseCreated(base);
    return base;
}

Result<KnowledgeBase> KnowledgeBaseManager::getKnowledgeBase(const std::string& id) {
    return loadBase(id);
}

Result<std::vector<KnowledgeBase>> KnowledgeBaseManager::listKnowledgeBases() {
    return repository_->list();
}

Result<KnowledgeBase> KnowledgeBaseManager::updateKnowledgeBase(const std::string& id,
                                                                const KnowledgeBasePatch& patch) {
    auto loaded = loadBase(id);
    if (!loaded) {
        return loaded.error();
    }
    KnowledgeBase base = std::move(loaded).value();

    const bool modelChanged = patch.model && *patch.model != base.model;
    const bool dimsChanged = patch.dimensions && *patch.dimensions != base.dimensions;
    if (modelChanged || dimsChanged) {
        auto chunks = store_->listByKnowledgeBase(id);
        if (!chunks) {
            return chunks.error();
        }
        if (!chunks.value().empty()) {
            return Error{ErrorCode::DimensionMismatch,
                         "knowledge base '" + base.name + "' already holds " +
                             std::to_string(chunks.value().size()) + " chunks; " +
                             kModelMismatchHint};
        }
    }

    if (patch.name)
        base.name = *patch.name;
    if (patch.description)
        base.description = *patch.description;
    if (patch.model)
        base.model = *patch.model;
    if (patch.dimensions) {
        base.dimensions = *patch.dimensions;
    } else if (modelChanged) {
        auto model = resolveModel(base.model);
        base.dimensions = (model && embeddings_) ? embeddings_->dimensionsOf(*model)
                                                 : vector::dimres::resolve_dim(base.model, {});
    }
    if (patch.documentCount)
        base.documentCount = *patch.documentCount;
    if (patch.chunkSize)
        base.chunkSize = *patch.chunkSize;
    if (patch.chunkOverlap)
        base.chunkOverlap = *patch.chunkOverlap;
    if (patch.threshold)
        base.threshold = *patch.threshold;

    if (auto valid = validateSettings(base); !valid) {
        return valid.error();
    }

    base.updatedAt = std::max(now(), base.createdAt);
    if (auto r = repository_->put(base); !r) {
        return r.error();
    }
    events_->onKnowledgeBaseUpdated(base);
    return base;
}

Result<size_t> KnowledgeBaseManager::deleteKnowledgeBase(const std::string& id) {
    auto loaded = loadBase(id);
    if (!loaded) {
        return loaded.error();
    }

    auto removed = store_->deleteByKnowledgeBase(id);
    if (!removed) {
        return removed.error();
    }
    if (auto r = repository_->remove(id); !r) {
        return r.error();
    }
    events_->onKnowledgeBaseDeleted(id, removed.value());
    return removed.value();
}

// =============================================================================
// Documents
// =============================================================================

Result<std::vector<ChunkRecord>> KnowledgeBaseManager::addDocument(
    const std::string& knowledgeBaseId, const std::string& content, const SourceMetadata& source) {
    auto loaded = loadBase(knowledgeBaseId);
    if (!loaded) {
        return loaded.error();
    }
    const KnowledgeBase base = std::move(loaded).value();

    auto chunks =
        chunking::chunkText(content, chunking::ChunkingConfig{base.chunkSize, base.chunkOverlap});
    if (!chunks) {
        return chunks.error();
    }

    const size_t total = chunks.value().size();
    std::vector<ChunkRecord> created;
    created.reserve(total);
    size_t degraded = 0;

    for (const auto& chunk : chunks.value()) {
        ChunkRecord record;
        record.id = core::generateUUID();
        record.knowledgeBaseId = base.id;
        record.content = chunk.content;
        record.metadata.source = source.source;
        record.metadata.fileName = source.fileName;
        record.metadata.fileId = source.fileId;
        record.metadata.chunkIndex = chunk.index;
        record.metadata.createdAt = now();

        auto embedded = embedFor(base, chunk.content);
        if (embedded) {
            if (embedded.value().size() != base.dimensions) {
                return Error{ErrorCode::DimensionMismatch,
                             "model '" + base.model + "' produced " +
                                 std::to_string(embedded.value().size()) +
                                 " dimensions but knowledge base '" + base.name + "' expects " +
                                 std::to_string(base.dimensions) + "; " + kModelMismatchHint};
            }
            record.vector = std::move(embedded).value();
        } else {
            record.vector = fallbackVector(base.dimensions);
            record.metadata.degraded = true;
            ++degraded;
            events_->onEmbeddingDegraded(
                EmbeddingDegradedEvent{base.id, record.id, chunk.index, embedded.error().message});
        }

        if (auto r = store_->put(record); !r) {
            return r.error();
        }
        events_->onChunkProcessed(ChunkProcessedEvent{record.id, base.id, chunk.index + 1, total});
        created.push_back(std::move(record));
    }

    if (degraded > 0) {
        spdlog::warn("{} of {} chunks in knowledge base '{}' use fallback vectors and will rank "
                     "poorly until re-embedded",
                     degraded, total, base.name);
    }
    events_->onDocumentsAdded(base.id, created.size());
    return created;
}

Result<std::vector<ChunkRecord>>
KnowledgeBaseManager::listDocuments(const std::string& knowledgeBaseId) {
    if (auto loaded = loadBase(knowledgeBaseId); !loaded) {
        return loaded.error();
    }
    return store_->listByKnowledgeBase(knowledgeBaseId);
}

Result<bool> KnowledgeBaseManager::deleteDocument(const std::string& chunkId) {
    auto found = store_->get(chunkId);
    if (!found) {
        return found.error();
    }
    if (!found.value()) {
        spdlog::warn("Chunk {} does not exist; nothing deleted", chunkId);
        return false;
    }
    const std::string baseId = found.value()->knowledgeBaseId;

    auto removed = store_->deleteById(chunkId);
    if (!removed) {
        return removed.error();
    }
    if (removed.value()) {
        events_->onDocumentDeleted(chunkId, baseId);
    }
    return removed.value();
}

Result<std::vector<ChunkRecord>>
KnowledgeBaseManager::listDegradedChunks(const std::string& knowledgeBaseId) {
    auto all = listDocuments(knowledgeBaseId);
    if (!all) {
        return all.error();
    }
    std::vector<ChunkRecord> out;
    for (auto& record : all.value()) {
        if (record.metadata.degraded) {
            out.push_back(std::move(record));
        }
    }
    return out;
}

Result<size_t> KnowledgeBaseManager::reembedDegradedChunks(const std::string& knowledgeBaseId) {
    auto loaded = loadBase(knowledgeBaseId);
    if (!loaded) {
        return loaded.error();
    }
    const KnowledgeBase base = std::move(loaded).value();

    auto degraded = listDegradedChunks(knowledgeBaseId);
    if (!degraded) {
        return degraded.error();
    }

    size_t repaired = 0;
    for (auto& record : degraded.value()) {
        auto embedded = embedFor(base, record.content);
        if (!embedded) {
            spdlog::debug("Chunk {} still cannot be embedded: {}", record.id,
                          embedded.error().message);
            continue;
        }
        if (embedded.value().size() != base.dimensions) {
            return Error{ErrorCode::DimensionMismatch,
                         "model '" + base.model + "' produced " +
                             std::to_string(embedded.value().size()) + " dimensions but '" +
                             base.name + "' expects " + std::to_string(base.dimensions) + "; " +
                             kModelMismatchHint};
        }
        // Same id, so the store replaces the record where it stands
        ChunkRecord replacement = record;
        replacement.vector = std::move(embedded).value();
        replacement.metadata.degraded = false;
        if (auto r = store_->put(replacement); !r) {
            return r.error();
        }
        ++repaired;
    }

    spdlog::info("Re-embedded {} of {} degraded chunks in knowledge base '{}'", repaired,
                 degraded.value().size(), base.name);
    return repaired;
}

// =============================================================================
// Search
// =============================================================================

Result<std::vector<SearchResult>> KnowledgeBaseManager::search(const SearchRequest& request) {
    std::optional<search::RetrievalConfig> enhanced;
    if (request.useEnhanced.value_or(true)) {
        enhanced = options_.retrieval;
    }
    return runSearch(request.knowledgeBaseId, request.query, request.threshold, request.limit,
                     enhanced);
}

Result<std::vector<SearchResult>>
KnowledgeBaseManager::enhancedSearch(const EnhancedSearchRequest& request) {
    return runSearch(request.knowledgeBaseId, request.query, request.threshold, request.limit,
                     request.config.value_or(options_.retrieval));
}

Result<std::vector<SearchResult>>
KnowledgeBaseManager::runSearch(const std::string& knowledgeBaseId, const std::string& query,
                                std::optional<double> threshold, std::optional<size_t> limit,
                                std::optional<search::RetrievalConfig> enhanced) {
    auto loaded = loadBase(knowledgeBaseId);
    if (!loaded) {
        return loaded.error();
    }
    const KnowledgeBase base = std::move(loaded).value();

    const double effectiveThreshold = threshold.value_or(base.threshold);
    size_t effectiveLimit = limit.value_or(0);
    if (effectiveLimit == 0)
        effectiveLimit = base.documentCount > 0 ? base.documentCount : kFallbackLimit;

    Embedding queryVector;
    bool queryDegraded = false;
    if (auto embedded = embedFor(base, query); embedded) {
        queryVector = std::move(embedded).value();
    } else {
        queryDegraded = true;
        spdlog::warn("Query embedding failed for knowledge base '{}', searching with a fallback "
                     "vector: {}",
                     base.name, embedded.error().message);
        queryVector = fallbackVector(base.dimensions);
    }

    auto chunks = store_->listByKnowledgeBase(base.id);
    if (!chunks) {
        return chunks.error();
    }
    if (chunks.value().empty()) {
        return std::vector<SearchResult>{};
    }
    if (auto dims = search::SimilarityEngine::verifyDimensions(queryVector.size(), chunks.value());
        !dims) {
        return dims.error();
    }

    if (enhanced) {
        auto model = resolveModel(base.model);
        search::RetrievalRequest request;
        request.query = query;
        request.scope = base.id;
        request.queryVector = queryVector;
        request.candidates = &chunks.value();
        request.threshold = effectiveThreshold;
        request.limit = effectiveLimit;
        // A fallback query vector leaves expansion with the original query only
        if (model && embeddings_ && !queryDegraded) {
            request.embedVariant = [this, descriptor = *model](const std::string& text) {
                return embeddings_->embed(text, descriptor);
            };
        }

        auto results = pipeline_->run(request, *enhanced);
        if (results) {
            return results;
        }
        if (results.error().code == ErrorCode::DimensionMismatch) {
            return results.error();
        }
        spdlog::warn("Enhanced retrieval failed for '{}', using plain similarity search: {}",
                     base.name, results.error().message);
    }

    return search::SimilarityEngine::search(queryVector, chunks.value(), effectiveThreshold,
                                            effectiveLimit);
}

} // namespace kbase::knowledge
