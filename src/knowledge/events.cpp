#include <kbase/knowledge/events.h>

#include <spdlog/spdlog.h>

namespace kbase::knowledge {

void LoggingEventListener::onKnowledgeBaseCreated(const KnowledgeBase& base) {
    spdlog::info("Knowledge base created: {} ({}), model={}, dim={}", base.name, base.id,
                 base.model, base.dimensions);
}

void LoggingEventListener::onKnowledgeBaseUpdated(const KnowledgeBase& base) {
    spdlog::info("Knowledge base updated: {} ({})", base.name, base.id);
}

void LoggingEventListener::onKnowledgeBaseDeleted(const std::string& baseId, size_t removed) {
    spdlog::info("Knowledge base deleted: {} ({} chunks removed)", baseId, removed);
}

void LoggingEventListener::onChunkProcessed(const ChunkProcessedEvent& event) {
    spdlog::debug("Chunk {}/{} processed for {}: {}", event.current, event.total,
                  event.knowledgeBaseId, event.chunkId);
}

void LoggingEventListener::onDocumentsAdded(const std::string& baseId, size_t count) {
    spdlog::info("Added {} chunks to knowledge base {}", count, baseId);
}

void LoggingEventListener::onDocumentDeleted(const std::string& chunkId,
                                             const std::string& baseId) {
    spdlog::info("Deleted chunk {} from knowledge base {}", chunkId, baseId);
}

void LoggingEventListener::onEmbeddingDegraded(const EmbeddingDegradedEvent& event) {
    spdlog::warn("Chunk {} of knowledge base {} stored with a fallback vector: {}",
                 event.chunkIndex, event.knowledgeBaseId, event.reason);
}

} // namespace kbase::knowledge
