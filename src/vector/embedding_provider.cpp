#include <hybridstore/vector/embedding_provider.h>

#include <spdlog/spdlog.h>
#include <cmath>
#include <map>
#include <mutex>
#include <random>

namespace hybridstore::vector {

// ============================================================================
// Mock Embedding Provider Implementation
// ============================================================================

MockEmbeddingProvider::MockEmbeddingProvider(size_t dimensions) : dimensions_(dimensions) {
    spdlog::debug("MockEmbeddingProvider created with dimension {}", dimensions);
}

Embedding MockEmbeddingProvider::embedText(const std::string& text) const {
    std::hash<std::string> hasher;
    size_t seed = hasher(text);
    std::mt19937 gen(static_cast<std::mt19937::result_type>(seed));
    std::normal_distribution<float> dist(0.0f, 1.0f);

    Embedding embedding(dimensions_);
    for (size_t i = 0; i < dimensions_; ++i) {
        embedding[i] = dist(gen);
    }

    // Normalize to unit length
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }

    return embedding;
}

Result<std::vector<Embedding>> MockEmbeddingProvider::embed(const std::vector<std::string>& texts) {
    std::vector<Embedding> embeddings;
    embeddings.reserve(texts.size());
    for (const auto& text : texts) {
        embeddings.push_back(embedText(text));
    }
    return embeddings;
}

// ============================================================================
// Provider Registry Implementation
// ============================================================================

namespace {

struct ProviderRegistry {
    std::mutex mutex;
    std::map<std::string, EmbeddingProviderFactory> factories;

    static ProviderRegistry& instance() {
        static ProviderRegistry registry;
        return registry;
    }

private:
    ProviderRegistry() {
        factories["mock"] = [](size_t dimensions) -> std::unique_ptr<IEmbeddingProvider> {
            return std::make_unique<MockEmbeddingProvider>(dimensions > 0 ? dimensions : 384);
        };
    }
};

} // namespace

void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory) {
    auto& registry = ProviderRegistry::instance();
    std::lock_guard<std::mutex> lock(registry.mutex);
    registry.factories[name] = std::move(factory);
    spdlog::debug("Registered embedding provider '{}'", name);
}

std::vector<std::string> getRegisteredEmbeddingProviders() {
    auto& registry = ProviderRegistry::instance();
    std::lock_guard<std::mutex> lock(registry.mutex);
    std::vector<std::string> names;
    names.reserve(registry.factories.size());
    for (const auto& [name, _] : registry.factories) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            size_t dimensions) {
    EmbeddingProviderFactory factory;
    {
        auto& registry = ProviderRegistry::instance();
        std::lock_guard<std::mutex> lock(registry.mutex);
        auto it = registry.factories.find(name);
        if (it == registry.factories.end()) {
            spdlog::warn("Embedding provider '{}' not found", name);
            return nullptr;
        }
        factory = it->second;
    }

    auto provider = factory(dimensions);
    if (!provider) {
        spdlog::error("Embedding provider factory '{}' returned no provider", name);
        return nullptr;
    }
    spdlog::info("Using {} embedding provider ({} dimensions)", provider->getProviderName(),
                 provider->getDimensions());
    return provider;
}

} // namespace hybridstore::vector
