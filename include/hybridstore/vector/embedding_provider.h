#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <hybridstore/core/types.h>

namespace hybridstore::vector {

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers.
 * The store consumes vectors through this contract and never depends on a model directly.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Embed a batch of texts
     * @param texts Input texts
     * @return One vector per input text, in input order, each of getDimensions() length;
     *         EmbeddingError when the provider is unreachable or malformed
     */
    virtual Result<std::vector<Embedding>> embed(const std::vector<std::string>& texts) = 0;

    /**
     * Dimension of every vector this provider produces
     */
    virtual size_t getDimensions() const = 0;

    /**
     * Provider name (e.g. "mock"); also used to namespace embedding cache keys
     */
    virtual std::string getProviderName() const = 0;

    /**
     * Check if the provider is available and functional
     */
    virtual bool isAvailable() const { return true; }
};

// ============================================================================
// Mock Embedding Provider
// ============================================================================

/**
 * Deterministic provider for tests and offline use.
 * Each text seeds a normal distribution through its hash; vectors are unit length.
 */
class MockEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit MockEmbeddingProvider(size_t dimensions = 384);

    Result<std::vector<Embedding>> embed(const std::vector<std::string>& texts) override;
    size_t getDimensions() const override { return dimensions_; }
    std::string getProviderName() const override { return "mock"; }

    Embedding embedText(const std::string& text) const;

private:
    size_t dimensions_;
};

// ============================================================================
// Provider Registry
// ============================================================================

using EmbeddingProviderFactory =
    std::function<std::unique_ptr<IEmbeddingProvider>(size_t dimensions)>;

/**
 * Register a provider factory under @p name, replacing any previous registration
 */
void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory);

/**
 * Names of all registered providers; the built-in "mock" provider is always present
 */
std::vector<std::string> getRegisteredEmbeddingProviders();

/**
 * Create a provider by registry name
 * @param dimensions Requested vector dimension, 0 for the provider default
 * @return nullptr when no provider is registered under @p name
 */
std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            size_t dimensions = 0);

} // namespace hybridstore::vector
