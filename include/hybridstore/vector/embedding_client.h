#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <hybridstore/core/types.h>
#include <hybridstore/vector/embedding_cache.h>
#include <hybridstore/vector/embedding_provider.h>

namespace hybridstore::vector {

struct EmbeddingClientConfig {
    size_t dimensions = 0;                     ///< Expected vector length
    std::chrono::milliseconds timeout{30000}; ///< Deadline for one provider call
};

/**
 * @brief Guards every provider call made by the store
 *
 * Serves cached texts first, then issues exactly one provider call for the remaining texts.
 * The call runs on its own thread and is abandoned with Timeout when it exceeds the deadline;
 * the deadline covers the provider call only, and an abandoned call holds no shared worker.
 * The returned vectors are validated for count and length before anything is cached.
 */
class EmbeddingClient {
public:
    EmbeddingClient(std::shared_ptr<IEmbeddingProvider> provider,
                    std::shared_ptr<IEmbeddingCache> cache, EmbeddingClientConfig config);
    ~EmbeddingClient();

    EmbeddingClient(const EmbeddingClient&) = delete;
    EmbeddingClient& operator=(const EmbeddingClient&) = delete;

    /**
     * @brief Embed texts in input order
     * @return ValidationError without a provider, Timeout past the deadline, EmbeddingError for a
     *         failed or malformed provider response
     */
    Result<std::vector<Embedding>> embed(const std::vector<std::string>& texts);

    Result<Embedding> embedOne(const std::string& text);

    [[nodiscard]] bool hasProvider() const;
    [[nodiscard]] std::string providerName() const;
    [[nodiscard]] size_t dimensions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace hybridstore::vector
