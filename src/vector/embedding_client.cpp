#include <hybridstore/vector/embedding_client.h>

#include <spdlog/spdlog.h>
#include <cmath>
#include <future>
#include <system_error>
#include <thread>

namespace hybridstore::vector {

namespace {

std::string describeCall(size_t count, const std::string& provider) {
    return "embed(" + std::to_string(count) + " text" + (count == 1 ? "" : "s") +
           ") via provider '" + provider + "'";
}

} // namespace

class EmbeddingClient::Impl {
public:
    Impl(std::shared_ptr<IEmbeddingProvider> provider, std::shared_ptr<IEmbeddingCache> cache,
         EmbeddingClientConfig config)
        : provider_(std::move(provider)), cache_(std::move(cache)), config_(config) {
        if (provider_) {
            providerName_ = provider_->getProviderName();
            if (config_.dimensions == 0) {
                config_.dimensions = provider_->getDimensions();
            }
        }
    }

    Result<std::vector<Embedding>> embed(const std::vector<std::string>& texts) {
        if (!provider_) {
            return Error{ErrorCode::ValidationError,
                         "No embedding provider configured; supply explicit embeddings"};
        }
        if (texts.empty()) {
            return std::vector<Embedding>{};
        }

        std::vector<Embedding> out(texts.size());
        std::vector<size_t> missIndex;
        std::vector<std::string> missTexts;

        for (size_t i = 0; i < texts.size(); ++i) {
            if (cache_) {
                auto hit = cache_->get(makeEmbeddingCacheKey(providerName_, texts[i]));
                if (hit && hit->size() == config_.dimensions) {
                    out[i] = std::move(*hit);
                    continue;
                }
            }
            missIndex.push_back(i);
            missTexts.push_back(texts[i]);
        }

        if (missTexts.empty()) {
            spdlog::debug("EmbeddingClient: all {} texts served from cache", texts.size());
            return out;
        }

        const auto context = describeCall(missTexts.size(), providerName_);
        auto result = callProvider(missTexts, context);
        if (!result) {
            return result.error();
        }
        auto vectors = std::move(result).value();

        if (vectors.size() != missTexts.size()) {
            spdlog::error("{} returned {} vectors", context, vectors.size());
            return Error{ErrorCode::EmbeddingError,
                         context + " returned " + std::to_string(vectors.size()) + " vectors"};
        }
        for (size_t j = 0; j < vectors.size(); ++j) {
            if (vectors[j].size() != config_.dimensions) {
                spdlog::error("{} returned a vector of length {} (expected {})", context,
                              vectors[j].size(), config_.dimensions);
                return Error{ErrorCode::EmbeddingError,
                             context + " returned a vector of length " +
                                 std::to_string(vectors[j].size()) + ", expected " +
                                 std::to_string(config_.dimensions)};
            }
            for (float v : vectors[j]) {
                if (!std::isfinite(v)) {
                    return Error{ErrorCode::EmbeddingError,
                                 context + " returned a non-finite vector component"};
                }
            }
        }

        for (size_t j = 0; j < vectors.size(); ++j) {
            if (cache_) {
                cache_->set(makeEmbeddingCacheKey(providerName_, missTexts[j]), vectors[j]);
            }
            out[missIndex[j]] = std::move(vectors[j]);
        }

        spdlog::debug("{} succeeded ({} cached)", context, texts.size() - missTexts.size());
        return out;
    }

    bool hasProvider() const { return provider_ != nullptr; }
    const std::string& providerName() const { return providerName_; }
    size_t dimensions() const { return config_.dimensions; }

private:
    Result<std::vector<Embedding>> callProvider(const std::vector<std::string>& texts,
                                                const std::string& context) {
        auto promise = std::make_shared<std::promise<Result<std::vector<Embedding>>>>();
        auto fut = promise->get_future();

        // Each call gets its own thread so a hung call never delays the next one. The worker
        // owns the provider and the promise, so a detached call may outlive this client.
        std::thread worker;
        try {
            worker = std::thread([provider = provider_, texts, promise]() {
                try {
                    promise->set_value(provider->embed(texts));
                } catch (const std::exception& e) {
                    promise->set_value(Error{ErrorCode::EmbeddingError,
                                             std::string("provider threw: ") + e.what()});
                } catch (...) {
                    promise->set_value(
                        Error{ErrorCode::EmbeddingError, "provider threw an unknown exception"});
                }
            });
        } catch (const std::system_error& e) {
            spdlog::error("{}: failed to start provider thread: {}", context, e.what());
            return Error{ErrorCode::InternalError,
                         context + ": failed to start provider thread: " + e.what()};
        }

        if (fut.wait_for(config_.timeout) != std::future_status::ready) {
            worker.detach();
            spdlog::warn("{} timed out after {} ms", context, config_.timeout.count());
            return Error{ErrorCode::Timeout, context + " timed out after " +
                                                 std::to_string(config_.timeout.count()) + " ms"};
        }
        worker.join();

        auto result = fut.get();
        if (!result) {
            const auto& err = result.error();
            spdlog::error("{} failed: {}", context, err.message);
            auto code = err.code == ErrorCode::Timeout ? ErrorCode::Timeout
                                                       : ErrorCode::EmbeddingError;
            return Error{code, context + " failed: " + err.message};
        }
        return result;
    }

    std::shared_ptr<IEmbeddingProvider> provider_;
    std::shared_ptr<IEmbeddingCache> cache_;
    EmbeddingClientConfig config_;
    std::string providerName_;
};

EmbeddingClient::EmbeddingClient(std::shared_ptr<IEmbeddingProvider> provider,
                                 std::shared_ptr<IEmbeddingCache> cache,
                                 EmbeddingClientConfig config)
    : pImpl(std::make_unique<Impl>(std::move(provider), std::move(cache), config)) {}

EmbeddingClient::~EmbeddingClient() = default;

Result<std::vector<Embedding>> EmbeddingClient::embed(const std::vector<std::string>& texts) {
    return pImpl->embed(texts);
}

Result<Embedding> EmbeddingClient::embedOne(const std::string& text) {
    auto result = pImpl->embed(std::vector<std::string>{text});
    if (!result) {
        return result.error();
    }
    return std::move(std::move(result).value().front());
}

bool EmbeddingClient::hasProvider() const {
    return pImpl->hasProvider();
}

std::string EmbeddingClient::providerName() const {
    return pImpl->providerName();
}

size_t EmbeddingClient::dimensions() const {
    return pImpl->dimensions();
}

} // namespace hybridstore::vector
