// Shared fixtures for hybridstore unit tests
#pragma once

#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <hybridstore/storage/sqlite_backend.h>
#include <hybridstore/vector/embedding_provider.h>

namespace hybridstore::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "hybridstore_test_") {
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

// Sets or clears an environment variable, restoring the previous value on scope exit
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            previous_ = old;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (previous_) {
            ::setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

/**
 * Scriptable provider: fixed vectors per text, injected failures, delays and malformed output.
 * Texts without a fixed vector fall back to the deterministic mock embedding.
 */
class FakeEmbeddingProvider : public vector::IEmbeddingProvider {
public:
    explicit FakeEmbeddingProvider(size_t dimensions, std::string name = "fake")
        : dimensions_(dimensions), name_(std::move(name)), mock_(dimensions) {}

    Result<std::vector<Embedding>> embed(const std::vector<std::string>& texts) override {
        std::optional<Error> failure;
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard lock(mutex_);
            ++calls_;
            textsEmbedded_ += texts.size();
            lastBatch_ = texts;
            failure = failure_;
            if (!delayedCallsLeft_) {
                delay = delay_;
            } else if (*delayedCallsLeft_ > 0) {
                delay = delay_;
                --*delayedCallsLeft_;
            }
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (failure) {
            return *failure;
        }

        std::vector<Embedding> out;
        std::lock_guard lock(mutex_);
        for (const auto& text : texts) {
            auto it = fixed_.find(text);
            Embedding e = it != fixed_.end() ? it->second : mock_.embedText(text);
            if (wrongDimensions_) {
                e.push_back(0.0f);
            }
            out.push_back(std::move(e));
        }
        if (tooFew_ && !out.empty()) {
            out.pop_back();
        }
        return out;
    }

    size_t getDimensions() const override { return dimensions_; }
    std::string getProviderName() const override { return name_; }

    void setVector(const std::string& text, Embedding embedding) {
        std::lock_guard lock(mutex_);
        fixed_[text] = std::move(embedding);
    }
    void failWith(Error error) {
        std::lock_guard lock(mutex_);
        failure_ = std::move(error);
    }
    void clearFailure() {
        std::lock_guard lock(mutex_);
        failure_.reset();
    }
    // Delay every call, or only the next @p forCalls calls when it is non-zero
    void setDelay(std::chrono::milliseconds delay, size_t forCalls = 0) {
        std::lock_guard lock(mutex_);
        delay_ = delay;
        delayedCallsLeft_ = forCalls == 0 ? std::nullopt : std::optional<size_t>(forCalls);
    }
    void returnWrongDimensions(bool on) {
        std::lock_guard lock(mutex_);
        wrongDimensions_ = on;
    }
    void returnTooFew(bool on) {
        std::lock_guard lock(mutex_);
        tooFew_ = on;
    }

    size_t calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }
    size_t textsEmbedded() const {
        std::lock_guard lock(mutex_);
        return textsEmbedded_;
    }
    std::vector<std::string> lastBatch() const {
        std::lock_guard lock(mutex_);
        return lastBatch_;
    }

private:
    size_t dimensions_;
    std::string name_;
    vector::MockEmbeddingProvider mock_;

    mutable std::mutex mutex_;
    std::map<std::string, Embedding> fixed_;
    std::optional<Error> failure_;
    std::chrono::milliseconds delay_{0};
    std::optional<size_t> delayedCallsLeft_;
    bool wrongDimensions_ = false;
    bool tooFew_ = false;
    size_t calls_ = 0;
    size_t textsEmbedded_ = 0;
    std::vector<std::string> lastBatch_;
};

/**
 * In-memory SQLite backend whose ranking calls can be made to fail.
 */
class FlakyStorageBackend : public storage::SqliteStorageBackend {
public:
    FlakyStorageBackend() = default;

    Result<std::vector<storage::VectorHit>>
    vectorTopK(std::span<const float> query, size_t k, const metadata::MetadataFilter& filter,
               std::optional<double> minSimilarity = std::nullopt) override {
        if (auto failure = current(vectorFailure_)) {
            return *failure;
        }
        return SqliteStorageBackend::vectorTopK(query, k, filter, minSimilarity);
    }

    Result<std::vector<storage::TextHit>> textTopK(const std::string& text, size_t k,
                                                   const metadata::MetadataFilter& filter) override {
        if (auto failure = current(textFailure_)) {
            return *failure;
        }
        return SqliteStorageBackend::textTopK(text, k, filter);
    }

    void failVectorSearch(Error error) {
        std::lock_guard lock(mutex_);
        vectorFailure_ = std::move(error);
    }
    void failTextSearch(Error error) {
        std::lock_guard lock(mutex_);
        textFailure_ = std::move(error);
    }
    void heal() {
        std::lock_guard lock(mutex_);
        vectorFailure_.reset();
        textFailure_.reset();
    }

private:
    std::optional<Error> current(const std::optional<Error>& slot) {
        std::lock_guard lock(mutex_);
        return slot;
    }

    std::mutex mutex_;
    std::optional<Error> vectorFailure_;
    std::optional<Error> textFailure_;
};

} // namespace hybridstore::tests
