#pragma once
#ifndef TESTS_MOCKS_MOCK_UPSTREAM_FETCHER_H
#define TESTS_MOCKS_MOCK_UPSTREAM_FETCHER_H

#include "cache/upstream_fetcher.h"
#include "utilities/errors.h"
#include <gmock/gmock.h>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class MockUpstreamFetcher : public gutex::UpstreamFetcher {
public:
    MOCK_METHOD(gutex::UpstreamHead, head, (const std::string &resourceId), (override));
    MOCK_METHOD(std::string, getRange,
                (const std::string &resourceId, std::int64_t startByte, std::int64_t endByte),
                (override));
};

/**
 * @brief Upstream serving documents held in memory, recording every call.
 */
class MemoryUpstream : public gutex::UpstreamFetcher {
public:
    struct Request {
        std::string resourceId;
        std::int64_t start;
        std::int64_t end;
    };

    void setDocument(const std::string &id, const std::string &content,
                     std::optional<std::string> etag = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        docs_[id] = {content, std::move(etag)};
    }

    void setFailing(bool failHead, bool failGet) {
        std::lock_guard<std::mutex> lock(mutex_);
        failHead_ = failHead;
        failGet_ = failGet;
    }

    void setShortReads(bool shortReads) {
        std::lock_guard<std::mutex> lock(mutex_);
        shortReads_ = shortReads;
    }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::size_t headCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return heads_;
    }

    void clearRequests() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
        heads_ = 0;
    }

    gutex::UpstreamHead head(const std::string &resourceId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++heads_;
        if (failHead_)
            throw gutex::GutexError("upstream unavailable");
        auto it = docs_.find(resourceId);
        if (it == docs_.end())
            throw gutex::HttpError(404, resourceId);
        return {static_cast<std::int64_t>(it->second.content.size()), it->second.etag,
                std::nullopt};
    }

    std::string getRange(const std::string &resourceId, std::int64_t startByte,
                         std::int64_t endByte) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back({resourceId, startByte, endByte});
        if (failGet_)
            throw gutex::GutexError("upstream unavailable");
        auto it = docs_.find(resourceId);
        if (it == docs_.end())
            throw gutex::HttpError(404, resourceId);
        const std::string &content = it->second.content;
        if (startByte >= static_cast<std::int64_t>(content.size()))
            return "";
        std::string out = content.substr(startByte, endByte - startByte + 1);
        if (shortReads_ && !out.empty())
            out.pop_back();
        return out;
    }

private:
    struct Doc {
        std::string content;
        std::optional<std::string> etag;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Doc> docs_;
    std::vector<Request> requests_;
    std::size_t heads_{0};
    bool failHead_{false};
    bool failGet_{false};
    bool shortReads_{false};
};

#endif // TESTS_MOCKS_MOCK_UPSTREAM_FETCHER_H
