#include "stratus/forecast/ForestCache.hpp"
#include "stratus/core/Errors.hpp"
#include "stratus/core/Log.hpp"

#include <openssl/evp.h>

#include <cstdio>

namespace stratus {

namespace {

struct DigestCtx {
    EVP_MD_CTX* ctx;
    DigestCtx() : ctx(EVP_MD_CTX_new()) {}
    ~DigestCtx() { if (ctx) EVP_MD_CTX_free(ctx); }
    DigestCtx(const DigestCtx&) = delete;
    DigestCtx& operator=(const DigestCtx&) = delete;
};

}

ForestCache::ForestCache(std::size_t capacity)
    : max_entries(capacity) {}

std::string ForestCache::key(
    const std::string& resource_id,
    const FeatureMatrix& features
) {
    if (features.cols() < FeatureMatrix::BASE_COLUMNS) {
        throw ModelInferenceError("cache key needs the base metric columns");
    }

    DigestCtx d;
    if (!d.ctx || EVP_DigestInit_ex(d.ctx, EVP_sha256(), nullptr) != 1) {
        throw ModelInferenceError("sha256 init failed");
    }

    // Resource id is NUL-terminated so "a"+rows never collides with "ab"+rows.
    bool ok = EVP_DigestUpdate(d.ctx, resource_id.c_str(), resource_id.size() + 1) == 1;
    for (std::size_t r = 0; ok && r < features.rows(); ++r) {
        const auto& row = features.row(r);
        ok = EVP_DigestUpdate(d.ctx, row.data(),
                              FeatureMatrix::BASE_COLUMNS * sizeof(double)) == 1;
    }
    if (!ok) {
        throw ModelInferenceError("sha256 update failed");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(d.ctx, md, &len) != 1) {
        throw ModelInferenceError("sha256 final failed");
    }

    std::string hex;
    hex.reserve(len * 2);
    char buf[3];
    for (unsigned int i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", md[i]);
        hex += buf;
    }
    return hex;
}

std::shared_ptr<const RegressionForest> ForestCache::find(const std::string& k) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = map.find(k);
    if (it == map.end()) return nullptr;
    return it->second;
}

void ForestCache::insert(
    const std::string& k,
    std::shared_ptr<const RegressionForest> forest
) {
    if (max_entries == 0 || !forest) return;

    std::lock_guard<std::mutex> lock(mtx);
    if (map.count(k)) return;

    while (map.size() >= max_entries && !order.empty()) {
        map.erase(order.front());
        order.pop_front();
    }
    map.emplace(k, std::move(forest));
    order.push_back(k);

    STRATUS_LOG_DEBUG("CACHE", "stored forest %.12s (%zu/%zu)",
                      k.c_str(), map.size(), max_entries);
}

std::size_t ForestCache::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return map.size();
}

}
