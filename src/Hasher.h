#pragma once
#include <QtCore>
#include <memory>
#include "EngineOptions.h"
#include "Grid.h"
#include "HashResult.h"
#include "LuminanceProvider.h"

namespace PHash {

// Hashes one image. The luminance grid and its coefficient matrix are computed
// at most once, on the first request, and every distinct config is computed
// once and cached for the lifetime of the Hasher.
//
// The DC term is never part of a threshold set, but when a selection starts
// with it (plain NxN, linear K) it still yields bit 0. A solid-colour image
// therefore hashes to all zeros only under reduce; an unreduced 8x8 average
// or median hash of it is 8000000000000000, the set DC bit followed by 63 zero
// AC bits.
//
// Not safe for concurrent first-time computation. Reads of configs already in
// the cache may run concurrently; otherwise use one Hasher per thread.
class Hasher {
public:
    // The image is decoded lazily through `providers`; a null chain builds one
    // from options.backends.
    explicit Hasher(const ImageSource& source,
                    const EngineOptions& options = EngineOptions(),
                    std::shared_ptr<const ProviderChain> providers = {});

    // An already prepared grid. Its size is the matrix size.
    explicit Hasher(const LuminanceGrid& grid, const EngineOptions& options = EngineOptions());

    HashResult computeHash(const HashConfig& config, HashError* error = nullptr);
    HashResult computeHash(HashError* error = nullptr) { return computeHash(m_options.defaultConfig, error); }

    CoefficientMatrix coefficientMatrix(HashError* error = nullptr);
    LuminanceGrid luminanceGrid(HashError* error = nullptr);

    const EngineOptions& options() const { return m_options; }
    int matrixSize() const;
    int cachedResults() const { return m_cache.size(); }

private:
    bool ensureMatrix(HashError* error);

    const ImageSource m_source;
    const EngineOptions m_options;
    std::shared_ptr<const ProviderChain> m_providers;

    bool m_loaded{false};
    HashError m_loadError;
    LuminanceGrid m_grid;
    CoefficientMatrix m_matrix;
    QHash<HashConfig, HashResult> m_cache;
};

inline HashResult computeHash(Hasher& hasher, const HashConfig& config, HashError* error = nullptr) {
    return hasher.computeHash(config, error);
}

inline CoefficientMatrix coefficientMatrix(Hasher& hasher, HashError* error = nullptr) {
    return hasher.coefficientMatrix(error);
}

}
