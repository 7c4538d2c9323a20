#include "Hasher.h"
#include "Bitmask.h"
#include "CoefficientSelector.h"
#include "Dct.h"
#include "Logging.h"
#include "MirrorTransform.h"

namespace PHash {

Hasher::Hasher(const ImageSource& source, const EngineOptions& options,
               std::shared_ptr<const ProviderChain> providers)
    : m_source(source), m_options(options), m_providers(std::move(providers)) {}

Hasher::Hasher(const LuminanceGrid& grid, const EngineOptions& options)
    : m_options(options), m_grid(grid) {}

int Hasher::matrixSize() const {
    return m_grid.isNull() ? m_options.resizeSize : m_grid.size();
}

bool Hasher::ensureMatrix(HashError* error) {
    if (m_loaded) {
        if (m_matrix.isNull()) {
            if (error) *error = m_loadError;
            return false;
        }
        return true;
    }

    if (m_grid.isNull()) {
        if (m_options.resizeSize < 2)
            return fail(error, HashError::ConfigurationError,
                        QStringLiteral("resize must be at least 2, got %1").arg(m_options.resizeSize));
        if (!m_providers) {
            m_providers = ProviderChain::create(m_options.backends, error);
            if (!m_providers) return false;
        }
        m_grid = m_providers->load(m_source, m_options.resizeSize, &m_loadError);
    } else if (m_grid.size() < 2) {
        return fail(error, HashError::ConfigurationError, QStringLiteral("luminance grid is smaller than 2x2"));
    }

    m_loaded = true;
    if (m_grid.isNull()) {
        if (error) *error = m_loadError;
        return false;
    }
    m_matrix = Dct(m_grid.size()).forward(m_grid);
    qCDebug(lcEngine) << "coefficient matrix ready" << m_matrix << m_source.describe();
    clear(error);
    return true;
}

HashResult Hasher::computeHash(const HashConfig& config, HashError* error) {
    const HashConfig c = config.normalized();
    if (!c.validate(matrixSize(), error)) return {};

    const auto it = m_cache.constFind(c);
    if (it != m_cache.constEnd()) {
        qCDebug(lcEngine) << "cache hit" << c.toString();
        clear(error);
        return it.value();
    }

    if (!ensureMatrix(error)) return {};

    Selection sel = selectCoefficients(c.mirror ? mirrored(m_matrix) : m_matrix, c);
    if (c.mirrorproof) makeMirrorproof(sel);

    const HashResult result(generateBits(sel, c.method));
    m_cache.insert(c, result);
    qCDebug(lcEngine) << "computed" << c.toString() << result;
    clear(error);
    return result;
}

CoefficientMatrix Hasher::coefficientMatrix(HashError* error) {
    if (!ensureMatrix(error)) return {};
    return m_matrix;
}

LuminanceGrid Hasher::luminanceGrid(HashError* error) {
    if (!ensureMatrix(error)) return {};
    return m_grid;
}

}
