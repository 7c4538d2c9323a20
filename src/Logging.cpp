#include "Logging.h"

namespace PHash {
Q_LOGGING_CATEGORY(lcEngine, "phash.engine", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSource, "phash.source", QtInfoMsg)
Q_LOGGING_CATEGORY(lcBatch, "phash.batch", QtInfoMsg)
}
