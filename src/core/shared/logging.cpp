#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(ciCore, "codeindex.core")
Q_LOGGING_CATEGORY(ciLearning, "codeindex.learning")
Q_LOGGING_CATEGORY(ciStore, "codeindex.store")
