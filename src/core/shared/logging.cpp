#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(ieCore, "ie.core")
Q_LOGGING_CATEGORY(ieChunking, "ie.chunking")
Q_LOGGING_CATEGORY(iePreprocess, "ie.preprocess")
Q_LOGGING_CATEGORY(ieIo, "ie.io")
