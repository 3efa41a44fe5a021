#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(ulCore, "urbanlex.core")
Q_LOGGING_CATEGORY(ulExtraction, "urbanlex.extraction")
Q_LOGGING_CATEGORY(ulIngest, "urbanlex.ingest")
Q_LOGGING_CATEGORY(ulIndex, "urbanlex.index")
Q_LOGGING_CATEGORY(ulRetrieval, "urbanlex.retrieval")
Q_LOGGING_CATEGORY(ulLlm, "urbanlex.llm")
