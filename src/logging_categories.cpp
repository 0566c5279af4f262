#include "logging_categories.h"

Q_LOGGING_CATEGORY(kv_store, "kv.store")
Q_LOGGING_CATEGORY(kv_ingest, "kv.ingest")
Q_LOGGING_CATEGORY(kv_retrieval, "kv.retrieval")
Q_LOGGING_CATEGORY(kv_redaction, "kv.redaction")
Q_LOGGING_CATEGORY(kv_backend, "kv.backend")
Q_LOGGING_CATEGORY(kv_config, "kv.config")
