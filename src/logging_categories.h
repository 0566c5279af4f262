// Centralized Qt logging categories for Knowledge Vault
#pragma once

#include <QLoggingCategory>

// Storage open/initialize/write/read traces
Q_DECLARE_LOGGING_CATEGORY(kv_store)

// Ingestion pipeline stages
Q_DECLARE_LOGGING_CATEGORY(kv_ingest)

// Query embedding, search and context assembly
Q_DECLARE_LOGGING_CATEGORY(kv_retrieval)

// Redaction audit (document ids and categories only, never text)
Q_DECLARE_LOGGING_CATEGORY(kv_redaction)

// Model server requests and streaming
Q_DECLARE_LOGGING_CATEGORY(kv_backend)

// Config file load/save
Q_DECLARE_LOGGING_CATEGORY(kv_config)
