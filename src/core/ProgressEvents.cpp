//
// Knowledge Vault
//
// Copyright (c) 2025 Adrian Sutherland
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//

#include "ProgressEvents.h"

namespace kv {

QString describe(const IngestionProgress& event)
{
    return std::visit(Overloaded{
        [](const ingest::Reading& e) { return QStringLiteral("Reading: %1").arg(e.message); },
        [](const ingest::Chunking& e) { return QStringLiteral("Chunking: %1").arg(e.message); },
        [](const ingest::Embedding& e) { return QStringLiteral("Embedding chunk %1/%2").arg(e.current).arg(e.total); },
        [](const ingest::Storing& e) { return QStringLiteral("Storing: %1").arg(e.message); },
        [](const ingest::Complete& e) {
            return QStringLiteral("Complete: %1 (%2 chunks, %3 ms)")
                .arg(e.documentId).arg(e.chunkCount).arg(e.durationMs);
        },
        [](const ingest::Error& e) { return QStringLiteral("Error: %1").arg(e.reason); },
    }, event);
}

QString describe(const QueryProgress& event)
{
    return std::visit(Overloaded{
        [](const ask::Retrieving& e) { return QStringLiteral("Retrieving: %1").arg(e.message); },
        [](const ask::ContextRetrieved& e) { return QStringLiteral("Context retrieved: %1 chunks").arg(e.chunkCount); },
        [](const ask::NoContext& e) { return QStringLiteral("No context: %1").arg(e.message); },
        [](const ask::Generating& e) { return QStringLiteral("Generating: %1").arg(e.message); },
        [](const ask::Token& e) { return e.text; },
        [](const ask::Complete&) { return QStringLiteral("Complete"); },
        [](const ask::Error& e) { return QStringLiteral("Error: %1").arg(e.reason); },
    }, event);
}

QString describe(const ChatProgress& event)
{
    return std::visit([](const auto& inner) { return describe(inner); }, event);
}

} // namespace kv
