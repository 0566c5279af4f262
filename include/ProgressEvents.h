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

#pragma once

#include <QString>

#include <variant>

// Ingestion stages, emitted in this order for one document:
// Reading, Chunking, Embedding (once per chunk), Storing, then Complete or Error.
namespace ingest {

struct Reading { QString message; };
struct Chunking { QString message; };
struct Embedding { int current = 0; int total = 0; };
struct Storing { QString message; };
struct Complete { QString documentId; int chunkCount = 0; qint64 durationMs = 0; };
struct Error { QString reason; };

} // namespace ingest

// Query stages: Retrieving, ContextRetrieved or NoContext, Generating,
// Token (once per token), then Complete or Error.
namespace ask {

struct Retrieving { QString message; };
struct ContextRetrieved { int chunkCount = 0; };
struct NoContext { QString message; };
struct Generating { QString message; };
struct Token { QString text; };
struct Complete {};
struct Error { QString reason; };

} // namespace ask

using IngestionProgress = std::variant<ingest::Reading,
                                       ingest::Chunking,
                                       ingest::Embedding,
                                       ingest::Storing,
                                       ingest::Complete,
                                       ingest::Error>;

using QueryProgress = std::variant<ask::Retrieving,
                                   ask::ContextRetrieved,
                                   ask::NoContext,
                                   ask::Generating,
                                   ask::Token,
                                   ask::Complete,
                                   ask::Error>;

// Upload & chat forwards the ingestion events first, then the query events.
using ChatProgress = std::variant<IngestionProgress, QueryProgress>;

namespace kv {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/// One-line human readable rendering for logs and the CLI.
QString describe(const IngestionProgress& event);
QString describe(const QueryProgress& event);
QString describe(const ChatProgress& event);

inline bool isTerminal(const IngestionProgress& event)
{
    return std::holds_alternative<ingest::Complete>(event) || std::holds_alternative<ingest::Error>(event);
}

inline bool isTerminal(const QueryProgress& event)
{
    return std::holds_alternative<ask::Complete>(event) || std::holds_alternative<ask::Error>(event);
}

} // namespace kv
