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

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QFutureIterator>
#include <QLoggingCategory>
#include <QTextStream>

#include <cstdio>
#include <memory>

#include "Logger.h"
#include "VaultErrors.h"
#include "logging_categories.h"
#include "string_utils.h"
#include "core/ContextRetriever.h"
#include "core/DocumentLoader.h"
#include "core/DocumentStore.h"
#include "core/PrivacyRedactor.h"
#include "core/RagOrchestrator.h"
#include "core/VaultConfig.h"
#include "backends/LocalModelBackend.h"
#include "backends/QtPdfExtractor.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;     // usage, configuration or operation failure
constexpr int kExitAccessDenied = 2;

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString readPassphrase()
{
    const QString fromEnv = VaultConfig::passphraseFromEnvironment();
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    err() << "Vault passphrase: " << Qt::flush;
    QTextStream in(stdin);
    return in.readLine();
}

struct CliContext {
    QCommandLineParser& parser;
    VaultConfig config;
    QStringList args;               // positional arguments after the command
};

// Everything the model-backed commands need, owned in construction order
struct Pipeline {
    explicit Pipeline(DocumentStore& store, const VaultConfig& config)
        : backend(LocalModelBackend::Settings{config.backend.baseUrl,
                                              config.backend.embeddingModel,
                                              config.backend.generationModel,
                                              config.backend.apiKey,
                                              config.backend.connectTimeoutMs,
                                              config.backend.requestTimeoutMs})
        , retriever(store, backend)
        , orchestrator(store, backend, backend, retriever, &pdfExtractor)
    {
    }

    LocalModelBackend backend;
    QtPdfExtractor pdfExtractor;
    ContextRetriever retriever;
    RagOrchestrator orchestrator;
};

void printDocument(const Document& doc)
{
    out() << doc.id << "  " << doc.source
          << "  chunks=" << doc.chunkCount
          << "  created=" << doc.createdAt.toUTC().toString(Qt::ISODate);
    const QStringList tags = kv::strings::split_tags(doc.metadata.value(QStringLiteral("tags")));
    if (!tags.isEmpty()) {
        out() << "  tags=" << tags.join(QLatin1Char(' '));
    }
    out() << "  " << kv::strings::preview(doc.content, 60) << Qt::endl;
}

void printSession(const Session& session)
{
    out() << session.id << "  " << session.name
          << "  last_accessed=" << session.lastAccessedAt.toUTC().toString(Qt::ISODate);
    if (!session.description.isEmpty()) {
        out() << "  " << session.description;
    }
    out() << Qt::endl;
}

int requireArgs(const CliContext& ctx, int count, const char* usage)
{
    if (ctx.args.size() < count) {
        err() << "Usage: vaultctl " << usage << Qt::endl;
        return kExitFailure;
    }
    return kExitOk;
}

int runIngest(const CliContext& ctx, DocumentStore& store)
{
    if (ctx.args.isEmpty()) {
        err() << "Usage: vaultctl ingest <paths...> [--folder NAME]" << Qt::endl;
        return kExitFailure;
    }

    QStringList files;
    QString folderName = ctx.parser.value(QStringLiteral("folder"));
    for (const QString& path : ctx.args) {
        const QFileInfo info(path);
        if (info.isDir()) {
            files += DocumentLoader::scanDirectory(info.absoluteFilePath());
            if (folderName.isEmpty()) {
                folderName = info.fileName();
            }
        } else {
            files.append(info.absoluteFilePath());
        }
    }
    if (folderName.isEmpty()) {
        folderName = QStringLiteral("cli");
    }

    Pipeline pipeline(store, ctx.config);
    QFuture<IngestionProgress> future =
        pipeline.orchestrator.ingestFolder(files, folderName, ctx.config.chunking);

    int completed = 0;
    int failed = 0;
    QFutureIterator<IngestionProgress> it(future);
    while (it.hasNext()) {
        const IngestionProgress event = it.next();
        if (std::holds_alternative<ingest::Complete>(event)) {
            ++completed;
        } else if (std::holds_alternative<ingest::Error>(event)) {
            ++failed;
        }
        out() << kv::describe(event) << Qt::endl;
    }

    out() << "Ingested " << completed << " of " << files.size() << " file(s)";
    if (failed > 0) {
        out() << ", " << failed << " failed";
    }
    out() << Qt::endl;
    return failed > 0 ? kExitFailure : kExitOk;
}

int runAsk(const CliContext& ctx, DocumentStore& store)
{
    if (ctx.args.isEmpty()) {
        err() << "Usage: vaultctl ask <question> [--session ID] [--top-k N] [--min-score S]" << Qt::endl;
        return kExitFailure;
    }

    RetrievalConfig retrieval = ctx.config.retrieval;
    retrieval.sessionId = ctx.parser.value(QStringLiteral("session"));
    if (ctx.parser.isSet(QStringLiteral("top-k"))) {
        bool ok = false;
        retrieval.topK = ctx.parser.value(QStringLiteral("top-k")).toInt(&ok);
        if (!ok) {
            err() << "--top-k expects an integer" << Qt::endl;
            return kExitFailure;
        }
    }
    if (ctx.parser.isSet(QStringLiteral("min-score"))) {
        bool ok = false;
        retrieval.minRelevanceScore = ctx.parser.value(QStringLiteral("min-score")).toDouble(&ok);
        if (!ok) {
            err() << "--min-score expects a number" << Qt::endl;
            return kExitFailure;
        }
    }

    Pipeline pipeline(store, ctx.config);
    QFuture<QueryProgress> future =
        pipeline.orchestrator.ask(ctx.args.join(QLatin1Char(' ')), retrieval, ctx.config.generation);

    bool failed = false;
    QFutureIterator<QueryProgress> it(future);
    while (it.hasNext()) {
        const QueryProgress event = it.next();
        std::visit(kv::Overloaded{
            [](const ask::Token& e) { out() << e.text << Qt::flush; },
            [](const ask::Complete&) { out() << Qt::endl; },
            [&failed](const ask::Error& e) {
                failed = true;
                err() << "Error: " << e.reason << Qt::endl;
            },
            [&event](const auto&) { err() << kv::describe(event) << Qt::endl; },
        }, event);
    }
    return failed ? kExitFailure : kExitOk;
}

int runStats(DocumentStore& store)
{
    const StoreStats stats = store.statistics();
    out() << "Documents:       " << stats.documentCount << Qt::endl
          << "Chunks:          " << stats.chunkCount << Qt::endl
          << "Indexed chunks:  " << stats.indexedChunkCount << Qt::endl
          << "Tokens (est.):   " << stats.totalTokens << Qt::endl
          << "Dimension:       " << store.embeddingDimension() << Qt::endl
          << "Index:           " << (store.isDegraded() ? "unavailable (degraded)" : "ready") << Qt::endl;
    if (stats.oldestCreatedAt.isValid()) {
        out() << "Oldest document: " << stats.oldestCreatedAt.toUTC().toString(Qt::ISODate) << Qt::endl
              << "Newest document: " << stats.newestCreatedAt.toUTC().toString(Qt::ISODate) << Qt::endl;
    }
    return kExitOk;
}

int runVaultCommand(const QString& command, const CliContext& ctx, DocumentStore& store)
{
    if (command == QLatin1String("ingest")) {
        return runIngest(ctx, store);
    }
    if (command == QLatin1String("ask")) {
        return runAsk(ctx, store);
    }
    if (command == QLatin1String("list")) {
        for (const Document& doc : store.listDocuments()) {
            printDocument(doc);
        }
        return kExitOk;
    }
    if (command == QLatin1String("remove")) {
        if (requireArgs(ctx, 1, "remove <docId>") != kExitOk) {
            return kExitFailure;
        }
        if (!store.removeDocument(ctx.args.first())) {
            err() << "No document with id " << ctx.args.first() << Qt::endl;
            return kExitFailure;
        }
        out() << "Removed " << ctx.args.first() << Qt::endl;
        return kExitOk;
    }
    if (command == QLatin1String("sessions")) {
        for (const Session& session : store.listSessions()) {
            printSession(session);
        }
        return kExitOk;
    }
    if (command == QLatin1String("session-create")) {
        if (requireArgs(ctx, 1, "session-create <name> [--description D]") != kExitOk) {
            return kExitFailure;
        }
        const Session session = store.createSession(ctx.args.join(QLatin1Char(' ')),
                                                    ctx.parser.value(QStringLiteral("description")));
        out() << session.id << Qt::endl;
        return kExitOk;
    }
    if (command == QLatin1String("session-add")) {
        if (requireArgs(ctx, 2, "session-add <sessionId> <docId>") != kExitOk) {
            return kExitFailure;
        }
        store.addDocumentToSession(ctx.args.at(0), ctx.args.at(1));
        return kExitOk;
    }
    if (command == QLatin1String("session-remove")) {
        if (requireArgs(ctx, 2, "session-remove <sessionId> <docId>") != kExitOk) {
            return kExitFailure;
        }
        if (!store.removeDocumentFromSession(ctx.args.at(0), ctx.args.at(1))) {
            err() << "Document " << ctx.args.at(1) << " is not in session " << ctx.args.at(0) << Qt::endl;
            return kExitFailure;
        }
        return kExitOk;
    }
    if (command == QLatin1String("session-docs")) {
        if (requireArgs(ctx, 1, "session-docs <sessionId>") != kExitOk) {
            return kExitFailure;
        }
        for (const Document& doc : store.getSessionDocuments(ctx.args.first())) {
            printDocument(doc);
        }
        return kExitOk;
    }
    if (command == QLatin1String("stats")) {
        return runStats(store);
    }

    err() << "Unknown command: " << command << Qt::endl;
    return kExitFailure;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("KnowledgeVault"));
    QCoreApplication::setApplicationName(QStringLiteral("vaultctl"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    // Keep the console clean unless the user opts in via QT_LOGGING_RULES or --verbose
    if (qEnvironmentVariableIsEmpty("QT_LOGGING_RULES")) {
        QLoggingCategory::setFilterRules(QStringLiteral(
            "kv.*.debug=false\n"
            "kv.*.info=false\n"));
    }

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Encrypted on-device knowledge vault.\n\n"
        "Commands:\n"
        "  ingest <paths...>                 Add files or folders (.txt, .md, .pdf)\n"
        "  ask <question>                    Answer a question from the vault\n"
        "  list                              List stored documents\n"
        "  remove <docId>                    Delete a document\n"
        "  sessions                          List sessions\n"
        "  session-create <name>             Create a session\n"
        "  session-add <sessionId> <docId>   Add a document to a session\n"
        "  session-remove <sessionId> <docId>\n"
        "  session-docs <sessionId>          List a session's documents\n"
        "  stats                             Vault statistics\n"
        "  redact <text>                     Show what the redactor would store"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {QStringLiteral("config"), QStringLiteral("Config file (default: %1).").arg(VaultConfig::defaultConfigPath()),
         QStringLiteral("path")},
        {QStringLiteral("verbose"), QStringLiteral("Print debug logging to stderr.")},
        {QStringLiteral("degraded"), QStringLiteral("Open the vault even when the similarity index is unavailable.")},
        {QStringLiteral("folder"), QStringLiteral("Logical folder name for ingest."), QStringLiteral("name")},
        {QStringLiteral("session"), QStringLiteral("Restrict ask to one session."), QStringLiteral("id")},
        {QStringLiteral("top-k"), QStringLiteral("Number of context chunks for ask."), QStringLiteral("n")},
        {QStringLiteral("min-score"), QStringLiteral("Minimum relevance (0..1) for ask."), QStringLiteral("score")},
        {QStringLiteral("description"), QStringLiteral("Description for session-create."), QStringLiteral("text")},
    });
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."), QStringLiteral("[args...]"));
    parser.process(app);

    if (parser.isSet(QStringLiteral("verbose"))) {
        AppLogHelper::setGlobalDebugEnabled(true);
        QLoggingCategory::setFilterRules(QStringLiteral("kv.*.debug=true\nkv.*.info=true\n"));
        AppLogHelper::setSink([](const QString& message, bool isWarning) {
            err() << (isWarning ? "warning: " : "debug: ") << message << Qt::endl;
        });
    }

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(kExitFailure);
    }
    const QString command = positional.takeFirst();

    if (command == QLatin1String("redact")) {
        if (positional.isEmpty()) {
            err() << "Usage: vaultctl redact <text>" << Qt::endl;
            return kExitFailure;
        }
        RegexPrivacyRedactor redactor;
        const RedactionReport report = redactor.redactWithReport(positional.join(QLatin1Char(' ')));
        out() << report.text << Qt::endl;
        if (report.changed) {
            err() << "Redacted: " << report.categories.join(QStringLiteral(", ")) << Qt::endl;
        }
        return kExitOk;
    }

    const QString configPath = parser.isSet(QStringLiteral("config"))
        ? parser.value(QStringLiteral("config"))
        : VaultConfig::defaultConfigPath();

    try {
        CliContext ctx{parser, VaultConfig::loadFromFile(configPath), positional};
        ctx.config.validate();

        const QString vaultPath = ctx.config.resolvedStorePath();
        if (!QDir().mkpath(QFileInfo(vaultPath).absolutePath())) {
            err() << "Cannot create directory for " << vaultPath << Qt::endl;
            return kExitFailure;
        }

        KV_LOG << "vaultctl: vault " << vaultPath << ", config " << configPath;

        DocumentStore::Options options;
        options.embeddingDimension = ctx.config.store.embeddingDimension;
        options.kdfIterations = ctx.config.store.kdfIterations;
        DocumentStore store(vaultPath, std::make_shared<RegexPrivacyRedactor>(), options);

        store.open(readPassphrase());
        store.initialize(ctx.config.store.requireIndex && !parser.isSet(QStringLiteral("degraded")));
        if (store.isDegraded()) {
            KV_WARN << "vaultctl: similarity index unavailable, search returns no results";
        }

        return runVaultCommand(command, ctx, store);
    } catch (const VaultAccessError& e) {
        err() << "Access denied: " << e.what() << Qt::endl;
        return kExitAccessDenied;
    } catch (const std::exception& e) {
        err() << "Error: " << e.what() << Qt::endl;
        return kExitFailure;
    }
}
