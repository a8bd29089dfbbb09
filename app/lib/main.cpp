#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

#include <atomic>
#include <csignal>

#include "AppLogger.hpp"
#include "RemovalPlan.hpp"
#include "ScanController.hpp"
#include "ScanSettings.hpp"

namespace {

enum ExitCode {
    kExitCompleted = 0,
    kExitConfigError = 1,
    kExitFailed = 2,
    kExitCancelled = 3
};

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) {
    g_interrupted.store(true);
}

QStringList split_list(const QStringList& values) {
    QStringList result;
    for (const QString& value : values) {
        for (const QString& part : value.split(',', Qt::SkipEmptyParts)) {
            if (!part.trimmed().isEmpty()) result.append(part.trimmed());
        }
    }
    return result;
}

bool parse_byte_count(const QString& text, qint64& value) {
    bool ok = false;
    qint64 parsed = text.trimmed().toLongLong(&ok);
    if (!ok || parsed < 0) return false;
    value = parsed;
    return true;
}

// Applies command-line overrides on top of the stored defaults.
bool apply_options(const QCommandLineParser& parser, ScanRequest& request, QString& error) {
    if (parser.isSet("algorithm")
        && !parse_algorithm(parser.value("algorithm"), request.algorithm)) {
        error = QString("Unknown hash algorithm: %1 (use md5, sha1 or sha256)")
                .arg(parser.value("algorithm"));
        return false;
    }
    if (parser.isSet("keep")
        && !parse_keep_policy(parser.value("keep"), request.keep_policy)) {
        error = QString("Unknown keep policy: %1 (use oldest or newest)").arg(parser.value("keep"));
        return false;
    }
    if (parser.isSet("min-size")
        && !parse_byte_count(parser.value("min-size"), request.filter.min_size)) {
        error = QString("Invalid minimum size: %1").arg(parser.value("min-size"));
        return false;
    }
    if (parser.isSet("max-size")
        && !parse_byte_count(parser.value("max-size"), request.filter.max_size)) {
        error = QString("Invalid maximum size: %1").arg(parser.value("max-size"));
        return false;
    }
    if (parser.isSet("ext")) {
        request.filter.extensions = normalize_extensions(split_list(parser.values("ext")));
    }
    if (parser.isSet("exclude")) {
        request.filter.excluded_patterns = parser.values("exclude");
    }
    if (parser.isSet("skip-hidden")) request.filter.skip_hidden = true;
    if (parser.isSet("include-system")) request.filter.skip_system = false;
    if (parser.isSet("verify")) request.verify_contents = true;
    return true;
}

void print_groups(QTextStream& out, const ScanResult& result) {
    for (const auto& group : result.groups) {
        out << QString("Group %1: %2 copies, %3 each, %4 %5")
               .arg(group.id)
               .arg(group.members.size())
               .arg(format_size(group.key.size))
               .arg(algorithm_name(group.key.algorithm), group.key.digest) << "\n";
        for (int i = 0; i < static_cast<int>(group.members.size()); ++i) {
            const auto& member = group.members[i];
            out << (i == group.keep_index ? "  keep  " : "  dup   ")
                << member.modified.toString("yyyy-MM-dd hh:mm") << "  "
                << QDir::toNativeSeparators(member.path) << "\n";
        }
    }
}

void print_summary(QTextStream& out, const ScanResult& result) {
    RemovalPlan plan = build_removal_plan(result);
    out << QString("Status: %1 | Files: %2 examined, %3 accepted, %4 hashed (%5)")
           .arg(status_name(result.status))
           .arg(result.files_examined)
           .arg(result.files_accepted)
           .arg(result.candidate_files)
           .arg(format_size(result.bytes_hashed)) << "\n";
    out << QString("Groups: %1 | Duplicates: %2 | Wasted: %3")
           .arg(result.groups.size())
           .arg(plan.paths.size())
           .arg(format_size(plan.reclaimable_bytes)) << "\n";
    if (result.error_count() > 0) {
        out << QString("%1 path(s) could not be scanned:").arg(result.error_count()) << "\n";
        for (const auto& error : result.errors) {
            out << "  [" << error_kind_name(error.kind) << "] "
                << QDir::toNativeSeparators(error.path) << ": " << error.reason << "\n";
        }
    }
}

}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("DupeScout");
    QCoreApplication::setApplicationName("DupeScout");
    QCoreApplication::setApplicationVersion("1.3.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Find duplicate files by content.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("directory", "Directory to scan (defaults to the last one scanned).");
    parser.addOptions({
        {{"a", "algorithm"}, "Hash algorithm: md5, sha1 or sha256.", "name"},
        {{"k", "keep"}, "Member to keep in each group: oldest or newest.", "policy"},
        {"min-size", "Ignore files smaller than this many bytes.", "bytes"},
        {"max-size", "Ignore files larger than this many bytes (0 = no limit).", "bytes"},
        {{"e", "ext"}, "Only scan these extensions (repeatable, comma separated).", "list"},
        {{"x", "exclude"}, "Skip names or paths matching this pattern (repeatable).", "pattern"},
        {"skip-hidden", "Skip hidden files."},
        {"include-system", "Scan system files too."},
        {"verify", "Byte-compare files whose digests match."},
        {"log-file", "Write the log to this file.", "path"},
        {"log-level", "trace, debug, info, warn, error or critical.", "level"},
        {"save-defaults", "Store the effective options as new defaults."},
        {{"q", "quiet"}, "Do not print progress."},
    });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    ScanSettings settings;
    AppLogger& logger = AppLogger::instance();
    logger.set_console_output(false);
    logger.set_minimum_severity(parser.isSet("log-level")
        ? AppLogger::parse_severity(parser.value("log-level"), settings.log_level())
        : settings.log_level());
    const QString log_path = parser.isSet("log-file") ? parser.value("log-file")
                                                      : AppLogger::default_log_path();
    if (!logger.set_log_file(log_path)) {
        err << "Continuing without a log file" << Qt::endl;
    }

    LOG_INFO("Main", QString("%1 %2 started").arg(QCoreApplication::applicationName(),
                                                  QCoreApplication::applicationVersion()));

    ScanRequest request = settings.load_request();
    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty()) {
        request.root = QFileInfo(positional.first()).absoluteFilePath();
    }

    QString error;
    if (!apply_options(parser, request, error)) {
        err << error << Qt::endl;
        return kExitConfigError;
    }

    ScanController controller;
    StartStatus status = controller.start(request, &error);
    if (status != StartStatus::Started) {
        err << "Cannot start scan: " << error << Qt::endl;
        return kExitConfigError;
    }

    settings.set_last_directory(request.root);
    if (parser.isSet("save-defaults")) {
        settings.save_request(request);
        LOG_INFO("Main", QString("Defaults saved to %1").arg(settings.file_name()));
    }

    std::signal(SIGINT, handle_interrupt);
    const bool quiet = parser.isSet("quiet");
    bool cancel_sent = false;
    while (!controller.wait(200)) {
        if (g_interrupted.load() && !cancel_sent) {
            controller.cancel();
            cancel_sent = true;
        }
        if (quiet) continue;
        ScanProgress progress = controller.progress();
        if (progress.phase == ScanPhase::Hashing) {
            err << QString("\rHashing %1/%2 (%3%) ~%4 left, %5 error(s)   ")
                   .arg(progress.files_processed).arg(progress.files_total)
                   .arg(progress.fraction * 100.0, 0, 'f', 1)
                   .arg(format_duration(progress.seconds_remaining))
                   .arg(progress.error_count);
        } else {
            err << QString("\rCollecting: %1 files examined, %2 accepted   ")
                   .arg(progress.files_examined).arg(progress.files_total);
        }
        err.flush();
    }
    if (!quiet) err << "\n";

    ScanResult result;
    if (!controller.take_result(result)) {
        LOG_CRITICAL("Main", "Scan thread finished without a result");
        return kExitFailed;
    }

    print_groups(out, result);
    print_summary(out, result);

    switch (result.status) {
        case ScanStatus::Completed: return kExitCompleted;
        case ScanStatus::Cancelled: return kExitCancelled;
        case ScanStatus::Failed:    return kExitFailed;
    }
    return kExitFailed;
}
