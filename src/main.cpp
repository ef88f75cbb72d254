#include "coldstash/archive_service.hpp"
#include "coldstash/aws_cli_object_store.hpp"
#include "coldstash/cli_transfer_agent.hpp"
#include "coldstash/cold_storage_backend.hpp"
#include "coldstash/manifest_index.hpp"
#include "coldstash/manifest_store.hpp"
#include "coldstash/remote_archive_backend.hpp"
#include "coldstash/restore_orchestrator.hpp"
#include "system/process_runner.hpp"
#include "system/signals.hpp"
#include "util/config.hpp"
#include "util/console_progress.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <string>
#include <vector>

namespace {

using coldstash::config::Config;

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-v] archive [options] <path>\n"
        "   %s [-c <config>] [-v] restore [options] <dir>\n"
        "   %s [-c <config>] [-v] index create|dump|search <text>\n"
        "\n"
        "Global options:\n"
        "  -c, --config           Config file (default %s)\n"
        "  -v, --verbose          Debug logging\n"
        "  -q, --quiet            No progress line\n"
        "\n"
        "archive options:\n"
        "  -m, --mode             cold_storage | remote_archive | dry_run (default cold_storage)\n"
        "  -b, --bucket           Bucket (cold_storage)\n"
        "  -s, --storage-class    STANDARD, STANDARD_IA, GLACIER_IR, GLACIER, DEEP_ARCHIVE\n"
        "  -e, --endpoint         Transfer endpoint (remote_archive)\n"
        "  -p, --remote-path      Destination directory (remote_archive)\n"
        "  -t, --bundle           <path> is an existing <prefix>.<id>.tar.gz\n"
        "  -f, --force            Archive again next to an existing archive\n"
        "  -o, --overwrite        Replace the existing archive, keeping its id\n"
        "  -k, --keep             Keep the local bundle\n"
        "      --remove-sources   Delete archived files after success\n"
        "\n"
        "restore options:\n"
        "  -d, --dest             Restore into this directory (default <dir>)\n"
        "  -k, --keep             Keep a bundle that fails verification\n"
        "      --delete-bundle    Delete the bundle after extraction\n"
        "      --deadline         Give up waiting for a tier restore after N seconds\n"
        "      --no-member-check  Only verify the bundle fingerprint\n",
        argv0, argv0, argv0, coldstash::config::kDefaultConfigPath);
}

bool ParseSeconds(const char* s, std::uint64_t& out) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || *end != '\0' || end == s) return false;
    out = v;
    return true;
}

int Fail(const coldstash::Result& r) {
    coldstash::ClearProgressLine();
    std::fprintf(stderr, "ERROR: %s: %s\n", coldstash::ErrorCodeName(r.code), r.msg.c_str());
    return 1;
}

std::unique_ptr<coldstash::TransferBackend> MakeBackend(const Config& cfg,
                                                        coldstash::LocationKind kind,
                                                        std::shared_ptr<coldstash::ICommandRunner> runner) {
    using namespace coldstash;
    if (kind == LocationKind::ColdStorage) {
        AwsCliObjectStoreClient::Options o;
        o.cli = cfg.cold_storage.cli;
        o.region = cfg.cold_storage.region;
        o.multipart_threshold = cfg.cold_storage.multipart_threshold_bytes;
        o.multipart_chunk = cfg.cold_storage.multipart_chunk_bytes;
        o.max_concurrency = cfg.cold_storage.max_concurrency;
        auto client = std::make_shared<AwsCliObjectStoreClient>(std::move(runner), o);
        return std::make_unique<ColdStorageBackend>(
            client, ColdStorageBackend::Options{.restore_days = cfg.cold_storage.restore_days,
                                                .restore_tier = cfg.cold_storage.restore_tier});
    }
    if (kind == LocationKind::RemoteArchive) {
        auto agent = std::make_shared<CliTransferAgent>(std::move(runner), cfg.remote_archive.cli);
        return std::make_unique<RemoteArchiveBackend>(agent);
    }
    return nullptr;
}

coldstash::Result OpenIndex(const Config& cfg, std::unique_ptr<coldstash::SqliteManifestIndex>& out) {
    if (cfg.index_db.empty()) return coldstash::Result::Ok();
    return coldstash::SqliteManifestIndex::Open(cfg.index_db, cfg.index_table, out);
}

int RunArchive(int argc, char** argv, Config& cfg, coldstash::IProgress* progress) {
    using namespace coldstash;

    ArchiveRequest req;
    req.backend.kind = LocationKind::ColdStorage;

    enum { kRemoveSources = 1000 };
    static option long_opts[] = {
        {"mode", required_argument, nullptr, 'm'},
        {"bucket", required_argument, nullptr, 'b'},
        {"storage-class", required_argument, nullptr, 's'},
        {"endpoint", required_argument, nullptr, 'e'},
        {"remote-path", required_argument, nullptr, 'p'},
        {"bundle", no_argument, nullptr, 't'},
        {"force", no_argument, nullptr, 'f'},
        {"overwrite", no_argument, nullptr, 'o'},
        {"keep", no_argument, nullptr, 'k'},
        {"remove-sources", no_argument, nullptr, kRemoveSources},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    int c;
    while ((c = getopt_long(argc, argv, "m:b:s:e:p:tfok", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'm': {
                auto kind = ParseLocationKind(optarg);
                if (!kind) {
                    std::fprintf(stderr, "Invalid --mode: %s\n", optarg);
                    return 2;
                }
                req.backend.kind = *kind;
                break;
            }
            case 'b': cfg.cold_storage.bucket = optarg; break;
            case 's': cfg.cold_storage.storage_class = optarg; break;
            case 'e': cfg.remote_archive.endpoint = optarg; break;
            case 'p': cfg.remote_archive.path = optarg; break;
            case 't': req.existing_bundle = true; break;
            case 'f': req.force = true; break;
            case 'o': req.overwrite = true; break;
            case 'k': req.keep_artifacts = true; break;
            case kRemoveSources: req.remove_sources = true; break;
            default: return 2;
        }
    }
    if (optind + 1 != argc) {
        std::fprintf(stderr, "archive: expected exactly one path\n");
        return 2;
    }
    req.path = argv[optind];

    if (auto r = cfg.Validate(); !r.is_ok()) return Fail(r);
    if (auto r = cfg.ValidateFor(req.backend.kind); !r.is_ok()) return Fail(r);

    req.backend.cold_storage = {cfg.cold_storage.bucket, cfg.cold_storage.region, cfg.cold_storage.storage_class};
    req.backend.remote_archive = {cfg.remote_archive.endpoint, cfg.remote_archive.local_endpoint,
                                  cfg.remote_archive.path};
    req.backend.overwrite = req.overwrite;

    std::unique_ptr<SqliteManifestIndex> index;
    if (auto r = OpenIndex(cfg, index); !r.is_ok()) return Fail(r);

    auto backend = MakeBackend(cfg, req.backend.kind, std::make_shared<ProcessRunner>());
    ManifestStore store(ArtifactNaming(cfg.artifact_prefix), index.get());
    ArchiveService service(ArchiveService::Options{.naming = ArtifactNaming(cfg.artifact_prefix),
                                                   .hash_workers = cfg.hash_workers,
                                                   .max_source_bytes = cfg.max_source_bytes,
                                                   .integrity_mode = cfg.integrity_mode,
                                                   .owner = cfg.owner,
                                                   .progress_sink = progress},
                           store, backend.get());

    ArchiveOutcome out;
    if (auto r = service.Archive(req, out); !r.is_ok()) return Fail(r);

    ClearProgressLine();
    std::printf("%s %s %zu files -> %s\n", out.manifest.id.c_str(), LocationKindName(out.manifest.location),
                out.manifest.files.size(),
                out.manifest.archive_path.empty() ? out.bundle_path.c_str()
                                                  : (out.manifest.archive_path + "/" + out.manifest.filename).c_str());
    return 0;
}

int RunRestore(int argc, char** argv, Config& cfg, coldstash::IProgress* progress) {
    using namespace coldstash;

    std::string dest;
    RestoreOrchestrator::Options opt;
    opt.poll_interval = std::chrono::seconds(cfg.restore.poll_interval_seconds);
    opt.deadline = std::chrono::seconds(cfg.restore.deadline_seconds);
    opt.integrity_mode = cfg.integrity_mode;
    opt.progress_sink = progress;

    enum { kDeleteBundle = 1000, kDeadline, kNoMemberCheck };
    static option long_opts[] = {
        {"dest", required_argument, nullptr, 'd'},
        {"keep", no_argument, nullptr, 'k'},
        {"delete-bundle", no_argument, nullptr, kDeleteBundle},
        {"deadline", required_argument, nullptr, kDeadline},
        {"no-member-check", no_argument, nullptr, kNoMemberCheck},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    int c;
    while ((c = getopt_long(argc, argv, "d:k", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'd': dest = optarg; break;
            case 'k': opt.keep_artifacts = true; break;
            case kDeleteBundle: opt.delete_bundle_after_extract = true; break;
            case kNoMemberCheck: opt.verify_members = false; break;
            case kDeadline: {
                std::uint64_t s = 0;
                if (!ParseSeconds(optarg, s)) {
                    std::fprintf(stderr, "Invalid --deadline: %s\n", optarg);
                    return 2;
                }
                opt.deadline = std::chrono::seconds(s);
                break;
            }
            default: return 2;
        }
    }
    if (optind + 1 != argc) {
        std::fprintf(stderr, "restore: expected exactly one directory\n");
        return 2;
    }
    const std::string dir = argv[optind];
    if (dest.empty()) dest = dir;

    if (auto r = cfg.Validate(); !r.is_ok()) return Fail(r);

    ManifestStore store(ArtifactNaming(cfg.artifact_prefix));
    Manifest m;
    if (auto r = store.Load(dir, m); !r.is_ok()) return Fail(r);
    LogInfo("Restoring archive %s (%s, %zu files)", m.id.c_str(), LocationKindName(m.location), m.files.size());

    auto backend = MakeBackend(cfg, m.location, std::make_shared<ProcessRunner>());
    if (!backend) {
        return Fail(Result::Fail(ErrorCode::RestoreUnsupported,
                                 "archive " + m.id + " was a dry run; there is nothing to restore"));
    }

    RestoreOrchestrator orchestrator(*backend, opt);
    RestoreReport report;
    auto r = orchestrator.Restore(m, dest, report);
    if (!r.is_ok()) {
        if (r.code == ErrorCode::RestoreUnsupported) {
            ClearProgressLine();
            std::printf("Archive %s cannot be restored automatically.\n"
                        "Request a manual retrieval of: %s\n",
                        m.id.c_str(), report.locator.ToString().c_str());
        }
        return Fail(r);
    }

    ClearProgressLine();
    std::printf("%s restored %zu files into %s\n", m.id.c_str(), m.files.size(), dest.c_str());
    return 0;
}

void PrintRow(const coldstash::IndexRow& row) {
    std::printf("%lld\t%s\t%s\t%s\t%s\t%s\t%s\t%s\t%llu\t%s\t%s\t%s\n",
                (long long)row.record, row.id.c_str(), row.timestamp.c_str(), row.location.c_str(),
                row.filename.c_str(), row.local_path.c_str(), row.archive_path.c_str(), row.file.c_str(),
                (unsigned long long)row.size, row.fingerprint.c_str(), row.bundle_fingerprint.c_str(),
                row.owner.c_str());
}

int RunIndex(int argc, char** argv, Config& cfg) {
    using namespace coldstash;

    if (argc < 2) {
        std::fprintf(stderr, "index: expected create, dump or search\n");
        return 2;
    }
    const std::string action = argv[1];
    if (cfg.index_db.empty()) {
        return Fail(Result::Fail(ErrorCode::InvalidConfig, "Config: 'index_db' is not set"));
    }

    std::unique_ptr<SqliteManifestIndex> index;
    if (auto r = OpenIndex(cfg, index); !r.is_ok()) return Fail(r);

    std::vector<IndexRow> rows;
    if (action == "create" && argc == 2) {
        if (auto r = index->CreateTable(); !r.is_ok()) return Fail(r);
        return 0;
    }
    if (action == "dump" && argc == 2) {
        if (auto r = index->SelectAll(rows); !r.is_ok()) return Fail(r);
    } else if (action == "search" && argc == 3) {
        if (auto r = index->FindByFile(argv[2], rows); !r.is_ok()) return Fail(r);
    } else {
        std::fprintf(stderr, "index: unknown action or wrong arguments: %s\n", action.c_str());
        return 2;
    }

    for (const auto& row : rows) PrintRow(row);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    coldstash::InstallSignalHandlers();

    std::string config_path = coldstash::config::kDefaultConfigPath;
    bool config_given = false;
    bool verbose = false;
    bool quiet = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int c;
    // '+' stops at the subcommand
    while ((c = getopt_long(argc, argv, "+c:vqh", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'c':
                config_path = optarg;
                config_given = true;
                break;
            case 'v':
                verbose = true;
                break;
            case 'q':
                quiet = true;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }
    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    Config cfg;
    if (auto r = cfg.LoadFile(config_path, config_given); !r.is_ok()) return Fail(r);
    coldstash::Logger::Instance().SetLevel(verbose ? coldstash::LogLevel::Debug : cfg.log_level);

    coldstash::ConsoleProgressSink console;
    coldstash::IProgress* progress = quiet ? nullptr : &console;

    const std::string cmd = argv[optind];
    const int sub_argc = argc - optind;
    char** sub_argv = argv + optind;

    if (cmd == "archive") return RunArchive(sub_argc, sub_argv, cfg, progress);
    if (cmd == "restore") return RunRestore(sub_argc, sub_argv, cfg, progress);
    if (cmd == "index") return RunIndex(sub_argc, sub_argv, cfg);

    PrintUsage(argv[0]);
    return 2;
}
