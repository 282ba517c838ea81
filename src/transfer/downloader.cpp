#include "downloader.hpp"
#include "archive_codec.hpp"
#include "checksum.hpp"
#include "glob_filter.hpp"
#include "key_template.hpp"
#include "pipe_bridge.hpp"
#include "progress.hpp"
#include "prune.hpp"
#include "streams.hpp"
#include "transfer_tracker.hpp"
#include "worker_pool.hpp"
#include <nexus/repository_client.hpp>
#include <cli/console.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <future>
#include <set>

DownloadSource parse_download_source(const std::string& source, bool compress) {
    DownloadSource s;
    if (!parse_repository_path(source, s.repository, s.folder)) {
        throw ConfigurationError(fmt::format(
            "source '{}' must be in the form 'repository/folder' or 'repository/folder/subfolder'", source));
    }

    if (compress) {
        auto last = s.folder.rfind('/');
        std::string name = last == std::string::npos ? s.folder : s.folder.substr(last + 1);
        if (!has_archive_suffix(name)) {
            throw ConfigurationError(
                "when using --compress, the source must end with the archive filename "
                "(e.g., repo/path/archive.tar.gz)");
        }
        s.archive_name = name;
        s.folder = last == std::string::npos ? "" : s.folder.substr(0, last);
    }
    return s;
}

Downloader::Downloader(RepositoryClient& client, const TransferOptions& options, Console& console)
    : client_(client), options_(options), console_(console) {}

std::vector<PlannedDownload> Downloader::plan(const std::vector<RemoteAsset>& assets,
                                              const std::string& folder,
                                              const fs::path& dest_dir) const {
    std::vector<PlannedDownload> out;
    out.reserve(assets.size());
    for (const auto& asset : assets) {
        PlannedDownload p;
        p.asset = asset;
        std::string rel = options_.flatten ? remote_relative_path(asset.path, folder)
                                           : trim_leading_slashes(asset.path);
        p.local_path = contained_path(dest_dir, rel, "asset");
        p.display_path = remote_relative_path(asset.path, folder);
        out.push_back(std::move(p));
    }
    return out;
}

TransferReport Downloader::download(const std::string& source, const fs::path& dest_dir) {
    std::string resolved = apply_key_template(source, options_.key_from);
    if (!options_.key_from.empty()) {
        console_.info(fmt::format("Using key template: {} -> {}", source, resolved));
    }

    DownloadSource src = parse_download_source(resolved, options_.compress);
    if (options_.compress) {
        return download_compressed(src, dest_dir);
    }

    std::vector<RemoteAsset> assets = client_.list_assets(src.repository, src.folder);
    std::string base = src.folder;

    // An empty folder listing may mean the path names a single asset
    if (assets.empty() && !src.folder.empty()) {
        try {
            assets.push_back(client_.get_asset_by_path(src.repository, src.folder));
            auto slash = src.folder.rfind('/');
            base = slash == std::string::npos ? "" : src.folder.substr(0, slash);
            nexcli_log(fmt::format("download: {} is a single asset", src.folder));
        } catch (const ProtocolError& e) {
            if (e.status() != 404) throw;
        }
    }

    if (!options_.glob.empty()) {
        GlobFilter filter(options_.glob);
        std::vector<RemoteAsset> kept;
        for (auto& a : assets) {
            if (filter.matches(remote_relative_path(a.path, base))) kept.push_back(std::move(a));
        }
        assets.swap(kept);
    }

    TransferReport report;
    if (assets.empty()) {
        console_.warn(fmt::format("No assets found in folder '{}' in repository '{}'",
                                  src.folder, src.repository));
        report.status = TransferStatus::NoAssetsFound;
        return report;
    }

    std::string label = src.folder.empty() ? src.repository : src.repository + "/" + src.folder;
    return execute(plan(assets, base, dest_dir), label, options_.delete_extra ? &dest_dir : nullptr);
}

TransferReport Downloader::download_planned(const std::vector<PlannedDownload>& plan,
                                            const std::string& label) {
    return execute(plan, label, nullptr);
}

TransferOutcome Downloader::download_one(const PlannedDownload& item, const ChecksumValidator& validator,
                                         ProgressAccounter& progress) {
    const RemoteAsset& asset = item.asset;
    TransferOutcome out{TransferOutcome::Kind::Failed, item.display_path, asset.size_bytes, ""};
    bool writing = false;

    try {
        std::error_code ec;
        if (!options_.force && fs::exists(item.local_path, ec)) {
            if (options_.skip_checksum) {
                progress.add_bytes(asset.size_bytes);
                out.kind = TransferOutcome::Kind::Skipped;
                out.detail = "file exists";
                return out;
            }
            if (validator.can_validate(asset.checksums) &&
                validator.validate(item.local_path, asset.checksums, &progress)) {
                out.kind = TransferOutcome::Kind::Skipped;
                out.detail = algorithm_name(validator.algorithm()) + " match";
                return out;
            }
            nexcli_log(fmt::format("download: {} differs from remote, fetching", item.display_path));
        }

        if (options_.dry_run) {
            console_.detail(fmt::format("Would download: {}", item.display_path));
            progress.add_bytes(asset.size_bytes);
            out.kind = TransferOutcome::Kind::Downloaded;
            out.detail = "dry run";
            return out;
        }

        writing = true;
        FileSink file(item.local_path);
        ProgressSink tapped(file, &progress);
        client_.download_asset(asset.download_url, tapped);
        file.close();
        out.kind = TransferOutcome::Kind::Downloaded;
    } catch (const std::exception& e) {
        out.kind = TransferOutcome::Kind::Failed;
        out.detail = e.what();
        nexcli_log(fmt::format("download {} failed: {}", item.display_path, e.what()));
        if (writing) {
            // No partial files
            std::error_code rm_ec;
            fs::remove(item.local_path, rm_ec);
        }
    }
    return out;
}

TransferReport Downloader::execute(const std::vector<PlannedDownload>& plan, const std::string& label,
                                   const fs::path* prune_root) {
    int64_t total_bytes = 0;
    for (const auto& p : plan) total_bytes += p.asset.size_bytes;

    bool show_progress = console_.show_progress() && !options_.dry_run;
    TransferTracker tracker(TransferDirection::Download, label, console_, !show_progress);
    tracker.print_header(static_cast<int>(plan.size()), total_bytes);

    ChecksumValidator validator(options_.checksum);
    ProgressAccounter progress("Downloading", total_bytes, static_cast<int>(plan.size()),
                               show_progress, console_.out());

    {
        WorkerPool pool(static_cast<size_t>(options_.parallelism));
        std::vector<std::future<void>> pending;
        for (const auto& item : plan) {
            pending.push_back(pool.submit([&, item]() {
                TransferOutcome outcome = download_one(item, validator, progress);
                progress.file_done();
                tracker.record(outcome);
            }));
        }
        for (auto& f : pending) f.get();
    }
    progress.finish();

    if (prune_root) {
        if (options_.dry_run) {
            console_.info("Dry-run mode: --delete ignored (no files would be deleted)");
        } else {
            std::set<std::string> keep;
            for (const auto& p : plan) keep.insert(prune_key(p.local_path));
            prune_extra_files(*prune_root, keep, [&](const fs::path& deleted) {
                tracker.record_deleted(relative_slash_path(deleted, *prune_root));
            });
        }
    }

    if (options_.dry_run) {
        console_.info(fmt::format("Dry-run mode: would download {} files from {}",
                                  tracker.summary().succeeded, label));
    }
    tracker.print_summary();

    TransferReport report;
    report.summary = tracker.summary();
    report.status = report.summary.ok() ? TransferStatus::Success : TransferStatus::Error;
    return report;
}

TransferReport Downloader::download_compressed(const DownloadSource& src, const fs::path& dest_dir) {
    ArchiveFormat format = options_.compress_format ? *options_.compress_format
                                                    : detect_archive_format(src.archive_name);
    console_.detail(fmt::format("Looking for compressed archive: {} (format: {})", src.archive_name,
                                archive_format_name(format)));

    std::vector<RemoteAsset> assets = client_.list_assets(src.repository, src.folder);

    const RemoteAsset* archive = nullptr;
    for (const auto& a : assets) {
        if (a.path == src.archive_name || ends_with(a.path, "/" + src.archive_name)) {
            archive = &a;
            break;
        }
    }

    TransferReport report;
    if (!archive) {
        console_.warn(fmt::format("Archive '{}' not found in '{}' in repository '{}'",
                                  src.archive_name, src.folder, src.repository));
        for (const auto& a : assets) console_.detail(fmt::format("available: {}", a.path));
        report.status = assets.empty() ? TransferStatus::NoAssetsFound : TransferStatus::Error;
        return report;
    }

    std::string label = src.repository + "/" + archive->path;
    TransferTracker tracker(TransferDirection::Download, label, console_, false);

    if (options_.dry_run) {
        console_.info(fmt::format("Dry-run mode: would download and extract archive '{}' to {}",
                                  src.archive_name, dest_dir.string()));
        tracker.record({TransferOutcome::Kind::Downloaded, archive->path, archive->size_bytes, "dry run"});
        report.summary = tracker.summary();
        return report;
    }

    tracker.print_header(1, archive->size_bytes);
    ProgressAccounter progress("Downloading archive", archive->size_bytes, 1,
                               console_.show_progress(), console_.out());
    ArchiveCodec codec(format);
    const std::string url = archive->download_url;

    TransferOutcome outcome{TransferOutcome::Kind::Downloaded, archive->path, archive->size_bytes, ""};
    try {
        run_bridged(
            [&](ByteSink& sink) {
                ProgressSink tapped(sink, &progress);
                client_.download_asset(url, tapped);
            },
            [&](ByteSource& stream) {
                codec.read(stream, dest_dir);
            });
    } catch (const PathTraversalError&) {
        throw;
    } catch (const std::exception& e) {
        outcome.kind = TransferOutcome::Kind::Failed;
        outcome.detail = e.what();
    }
    progress.file_done();
    progress.finish();
    tracker.record(outcome);

    if (outcome.succeeded()) {
        console_.ok(fmt::format("Downloaded and extracted archive '{}' to {}", src.archive_name,
                                dest_dir.string()));
    }
    tracker.print_summary();

    report.summary = tracker.summary();
    report.status = report.summary.ok() ? TransferStatus::Success : TransferStatus::Error;
    return report;
}
