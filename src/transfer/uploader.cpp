#include "uploader.hpp"
#include "checksum.hpp"
#include "glob_filter.hpp"
#include "key_template.hpp"
#include "pipe_bridge.hpp"
#include "progress.hpp"
#include "streams.hpp"
#include "transfer_tracker.hpp"
#include "worker_pool.hpp"
#include <nexus/multipart.hpp>
#include <nexus/repository_client.hpp>
#include <cli/console.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <future>

UploadTarget parse_upload_destination(const std::string& destination, bool compress) {
    UploadTarget t;
    std::string dest = destination;
    while (!dest.empty() && dest.back() == '/') dest.pop_back();

    auto slash = dest.find('/');
    if (slash == std::string::npos) {
        t.repository = dest;
    } else {
        t.repository = dest.substr(0, slash);
        t.subdir = dest.substr(slash + 1);
    }
    if (t.repository.empty()) {
        throw ConfigurationError(fmt::format(
            "destination '{}' must be in the form 'repository' or 'repository/folder'", destination));
    }

    if (compress) {
        auto last = t.subdir.rfind('/');
        std::string name = last == std::string::npos ? t.subdir : t.subdir.substr(last + 1);
        if (!has_archive_suffix(name)) {
            throw ConfigurationError(
                "when using --compress, the destination must end with the archive filename "
                "(e.g., repo/path/archive.tar.gz)");
        }
        t.archive_name = name;
        t.subdir = last == std::string::npos ? "" : t.subdir.substr(0, last);
    }
    return t;
}

std::optional<PackageFormat> detect_package_format(const fs::path& source) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) return std::nullopt;
    std::string name = to_lower(source.filename().string());
    if (ends_with(name, ".deb")) return PackageFormat::Apt;
    if (ends_with(name, ".rpm")) return PackageFormat::Yum;
    return std::nullopt;
}

Uploader::Uploader(RepositoryClient& client, const TransferOptions& options, Console& console)
    : client_(client), options_(options), console_(console) {}

TransferReport Uploader::upload(const fs::path& source, const std::string& destination) {
    std::string dest = apply_key_template(destination, options_.key_from);
    if (!options_.key_from.empty()) {
        console_.info(fmt::format("Using key template: {} -> {}", destination, dest));
    }

    if (auto package = detect_package_format(source)) {
        const char* kind = *package == PackageFormat::Apt ? "APT" : "YUM";
        while (!dest.empty() && dest.back() == '/') dest.pop_back();
        if (dest.find('/') != std::string::npos) {
            throw ConfigurationError(fmt::format(
                "{} package upload does not support subdirectories. "
                "Use only repository name as destination.", kind));
        }
        if (dest.empty()) {
            throw ConfigurationError(fmt::format("destination '{}' must name a repository", destination));
        }
        if (options_.compress) {
            throw ConfigurationError(fmt::format("{} package upload does not support compression.", kind));
        }
        return upload_package(source, dest, *package);
    }

    UploadTarget target = parse_upload_destination(dest, options_.compress);
    if (options_.compress) {
        return upload_compressed(source, target);
    }
    return upload_files(source, target);
}

std::map<std::string, RemoteAsset> Uploader::remote_index(const UploadTarget& target) {
    std::map<std::string, RemoteAsset> index;
    if (options_.force) return index;

    try {
        for (auto& asset : client_.list_assets(target.repository, target.subdir)) {
            index[remote_relative_path(asset.path, target.subdir)] = asset;
        }
    } catch (const ProtocolError& e) {
        // Nothing to compare against; every file is uploaded
        console_.detail(fmt::format("Could not list existing assets (will upload all files): {}", e.what()));
        nexcli_log(fmt::format("upload: listing {}/{} failed: {}", target.repository, target.subdir, e.what()));
    }
    return index;
}

TransferOutcome Uploader::upload_one(const FileTransferUnit& unit, const UploadTarget& target,
                                     const std::map<std::string, RemoteAsset>& remote,
                                     const ChecksumValidator& validator, ProgressAccounter& progress) {
    TransferOutcome out{TransferOutcome::Kind::Failed, unit.relative_path, unit.size_bytes, ""};

    try {
        auto it = remote.find(unit.relative_path);
        if (!options_.force && it != remote.end()) {
            if (options_.skip_checksum) {
                progress.add_bytes(unit.size_bytes);
                out.kind = TransferOutcome::Kind::Skipped;
                out.detail = "file exists";
                return out;
            }
            if (validator.can_validate(it->second.checksums) &&
                validator.validate(unit.absolute_path, it->second.checksums, &progress)) {
                out.kind = TransferOutcome::Kind::Skipped;
                out.detail = algorithm_name(validator.algorithm()) + " match";
                return out;
            }
        }

        if (options_.dry_run) {
            console_.detail(fmt::format("Would upload: {}", unit.relative_path));
            out.kind = TransferOutcome::Kind::Uploaded;
            out.detail = "dry run";
            return out;
        }

        std::string boundary = MultipartWriter::random_boundary();
        std::string content_type = "multipart/form-data; boundary=" + boundary;
        run_bridged(
            [&](ByteSink& sink) {
                MultipartWriter form(sink, boundary);
                write_raw_upload_form(form, unit, target.subdir, &progress);
            },
            [&](ByteSource& body) {
                client_.upload_component(target.repository, body, content_type);
            });
        out.kind = TransferOutcome::Kind::Uploaded;
    } catch (const std::exception& e) {
        out.kind = TransferOutcome::Kind::Failed;
        out.detail = e.what();
        nexcli_log(fmt::format("upload {} failed: {}", unit.relative_path, e.what()));
    }
    return out;
}

TransferReport Uploader::upload_files(const fs::path& source, const UploadTarget& target) {
    GlobFilter filter(options_.glob);
    std::vector<FileTransferUnit> files = filter.collect_files(source);

    std::string label = target.subdir.empty() ? target.repository
                                              : target.repository + "/" + target.subdir;
    TransferReport report;
    if (files.empty()) {
        console_.info(fmt::format("No files to upload in {}", source.string()));
        return report;
    }

    int64_t total_bytes = 0;
    for (const auto& f : files) total_bytes += f.size_bytes;

    bool show_progress = console_.show_progress() && !options_.dry_run;
    TransferTracker tracker(TransferDirection::Upload, label, console_, !show_progress);
    tracker.print_header(static_cast<int>(files.size()), total_bytes);

    std::map<std::string, RemoteAsset> remote = remote_index(target);
    ChecksumValidator validator(options_.checksum);
    ProgressAccounter progress("Uploading", total_bytes, static_cast<int>(files.size()),
                               show_progress, console_.out());

    {
        WorkerPool pool(static_cast<size_t>(options_.parallelism));
        std::vector<std::future<void>> pending;
        for (const auto& unit : files) {
            pending.push_back(pool.submit([&, unit]() {
                TransferOutcome outcome = upload_one(unit, target, remote, validator, progress);
                progress.file_done();
                tracker.record(outcome);
            }));
        }
        for (auto& f : pending) f.get();
    }
    progress.finish();

    if (options_.dry_run) {
        console_.info(fmt::format("Dry-run mode: would upload {} files to {}",
                                  tracker.summary().succeeded, label));
    }
    tracker.print_summary();

    report.summary = tracker.summary();
    report.status = report.summary.ok() ? TransferStatus::Success : TransferStatus::Error;
    return report;
}

TransferReport Uploader::upload_compressed(const fs::path& source, const UploadTarget& target) {
    ArchiveFormat format = options_.compress_format ? *options_.compress_format
                                                    : detect_archive_format(target.archive_name);
    GlobFilter filter(options_.glob);
    std::vector<FileTransferUnit> files = filter.collect_files(source);
    if (files.empty()) {
        throw NexcliError(fmt::format("no files to upload in {}", source.string()));
    }

    int64_t total_bytes = 0;
    for (const auto& f : files) total_bytes += f.size_bytes;

    std::string archive_path = target.subdir.empty() ? target.archive_name
                                                     : target.subdir + "/" + target.archive_name;
    console_.detail(fmt::format("Creating compressed archive: {} (format: {})", target.archive_name,
                                archive_format_name(format)));

    TransferReport report;
    TransferTracker tracker(TransferDirection::Upload, target.repository + "/" + archive_path,
                            console_, false);

    if (options_.dry_run) {
        console_.info(fmt::format("Dry-run mode: would upload compressed archive containing {} files to {}/{}",
                                  files.size(), target.repository, archive_path));
        tracker.record({TransferOutcome::Kind::Uploaded, archive_path, total_bytes, "dry run"});
        report.summary = tracker.summary();
        return report;
    }

    tracker.print_header(static_cast<int>(files.size()), total_bytes);
    // The uncompressed size is only an estimate of what crosses the wire
    ProgressAccounter progress("Uploading compressed archive", total_bytes, 1,
                               console_.show_progress(), console_.out());

    ArchiveCodec codec(format);
    std::string boundary = MultipartWriter::random_boundary();
    std::string content_type = "multipart/form-data; boundary=" + boundary;

    TransferOutcome outcome{TransferOutcome::Kind::Uploaded, archive_path, total_bytes, ""};
    try {
        run_bridged(
            [&](ByteSink& sink) {
                MultipartWriter form(sink, boundary);
                ByteSink& part = form.begin_file("raw.asset1", target.archive_name);
                codec.write(source, part, filter, &progress);
                form.end_part();
                form.write_field("raw.asset1.filename", target.archive_name);
                if (!target.subdir.empty()) form.write_field("raw.directory", target.subdir);
                form.close();
            },
            [&](ByteSource& body) {
                client_.upload_component(target.repository, body, content_type);
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
        console_.ok(fmt::format("Uploaded compressed archive containing {} files from {}",
                                files.size(), source.string()));
    }
    tracker.print_summary();

    report.summary = tracker.summary();
    report.status = report.summary.ok() ? TransferStatus::Success : TransferStatus::Error;
    return report;
}

TransferReport Uploader::upload_package(const fs::path& source, const std::string& repository,
                                        PackageFormat format) {
    FileTransferUnit unit;
    unit.absolute_path = fs::absolute(source).string();
    unit.relative_path = source.filename().string();
    std::error_code ec;
    unit.size_bytes = static_cast<int64_t>(fs::file_size(source, ec));

    std::string kind = package_format_name(format);
    TransferReport report;
    TransferTracker tracker(TransferDirection::Upload, repository, console_, false);

    if (options_.dry_run) {
        console_.info(fmt::format("Dry-run mode: would upload {} package {} to {}",
                                  kind, unit.relative_path, repository));
        tracker.record({TransferOutcome::Kind::Uploaded, unit.relative_path, unit.size_bytes, "dry run"});
        report.summary = tracker.summary();
        return report;
    }

    tracker.print_header(1, unit.size_bytes);
    ProgressAccounter progress(fmt::format("Uploading {} package", kind), unit.size_bytes, 1,
                               console_.show_progress(), console_.out());

    std::string boundary = MultipartWriter::random_boundary();
    std::string content_type = "multipart/form-data; boundary=" + boundary;

    TransferOutcome outcome{TransferOutcome::Kind::Uploaded, unit.relative_path, unit.size_bytes, ""};
    try {
        run_bridged(
            [&](ByteSink& sink) {
                MultipartWriter form(sink, boundary);
                write_package_upload_form(form, format, unit, &progress);
            },
            [&](ByteSource& body) {
                client_.upload_component(repository, body, content_type);
            });
    } catch (const std::exception& e) {
        outcome.kind = TransferOutcome::Kind::Failed;
        outcome.detail = e.what();
        nexcli_log(fmt::format("upload {} package {} failed: {}", kind, unit.relative_path, e.what()));
    }
    progress.file_done();
    progress.finish();
    tracker.record(outcome);

    if (outcome.succeeded()) {
        console_.ok(fmt::format("Uploaded {} package {}", kind, unit.relative_path));
    }
    tracker.print_summary();

    report.summary = tracker.summary();
    report.status = report.summary.ok() ? TransferStatus::Success : TransferStatus::Error;
    return report;
}
