#include "../base_cli.hpp"
#include <transfer/checksum.hpp>
#include <transfer/downloader.hpp>
#include <transfer/uploader.hpp>
#include <nexus/repository_client.hpp>
#include <core/errors.hpp>
#include <fmt/format.h>

// ── Flags ────────────────────────────────────────────────────

static std::vector<FlagSpec> transfer_flags(bool download) {
    std::vector<FlagSpec> flags = BaseCLI::global_flags();
    flags.insert(flags.end(), {
        {"checksum", 'c', true},
        {"skip-checksum", 's', false},
        {"force", 0, false},
        {"dry-run", 'n', false},
        {"compress", 'z', false},
        {"compress-format", 0, true},
        {"glob", 'g', true},
        {"key-from", 0, true},
    });
    if (download) {
        flags.push_back({"flatten", 'f', false});
        flags.push_back({"delete", 0, false});
    }
    return flags;
}

static TransferOptions build_options(BaseCLI& cli, const Arguments& args) {
    const Config& cfg = cli.config();

    TransferOptions opts;
    opts.checksum = args.has("checksum") ? parse_checksum_algorithm(args.value("checksum"))
                                         : cfg.checksum();
    opts.skip_checksum = args.has("skip-checksum");
    opts.force = args.has("force");
    opts.dry_run = args.has("dry-run");
    opts.compress = args.has("compress");
    if (args.has("compress-format")) {
        opts.compress_format = parse_archive_format(args.value("compress-format"));
        opts.compress = true;
    }
    opts.glob = args.value("glob");
    opts.key_from = args.value("key-from");
    opts.flatten = args.has("flatten");
    opts.delete_extra = args.has("delete");
    opts.parallelism = cfg.parallelism();

    if (opts.skip_checksum && opts.force) {
        throw ConfigurationError("--skip-checksum and --force cannot be combined");
    }
    return opts;
}

// ── upload ───────────────────────────────────────────────────

static int cmd_upload(BaseCLI& cli, const std::vector<std::string>& tokens) {
    Arguments args(tokens, transfer_flags(false));
    cli.apply_global_flags(args);

    const auto& pos = args.positionals();
    if (pos.size() != 2) {
        throw ConfigurationError("usage: nexcli upload <localPath> <repository[/subdir]>");
    }

    TransferOptions opts = build_options(cli, args);
    auto client = cli.clients().client_for("");
    Uploader uploader(*client, opts, cli.console());
    TransferReport report = uploader.upload(pos[0], pos[1]);
    return static_cast<int>(report.status);
}

// ── download ─────────────────────────────────────────────────

static int cmd_download(BaseCLI& cli, const std::vector<std::string>& tokens) {
    Arguments args(tokens, transfer_flags(true));
    cli.apply_global_flags(args);

    const auto& pos = args.positionals();
    if (pos.size() != 2) {
        throw ConfigurationError("usage: nexcli download <repository/folder> <localDir>");
    }

    TransferOptions opts = build_options(cli, args);
    auto client = cli.clients().client_for("");
    Downloader downloader(*client, opts, cli.console());
    TransferReport report = downloader.download(pos[0], pos[1]);
    return static_cast<int>(report.status);
}

void register_transfer_commands(BaseCLI& cli) {
    cli.add_command("upload", cmd_upload, "upload <localPath> <repository[/subdir]>",
                    "Upload a file or directory");
    cli.add_command("download", cmd_download, "download <repository/folder> <localDir>",
                    "Download a folder, asset or archive");
}
