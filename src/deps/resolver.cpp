#include "resolver.hpp"
#include <nexus/repository_client.hpp>
#include <transfer/checksum.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

namespace {

std::string lock_entry(const Dependency& dep, const RemoteAsset& asset) {
    std::string digest = asset.checksums.get(dep.checksum_algorithm);
    if (digest.empty()) {
        throw IntegrityError(fmt::format("no {} checksum available for asset {}",
                                         algorithm_name(dep.checksum_algorithm), asset.path));
    }
    return algorithm_name(dep.checksum_algorithm) + ":" + digest;
}

}  // namespace

LockedFiles Resolver::resolve(const Dependency& dep) {
    auto client = clients_.client_for(dep.source_url);
    std::string expanded = dep.expanded_path();
    LockedFiles files;

    if (dep.recursive) {
        std::string prefix = expanded;
        while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();

        std::vector<RemoteAsset> assets;
        try {
            assets = client->search_assets(dep.repository, prefix);
        } catch (const ProtocolError& e) {
            throw ProtocolError(fmt::format("failed to search assets for {}: {}", dep.name, e.what()),
                                e.status());
        }
        if (assets.empty()) {
            throw NexcliError(fmt::format("no assets found for dependency {} at path {}",
                                          dep.name, expanded));
        }
        for (const auto& asset : assets) {
            files[asset.path] = lock_entry(dep, asset);
        }
    } else {
        RemoteAsset asset;
        try {
            asset = client->get_asset_by_path(dep.repository, expanded);
        } catch (const ProtocolError& e) {
            throw ProtocolError(fmt::format("failed to get asset for {}: {}", dep.name, e.what()),
                                e.status());
        }
        files[asset.path] = lock_entry(dep, asset);
    }

    nexcli_log(fmt::format("resolve {}: {} file(s)", dep.name, files.size()));
    return files;
}
