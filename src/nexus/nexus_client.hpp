#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>
#include "repository_client.hpp"

// RepositoryClient over the Nexus 3 REST API (libcurl, HTTP basic auth).
// One easy handle per call, so a single client may be shared by workers.
class NexusClient : public RepositoryClient {
public:
    NexusClient(std::string base_url, std::string username, std::string password);

    std::vector<RemoteAsset> list_assets(const std::string& repository,
                                         const std::string& path_prefix) override;
    std::vector<RemoteAsset> search_assets(const std::string& repository,
                                           const std::string& path_prefix) override;
    RemoteAsset get_asset_by_path(const std::string& repository,
                                  const std::string& path) override;
    void upload_component(const std::string& repository, ByteSource& body,
                          const std::string& content_type) override;
    void download_asset(const std::string& download_url, ByteSink& dest) override;

    // Search URL with the query parameters percent-encoded.
    std::string search_url(const std::string& repository, const std::string& query,
                           bool folder_listing, const std::string& continuation_token) const;

private:
    std::vector<RemoteAsset> paginate(const std::string& repository, const std::string& query,
                                      bool folder_listing, const char* what);
    std::string get_json(const std::string& url, const char* what);

    std::string base_url_;
    std::string username_;
    std::string password_;
};

// Caches one NexusClient per base URL; all share the same credentials.
class NexusClientFactory : public ClientFactory {
public:
    NexusClientFactory(std::string default_url, std::string username, std::string password);

    std::shared_ptr<RepositoryClient> client_for(const std::string& url) override;

private:
    std::string default_url_;
    std::string username_;
    std::string password_;
    std::mutex mu_;
    std::map<std::string, std::shared_ptr<RepositoryClient>> clients_;
};
