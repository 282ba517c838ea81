#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/types.hpp>

class ByteSink;
class ByteSource;

// Remote side of every transfer. Implementations throw ProtocolError for
// transport failures, non-2xx responses and malformed bodies.
class RepositoryClient {
public:
    virtual ~RepositoryClient() = default;

    // Every asset under path_prefix/ (folder listing), following
    // continuation tokens until the server omits one.
    virtual std::vector<RemoteAsset> list_assets(const std::string& repository,
                                                 const std::string& path_prefix) = 0;

    // Every asset whose path starts with path_prefix.
    virtual std::vector<RemoteAsset> search_assets(const std::string& repository,
                                                   const std::string& path_prefix) = 0;

    // The asset at exactly `path`; ProtocolError "asset not found" otherwise.
    virtual RemoteAsset get_asset_by_path(const std::string& repository,
                                          const std::string& path) = 0;

    // POST a component form; `body` is consumed to end of stream.
    virtual void upload_component(const std::string& repository, ByteSource& body,
                                  const std::string& content_type) = 0;

    virtual void download_asset(const std::string& download_url, ByteSink& dest) = 0;
};

// Hands out clients for a repository base URL. An empty URL means the
// configured default repository.
class ClientFactory {
public:
    virtual ~ClientFactory() = default;
    virtual std::shared_ptr<RepositoryClient> client_for(const std::string& url) = 0;
};
