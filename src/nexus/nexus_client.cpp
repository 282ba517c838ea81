#include "nexus_client.hpp"
#include "asset_json.hpp"
#include <transfer/streams.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <exception>

namespace {

std::once_flag g_curl_init;

struct CurlHandle {
    CURL* h = nullptr;
    struct curl_slist* headers = nullptr;

    CurlHandle() {
        std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
        h = curl_easy_init();
        if (!h) throw ProtocolError("failed to initialise libcurl");
    }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    void add_header(const std::string& line) {
        headers = curl_slist_append(headers, line.c_str());
    }
};

// Response bodies go to `sink` only for the expected status; anything else is
// captured as error text so a 404 page never lands in a downloaded file.
struct ResponseContext {
    CURL* h;
    long expect_status;
    ByteSink* sink;
    std::string error_body;
    std::exception_ptr error;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<ResponseContext*>(userdata);
    const size_t total = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->h, CURLINFO_RESPONSE_CODE, &status);
    if (status != ctx->expect_status || !ctx->sink) {
        if (ctx->error_body.size() < 4096) ctx->error_body.append(ptr, total);
        return total;
    }

    try {
        ctx->sink->write(ptr, total);
        return total;
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;   // CURLE_WRITE_ERROR
    }
}

struct RequestBody {
    ByteSource* source;
    std::exception_ptr error;
};

size_t read_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* body = static_cast<RequestBody*>(userdata);
    try {
        return body->source->read(buffer, size * nitems);
    } catch (...) {
        body->error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

std::string escape(CURL* h, const std::string& s) {
    char* out = curl_easy_escape(h, s.c_str(), static_cast<int>(s.size()));
    if (!out) throw ProtocolError("failed to encode URL component");
    std::string result(out);
    curl_free(out);
    return result;
}

void apply_common(CurlHandle& c, const std::string& url, const std::string& user,
                  const std::string& pass) {
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(c.h, CURLOPT_USERNAME, user.c_str());
    curl_easy_setopt(c.h, CURLOPT_PASSWORD, pass.c_str());
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(c.h, CURLOPT_USERAGENT, (std::string("nexcli/") + NEXCLI_VERSION).c_str());
}

// Run the request; rethrow stream errors parked by callbacks.
long perform(CurlHandle& c, const std::string& method, const std::string& url,
             ResponseContext& ctx, RequestBody* body) {
    CURLcode rc = curl_easy_perform(c.h);
    if (ctx.error) std::rethrow_exception(ctx.error);
    if (body && body->error) std::rethrow_exception(body->error);

    long status = 0;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    nexcli_log_http(method, url, status);

    if (rc != CURLE_OK) {
        throw ProtocolError(fmt::format("{} {}: {}", method, url, curl_easy_strerror(rc)), status);
    }
    return status;
}

} // namespace

// ── NexusClient ────────────────────────────────────────────

NexusClient::NexusClient(std::string base_url, std::string username, std::string password)
    : base_url_(std::move(base_url)), username_(std::move(username)), password_(std::move(password)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string NexusClient::search_url(const std::string& repository, const std::string& query,
                                    bool folder_listing, const std::string& continuation_token) const {
    CurlHandle c;
    std::string url = base_url_ + NEXUS_SEARCH_ASSETS + "?repository=" + escape(c.h, repository);
    if (folder_listing) {
        url += "&format=raw&sort=name&direction=asc";
    }
    if (!query.empty()) {
        url += "&q=" + escape(c.h, query);
    }
    if (!continuation_token.empty()) {
        url += "&continuationToken=" + escape(c.h, continuation_token);
    }
    return url;
}

std::string NexusClient::get_json(const std::string& url, const char* what) {
    CurlHandle c;
    apply_common(c, url, username_, password_);
    c.add_header("Accept: application/json");
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);

    StringSink body;
    ResponseContext ctx{c.h, 200, &body, "", nullptr};
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &ctx);

    long status = perform(c, "GET", url, ctx, nullptr);
    if (status != 200) {
        throw ProtocolError(fmt::format("failed to {}: status {}", what, status), status);
    }
    return body.data();
}

std::vector<RemoteAsset> NexusClient::paginate(const std::string& repository, const std::string& query,
                                               bool folder_listing, const char* what) {
    std::vector<RemoteAsset> assets;
    std::string token;
    for (;;) {
        SearchPage page = parse_search_page(get_json(search_url(repository, query, folder_listing, token), what));
        for (auto& a : page.items) assets.push_back(std::move(a));
        if (page.continuation_token.empty()) break;
        token = page.continuation_token;
    }
    return assets;
}

std::vector<RemoteAsset> NexusClient::list_assets(const std::string& repository,
                                                  const std::string& path_prefix) {
    std::string prefix = trim_leading_slashes(path_prefix);
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    std::string q = prefix.empty() ? "/*" : "/" + prefix + "/*";
    return paginate(repository, q, true, "list assets");
}

std::vector<RemoteAsset> NexusClient::search_assets(const std::string& repository,
                                                    const std::string& path_prefix) {
    std::string prefix = trim_leading_slashes(path_prefix);
    std::string q = prefix.empty() ? "" : "/" + prefix + "*";
    return paginate(repository, q, false, "search assets");
}

RemoteAsset NexusClient::get_asset_by_path(const std::string& repository, const std::string& path) {
    std::string wanted = trim_leading_slashes(path);
    SearchPage page = parse_search_page(
        get_json(search_url(repository, "/" + wanted, false, ""), "get asset"));
    for (auto& asset : page.items) {
        if (asset.path == wanted) return asset;
    }
    throw ProtocolError(fmt::format("asset not found: {}", wanted), 404);
}

void NexusClient::upload_component(const std::string& repository, ByteSource& body,
                                   const std::string& content_type) {
    CurlHandle c;
    std::string url = base_url_ + NEXUS_COMPONENTS + "?repository=" + escape(c.h, repository);
    apply_common(c, url, username_, password_);

    c.add_header("Content-Type: " + content_type);
    c.add_header("Transfer-Encoding: chunked");
    c.add_header("Expect:");
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_POST, 1L);

    RequestBody request{&body, nullptr};
    curl_easy_setopt(c.h, CURLOPT_READFUNCTION, read_cb);
    curl_easy_setopt(c.h, CURLOPT_READDATA, &request);

    ResponseContext ctx{c.h, 0, nullptr, "", nullptr};
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &ctx);

    long status = perform(c, "POST", url, ctx, &request);
    if (status == 204) return;
    if (status == 404) {
        throw ProtocolError(fmt::format("repository '{}' not found (status {})", repository, status),
                            status);
    }
    throw ProtocolError(fmt::format("upload failed with status {}: {}", status, ctx.error_body),
                        status);
}

void NexusClient::download_asset(const std::string& download_url, ByteSink& dest) {
    CurlHandle c;
    apply_common(c, download_url, username_, password_);

    ResponseContext ctx{c.h, 200, &dest, "", nullptr};
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &ctx);

    long status = perform(c, "GET", download_url, ctx, nullptr);
    if (status != 200) {
        throw ProtocolError(fmt::format("failed to download asset: status {}", status), status);
    }
}

// ── NexusClientFactory ─────────────────────────────────────

NexusClientFactory::NexusClientFactory(std::string default_url, std::string username,
                                       std::string password)
    : default_url_(std::move(default_url)), username_(std::move(username)), password_(std::move(password)) {}

std::shared_ptr<RepositoryClient> NexusClientFactory::client_for(const std::string& url) {
    std::string key = url.empty() ? default_url_ : url;
    while (!key.empty() && key.back() == '/') key.pop_back();

    std::lock_guard<std::mutex> lock(mu_);
    auto it = clients_.find(key);
    if (it != clients_.end()) return it->second;

    auto client = std::make_shared<NexusClient>(key, username_, password_);
    clients_[key] = client;
    return client;
}
