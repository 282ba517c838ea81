#include "asset_json.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <json/json.h>
#include <fmt/format.h>
#include <memory>

static std::string string_field(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : std::string();
}

SearchPage parse_search_page(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
        throw ProtocolError(fmt::format("malformed search response: {}", errs));
    }
    if (!root.isObject()) {
        throw ProtocolError("malformed search response: expected an object");
    }

    SearchPage page;
    const Json::Value& items = root["items"];
    if (!items.isNull() && !items.isArray()) {
        throw ProtocolError("malformed search response: 'items' is not an array");
    }

    for (const auto& item : items) {
        if (!item.isObject()) {
            throw ProtocolError("malformed search response: asset is not an object");
        }
        RemoteAsset asset;
        asset.path = trim_leading_slashes(string_field(item, "path"));
        asset.repository = string_field(item, "repository");
        asset.download_url = string_field(item, "downloadUrl");
        if (item["fileSize"].isNumeric()) {
            asset.size_bytes = item["fileSize"].asInt64();
        }

        const Json::Value& sums = item["checksum"];
        if (sums.isObject()) {
            asset.checksums.sha1 = string_field(sums, "sha1");
            asset.checksums.sha256 = string_field(sums, "sha256");
            asset.checksums.sha512 = string_field(sums, "sha512");
            asset.checksums.md5 = string_field(sums, "md5");
        }
        page.items.push_back(std::move(asset));
    }

    page.continuation_token = string_field(root, "continuationToken");
    return page;
}
