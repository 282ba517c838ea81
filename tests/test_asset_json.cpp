#include <gtest/gtest.h>
#include <nexus/asset_json.hpp>
#include <nexus/nexus_client.hpp>
#include <core/errors.hpp>

TEST(AssetJson, ParsesItemsAndToken) {
    const char* body = R"({
      "items": [
        {
          "downloadUrl": "http://nexus/repository/libs/docs/a.txt",
          "path": "/docs/a.txt",
          "repository": "libs",
          "fileSize": 1234,
          "checksum": {"sha1": "aa", "sha256": "bb", "md5": "cc"}
        },
        {"path": "docs/b.txt", "repository": "libs"}
      ],
      "continuationToken": "next-page"
    })";

    SearchPage page = parse_search_page(body);
    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.items[0].path, "docs/a.txt");
    EXPECT_EQ(page.items[0].download_url, "http://nexus/repository/libs/docs/a.txt");
    EXPECT_EQ(page.items[0].size_bytes, 1234);
    EXPECT_EQ(page.items[0].checksums.sha256, "bb");
    EXPECT_EQ(page.items[0].checksums.sha512, "");
    EXPECT_EQ(page.items[1].size_bytes, 0);
    EXPECT_EQ(page.continuation_token, "next-page");
}

TEST(AssetJson, NullTokenEndsPagination) {
    SearchPage page = parse_search_page(R"({"items": [], "continuationToken": null})");
    EXPECT_TRUE(page.items.empty());
    EXPECT_TRUE(page.continuation_token.empty());
}

TEST(AssetJson, MalformedBodiesAreProtocolErrors) {
    EXPECT_THROW(parse_search_page("not json"), ProtocolError);
    EXPECT_THROW(parse_search_page("[1, 2]"), ProtocolError);
    EXPECT_THROW(parse_search_page(R"({"items": {}})"), ProtocolError);
    EXPECT_THROW(parse_search_page(R"({"items": [5]})"), ProtocolError);
}

TEST(NexusClientUrls, SearchUrlEncodesQuery) {
    NexusClient client("http://nexus:8081", "u", "p");
    EXPECT_EQ(client.search_url("libs", "/docs/*", true, ""),
              "http://nexus:8081/service/rest/v1/search/assets?repository=libs"
              "&format=raw&sort=name&direction=asc&q=%2Fdocs%2F%2A");
    EXPECT_EQ(client.search_url("libs", "/docs*", false, "tok=1"),
              "http://nexus:8081/service/rest/v1/search/assets?repository=libs"
              "&q=%2Fdocs%2A&continuationToken=tok%3D1");
}
