#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// One page of GET /service/rest/v1/search/assets.
struct SearchPage {
    std::vector<RemoteAsset> items;
    std::string continuation_token;     // empty on the last page
};

// Throws ProtocolError on malformed JSON or an unexpected document shape.
SearchPage parse_search_page(const std::string& body);
