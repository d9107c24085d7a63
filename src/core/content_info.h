#pragma once

#include <cstdint>
#include <string>

/// Metadata about the remote resource, filled in by the caller from the
/// response headers. Persisted verbatim with the cache state.
struct ContentInfo {
    std::string content_type;
    bool byte_range_access_supported = false;
    int64_t content_length = 0;              // 0 = unknown
    int64_t downloaded_content_length = 0;

    bool operator==(const ContentInfo& other) const {
        return content_type == other.content_type
            && byte_range_access_supported == other.byte_range_access_supported
            && content_length == other.content_length
            && downloaded_content_length == other.downloaded_content_length;
    }
    bool operator!=(const ContentInfo& other) const { return !(*this == other); }
};
