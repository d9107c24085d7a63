#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "content_info.h"
#include "download_stats_log.h"
#include "fragment_index.h"

/// Persisted fields of a cache configuration. The snapshot path and the
/// pending save counter are properties of the live entity and never stored.
struct SnapshotData {
    std::string file_name;
    std::vector<Fragment> fragments;
    std::vector<DownloadSample> download_info;
    std::string url;                          // empty = unknown
    std::optional<ContentInfo> content_info;
};

/// Binary (CBOR) codec for SnapshotData.
///
/// Every object in the document carries a "$type" tag. Decoding accepts only
/// the closed set {CacheConfiguration, Range, ContentInfo} plus arrays,
/// strings, numbers, booleans and null; anything else (unknown tags, byte
/// strings, CBOR semantic tags) fails the whole decode.
class SnapshotCodec {
public:
    static constexpr const char* kRootType = "CacheConfiguration";
    static constexpr const char* kRangeType = "Range";
    static constexpr const char* kContentInfoType = "ContentInfo";

    /// Serialize to CBOR. Returns nullopt (and sets *error) on failure.
    static std::optional<std::vector<uint8_t>> encode(const SnapshotData& data,
                                                      std::string* error = nullptr);

    /// Parse and validate a CBOR blob.
    static std::optional<SnapshotData> decode(const std::vector<uint8_t>& bytes,
                                              std::string* error = nullptr);

    /// Read a whole snapshot file.
    static std::optional<std::vector<uint8_t>> readFile(const std::string& path,
                                                        std::string* error = nullptr);

    /// Atomically replace `path` with `bytes` (temp file + rename).
    /// Creates missing parent directories.
    static bool writeFile(const std::string& path,
                          const std::vector<uint8_t>& bytes,
                          std::string* error = nullptr);
};
