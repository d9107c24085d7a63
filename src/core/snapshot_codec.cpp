#include "snapshot_codec.h"
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kTypeKey = "$type";
constexpr int kMaxDepth = 16;

void setError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

// ── Encoding helpers ───────────────────────────────────────────

json fragmentToJson(const Fragment& f) {
    return json{
        {kTypeKey, SnapshotCodec::kRangeType},
        {"offset", f.offset},
        {"length", f.length}
    };
}

json contentInfoToJson(const ContentInfo& info) {
    return json{
        {kTypeKey,                      SnapshotCodec::kContentInfoType},
        {"content_type",                info.content_type},
        {"byte_range_access_supported", info.byte_range_access_supported},
        {"content_length",              info.content_length},
        {"downloaded_content_length",   info.downloaded_content_length}
    };
}

json snapshotToJson(const SnapshotData& data) {
    json fragments = json::array();
    for (const auto& f : data.fragments) {
        fragments.push_back(fragmentToJson(f));
    }

    json download_info = json::array();
    for (const auto& s : data.download_info) {
        download_info.push_back(json::array({s.bytes, s.seconds}));
    }

    return json{
        {kTypeKey,        SnapshotCodec::kRootType},
        {"file_name",     data.file_name},
        {"fragments",     fragments},
        {"download_info", download_info},
        {"content_info",  data.content_info ? contentInfoToJson(*data.content_info) : json(nullptr)},
        {"url",           data.url.empty() ? json(nullptr) : json(data.url)}
    };
}

// ── Allow-list walk ────────────────────────────────────────────

bool isAllowedType(const std::string& type) {
    return type == SnapshotCodec::kRootType
        || type == SnapshotCodec::kRangeType
        || type == SnapshotCodec::kContentInfoType;
}

bool checkAllowed(const json& value, int depth, std::string* error) {
    if (depth > kMaxDepth) {
        setError(error, "snapshot nesting too deep");
        return false;
    }

    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::boolean:
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
        case json::value_t::string:
            return true;

        case json::value_t::array:
            for (const auto& element : value) {
                if (!checkAllowed(element, depth + 1, error)) {
                    return false;
                }
            }
            return true;

        case json::value_t::object: {
            auto it = value.find(kTypeKey);
            if (it == value.end() || !it->is_string()) {
                setError(error, "object without type tag");
                return false;
            }
            const auto& type = it->get_ref<const std::string&>();
            if (!isAllowedType(type)) {
                setError(error, "type not allowed: " + type);
                return false;
            }
            for (const auto& element : value.items()) {
                if (!checkAllowed(element.value(), depth + 1, error)) {
                    return false;
                }
            }
            return true;
        }

        default:
            setError(error, std::string("value kind not allowed: ") + value.type_name());
            return false;
    }
}

bool hasType(const json& value, const char* type) {
    if (!value.is_object()) {
        return false;
    }
    auto it = value.find(kTypeKey);
    return it != value.end() && it->is_string()
        && it->get_ref<const std::string&>() == type;
}

// ── Field extraction ───────────────────────────────────────────

bool readInt64(const json& value, int64_t& out) {
    if (value.is_number_unsigned()) {
        auto u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        out = static_cast<int64_t>(u);
        return true;
    }
    if (value.is_number_integer()) {
        out = value.get<int64_t>();
        return true;
    }
    return false;
}

bool readOptionalString(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        out.clear();
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool fragmentFromJson(const json& j, Fragment& out) {
    if (!hasType(j, SnapshotCodec::kRangeType)) {
        return false;
    }
    auto offset = j.find("offset");
    auto length = j.find("length");
    if (offset == j.end() || length == j.end()) {
        return false;
    }
    return readInt64(*offset, out.offset) && readInt64(*length, out.length);
}

bool sampleFromJson(const json& j, DownloadSample& out) {
    if (!j.is_array() || j.size() != 2 || !j[1].is_number()) {
        return false;
    }
    if (!readInt64(j[0], out.bytes)) {
        return false;
    }
    out.seconds = j[1].get<double>();
    return true;
}

bool contentInfoFromJson(const json& j, ContentInfo& out) {
    if (!hasType(j, SnapshotCodec::kContentInfoType)) {
        return false;
    }
    if (!readOptionalString(j, "content_type", out.content_type)) {
        return false;
    }
    auto ranges = j.find("byte_range_access_supported");
    if (ranges != j.end()) {
        if (!ranges->is_boolean()) {
            return false;
        }
        out.byte_range_access_supported = ranges->get<bool>();
    }
    auto length = j.find("content_length");
    if (length != j.end() && !readInt64(*length, out.content_length)) {
        return false;
    }
    auto downloaded = j.find("downloaded_content_length");
    if (downloaded != j.end() && !readInt64(*downloaded, out.downloaded_content_length)) {
        return false;
    }
    return true;
}

std::optional<SnapshotData> snapshotFromJson(const json& j, std::string* error) {
    if (!hasType(j, SnapshotCodec::kRootType)) {
        setError(error, "root is not a cache configuration");
        return std::nullopt;
    }

    SnapshotData data;
    if (!readOptionalString(j, "file_name", data.file_name)) {
        setError(error, "file_name is not a string");
        return std::nullopt;
    }
    if (!readOptionalString(j, "url", data.url)) {
        setError(error, "url is not a string");
        return std::nullopt;
    }

    // A missing fragment list is an empty index, not an error.
    auto fragments = j.find("fragments");
    if (fragments != j.end() && !fragments->is_null()) {
        if (!fragments->is_array()) {
            setError(error, "fragments is not an array");
            return std::nullopt;
        }
        for (const auto& fj : *fragments) {
            Fragment f;
            if (!fragmentFromJson(fj, f)) {
                setError(error, "malformed fragment");
                return std::nullopt;
            }
            data.fragments.push_back(f);
        }
    }

    auto download_info = j.find("download_info");
    if (download_info != j.end() && !download_info->is_null()) {
        if (!download_info->is_array()) {
            setError(error, "download_info is not an array");
            return std::nullopt;
        }
        for (const auto& sj : *download_info) {
            DownloadSample s;
            if (!sampleFromJson(sj, s)) {
                setError(error, "malformed download sample");
                return std::nullopt;
            }
            data.download_info.push_back(s);
        }
    }

    auto content_info = j.find("content_info");
    if (content_info != j.end() && !content_info->is_null()) {
        ContentInfo info;
        if (!contentInfoFromJson(*content_info, info)) {
            setError(error, "malformed content_info");
            return std::nullopt;
        }
        data.content_info = info;
    }

    return data;
}

} // namespace

// ── SnapshotCodec implementation ───────────────────────────────

std::optional<std::vector<uint8_t>> SnapshotCodec::encode(const SnapshotData& data,
                                                          std::string* error) {
    try {
        return json::to_cbor(snapshotToJson(data));
    } catch (const json::exception& e) {
        setError(error, std::string("encode failed: ") + e.what());
        return std::nullopt;
    }
}

std::optional<SnapshotData> SnapshotCodec::decode(const std::vector<uint8_t>& bytes,
                                                  std::string* error) {
    if (bytes.empty()) {
        setError(error, "empty snapshot");
        return std::nullopt;
    }

    json j;
    try {
        // Default tag handler rejects CBOR semantic tags.
        j = json::from_cbor(bytes);
    } catch (const json::exception& e) {
        setError(error, std::string("malformed snapshot: ") + e.what());
        return std::nullopt;
    }

    if (!checkAllowed(j, 0, error)) {
        return std::nullopt;
    }

    try {
        return snapshotFromJson(j, error);
    } catch (const json::exception& e) {
        setError(error, std::string("malformed snapshot: ") + e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<uint8_t>> SnapshotCodec::readFile(const std::string& path,
                                                            std::string* error) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        setError(error, "cannot open " + path);
        return std::nullopt;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(ifs)),
                               std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        setError(error, "read error on " + path);
        return std::nullopt;
    }
    return bytes;
}

bool SnapshotCodec::writeFile(const std::string& path,
                              const std::vector<uint8_t>& bytes,
                              std::string* error) {
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            setError(error, "cannot create directory for " + path + ": " + ec.message());
            return false;
        }
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            setError(error, "cannot open " + tmp.string());
            return false;
        }
        ofs.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        ofs.flush();
        if (!ofs.good()) {
            setError(error, "write error on " + tmp.string());
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        setError(error, "cannot replace " + path + ": " + ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}
