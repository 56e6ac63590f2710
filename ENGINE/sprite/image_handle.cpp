#include "sprite/image_handle.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "utils/base64.hpp"
#include "utils/string_utils.hpp"

namespace fs = std::filesystem;

namespace flipbook::sprite {
namespace {
constexpr std::string_view kDataPrefix = "data:";
constexpr std::string_view kBase64Marker = ";base64,";
}

bool is_data_url(std::string_view handle) {
    return strings::starts_with(handle, kDataPrefix);
}

std::string make_data_url(std::string_view mime_type, std::string_view base64_payload) {
    std::string url;
    url.reserve(kDataPrefix.size() + mime_type.size() + kBase64Marker.size() + base64_payload.size());
    url.append(kDataPrefix);
    url.append(mime_type);
    url.append(kBase64Marker);
    url.append(base64_payload);
    return url;
}

std::vector<std::uint8_t> decode_data_url(std::string_view handle) {
    if (!is_data_url(handle)) {
        throw ImageLoadError("not a data URL");
    }
    const std::size_t marker = handle.find(kBase64Marker);
    if (marker == std::string_view::npos) {
        throw ImageLoadError("data URL is not base64 encoded");
    }
    auto bytes = base64::decode(handle.substr(marker + kBase64Marker.size()));
    if (!bytes) {
        throw ImageLoadError("data URL payload is not valid base64");
    }
    if (bytes->empty()) {
        throw ImageLoadError("data URL payload is empty");
    }
    return std::move(*bytes);
}

std::vector<std::uint8_t> read_image_bytes(const std::string& handle) {
    if (strings::trim_copy(handle).empty()) {
        throw ImageLoadError("empty image handle");
    }
    if (is_data_url(handle)) {
        return decode_data_url(handle);
    }

    const fs::path path(handle);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        throw ImageLoadError("image file not found: " + path.string());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw ImageLoadError("unable to open image file: " + path.string());
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (bytes.empty()) {
        throw ImageLoadError("image file is empty: " + path.string());
    }
    return bytes;
}

}
