#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace flipbook::sprite {

// Decode or I/O failure while turning an image handle into pixels. Terminal for that attempt.
class ImageLoadError : public std::runtime_error {
public:
    explicit ImageLoadError(const std::string& what) : std::runtime_error(what) {}
};

// An image handle is either a "data:<mime>;base64,<payload>" URL or a file path.
bool is_data_url(std::string_view handle);

std::string make_data_url(std::string_view mime_type, std::string_view base64_payload);

std::vector<std::uint8_t> decode_data_url(std::string_view handle);

std::vector<std::uint8_t> read_image_bytes(const std::string& handle);

}
