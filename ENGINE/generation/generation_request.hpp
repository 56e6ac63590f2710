#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "sprite/aspect_ratio.hpp"
#include "sprite/frame_geometry.hpp"

namespace flipbook::generation {

inline constexpr const char* kDefaultModel = "imagen-4.0-generate-001";
inline constexpr const char* kDefaultMimeType = "image/png";

inline constexpr const char* kNoImageMessage =
    "The AI did not return an image. Please try refining your prompt or try again.";

// The service produced no usable image or rejected the request. what() is meant for the user.
class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& what) : std::runtime_error(what) {}
};

struct GenerationRequest {
    std::string subject;
    std::string prompt;
    sprite::GridShape grid{};
    int frame_count = 0;
    sprite::AspectRatio aspect_ratio = sprite::AspectRatio::Square;
    std::string model = kDefaultModel;
    std::string mime_type = kDefaultMimeType;
};

// Full instruction text sent to the image model for a subject and grid.
std::string compose_prompt(const std::string& subject, const sprite::GridShape& grid);

// Throws std::invalid_argument for a blank subject; callers check before composing.
GenerationRequest compose_request(const std::string& subject,
                                  const sprite::GridShape& grid,
                                  const std::string& model = kDefaultModel,
                                  const std::string& mime_type = kDefaultMimeType);

nlohmann::json to_json(const GenerationRequest& request);

// Extracts generatedImages[0].image.imageBytes as a data URL; throws GenerationError when the
// response carries no image.
std::string decode_response(const nlohmann::json& response, const std::string& mime_type = kDefaultMimeType);

// User-facing text for a failure that is not a GenerationError (transport, parse, I/O).
std::string describe_failure(const std::string& details);

}
