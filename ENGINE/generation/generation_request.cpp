#include "generation/generation_request.hpp"

#include <sstream>

#include "sprite/image_handle.hpp"
#include "utils/string_utils.hpp"

namespace flipbook::generation {

std::string compose_prompt(const std::string& subject, const sprite::GridShape& grid) {
    const int frames = grid.frame_count();
    std::ostringstream out;
    out << "Generate a high-quality sprite sheet for a video game. The subject is: \"" << subject << "\".\n"
        << "The final sprite sheet must be a single image file containing a grid of animation frames.\n"
        << "- Total Frames: Exactly " << frames << " distinct frames showing a continuous animation sequence.\n"
        << "- Grid Layout: The frames must be arranged in a grid of " << grid.columns << " columns and "
        << grid.rows << " rows.\n"
        << "- Background: The background of the entire sprite sheet must be transparent.\n"
        << "- Style: The art style should be consistent across all frames.\n"
        << "- Spacing: All frames must be tightly packed in the grid with no space or gutter between them.\n"
        << "- Frame Size: Each frame must have the exact same dimensions.";
    return out.str();
}

GenerationRequest compose_request(const std::string& subject,
                                  const sprite::GridShape& grid,
                                  const std::string& model,
                                  const std::string& mime_type) {
    const std::string trimmed = strings::trim_copy(subject);
    if (trimmed.empty()) {
        throw std::invalid_argument("sprite description is empty");
    }
    GenerationRequest request;
    request.subject = trimmed;
    request.prompt = compose_prompt(trimmed, grid);
    request.grid = grid;
    request.frame_count = grid.frame_count();
    request.aspect_ratio = sprite::classify(grid.columns, grid.rows);
    request.model = model;
    request.mime_type = mime_type;
    return request;
}

nlohmann::json to_json(const GenerationRequest& request) {
    nlohmann::json body = nlohmann::json::object();
    body["model"] = request.model;
    body["prompt"] = request.prompt;
    body["config"] = {
        {"numberOfImages", 1},
        {"outputMimeType", request.mime_type},
        {"aspectRatio", std::string(sprite::label(request.aspect_ratio))},
    };
    return body;
}

std::string decode_response(const nlohmann::json& response, const std::string& mime_type) {
    if (!response.is_object()) {
        throw GenerationError(kNoImageMessage);
    }
    auto images = response.find("generatedImages");
    if (images == response.end() || !images->is_array() || images->empty()) {
        throw GenerationError(kNoImageMessage);
    }
    const nlohmann::json& first = images->front();
    if (!first.is_object() || !first.contains("image") || !first["image"].is_object()) {
        throw GenerationError(kNoImageMessage);
    }
    const nlohmann::json& image = first["image"];
    auto bytes = image.find("imageBytes");
    if (bytes == image.end() || !bytes->is_string() || bytes->get_ref<const std::string&>().empty()) {
        throw GenerationError(kNoImageMessage);
    }
    const std::string declared = image.value("mimeType", std::string{});
    return sprite::make_data_url(declared.empty() ? mime_type : declared, bytes->get_ref<const std::string&>());
}

std::string describe_failure(const std::string& details) {
    return "An error occurred while generating the sprite sheet. Please check your API key and prompt. Details: " +
           details;
}

}
