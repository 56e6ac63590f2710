#include "generation/generation_service.hpp"

#include <chrono>
#include <fstream>
#include <system_error>
#include <utility>

#include "utils/log.hpp"

namespace flipbook::generation {

ResponseFileService::ResponseFileService(std::filesystem::path response_path)
    : response_path_(std::move(response_path)) {}

std::string ResponseFileService::generate(const GenerationRequest& request) {
    flipbook::log::info("[Generation] " + request.model + " aspect " +
                        std::string(sprite::label(request.aspect_ratio)) + ", " +
                        std::to_string(request.frame_count) + " frames (replaying " + response_path_.string() + ")");
    flipbook::log::debug("[Generation] request body: " + to_json(request).dump());

    std::error_code ec;
    if (!std::filesystem::is_regular_file(response_path_, ec) || ec) {
        throw std::runtime_error("response file not found: " + response_path_.string());
    }
    std::ifstream in(response_path_);
    if (!in.is_open()) {
        throw std::runtime_error("unable to open response file: " + response_path_.string());
    }
    nlohmann::json response;
    try {
        in >> response;
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error(std::string("malformed response: ") + ex.what());
    }
    return decode_response(response, request.mime_type);
}

GenerationJob::GenerationJob(std::shared_ptr<GenerationService> service, GenerationRequest request)
    : request_(std::move(request)) {
    if (!service) {
        state_ = State::Failed;
        error_ = describe_failure("no generation service configured");
        flipbook::log::error("[Generation] " + error_);
        return;
    }
    future_ = std::async(std::launch::async, [service, req = request_]() {
        return service->generate(req);
    });
}

GenerationJob::~GenerationJob() {
    if (state_ == State::Running && future_.valid()) {
        flipbook::log::debug("[Generation] waiting for an abandoned request to finish");
        future_.wait();
        settle();
    }
}

GenerationJob::State GenerationJob::poll() {
    if (state_ != State::Running) {
        return state_;
    }
    if (future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return state_;
    }
    settle();
    return state_;
}

void GenerationJob::settle() {
    try {
        image_handle_ = future_.get();
        state_ = State::Succeeded;
        flipbook::log::info("[Generation] image received (" + std::to_string(image_handle_.size()) + " byte handle)");
    } catch (const GenerationError& ex) {
        error_ = ex.what();
        state_ = State::Failed;
        flipbook::log::error(std::string("[Generation] ") + error_);
    } catch (const std::exception& ex) {
        error_ = describe_failure(ex.what());
        state_ = State::Failed;
        flipbook::log::error(std::string("[Generation] ") + error_);
    }
}

}
