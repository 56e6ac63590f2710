#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <string>

#include "generation/generation_request.hpp"

namespace flipbook::generation {

// Black-box image generation backend. generate() returns an image handle (data URL) or throws;
// GenerationError messages reach the user verbatim, anything else is wrapped by GenerationJob.
class GenerationService {
public:
    virtual ~GenerationService() = default;
    virtual std::string generate(const GenerationRequest& request) = 0;
};

// Replays a service response saved as JSON. Lets the studio run without network access.
class ResponseFileService : public GenerationService {
public:
    explicit ResponseFileService(std::filesystem::path response_path);

    std::string generate(const GenerationRequest& request) override;

private:
    std::filesystem::path response_path_;
};

// A single generate() call run off the main thread and polled from it.
class GenerationJob {
public:
    enum class State {
        Running,
        Succeeded,
        Failed,
    };

    GenerationJob(std::shared_ptr<GenerationService> service, GenerationRequest request);
    ~GenerationJob();

    GenerationJob(const GenerationJob&) = delete;
    GenerationJob& operator=(const GenerationJob&) = delete;

    // Non-blocking.
    State poll();
    State state() const { return state_; }

    const std::string& image_handle() const { return image_handle_; }
    // User-facing message once Failed.
    const std::string& error() const { return error_; }

private:
    void settle();

    GenerationRequest request_;
    std::future<std::string> future_;
    State state_ = State::Running;
    std::string image_handle_;
    std::string error_;
};

}
