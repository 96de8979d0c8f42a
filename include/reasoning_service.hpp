//
//  reasoning_service.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "sync_config.hpp"
#include "sync_errors.hpp"

namespace slidesync {

/// Prompt pair sent to the reasoning service.
struct ReasoningRequest {
    std::string system_prompt;
    std::string user_prompt;
};

/**
 * @brief External reasoning service that proposes slide timings.
 *
 * complete() blocks until the service answers and returns its text. It throws
 * MalformedResponseError when no response could be obtained at all; judging the content is the
 * aligner's job.
 */
class ReasoningService {
  public:
    virtual ~ReasoningService() = default;
    virtual std::string complete(const ReasoningRequest &request) = 0;
};

/**
 * @brief Runs a local command that talks to the service.
 *
 * The request is written as an Anthropic Messages API body to a temporary JSON file whose path
 * is appended to the command line. Standard output is the answer: either a Messages API response
 * (text blocks are concatenated) or plain text.
 */
class CommandReasoningService : public ReasoningService {
  public:
    explicit CommandReasoningService(ReasoningConfig cfg);

    std::string complete(const ReasoningRequest &request) override;

  private:
    ReasoningConfig cfg_;
};

// Messages API request body for the configured model.
nlohmann::json messages_request_body(const ReasoningConfig &cfg, const ReasoningRequest &request);

// Text of a Messages API response, or the trimmed output itself when it is not one.
std::string response_text_from_output(const std::string &output);

// Command service when configured; otherwise nullptr plus a Configuration diagnostic.
std::unique_ptr<ReasoningService> make_reasoning_service(const SlideSyncConfig &cfg,
                                                         Diagnostics &diagnostics);

}  // namespace slidesync
