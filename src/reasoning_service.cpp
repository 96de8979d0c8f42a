//
//  reasoning_service.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "reasoning_service.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#endif

#include "logging.hpp"
#include "text_utils.hpp"

using json = nlohmann::json;

namespace slidesync {

namespace {

std::string shell_quote(const std::string &arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::filesystem::path unique_request_path() {
    static std::atomic<unsigned> counter{0};
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           ("slidesync_request_" + std::to_string(ticks) + "_" +
            std::to_string(counter.fetch_add(1)) + ".json");
}

// Sets an environment variable for the lifetime of the object; the previous value (or its
// absence) is restored afterwards. Child processes started meanwhile inherit the value.
class ScopedEnv {
  public:
    ScopedEnv(const char *name, const std::string &value) : name_(name) {
        if (const char *old = std::getenv(name)) {
            previous_ = std::string(old);
        }
        if (!assign(value.c_str())) {
            throw MalformedResponseError(std::string("cannot set ") + name_ +
                                         " for the reasoning command");
        }
    }
    ~ScopedEnv() {
        if (!(previous_ ? assign(previous_->c_str()) : clear())) {
            SS_LOG("warn", "could not restore " << name_ << " after the reasoning command");
        }
    }
    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

  private:
    bool assign(const char *value) {
#if defined(_WIN32)
        return _putenv_s(name_, value) == 0;
#else
        return setenv(name_, value, 1) == 0;
#endif
    }
    bool clear() {
#if defined(_WIN32)
        return _putenv_s(name_, "") == 0;
#else
        return unsetenv(name_) == 0;
#endif
    }

    const char *name_;
    std::optional<std::string> previous_;
};

// Removes the request file when the call returns or throws.
struct TempFile {
    std::filesystem::path path;
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

}  // namespace

CommandReasoningService::CommandReasoningService(ReasoningConfig cfg) : cfg_(std::move(cfg)) {}

json messages_request_body(const ReasoningConfig &cfg, const ReasoningRequest &request) {
    json body;
    body["model"] = cfg.model;
    body["max_tokens"] = cfg.max_tokens;
    body["temperature"] = cfg.temperature;
    body["system"] = request.system_prompt;
    body["messages"] = json::array({{{"role", "user"}, {"content", request.user_prompt}}});
    return body;
}

std::string response_text_from_output(const std::string &output) {
    const std::string trimmed = trim_copy(output);
    const json j = json::parse(trimmed, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object() || !j.contains("content") ||
        !j["content"].is_array()) {
        return trimmed;
    }
    std::string text;
    for (const auto &block : j["content"]) {
        if (block.is_object() && block.value("type", "") == "text" && block.contains("text") &&
            block["text"].is_string()) {
            text += block["text"].get<std::string>();
        }
    }
    return text;
}

std::string CommandReasoningService::complete(const ReasoningRequest &request) {
    TempFile request_file{unique_request_path()};
    {
        std::ofstream out(request_file.path, std::ios::trunc);
        if (!out.is_open()) {
            throw MalformedResponseError("cannot write reasoning request to " +
                                         request_file.path.string());
        }
        out << messages_request_body(cfg_, request)
                   .dump(2, ' ', false, json::error_handler_t::replace);
    }

    // The credential travels in the child's environment, never on the command line or in logs.
    ScopedEnv credential(kApiKeyEnvVar, cfg_.api_key);
    const std::string cmd = cfg_.command + " " + shell_quote(request_file.path.string());
    SS_LOG("debug", "reasoning command: " << cmd);
    const auto t0 = std::chrono::steady_clock::now();
    FILE *pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw MalformedResponseError("cannot start reasoning command: " + cfg_.command);
    }
    std::string output;
    char buffer[4096];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }
    const int status = pclose(pipe);
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - t0)
                                .count();
#if defined(_WIN32)
    const int exit_code = status;
#else
    const int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
#endif
    SS_LOG("debug", "reasoning command finished in " << elapsed_ms << "ms exit=" << exit_code
                                                     << " bytes=" << output.size());
    if (exit_code != 0) {
        throw MalformedResponseError("reasoning command exited with status " +
                                     std::to_string(exit_code));
    }
    std::string text = response_text_from_output(output);
    if (text.empty()) {
        throw MalformedResponseError("reasoning command produced no response");
    }
    return text;
}

std::unique_ptr<ReasoningService> make_reasoning_service(const SlideSyncConfig &cfg,
                                                         Diagnostics &diagnostics) {
    std::string why;
    if (!reasoning_configured(cfg.reasoning, &why)) {
        record(diagnostics, ErrorKind::Configuration,
               why + "; using proportional fallback alignment");
        return nullptr;
    }
    return std::make_unique<CommandReasoningService>(cfg.reasoning);
}

}  // namespace slidesync
