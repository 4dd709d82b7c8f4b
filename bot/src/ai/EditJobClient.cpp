#include "ai/EditJobClient.hpp"

#include <thread>
#include <nlohmann/json.hpp>

#include "ai/AspectRatio.hpp"
#include "image/ImageInfo.hpp"
#include "monitor/Logger.hpp"

using json = nlohmann::json;

const char* toString(EditError e) {
    switch (e) {
        case EditError::None:              return "None";
        case EditError::SubmissionFailed:  return "SubmissionFailed";
        case EditError::JobFailed:         return "JobFailed";
        case EditError::JobTimedOut:       return "JobTimedOut";
        case EditError::ResultFetchFailed: return "ResultFetchFailed";
    }
    return "Unknown";
}

const char* toString(JobState s) {
    switch (s) {
        case JobState::Pending: return "Pending";
        case JobState::Ready:   return "Ready";
        case JobState::Failed:  return "Failed";
        case JobState::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string promptPreview(const std::string& prompt, std::size_t maxBytes) {
    if (prompt.size() <= maxBytes) return prompt;
    std::size_t cut = maxBytes;
    // lùi về đầu ký tự nếu đang đứng ở byte tiếp nối 10xxxxxx
    while (cut > 0 && (static_cast<unsigned char>(prompt[cut]) & 0xC0) == 0x80) --cut;
    return prompt.substr(0, cut);
}

static EditOutcome failure(EditError e, std::string reason, int polls = 0,
                           JobState state = JobState::Pending) {
    EditOutcome out;
    out.error = e;
    out.reason = std::move(reason);
    out.polls = polls;
    out.state = state;
    return out;
}

EditJobClient::EditJobClient(HttpClient& http, EditJobOptions opts, Sleeper sleeper)
    : http_(http), opts_(std::move(opts)), sleep_(std::move(sleeper)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

HttpHeaders EditJobClient::apiHeaders() const {
    return {
        {"accept", "application/json"},
        {"x-key", opts_.apiKey},
        {"Content-Type", "application/json"},
    };
}

EditOutcome EditJobClient::edit(const std::string& image, const std::string& prompt,
                                const std::string& aspectRatio) const {
    return edit(EditRequest(image, prompt, aspectRatio, opts_.outputFormat, opts_.safetyTolerance));
}

EditOutcome EditJobClient::edit(const EditRequest& req) const {
    if (req.prompt.find_first_not_of(" \t\r\n") == std::string::npos) {
        LOGE("EDIT", "Rejected request: empty prompt");
        return failure(EditError::SubmissionFailed, "empty prompt");
    }
    if (!AspectRatioClassifier::isSupported(req.aspectRatio)) {
        LOGE("EDIT", "Rejected request: unsupported aspect ratio '" << req.aspectRatio << "'");
        return failure(EditError::SubmissionFailed, "unsupported aspect ratio");
    }

    LOGX("EDIT", "Starting image edit request with prompt: " << promptPreview(req.prompt) << "...");

    JobHandle handle;
    if (!submit(req, handle)) {
        return failure(EditError::SubmissionFailed, "submission failed");
    }

    LOGX("EDIT", "Request " << handle.id << " created, polling for result...");
    return poll(handle);
}

bool EditJobClient::submit(const EditRequest& req, JobHandle& handle) const {
    json payload = {
        {"prompt", req.prompt},
        {"input_image", base64Encode(req.image)},
        {"aspect_ratio", req.aspectRatio},
        {"output_format", req.outputFormat},
        {"safety_tolerance", req.safetyTolerance}
    };

    HttpResponse res = http_.post(opts_.apiUrl, apiHeaders(), payload.dump());
    if (!res.ok()) {
        LOGE("EDIT", "API request failed: " << res.error << " " << res.body.substr(0, 200));
        return false;
    }

    try {
        auto j = json::parse(res.body);
        if (!j.is_object() || !j.contains("polling_url") || !j["polling_url"].is_string() ||
            j["polling_url"].get<std::string>().empty()) {
            LOGE("EDIT", "No polling URL received: " << res.body.substr(0, 200));
            return false;
        }
        handle.pollingUrl = j["polling_url"].get<std::string>();
        handle.id = (j.contains("id") && j["id"].is_string()) ? j["id"].get<std::string>() : "?";
    } catch (const json::exception& e) {
        LOGE("EDIT", "Malformed submission response: " << e.what());
        return false;
    }
    return true;
}

JobStatus EditJobClient::parseStatus(const std::string& body) {
    JobStatus st;

    auto j = json::parse(body);
    if (!j.is_object()) return st;

    std::string status;
    if (j.contains("status") && j["status"].is_string()) status = j["status"].get<std::string>();

    if (status == "Ready") {
        st.state = JobState::Ready;
        if (j.contains("result") && j["result"].is_object()) {
            const auto& r = j["result"];
            if (r.contains("sample") && r["sample"].is_string()) {
                st.resultUrl = r["sample"].get<std::string>();
            }
        }
    } else if (status == "Error" || status == "Failed") {
        st.state = JobState::Failed;
        st.reason = "Unknown error";
        if (j.contains("failure_reason") && j["failure_reason"].is_string()) {
            st.reason = j["failure_reason"].get<std::string>();
        }
    }
    // Pending, "Request Moderated", "Task not found", ... -> tiếp tục poll
    return st;
}

EditOutcome EditJobClient::poll(const JobHandle& handle) const {
    HttpHeaders headers = apiHeaders();

    for (int pollCount = 1; pollCount <= opts_.maxPolls; ++pollCount) {
        sleep_(opts_.pollInterval);

        HttpResponse res = http_.get(handle.pollingUrl, headers);
        if (!res.ok()) {
            LOGE("POLL", "Polling error for " << handle.id << ": " << res.error);
            continue;
        }

        JobStatus st;
        try {
            st = parseStatus(res.body);
        } catch (const json::exception& e) {
            LOGE("POLL", "Unexpected polling error for " << handle.id << ": " << e.what());
            continue;
        }

        LOGD("POLL", "Poll #" << pollCount << " for " << handle.id << ": " << toString(st.state));

        if (st.state == JobState::Ready) {
            if (st.resultUrl.empty()) {
                LOGE("POLL", "No image URL in ready response for " << handle.id);
                return failure(EditError::ResultFetchFailed, "no result url", pollCount, JobState::Ready);
            }
            EditOutcome out = fetch(handle, st.resultUrl);
            out.polls = pollCount;
            out.state = JobState::Ready;
            return out;
        }

        if (st.state == JobState::Failed) {
            LOGE("POLL", "Request " << handle.id << " failed: " << st.reason);
            return failure(EditError::JobFailed, st.reason, pollCount, JobState::Failed);
        }
    }

    LOGE("POLL", "Request " << handle.id << " timed out after " << opts_.maxPolls
                  << " polls, state " << toString(JobState::Unknown));
    return failure(EditError::JobTimedOut, "timed out", opts_.maxPolls, JobState::Unknown);
}

EditOutcome EditJobClient::fetch(const JobHandle& handle, const std::string& resultUrl) const {
    // URL kết quả là link download trực tiếp, không cần x-key
    HttpResponse res = http_.get(resultUrl, {});
    if (!res.ok()) {
        LOGE("FETCH", "Result download failed for " << handle.id << ": " << res.error);
        return failure(EditError::ResultFetchFailed, res.error);
    }

    LOGX("FETCH", "Successfully retrieved edited image for " << handle.id
                  << " (" << res.body.size() << " bytes)");
    EditOutcome out;
    out.image = std::move(res.body);
    return out;
}
