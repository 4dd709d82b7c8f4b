#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <utility>

#include "net/HttpClient.hpp"

// Bất biến sau khi tạo; edit() từ chối prompt rỗng hoặc ratio ngoài bảng
struct EditRequest {
    EditRequest(std::string image_, std::string prompt_, std::string aspectRatio_,
                std::string outputFormat_ = "jpeg", int safetyTolerance_ = 2)
        : image(std::move(image_)),
          prompt(std::move(prompt_)),
          aspectRatio(std::move(aspectRatio_)),
          outputFormat(std::move(outputFormat_)),
          safetyTolerance(safetyTolerance_) {}

    const std::string image;    // raw bytes, base64 hóa lúc submit
    const std::string prompt;
    const std::string aspectRatio;
    const std::string outputFormat;
    const int safetyTolerance;
};

struct JobHandle {
    std::string id;
    std::string pollingUrl;
};

// Unknown = hết poll budget mà chưa tới Ready/Failed
enum class JobState { Pending, Ready, Failed, Unknown };

const char* toString(JobState s);

struct JobStatus {
    JobState state = JobState::Pending;
    std::string resultUrl;      // Ready
    std::string reason;         // Failed
};

enum class EditError {
    None,
    SubmissionFailed,
    JobFailed,
    JobTimedOut,
    ResultFetchFailed
};

const char* toString(EditError e);

struct EditOutcome {
    EditError error = EditError::None;
    std::string reason;
    std::string image;
    int polls = 0;
    JobState state = JobState::Pending;     // trạng thái cuối của job

    bool ok() const { return error == EditError::None; }
};

struct EditJobOptions {
    std::string apiUrl = "https://api.bfl.ai/v1/flux-kontext-pro";
    std::string apiKey;
    int maxPolls = 60;
    std::chrono::milliseconds pollInterval{2000};
    std::string outputFormat = "jpeg";
    int safetyTolerance = 2;
};

// Cắt prompt cho log, không cắt giữa 1 ký tự UTF-8
std::string promptPreview(const std::string& prompt, std::size_t maxBytes = 50);

class EditJobClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // http phải sống lâu hơn client; sleeper mặc định = this_thread::sleep_for
    EditJobClient(HttpClient& http, EditJobOptions opts, Sleeper sleeper = nullptr);

    EditOutcome edit(const std::string& image, const std::string& prompt,
                     const std::string& aspectRatio) const;
    EditOutcome edit(const EditRequest& req) const;

    // Parse 1 poll response; status lạ (kể cả rỗng) = Pending
    static JobStatus parseStatus(const std::string& body);

    const EditJobOptions& options() const { return opts_; }

private:
    HttpHeaders apiHeaders() const;

    bool submit(const EditRequest& req, JobHandle& handle) const;
    EditOutcome poll(const JobHandle& handle) const;
    EditOutcome fetch(const JobHandle& handle, const std::string& resultUrl) const;

    HttpClient& http_;
    EditJobOptions opts_;
    Sleeper sleep_;
};
