#include "chunked/client/upload_session.hpp"

#include <algorithm>
#include <unordered_map>

namespace chunked::client {
namespace {

bool is_progressive(UploadState current, UploadState target) {
    static const std::unordered_map<UploadState, std::vector<UploadState>> transitions {
        {UploadState::Waiting, {UploadState::Checking}},
        {UploadState::Checking, {UploadState::FastSuccess, UploadState::Uploading}},
        {UploadState::Uploading, {UploadState::Merging}},
        {UploadState::Merging, {UploadState::Success}},
    };

    if (target == UploadState::Error || target == UploadState::Cancelled) {
        return current != UploadState::Waiting;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* upload_state_name(UploadState state) {
    switch (state) {
        case UploadState::Waiting: return "waiting";
        case UploadState::Checking: return "checking";
        case UploadState::FastSuccess: return "fast_success";
        case UploadState::Uploading: return "uploading";
        case UploadState::Merging: return "merging";
        case UploadState::Success: return "success";
        case UploadState::Error: return "error";
        case UploadState::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(UploadState state) {
    return state == UploadState::FastSuccess || state == UploadState::Success ||
           state == UploadState::Error || state == UploadState::Cancelled;
}

UploadSession::UploadSession(std::filesystem::path file, std::string artifact_name)
    : file_(std::move(file)),
      artifact_name_(std::move(artifact_name)),
      last_transition_(std::chrono::steady_clock::now()) {
}

void UploadSession::set_plan(std::uint64_t file_size, std::vector<ChunkRange> chunks) {
    file_size_ = file_size;
    chunks_ = std::move(chunks);
    stored_.clear();
}

std::vector<ChunkRange> UploadSession::missing_chunks() const {
    std::vector<ChunkRange> missing;
    for (const auto& chunk : chunks_) {
        if (!is_stored(chunk.index)) {
            missing.push_back(chunk);
        }
    }
    return missing;
}

Result<void> UploadSession::transition_to(UploadState next_state) {
    if (state_ == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::InvalidArgument,
                         std::string("illegal upload state transition ") +
                         upload_state_name(state_) + " -> " + upload_state_name(next_state));
    }

    state_ = next_state;
    last_transition_ = std::chrono::steady_clock::now();
    if (next_state != UploadState::Error) {
        last_error_.clear();
    }
    return Ok();
}

Result<void> UploadSession::mark_failed(std::string error_message) {
    auto res = transition_to(UploadState::Error);
    if (res.is_ok()) {
        last_error_ = std::move(error_message);
    }
    return res;
}

bool UploadSession::can_transition(UploadState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (is_terminal(state_)) {
        return false;
    }

    return is_progressive(state_, target);
}

} // namespace chunked::client
