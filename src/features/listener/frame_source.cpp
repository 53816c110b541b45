/**
 * @file frame_source.cpp
 * @brief VoiceGate - Audio Frame Sources Implementation
 */

#include "voicegate/features/listener/vg_frame_source.h"

#include <fstream>

#include "voicegate/core/vg_logger.h"

static const char* LOG_CAT = "Listener";

namespace voicegate {

const char* receive_status_name(ReceiveStatus status) {
    switch (status) {
        case ReceiveStatus::Frame:
            return "frame";
        case ReceiveStatus::Closed:
            return "closed";
        case ReceiveStatus::Timeout:
            return "timeout";
        default:
            return "unknown";
    }
}

// =============================================================================
// FRAME CHANNEL
// =============================================================================

FrameChannel::FrameChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool FrameChannel::push(AudioFrame frame) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
    if (closed_) {
        return false;
    }
    queue_.push_back(std::move(frame));
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

bool FrameChannel::try_push(AudioFrame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(std::move(frame));
    }
    not_empty_.notify_one();
    return true;
}

void FrameChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool FrameChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t FrameChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

ReceiveStatus FrameChannel::receive(AudioFrame& out, Deadline deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return closed_ || !queue_.empty(); };

    if (deadline == Deadline::max()) {
        not_empty_.wait(lock, ready);
    } else if (!not_empty_.wait_until(lock, deadline, ready)) {
        return ReceiveStatus::Timeout;
    }

    if (queue_.empty()) {
        return ReceiveStatus::Closed;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return ReceiveStatus::Frame;
}

// =============================================================================
// VECTOR SOURCE
// =============================================================================

ReceiveStatus VectorFrameSource::receive(AudioFrame& out, Deadline /*deadline*/) {
    if (next_ >= frames_.size()) {
        return ReceiveStatus::Closed;
    }
    out = frames_[next_++];
    return ReceiveStatus::Frame;
}

// =============================================================================
// FILE HELPER
// =============================================================================

vg_result_t read_pcm_frames(const std::string& path, size_t chunk_size,
                            std::vector<AudioFrame>& out) {
    if (chunk_size == 0) {
        vg_error_set_details("chunk size must be > 0");
        return VG_ERROR_INVALID_ARGUMENT;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        VG_LOG_ERROR(LOG_CAT, "Cannot open audio file: %s", path.c_str());
        vg_error_set_details(("cannot open audio file: " + path).c_str());
        return VG_ERROR_FILE_READ_FAILED;
    }

    std::vector<AudioFrame> frames;
    while (file) {
        AudioFrame chunk(chunk_size);
        file.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk_size));
        const std::streamsize got = file.gcount();
        if (got <= 0) {
            break;
        }
        chunk.resize(static_cast<size_t>(got));
        frames.push_back(std::move(chunk));
    }
    if (file.bad()) {
        vg_error_set_details(("read error on " + path).c_str());
        return VG_ERROR_FILE_READ_FAILED;
    }

    if (frames.empty()) {
        vg_error_set_details(("no audio frames read from " + path).c_str());
        return VG_ERROR_INVALID_INPUT;
    }

    VG_LOG_DEBUG(LOG_CAT, "Read %zu frames from %s", frames.size(), path.c_str());
    out = std::move(frames);
    return VG_SUCCESS;
}

}  // namespace voicegate
