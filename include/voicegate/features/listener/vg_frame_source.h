/**
 * @file vg_frame_source.h
 * @brief VoiceGate - Audio Frame Sources
 *
 * A FrameSource is a single-pass stream of frames. The consumer blocks in
 * receive() until a frame arrives, the stream ends, or its deadline passes.
 * Frames already received cannot be replayed.
 */

#ifndef VG_FRAME_SOURCE_H
#define VG_FRAME_SOURCE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "voicegate/core/vg_error.h"
#include "voicegate/core/vg_types.h"

namespace voicegate {

using SteadyClock = std::chrono::steady_clock;
using Deadline = SteadyClock::time_point;

enum class ReceiveStatus {
    Frame,    // out holds the next frame
    Closed,   // end of stream, nothing more will arrive
    Timeout,  // deadline passed with nothing available
};

const char* receive_status_name(ReceiveStatus status);

class FrameSource {
   public:
    virtual ~FrameSource() = default;

    virtual ReceiveStatus receive(AudioFrame& out, Deadline deadline) = 0;

    // Wait with no deadline
    ReceiveStatus receive(AudioFrame& out) { return receive(out, Deadline::max()); }
};

/**
 * Bounded multi-producer, single-consumer frame queue.
 *
 * push() blocks while the queue is full. close() marks end-of-stream; frames
 * already queued are still delivered before receive() reports Closed.
 */
class FrameChannel : public FrameSource {
   public:
    static constexpr size_t kDefaultCapacity = 256;

    explicit FrameChannel(size_t capacity = kDefaultCapacity);

    // False if the channel was closed
    bool push(AudioFrame frame);

    // False if full or closed
    bool try_push(AudioFrame frame);

    void close();
    bool is_closed() const;
    size_t size() const;

    ReceiveStatus receive(AudioFrame& out, Deadline deadline) override;
    using FrameSource::receive;

   private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<AudioFrame> queue_;
    bool closed_ = false;
};

/**
 * Pre-recorded frames, delivered in order and then Closed. Never times out.
 */
class VectorFrameSource : public FrameSource {
   public:
    explicit VectorFrameSource(std::vector<AudioFrame> frames) : frames_(std::move(frames)) {}

    ReceiveStatus receive(AudioFrame& out, Deadline deadline) override;
    using FrameSource::receive;

    size_t remaining() const { return frames_.size() - next_; }

   private:
    std::vector<AudioFrame> frames_;
    size_t next_ = 0;
};

/**
 * Split a raw PCM file into chunk_size frames (the last may be shorter).
 * Missing/unreadable file -> VG_ERROR_FILE_READ_FAILED,
 * empty file -> VG_ERROR_INVALID_INPUT, chunk_size 0 -> VG_ERROR_INVALID_ARGUMENT.
 */
vg_result_t read_pcm_frames(const std::string& path, size_t chunk_size,
                            std::vector<AudioFrame>& out);

}  // namespace voicegate

#endif  // VG_FRAME_SOURCE_H
