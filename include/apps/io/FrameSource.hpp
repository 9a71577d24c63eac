#pragma once
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "os/rtos.hpp"
#include "msg/ImageFrame.hpp"

namespace io {

static constexpr uint32_t FRAMESOURCE_MAX_BUFS = 8;

// ------------------------------
// Queue types
// ------------------------------
using LiveFrameQueue = Rtos::Queue<msg::ImageFrame, 1>;                    // freshest-wins
static constexpr std::size_t RELEASE_Q_CAP = FRAMESOURCE_MAX_BUFS;
using ReleaseFrameQueue = Rtos::Queue<msg::ImageFrame, RELEASE_Q_CAP>;    // never drop

// ------------------------------
// Config
// ------------------------------
struct FrameSourceConfig {
    // Camera index ("0", "1"...), video file, image sequence pattern or stream URL.
    std::string uri = "0";

    // Requested capture size for cameras; 0 keeps the device default.
    uint32_t width  = 0;
    uint32_t height = 0;

    // Pool of frame buffers shared with the consumer (>= 3: one live, one in
    // processing, one being filled).
    uint32_t buffer_count = 4;

    // File sources: sleep so frames come out at the container's rate, and
    // restart at the end instead of stopping.
    bool pace_to_source_fps = true;
    bool loop = false;
};

// ------------------------------
// FrameSource: owns the cv::VideoCapture and the frame buffer pool.
// Only the FrameSource thread may touch the capture or the pool.
// Frames go out as non-owning views into pool buffers and must come back on
// the release queue.
// ------------------------------
class FrameSource {
public:
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        FrameSource*       self       = nullptr;
        LiveFrameQueue*    live_out   = nullptr;
        ReleaseFrameQueue* release_in = nullptr;
    };

public:
    explicit FrameSource(const FrameSourceConfig& cfg);
    ~FrameSource();

    // Open the source and reset the pool. False on failure (see lastStatus()).
    bool Start();

    // Release the capture. Safe to call even if Start() partially failed.
    void Stop();

    // Read one frame into a free pool buffer and fill 'out' as a view of it.
    // The buffer stays taken until Release(out.buf_index).
    bool Grab(msg::ImageFrame& out);

    // Give a pool buffer back. Only the FrameSource thread may call this.
    bool Release(uint16_t buf_index);

    // Thread loop:
    // - drains release_in
    // - grabs one frame
    // - publishes it to live_out (overwrite=true), reclaiming an overwritten one
    void Run(LiveFrameQueue& live_out, ReleaseFrameQueue& release_in);

    // OSAL-compatible entry point
    static void TaskEntry(void* arg);

    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    // True once a non-looping file source has run out of frames.
    bool Finished() const { return m_finished.load(); }

    uint32_t frameWidth()  const { return m_width; }
    uint32_t frameHeight() const { return m_height; }
    double   sourceFps()   const { return m_source_fps; }

    enum class Status : uint8_t {
        OK = 0,
        OPEN_FAIL,
        READ_FAIL,
        END_OF_STREAM,
        UNSUPPORTED_FORMAT,
        NOT_RUNNING,
        NO_FREE_BUFFER,
        BAD_BUFF_INDEX,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }

private:
    FrameSourceConfig m_cfg{};
    cv::VideoCapture  m_cap;
    bool m_is_file = false;

    uint32_t m_width = 0;
    uint32_t m_height = 0;
    double   m_source_fps = 0.0;

    // Buffer pool. cv::Mat keeps its allocation between frames as long as
    // size and type do not change.
    cv::Mat  m_bufs[FRAMESOURCE_MAX_BUFS];
    bool     m_in_use[FRAMESOURCE_MAX_BUFS]{};
    uint32_t m_buf_count = 0;

    uint32_t m_frame_id = 0;
    bool m_running = false;
    bool m_live_valid = false;
    uint16_t m_live_idx = 0;
    uint64_t m_last_grab_us = 0;

    std::atomic<bool> m_stop_requested{false};
    std::atomic<bool> m_finished{false};

    // FDIR
    Status m_status = Status::OK;

private:
    bool openCapture();
    int  findFreeBuffer() const;
    void drainReleases(ReleaseFrameQueue& release_in);
    void paceFrame();

    bool fail(Status s);
};

} // namespace io
