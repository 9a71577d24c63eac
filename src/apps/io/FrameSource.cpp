// FrameSource.cpp
#include "apps/io/FrameSource.hpp"

#include <cctype>
#include <iostream>

namespace {

static bool is_camera_index(const std::string& uri) {
    if (uri.empty() || uri.size() > 3) return false;
    for (char c : uri) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static msg::PixelFormat format_from_channels(int channels) {
    switch (channels) {
        case 1:  return msg::PixelFormat::GRAY8;
        case 3:  return msg::PixelFormat::BGR8;
        case 4:  return msg::PixelFormat::BGRA8;
        default: return msg::PixelFormat::UNKNOWN;
    }
}

} // anonymous namespace

namespace io {

static inline FrameSourceConfig sanitise(const FrameSourceConfig& in) {
    FrameSourceConfig cfg = in;

    if (cfg.uri.empty()) cfg.uri = "0";

    if (cfg.buffer_count < 3) cfg.buffer_count = 3;
    if (cfg.buffer_count > FRAMESOURCE_MAX_BUFS) cfg.buffer_count = FRAMESOURCE_MAX_BUFS;

    return cfg;
}

FrameSource::FrameSource(const FrameSourceConfig& cfg)
: m_cfg(sanitise(cfg)) {
    m_status = Status::OK;
}

FrameSource::~FrameSource() {
    Stop();
}

bool FrameSource::Start() {
    if (m_running) return true;

    m_status = Status::OK;
    m_finished.store(false);

    if (!openCapture()) { Stop(); return false; }

    m_buf_count = m_cfg.buffer_count;
    for (uint32_t i = 0; i < FRAMESOURCE_MAX_BUFS; ++i) m_in_use[i] = false;

    m_frame_id = 0;
    m_live_valid = false;
    m_last_grab_us = 0;
    m_running = true;

    std::cout << "[FrameSource] opened '" << m_cfg.uri << "' "
              << m_width << "x" << m_height;
    if (m_source_fps > 0.0) std::cout << " @ " << m_source_fps << " fps";
    std::cout << (m_is_file ? " (file)" : " (camera)") << "\n";
    return true;
}

void FrameSource::Stop() {
    m_running = false;
    if (m_cap.isOpened()) m_cap.release();
}

bool FrameSource::Grab(msg::ImageFrame& out) {
    if (!m_running) return fail(Status::NOT_RUNNING);

    const int idx = findFreeBuffer();
    if (idx < 0) return fail(Status::NO_FREE_BUFFER);

    cv::Mat raw;
    bool got = m_cap.read(raw) && !raw.empty();
    if (!got && m_is_file && m_cfg.loop) {
        got = m_cap.set(cv::CAP_PROP_POS_FRAMES, 0) && m_cap.read(raw) && !raw.empty();
    }
    if (!got) return fail(m_is_file ? Status::END_OF_STREAM : Status::READ_FAIL);

    if (raw.depth() != CV_8U) return fail(Status::UNSUPPORTED_FORMAT);
    const msg::PixelFormat fmt = format_from_channels(raw.channels());
    if (fmt == msg::PixelFormat::UNKNOWN) return fail(Status::UNSUPPORTED_FORMAT);

    // Own copy: backends may hand out views of their internal buffer.
    cv::Mat& buf = m_bufs[idx];
    raw.copyTo(buf);

    m_in_use[idx] = true;
    m_width  = static_cast<uint32_t>(buf.cols);
    m_height = static_cast<uint32_t>(buf.rows);

    out.data         = buf.data;
    out.width        = m_width;
    out.height       = m_height;
    out.stride       = static_cast<uint32_t>(buf.step[0]);
    out.format       = fmt;
    out.t_capture_us = Rtos::NowUs();
    out.frame_id     = m_frame_id++;
    out.buf_index    = static_cast<uint16_t>(idx);

    return true;
}

bool FrameSource::Release(uint16_t buf_index) {
    if (buf_index >= m_buf_count) return fail(Status::BAD_BUFF_INDEX);
    m_in_use[buf_index] = false;
    return true;
}

void FrameSource::Run(LiveFrameQueue& live_out, ReleaseFrameQueue& release_in) {
    uint32_t consecutive_fail = 0;

    while (!StopRequested()) {

        // 1) Buffers the consumer finished with
        drainReleases(release_in);

        // 2) One fresh frame
        paceFrame();
        msg::ImageFrame f{};
        if (!Grab(f)) {
            if (m_status == Status::END_OF_STREAM) {
                std::cout << "[FrameSource] end of stream after " << m_frame_id << " frames\n";
                m_finished.store(true);
                break;
            }
            if (m_status == Status::NO_FREE_BUFFER) {
                // Consumer still holds everything; wait for a release.
                msg::ImageFrame rel{};
                if (release_in.receive(rel, 50)) (void)Release(rel.buf_index);
                continue;
            }
            if (++consecutive_fail == 1 || consecutive_fail % 100 == 0) {
                std::cerr << "[FrameSource] grab failed: " << StatusStr(m_status)
                          << " (x" << consecutive_fail << ")\n";
            }
            Rtos::SleepMs(10);
            continue;
        }
        consecutive_fail = 0;

        // 3) Publish newest frame (freshest-wins queue of depth 1).
        // An overwritten frame was never seen by the consumer, reclaim it here.
        const uint16_t old_idx = m_live_idx;
        (void)live_out.send(f, Rtos::MAX_TIMEOUT);

        if (live_out.wasLastSendOverwritten() && m_live_valid) {
            (void)Release(old_idx);
        }

        m_live_idx   = f.buf_index;
        m_live_valid = true;
    }
}

void FrameSource::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    if (!ctx || !ctx->self || !ctx->live_out || !ctx->release_in) {
        std::cerr << "[FrameSource] TaskEntry: incomplete context\n";
        return;
    }

    if (!ctx->self->Start()) {
        std::cerr << "[FrameSource] start failed: "
                  << StatusStr(ctx->self->lastStatus()) << "\n";
        ctx->self->m_finished.store(true);
        return;
    }

    ctx->self->Run(*ctx->live_out, *ctx->release_in);
    ctx->self->Stop();
}

// -------------------- private helpers --------------------

bool FrameSource::openCapture() {
    m_is_file = !is_camera_index(m_cfg.uri);

    bool ok = false;
    if (m_is_file) {
        ok = m_cap.open(m_cfg.uri);
    } else {
        ok = m_cap.open(std::stoi(m_cfg.uri));
        if (ok && m_cfg.width > 0)  (void)m_cap.set(cv::CAP_PROP_FRAME_WIDTH,  m_cfg.width);
        if (ok && m_cfg.height > 0) (void)m_cap.set(cv::CAP_PROP_FRAME_HEIGHT, m_cfg.height);
    }
    if (!ok || !m_cap.isOpened()) return fail(Status::OPEN_FAIL);

    m_width  = static_cast<uint32_t>(m_cap.get(cv::CAP_PROP_FRAME_WIDTH));
    m_height = static_cast<uint32_t>(m_cap.get(cv::CAP_PROP_FRAME_HEIGHT));
    m_source_fps = m_cap.get(cv::CAP_PROP_FPS);
    if (!(m_source_fps > 0.0 && m_source_fps < 1000.0)) m_source_fps = 0.0;

    return true;
}

int FrameSource::findFreeBuffer() const {
    for (uint32_t i = 0; i < m_buf_count; ++i) {
        if (!m_in_use[i]) return static_cast<int>(i);
    }
    return -1;
}

void FrameSource::drainReleases(ReleaseFrameQueue& release_in) {
    msg::ImageFrame rel{};
    while (release_in.try_receive(rel)) {
        if (!Release(rel.buf_index)) {
            std::cerr << "[FrameSource] release of bad buffer index " << rel.buf_index << "\n";
        }
    }
}

void FrameSource::paceFrame() {
    if (!m_is_file || !m_cfg.pace_to_source_fps || m_source_fps <= 0.0) return;

    const uint64_t period_us = static_cast<uint64_t>(1e6 / m_source_fps);
    const uint64_t now = Rtos::NowUs();
    if (m_last_grab_us != 0 && now < m_last_grab_us + period_us) {
        Rtos::SleepMs(static_cast<int>((m_last_grab_us + period_us - now) / 1000));
    }
    m_last_grab_us = Rtos::NowUs();
}

// FDIR

bool FrameSource::fail(Status s) {
    m_status = s;
    return false;
}

const char* FrameSource::StatusStr(FrameSource::Status s) {
    switch (s) {
        case FrameSource::Status::OK:                 return "OK";
        case FrameSource::Status::OPEN_FAIL:          return "OPEN_FAIL";
        case FrameSource::Status::READ_FAIL:          return "READ_FAIL";
        case FrameSource::Status::END_OF_STREAM:      return "END_OF_STREAM";
        case FrameSource::Status::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case FrameSource::Status::NOT_RUNNING:        return "NOT_RUNNING";
        case FrameSource::Status::NO_FREE_BUFFER:     return "NO_FREE_BUFFER";
        case FrameSource::Status::BAD_BUFF_INDEX:     return "BAD_BUFF_INDEX";
        default:                                      return "UNKNOWN";
    }
}

} // namespace io
