// test/io_framesource_test.cpp
// Image-sequence source written to a temp directory.

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "os/rtos.hpp"
#include "apps/io/FrameSource.hpp"

namespace fs = std::filesystem;
using Status = io::FrameSource::Status;

namespace {

int g_failures = 0;

void check(bool ok, const char* what) {
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
    if (!ok) ++g_failures;
}

constexpr uint32_t N_IMAGES = 4;

} // namespace

int main() {
    std::cout << "=== FRAME SOURCE TEST ===\n";

    const fs::path dir = fs::temp_directory_path() / "gridflash_framesource_test";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    for (uint32_t i = 0; i < N_IMAGES; ++i) {
        cv::Mat img(48, 64, CV_8UC3, cv::Scalar::all(10 + 40 * i));
        char name[32];
        std::snprintf(name, sizeof(name), "f_%02u.png", i);
        (void)cv::imwrite((dir / name).string(), img);
    }

    io::FrameSourceConfig cfg{};
    cfg.uri = (dir / "f_%02d.png").string();
    cfg.buffer_count = 3;
    cfg.pace_to_source_fps = false;

    // ---- Not started ----
    {
        io::FrameSource src(cfg);
        msg::ImageFrame f{};
        check(!src.Grab(f) && src.lastStatus() == Status::NOT_RUNNING, "grab before start");
    }

    // ---- Bad uri ----
    {
        io::FrameSourceConfig bad = cfg;
        bad.uri = (dir / "missing.avi").string();
        io::FrameSource src(bad);
        check(!src.Start() && src.lastStatus() == Status::OPEN_FAIL, "missing file is OPEN_FAIL");
    }

    // ---- Buffer pool ----
    {
        io::FrameSource src(cfg);
        check(src.Start(), "image sequence opened");

        msg::ImageFrame f[3];
        bool all = true;
        for (int i = 0; i < 3; ++i) all = all && src.Grab(f[i]);
        check(all, "three frames into three buffers");
        check(f[0].width == 64 && f[0].height == 48 && f[0].format == msg::PixelFormat::BGR8, "frame geometry");
        check(f[0].frame_id == 0 && f[2].frame_id == 2, "frame ids increase");
        check(f[0].buf_index != f[1].buf_index && f[1].buf_index != f[2].buf_index, "distinct buffers");
        check(f[1].data[0] == 50, "pixels copied into the pool");

        msg::ImageFrame extra{};
        check(!src.Grab(extra) && src.lastStatus() == Status::NO_FREE_BUFFER, "pool exhausted");

        check(src.Release(f[1].buf_index), "release");
        check(src.Grab(extra) && extra.buf_index == f[1].buf_index, "released buffer reused");
        check(!src.Release(9) && src.lastStatus() == Status::BAD_BUFF_INDEX, "bad index rejected");

        (void)src.Release(f[0].buf_index);
        msg::ImageFrame end{};
        check(!src.Grab(end) && src.lastStatus() == Status::END_OF_STREAM, "end of stream");
        src.Stop();
    }

    // ---- Task publishes until the sequence runs out ----
    {
        io::FrameSource src(cfg);
        io::LiveFrameQueue live(/*overwrite=*/true);
        io::ReleaseFrameQueue release(/*overwrite=*/false);

        io::FrameSource::TaskCtx ctx{};
        ctx.self = &src;
        ctx.live_out = &live;
        ctx.release_in = &release;

        Rtos::Task task;
        check(task.Create("FrameSource", &io::FrameSource::TaskEntry, &ctx), "source task created");

        uint32_t received = 0;
        uint32_t last_id = 0;
        for (int spins = 0; spins < 100 && last_id != N_IMAGES - 1; ++spins) {
            msg::ImageFrame f{};
            if (live.receive(f, 20)) {
                ++received;
                last_id = f.frame_id;
                (void)release.send(f, 1000);
            }
        }
        task.Join();

        check(src.Finished(), "source finished at the end of the sequence");
        check(received >= 1 && last_id == N_IMAGES - 1, "newest frame reached the consumer");
    }

    fs::remove_all(dir, ec);

    std::cout << (g_failures ? "FRAME SOURCE TEST FAILED\n" : "FRAME SOURCE TEST PASSED\n");
    return g_failures ? -1 : 0;
}
