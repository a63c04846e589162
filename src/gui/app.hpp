#pragma once

#include "orbiter/types.hpp"
#include "config/mission_config.hpp"
#include "pipeline/downlink_pipeline.hpp"
#include "pipeline/satellite_pass.hpp"
#include "pipeline/mission_archive.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace orbiter {
namespace gui {

class App {
public:
    App();
    ~App();

    void render();

private:
    // Persistent settings (mission.ini)
    config::MissionConfig mission_;
    int preset_index_ = -1;                    // -1 = custom

    std::unique_ptr<pipeline::CsvMissionArchive> archive_;

    // ========================================
    // Downlink console
    // ========================================
    char message_buffer_[256] = "Hello from orbit!";
    int weather_index_ = 0;
    float fade_start_ = 0.5f;
    float fade_duration_ = 0.5f;
    float fade_attenuation_ = 0.3f;

    bool has_result_ = false;
    pipeline::TransmissionResult last_result_;
    std::vector<float> tx_plot_;               // Decimated for display
    std::vector<float> rx_plot_;

    // ========================================
    // Pass simulator (runs on a worker thread)
    // ========================================
    std::thread pass_thread_;
    std::atomic<bool> pass_running_{false};
    std::atomic<bool> pass_cancel_{false};

    std::mutex pass_mutex_;
    std::vector<pipeline::PassTransmission> pass_progress_;   // Guarded by pass_mutex_
    pipeline::PassResult pass_result_;                        // Guarded by pass_mutex_
    bool pass_done_ = false;

    // ========================================
    // Mission archive browser
    // ========================================
    float archive_min_snr_ = -50.0f;
    float archive_max_ber_ = 1.0f;
    int archive_limit_ = 100;
    bool archive_loaded_ = false;
    std::vector<pipeline::ArchivedMission> archive_rows_;
    pipeline::ArchiveStatistics archive_stats_;

    void renderLinkControls();
    void renderConsoleTab();
    void renderPassTab();
    void renderArchiveTab();

    void refreshArchive();

    void applyPreset(int index);
    void transmit();
    void startPass();
    void stopPass();
};

} // namespace gui
} // namespace orbiter
