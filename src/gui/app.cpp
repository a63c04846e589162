#include "app.hpp"
#include "imgui.h"
#include "orbiter/logging.hpp"

#include <algorithm>
#include <cfloat>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace orbiter {
namespace gui {

namespace {

constexpr size_t MAX_PLOT_POINTS = 2000;
const char* WEATHER_NAMES[] = {"clear", "cloudy", "rain"};

// Keep every k-th sample so a plot never exceeds MAX_PLOT_POINTS
std::vector<float> decimate(const Samples& in) {
    std::vector<float> out;
    if (in.empty()) return out;
    size_t step = std::max<size_t>(1, in.size() / MAX_PLOT_POINTS);
    out.reserve(in.size() / step + 1);
    for (size_t i = 0; i < in.size(); i += step) {
        out.push_back(in[i]);
    }
    return out;
}

ImVec4 validityColor(bool ok) {
    return ok ? ImVec4(0.3f, 1.0f, 0.3f, 1.0f) : ImVec4(1.0f, 0.3f, 0.3f, 1.0f);
}

} // namespace

App::App() {
    if (!mission_.load()) {
        LOG_INFO("GUI", "No mission settings at %s, using defaults",
                 config::MissionConfig::getDefaultPath().c_str());
    }
    weather_index_ = static_cast<int>(mission_.link.channel.weather);
    mission_.link.keep_waveforms = true;

    if (mission_.archive_enabled) {
        std::string path = mission_.archive_path.empty()
            ? pipeline::CsvMissionArchive::getDefaultPath() : mission_.archive_path;
        archive_ = std::make_unique<pipeline::CsvMissionArchive>(path);
    }
}

App::~App() {
    stopPass();
    if (!mission_.save()) {
        LOG_WARN("GUI", "Could not save mission settings to %s",
                 config::MissionConfig::getDefaultPath().c_str());
    }
}

void App::applyPreset(int index) {
    std::vector<std::string> names = config::presets::names();
    if (index < 0 || index >= static_cast<int>(names.size())) return;

    config::MissionConfig preset;
    if (!config::presets::forName(names[index], preset)) return;

    // Presets replace the link, pass and archive settings stay
    mission_.name = preset.name;
    mission_.link = preset.link;
    mission_.link.keep_waveforms = true;
    mission_.link.save_to_archive = mission_.archive_enabled;
    weather_index_ = static_cast<int>(mission_.link.channel.weather);
    preset_index_ = index;
}

void App::render() {
    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags window_flags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoBringToFrontOnFocus;

    ImGui::Begin("MainWindow", nullptr, window_flags);

    ImGui::TextColored(ImVec4(0.4f, 0.8f, 1.0f, 1.0f), "Orbiter");
    ImGui::SameLine();
    ImGui::TextDisabled("Satellite Downlink Console");
    ImGui::Separator();

    float content_height = ImGui::GetContentRegionAvail().y - 30;
    ImGui::BeginChild("ContentArea", ImVec2(0, content_height), false);

    float left_width = ImGui::GetContentRegionAvail().x * 0.30f;

    // Left column: link configuration shared by both tabs
    ImGui::BeginChild("LinkPanel", ImVec2(left_width, 0), true);
    renderLinkControls();
    ImGui::EndChild();
    ImGui::SameLine();

    ImGui::BeginChild("MainPanel", ImVec2(0, 0), true);
    if (ImGui::BeginTabBar("Tabs")) {
        if (ImGui::BeginTabItem("Downlink")) {
            renderConsoleTab();
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Satellite Pass")) {
            renderPassTab();
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Mission Archive")) {
            renderArchiveTab();
            ImGui::EndTabItem();
        }
        ImGui::EndTabBar();
    }
    ImGui::EndChild();

    ImGui::EndChild();

    // Status bar
    ImGui::Separator();
    if (has_result_) {
        ImGui::Text("Last: BER %.6f | SNR %.1f dB | Packet %s | %zu anomalies",
                    last_result_.ber, last_result_.snr_actual_db,
                    last_result_.packet_valid ? "valid" : "corrupted",
                    last_result_.anomalies.size());
    } else {
        ImGui::TextDisabled("Ready");
    }

    ImGui::End();
}

void App::renderLinkControls() {
    ChannelConfig& ch = mission_.link.channel;

    ImGui::Text("Scenario");
    std::vector<std::string> names = config::presets::names();
    const char* current = preset_index_ >= 0 ? names[preset_index_].c_str() : "custom";
    if (ImGui::BeginCombo("##preset", current)) {
        for (int i = 0; i < static_cast<int>(names.size()); i++) {
            if (ImGui::Selectable(names[i].c_str(), i == preset_index_)) {
                applyPreset(i);
            }
        }
        ImGui::EndCombo();
    }

    ImGui::Separator();
    ImGui::Text("Link");

    bool changed = false;
    changed |= ImGui::SliderFloat("Distance", &ch.distance_km, 100.0f, 10000.0f, "%.0f km");
    changed |= ImGui::SliderFloat("SNR", &ch.snr_db, -20.0f, 40.0f, "%.1f dB");
    changed |= ImGui::SliderFloat("Elevation", &ch.elevation_deg, 0.0f, 90.0f, "%.0f deg");
    if (ImGui::Combo("Weather", &weather_index_, WEATHER_NAMES, IM_ARRAYSIZE(WEATHER_NAMES))) {
        ch.weather = static_cast<Weather>(weather_index_);
        changed = true;
    }
    changed |= ImGui::Checkbox("Hamming(7,4) FEC", &mission_.link.use_fec);

    int seed = static_cast<int>(mission_.link.seed);
    if (ImGui::InputInt("Seed", &seed)) {
        mission_.link.seed = static_cast<uint32_t>(std::max(0, seed));
        changed = true;
    }

    if (ImGui::TreeNode("Modem")) {
        changed |= ImGui::InputFloat("Carrier Hz", &ch.carrier_freq_hz, 100.0f, 1000.0f, "%.0f");
        changed |= ImGui::InputFloat("Sample rate Hz", &ch.sample_rate_hz, 1000.0f, 10000.0f, "%.0f");
        ch.carrier_freq_hz = std::max(1.0f, ch.carrier_freq_hz);
        ch.sample_rate_hz = std::max(1.0f, ch.sample_rate_hz);
        ImGui::TreePop();
    }

    ImGui::Separator();
    ImGui::Text("Fades (%zu)", mission_.link.fades.size());
    ImGui::SliderFloat("Start", &fade_start_, 0.0f, 10.0f, "%.2f s");
    ImGui::SliderFloat("Length", &fade_duration_, 0.05f, 5.0f, "%.2f s");
    ImGui::SliderFloat("Depth", &fade_attenuation_, 0.0f, 1.0f, "x%.2f");
    if (ImGui::Button("Add fade")) {
        // Ctrl+click text entry can go outside the slider ranges
        try {
            mission_.link.fades.emplace_back(fade_start_, fade_duration_, fade_attenuation_);
            changed = true;
        } catch (const std::invalid_argument& e) {
            LOG_WARN("GUI", "Fade rejected: %s", e.what());
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Clear fades")) {
        mission_.link.fades.clear();
        changed = true;
    }
    for (const auto& fade : mission_.link.fades) {
        ImGui::BulletText("%.2f-%.2f s  x%.2f", fade.start_time, fade.endTime(), fade.attenuation);
    }

    ImGui::Separator();
    if (ImGui::Checkbox("Archive missions", &mission_.archive_enabled)) {
        if (mission_.archive_enabled && !archive_) {
            std::string path = mission_.archive_path.empty()
                ? pipeline::CsvMissionArchive::getDefaultPath() : mission_.archive_path;
            archive_ = std::make_unique<pipeline::CsvMissionArchive>(path);
        }
    }
    mission_.link.save_to_archive = mission_.archive_enabled;

    if (changed) {
        preset_index_ = -1;
        mission_.name = "custom";
    }
}

void App::transmit() {
    last_result_ = pipeline::simulateTransmission(message_buffer_, mission_.link, archive_.get());
    tx_plot_ = decimate(last_result_.tx_signal);
    rx_plot_ = decimate(last_result_.rx_signal);
    has_result_ = true;
    archive_loaded_ = false;
}

void App::renderConsoleTab() {
    ImGui::Text("Message:");
    ImGui::SetNextItemWidth(-80);
    bool send = ImGui::InputText("##message", message_buffer_, sizeof(message_buffer_),
                                 ImGuiInputTextFlags_EnterReturnsTrue);
    ImGui::SameLine();
    // One archive writer at a time: no transmits while a pass runs
    bool busy = pass_running_;
    if (busy) ImGui::BeginDisabled();
    if (ImGui::Button("Transmit", ImVec2(-1, 0)) || (send && !busy)) {
        transmit();
    }
    if (busy) ImGui::EndDisabled();

    if (!has_result_) {
        ImGui::TextDisabled("Transmit a message to see the downlink.");
        return;
    }

    const pipeline::TransmissionResult& r = last_result_;
    ImGui::Separator();

    ImGui::Text("Received:");
    ImGui::SameLine();
    ImGui::TextColored(validityColor(r.perfect_match), "\"%s\"", r.message_received.c_str());

    ImGui::Text("Packet:");
    ImGui::SameLine();
    ImGui::TextColored(validityColor(r.packet_valid), "%s", r.packet_valid ? "CRC OK" : "CRC FAILED");
    ImGui::SameLine();
    ImGui::TextDisabled("(%s)", protocol::parseStatusToString(r.parse_status));

    ImGui::Text("BER %.6f (%zu/%zu)   SNR %.1f dB target, %.2f dB achieved",
                r.ber, r.total_bit_errors, r.transmitted_bits.size(),
                r.snr_target_db, r.snr_actual_db);
    if (r.config.use_fec) {
        ImGui::Text("After FEC: %.6f (%zu codewords corrected)", r.residual_ber, r.fec_corrections);
    }
    ImGui::Text("Range loss %.1f dB   Atmosphere %.2f dB   %.1f ms",
                r.range_loss_db, r.atmo_loss_db, r.elapsed_sec * 1000.0);

    if (!r.anomalies.empty()) {
        ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.2f, 1.0f), "Anomalies:");
        for (const auto& a : r.anomalies) {
            ImGui::BulletText("%s", a.description.c_str());
        }
    }

    if (r.packet_sent != r.packet_received && ImGui::CollapsingHeader("Packet damage")) {
        std::string report = protocol::formatDiffReport(r.packet_sent, r.packet_received, 8);
        ImGui::TextUnformatted(report.c_str());
    }

    ImGui::Separator();
    float plot_height = std::max(60.0f, (ImGui::GetContentRegionAvail().y - 40.0f) / 2.0f);
    ImGui::PlotLines("##tx", tx_plot_.data(), static_cast<int>(tx_plot_.size()), 0,
                     "Transmitted", -1.5f, 1.5f, ImVec2(-1, plot_height));

    // Received amplitude is scaled down by range loss, so autoscale
    ImGui::PlotLines("##rx", rx_plot_.data(), static_cast<int>(rx_plot_.size()), 0,
                     "Received", FLT_MAX, FLT_MAX, ImVec2(-1, plot_height));
}

void App::startPass() {
    stopPass();

    {
        std::lock_guard<std::mutex> lock(pass_mutex_);
        pass_progress_.clear();
        pass_result_ = {};
        pass_done_ = false;
    }

    pass_cancel_ = false;
    pass_running_ = true;

    std::string message = message_buffer_;
    pipeline::PassConfig pass = mission_.pass;
    pipeline::TransmissionConfig base = mission_.link;
    base.keep_waveforms = false;

    pipeline::MissionSink* sink = archive_.get();

    pass_thread_ = std::thread([this, message, pass, base, sink]() {
        auto on_tx = [this](const pipeline::PassTransmission& tx) {
            std::lock_guard<std::mutex> lock(pass_mutex_);
            pass_progress_.push_back(tx);
        };
        pipeline::PassResult result = pipeline::simulatePass(message, pass, base, on_tx,
                                                             &pass_cancel_, sink);
        {
            std::lock_guard<std::mutex> lock(pass_mutex_);
            pass_result_ = std::move(result);
            pass_done_ = true;
        }
        pass_running_ = false;
    });
}

void App::stopPass() {
    pass_cancel_ = true;
    if (pass_thread_.joinable()) {
        pass_thread_.join();
    }
}

void App::renderPassTab() {
    pipeline::PassConfig& pass = mission_.pass;

    bool running = pass_running_;
    if (running) ImGui::BeginDisabled();
    ImGui::SliderFloat("Duration", &pass.duration_sec, 60.0f, 1200.0f, "%.0f s");
    ImGui::SliderFloat("Max elevation", &pass.max_elevation_deg, 10.0f, 90.0f, "%.0f deg");
    ImGui::DragFloatRange2("SNR range", &pass.min_snr_db, &pass.max_snr_db, 0.5f, -20.0f, 40.0f, "%.1f dB");
    ImGui::DragFloatRange2("Distance range", &pass.min_distance_km, &pass.max_distance_km, 10.0f, 100.0f, 10000.0f, "%.0f km");
    int n = static_cast<int>(pass.num_transmissions);
    if (ImGui::SliderInt("Transmissions", &n, 1, 50)) {
        pass.num_transmissions = static_cast<size_t>(n);
    }
    if (running) ImGui::EndDisabled();

    if (!running) {
        if (ImGui::Button("Start pass")) startPass();
    } else {
        if (ImGui::Button("Cancel")) pass_cancel_ = true;
        ImGui::SameLine();
        ImGui::Text("Running...");
    }

    std::vector<float> elevations, snrs, bers;
    size_t corrupted = 0;
    {
        std::lock_guard<std::mutex> lock(pass_mutex_);
        for (const auto& tx : pass_progress_) {
            elevations.push_back(tx.elevation_deg);
            snrs.push_back(tx.result.snr_actual_db);
            bers.push_back(tx.result.ber);
            if (!tx.result.packet_valid) corrupted++;
        }
        if (pass_done_) {
            ImGui::Text("%zu/%zu packets OK   avg BER %.6f   avg SNR %.1f dB%s",
                        pass_result_.successful(), pass_result_.transmissions.size(),
                        pass_result_.avg_ber, pass_result_.avg_snr_db,
                        pass_result_.cancelled ? "   (cancelled)" : "");
        } else if (!pass_progress_.empty()) {
            ImGui::Text("%zu/%zu transmissions, %zu corrupted",
                        pass_progress_.size(), pass.num_transmissions, corrupted);
        }
    }

    if (elevations.empty()) return;

    ImGui::Separator();
    float plot_height = std::max(50.0f, (ImGui::GetContentRegionAvail().y - 20.0f) / 3.0f);
    int count = static_cast<int>(elevations.size());
    ImGui::PlotLines("##elev", elevations.data(), count, 0, "Elevation (deg)",
                     0.0f, 90.0f, ImVec2(-1, plot_height));
    ImGui::PlotLines("##snr", snrs.data(), count, 0, "Achieved SNR (dB)",
                     FLT_MAX, FLT_MAX, ImVec2(-1, plot_height));
    ImGui::PlotHistogram("##ber", bers.data(), count, 0, "BER",
                         0.0f, FLT_MAX, ImVec2(-1, plot_height));
}

// ============================================================================
// Mission archive
// ============================================================================

void App::refreshArchive() {
    if (!archive_) return;

    pipeline::ArchiveQuery q;
    q.limit = static_cast<size_t>(archive_limit_);
    q.min_snr_db = archive_min_snr_;
    q.max_ber = archive_max_ber_;

    archive_rows_ = archive_->query(q);
    archive_stats_ = archive_->statistics();
    archive_loaded_ = true;
}

void App::renderArchiveTab() {
    if (!archive_) {
        ImGui::TextDisabled("Enable \"Archive missions\" to record and browse missions.");
        return;
    }

    ImGui::TextDisabled("%s", archive_->path().c_str());

    // The pass thread appends to the file, so read it only when idle
    bool busy = pass_running_;
    if (busy) ImGui::BeginDisabled();

    bool changed = ImGui::SliderFloat("Min SNR (dB)", &archive_min_snr_, -50.0f, 50.0f, "%.0f");
    changed |= ImGui::SliderFloat("Max BER", &archive_max_ber_, 0.0f, 1.0f, "%.3f");
    changed |= ImGui::SliderInt("Rows", &archive_limit_, 10, 500);
    if (ImGui::Button("Refresh") || changed || (!archive_loaded_ && !busy)) {
        refreshArchive();
    }
    ImGui::SameLine();
    if (ImGui::Button("Clear archive")) {
        archive_->clear();
        refreshArchive();
    }

    if (busy) ImGui::EndDisabled();

    const pipeline::ArchiveStatistics& st = archive_stats_;
    ImGui::Separator();
    ImGui::Text("%zu missions   avg BER %.6f   avg SNR %.1f dB   packet error rate %.1f%%",
                st.total_missions, st.average_ber, st.average_snr_db, st.packet_error_rate * 100.0f);
    ImGui::Separator();

    if (archive_rows_.empty()) {
        ImGui::TextDisabled("No missions match.");
        return;
    }

    ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY;
    if (ImGui::BeginTable("Missions", 6, flags)) {
        ImGui::TableSetupColumn("Id");
        ImGui::TableSetupColumn("Time (UTC)");
        ImGui::TableSetupColumn("BER");
        ImGui::TableSetupColumn("SNR");
        ImGui::TableSetupColumn("Packets");
        ImGui::TableSetupColumn("Message");
        ImGui::TableHeadersRow();

        for (const auto& m : archive_rows_) {
            const pipeline::MissionRecord& r = m.record;
            ImGui::TableNextRow();
            ImGui::TableNextColumn(); ImGui::Text("%s", m.id.c_str());
            ImGui::TableNextColumn(); ImGui::Text("%s", m.timestamp.c_str());
            ImGui::TableNextColumn(); ImGui::Text("%.6f", r.ber);
            ImGui::TableNextColumn(); ImGui::Text("%.1f", r.snr_db);
            ImGui::TableNextColumn();
            ImGui::TextColored(validityColor(r.packets_corrupted == 0), "%d/%d",
                               r.packets_total - r.packets_corrupted, r.packets_total);
            ImGui::TableNextColumn(); ImGui::Text("%s", r.message_sent.c_str());
        }
        ImGui::EndTable();
    }
}

} // namespace gui
} // namespace orbiter
