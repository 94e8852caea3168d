#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace chanvault {

class UploadLedger;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports upload metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Ledger used for gauge snapshots (not owned).
    void set_ledger(UploadLedger* ledger) { ledger_ = ledger; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Serialize the registry to the .prom file now.
    bool write_file();

    // --- Counter accessors ---
    prometheus::Counter& parts_success() { return *parts_success_; }
    prometheus::Counter& parts_failure() { return *parts_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& compensations_success() { return *compensations_success_; }
    prometheus::Counter& compensations_failure() { return *compensations_failure_; }
    prometheus::Counter& flood_waits_total() { return *flood_waits_total_; }
    prometheus::Counter& flood_wait_seconds_total() { return *flood_wait_seconds_total_; }

    /// Failed part uploads by error class ("validation", "auth", ...)
    prometheus::Counter& upload_errors(const std::string& error_class) {
        return upload_errors_family_->Add({{"class", error_class}});
    }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }

private:
    void writer_loop();
    void update_gauges();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Pointer for gauge snapshots (not owned)
    UploadLedger* ledger_ = nullptr;

    // --- Counters ---
    prometheus::Counter* parts_success_;
    prometheus::Counter* parts_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* compensations_success_;
    prometheus::Counter* compensations_failure_;
    prometheus::Counter* flood_waits_total_;
    prometheus::Counter* flood_wait_seconds_total_;
    prometheus::Family<prometheus::Counter>* upload_errors_family_;

    // --- Gauges ---
    prometheus::Gauge* ledger_parts_;
    prometheus::Gauge* ledger_bytes_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace chanvault
