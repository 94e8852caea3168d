#include "chanvault/metrics.hpp"
#include "chanvault/core/log.hpp"
#include "chanvault/storage/upload_ledger.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace chanvault {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& parts_family = prometheus::BuildCounter()
        .Name("chanvault_part_uploads_total")
        .Help("Total part uploads handled")
        .Labels(labels)
        .Register(*registry_);
    parts_success_ = &parts_family.Add({{"result", "success"}});
    parts_failure_ = &parts_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("chanvault_upload_bytes_total")
        .Help("Total bytes sent to the transport for recorded parts")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& compensations_family = prometheus::BuildCounter()
        .Name("chanvault_compensations_total")
        .Help("Compensating deletes of sent messages")
        .Labels(labels)
        .Register(*registry_);
    compensations_success_ = &compensations_family.Add({{"result", "success"}});
    compensations_failure_ = &compensations_family.Add({{"result", "failure"}});

    flood_waits_total_ = &prometheus::BuildCounter()
        .Name("chanvault_flood_waits_total")
        .Help("Flood control waits slept through")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    flood_wait_seconds_total_ = &prometheus::BuildCounter()
        .Name("chanvault_flood_wait_seconds_total")
        .Help("Seconds spent in flood control waits")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    upload_errors_family_ = &prometheus::BuildCounter()
        .Name("chanvault_upload_errors_total")
        .Help("Failed part uploads by error class")
        .Labels(labels)
        .Register(*registry_);

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    ledger_parts_ = &gauge_reg("chanvault_ledger_parts", "Parts recorded in the upload ledger");
    ledger_bytes_ = &gauge_reg("chanvault_ledger_bytes", "Bytes recorded in the upload ledger");

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("chanvault_part_upload_duration_seconds")
        .Help("Part upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    if (ledger_) {
        auto stats = ledger_->stats();
        ledger_parts_->Set(static_cast<double>(stats.rows));
        ledger_bytes_->Set(static_cast<double>(stats.bytes));
    }
}

bool MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return false;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("metrics: cannot write %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    return !ec;
}

}  // namespace chanvault
