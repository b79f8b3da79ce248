#pragma once
#include <boost/thread/mutex.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tsdb {

using Labels = std::vector<std::pair<std::string, std::string>>;

// Что нужно компонентам от метрик. Реестр передаётся явно, глобального
// состояния нет.
class MetricsRecorder {
public:
  virtual ~MetricsRecorder() = default;

  virtual void inc_counter(const std::string &name, const Labels &labels = {},
                           double delta = 1.0) = 0;
  virtual void set_gauge(const std::string &name, double value,
                         const Labels &labels = {}) = 0;
  virtual void observe(const std::string &name, double value,
                       const Labels &labels = {}) = 0;
};

enum class MetricKind { counter, gauge, histogram };

class MetricsRegistry : public MetricsRecorder {
public:
  void register_counter(const std::string &name, const std::string &help);
  void register_gauge(const std::string &name, const std::string &help);
  void register_histogram(const std::string &name, const std::string &help,
                          std::vector<double> buckets);

  void inc_counter(const std::string &name, const Labels &labels = {},
                   double delta = 1.0) override;
  void set_gauge(const std::string &name, double value,
                 const Labels &labels = {}) override;
  void observe(const std::string &name, double value,
               const Labels &labels = {}) override;

  // Для тестов и /health; 0 если серии нет.
  double value(const std::string &name, const Labels &labels = {}) const;
  std::uint64_t histogram_count(const std::string &name,
                                const Labels &labels = {}) const;

  // Текстовый формат экспозиции Prometheus 0.0.4
  std::string render_prometheus() const;

private:
  struct Histogram {
    std::vector<std::uint64_t> bucket_counts;
    std::uint64_t count = 0;
    double sum = 0;
  };

  struct Family {
    MetricKind kind = MetricKind::gauge;
    std::string help;
    std::vector<double> buckets;
    std::map<Labels, double> values;
    std::map<Labels, Histogram> histograms;
  };

  Family &family_locked(const std::string &name, MetricKind kind);

  mutable boost::mutex m_;
  std::map<std::string, Family> families_;
};

// Имена метрик сервиса
namespace metric {
inline constexpr const char *kIngestionPoints = "tsdb_ingestion_points_total";
inline constexpr const char *kIngestionBatches = "tsdb_ingestion_batches_total";
inline constexpr const char *kIngestionLatency = "tsdb_ingestion_latency_seconds";
inline constexpr const char *kWriteErrors = "tsdb_write_errors_total";

inline constexpr const char *kHttpRequests = "tsdb_http_requests_total";
inline constexpr const char *kHttpDuration = "tsdb_http_request_duration_seconds";

inline constexpr const char *kStorageWrites = "tsdb_storage_write_operations_total";
inline constexpr const char *kStorageRows = "tsdb_storage_data_points_written_total";
inline constexpr const char *kStorageWriteErrors = "tsdb_storage_write_errors_total";
inline constexpr const char *kStorageWriteLatency = "tsdb_storage_write_latency_seconds";
inline constexpr const char *kStorageRotations = "tsdb_storage_rotations_total";
inline constexpr const char *kStorageConnection = "tsdb_storage_connection_status";

inline constexpr const char *kServerStatus = "tsdb_server_status";
inline constexpr const char *kServerHealth = "tsdb_server_health";
inline constexpr const char *kServerConnections = "tsdb_server_active_connections";
inline constexpr const char *kServerStartTime = "tsdb_server_start_time_seconds";
inline constexpr const char *kServerUptime = "tsdb_server_uptime_seconds";
inline constexpr const char *kServerShutdownDuration = "tsdb_server_shutdown_duration_seconds";
inline constexpr const char *kServerErrors = "tsdb_server_errors_total";
inline constexpr const char *kConfigPort = "tsdb_server_config_port";
inline constexpr const char *kConfigReadTimeout = "tsdb_server_config_read_timeout_seconds";
inline constexpr const char *kConfigWriteTimeout = "tsdb_server_config_write_timeout_seconds";
inline constexpr const char *kConfigIdleTimeout = "tsdb_server_config_idle_timeout_seconds";
} // namespace metric

void register_default_metrics(MetricsRegistry &registry);

} // namespace tsdb
