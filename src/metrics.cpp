#include "tsdb/metrics.hpp"
#include <boost/thread/lock_guard.hpp>
#include "tsdb/format.hpp"
#include <algorithm>
#include <sstream>

namespace tsdb {

namespace {

const std::vector<double> kDefaultBuckets = {0.005, 0.01, 0.025, 0.05, 0.1, 0.25,
                                             0.5,   1,    2.5,   5,    10};

const char *kind_name(MetricKind k) {
  switch (k) {
  case MetricKind::counter:
    return "counter";
  case MetricKind::gauge:
    return "gauge";
  case MetricKind::histogram:
    return "histogram";
  }
  return "untyped";
}

std::string escape_label(const std::string &v) {
  std::string out;
  out.reserve(v.size());
  for (char c : v) {
    if (c == '\\')
      out += "\\\\";
    else if (c == '"')
      out += "\\\"";
    else if (c == '\n')
      out += "\\n";
    else
      out += c;
  }
  return out;
}

std::string render_labels(const Labels &labels,
                          const std::string &extra_key = {},
                          const std::string &extra_value = {}) {
  if (labels.empty() && extra_key.empty())
    return {};
  std::string out = "{";
  bool first = true;
  for (const auto &[k, v] : labels) {
    if (!first)
      out += ',';
    first = false;
    out += k + "=\"" + escape_label(v) + "\"";
  }
  if (!extra_key.empty()) {
    if (!first)
      out += ',';
    out += extra_key + "=\"" + extra_value + "\"";
  }
  out += '}';
  return out;
}

} // namespace

void MetricsRegistry::register_counter(const std::string &name,
                                       const std::string &help) {
  boost::lock_guard<boost::mutex> lk(m_);
  auto &f = families_[name];
  f.kind = MetricKind::counter;
  f.help = help;
}

void MetricsRegistry::register_gauge(const std::string &name,
                                     const std::string &help) {
  boost::lock_guard<boost::mutex> lk(m_);
  auto &f = families_[name];
  f.kind = MetricKind::gauge;
  f.help = help;
}

void MetricsRegistry::register_histogram(const std::string &name,
                                         const std::string &help,
                                         std::vector<double> buckets) {
  std::sort(buckets.begin(), buckets.end());
  boost::lock_guard<boost::mutex> lk(m_);
  auto &f = families_[name];
  f.kind = MetricKind::histogram;
  f.help = help;
  f.buckets = std::move(buckets);
}

MetricsRegistry::Family &
MetricsRegistry::family_locked(const std::string &name, MetricKind kind) {
  auto it = families_.find(name);
  if (it != families_.end())
    return it->second;
  // незарегистрированную метрику заводим с типом по первому использованию
  auto &f = families_[name];
  f.kind = kind;
  if (kind == MetricKind::histogram)
    f.buckets = kDefaultBuckets;
  return f;
}

void MetricsRegistry::inc_counter(const std::string &name,
                                  const Labels &labels, double delta) {
  boost::lock_guard<boost::mutex> lk(m_);
  auto &f = family_locked(name, MetricKind::counter);
  f.values[labels] += delta;
}

void MetricsRegistry::set_gauge(const std::string &name, double value,
                                const Labels &labels) {
  boost::lock_guard<boost::mutex> lk(m_);
  auto &f = family_locked(name, MetricKind::gauge);
  f.values[labels] = value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const Labels &labels) {
  boost::lock_guard<boost::mutex> lk(m_);
  auto &f = family_locked(name, MetricKind::histogram);
  if (f.kind != MetricKind::histogram)
    return;
  auto &h = f.histograms[labels];
  if (h.bucket_counts.size() != f.buckets.size())
    h.bucket_counts.assign(f.buckets.size(), 0);
  for (std::size_t i = 0; i < f.buckets.size(); ++i) {
    if (value <= f.buckets[i])
      ++h.bucket_counts[i];
  }
  ++h.count;
  h.sum += value;
}

double MetricsRegistry::value(const std::string &name,
                              const Labels &labels) const {
  boost::lock_guard<boost::mutex> lk(m_);
  auto it = families_.find(name);
  if (it == families_.end())
    return 0;
  auto v = it->second.values.find(labels);
  return v == it->second.values.end() ? 0 : v->second;
}

std::uint64_t MetricsRegistry::histogram_count(const std::string &name,
                                               const Labels &labels) const {
  boost::lock_guard<boost::mutex> lk(m_);
  auto it = families_.find(name);
  if (it == families_.end())
    return 0;
  auto h = it->second.histograms.find(labels);
  return h == it->second.histograms.end() ? 0 : h->second.count;
}

std::string MetricsRegistry::render_prometheus() const {
  std::ostringstream out;
  boost::lock_guard<boost::mutex> lk(m_);

  for (const auto &[name, f] : families_) {
    if (!f.help.empty())
      out << "# HELP " << name << ' ' << f.help << '\n';
    out << "# TYPE " << name << ' ' << kind_name(f.kind) << '\n';

    if (f.kind != MetricKind::histogram) {
      for (const auto &[labels, v] : f.values)
        out << name << render_labels(labels) << ' ' << format_float(v) << '\n';
      continue;
    }

    for (const auto &[labels, h] : f.histograms) {
      // счётчики бакетов уже кумулятивные: каждое наблюдение попадает во все
      // бакеты с le >= value
      for (std::size_t i = 0; i < f.buckets.size(); ++i) {
        out << name << "_bucket"
            << render_labels(labels, "le", format_float(f.buckets[i])) << ' '
            << (i < h.bucket_counts.size() ? h.bucket_counts[i] : 0) << '\n';
      }
      out << name << "_bucket" << render_labels(labels, "le", "+Inf") << ' '
          << h.count << '\n';
      out << name << "_sum" << render_labels(labels) << ' '
          << format_float(h.sum) << '\n';
      out << name << "_count" << render_labels(labels) << ' ' << h.count
          << '\n';
    }
  }
  return out.str();
}

void register_default_metrics(MetricsRegistry &r) {
  using namespace metric;

  r.register_counter(kIngestionPoints, "Total number of points ingested.");
  r.register_counter(kIngestionBatches, "Total number of write batches.");
  r.register_histogram(kIngestionLatency,
                       "Latency of a write batch from parse to flush.",
                       kDefaultBuckets);
  r.register_counter(kWriteErrors, "Total number of failed write requests.");

  r.register_counter(kHttpRequests, "Total number of HTTP requests.");
  r.register_histogram(kHttpDuration, "HTTP request duration in seconds.",
                       kDefaultBuckets);

  r.register_counter(kStorageWrites, "Total number of storage write calls.");
  r.register_counter(kStorageRows, "Total number of rows appended to storage.");
  r.register_counter(kStorageWriteErrors, "Total number of storage write errors.");
  r.register_histogram(kStorageWriteLatency, "Storage write latency in seconds.",
                       {0.0001, 0.0005, 0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1});
  r.register_counter(kStorageRotations, "Total number of data file rotations.");
  r.register_gauge(kStorageConnection, "Storage status (1 = open, 0 = closed).");

  r.register_gauge(kServerStatus,
                   "Server status (0 = stopped, 1 = starting, 2 = running, "
                   "3 = shutting down, 4 = stopped).");
  r.register_gauge(kServerHealth, "Server health (1 = healthy, 0 = unhealthy).");
  r.register_gauge(kServerConnections, "Number of requests in flight.");
  r.register_gauge(kServerStartTime, "Server start time, Unix seconds.");
  r.register_gauge(kServerUptime, "Server uptime in seconds.");
  r.register_histogram(kServerShutdownDuration,
                       "Duration of graceful shutdown in seconds.",
                       {0.01, 0.1, 0.5, 1, 5, 10, 30, 60});
  r.register_counter(kServerErrors, "Server errors by type and component.");
  r.register_gauge(kConfigPort, "Configured listen port.");
  r.register_gauge(kConfigReadTimeout, "Configured read timeout in seconds.");
  r.register_gauge(kConfigWriteTimeout, "Configured write timeout in seconds.");
  r.register_gauge(kConfigIdleTimeout, "Configured idle timeout in seconds.");
}

} // namespace tsdb
