#include "tsdb/storage.hpp"
#include <boost/thread/lock_guard.hpp>
#include "tsdb/errors.hpp"
#include "tsdb/format.hpp"
#include "tsdb/log.hpp"
#include "tsdb/time_utils.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace tsdb {

namespace {

std::string errno_text(int err) { return std::strerror(err); }

} // namespace

Storage::Storage(const StorageConfig &cfg, MetricsRecorder &metrics)
    : cfg_(cfg), metrics_(metrics) {
  if (cfg_.data_file.empty())
    throw validation_error("storage data file path is empty");
  boost::lock_guard<boost::mutex> lk(m_);
  open_locked();
}

Storage::~Storage() {
  try {
    close();
  } catch (const std::exception &e) {
    log_err("STORAGE", std::string("close on destroy failed: ") + e.what());
  }
}

void Storage::open_locked() {
  file_ = std::fopen(cfg_.data_file.c_str(), "ab");
  if (!file_) {
    const int err = errno;
    auto e = storage_error("failed to open storage file", errno_text(err));
    e.with_context("path", cfg_.data_file);
    metrics_.set_gauge(metric::kStorageConnection, 0);
    throw e;
  }
  // без буфера stdio: хвост неудачной записи не уйдёт в файл со следующей
  std::setvbuf(file_, nullptr, _IONBF, 0);
  metrics_.set_gauge(metric::kStorageConnection, 1);
}

bool Storage::is_open() const {
  boost::lock_guard<boost::mutex> lk(m_);
  return file_ != nullptr;
}

void Storage::write_point(const Point &p) {
  if (p.measurement.empty())
    throw validation_error("point has empty measurement");
  if (p.fields.empty())
    throw validation_error("point has no fields");

  const auto started = std::chrono::steady_clock::now();

  // строки собираем заранее, чтобы запись шла одним fwrite под мьютексом
  const std::string tags = format_tags(p.tags);
  const std::string ts = format_rfc3339_nano(p.timestamp);
  std::string rows;
  for (const auto &[key, value] : p.fields)
    rows += encode_row({p.measurement, tags, key, format_float(value), ts});

  boost::lock_guard<boost::mutex> lk(m_);
  metrics_.inc_counter(metric::kStorageWrites);

  if (!file_) {
    metrics_.inc_counter(metric::kStorageWriteErrors);
    throw storage_error("storage is closed");
  }

  try {
    rotate_if_needed_locked();
  } catch (const std::exception &e) {
    metrics_.inc_counter(metric::kStorageWriteErrors);
    throw AppError::wrap(e, ErrorType::storage, "file rotation failed");
  }

  errno = 0;
  const std::size_t n = std::fwrite(rows.data(), 1, rows.size(), file_);
  if (n != rows.size() || std::fflush(file_) != 0) {
    const int err = errno;
    std::clearerr(file_);
    metrics_.inc_counter(metric::kStorageWriteErrors);
    throw storage_error("failed to write point to storage",
                        err ? errno_text(err) : "short write");
  }

  metrics_.inc_counter(metric::kStorageRows,
                       {}, static_cast<double>(p.fields.size()));
  metrics_.observe(metric::kStorageWriteLatency,
                   std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - started)
                       .count());
}

void Storage::rotate_if_needed_locked() {
  if (cfg_.max_file_size <= 0)
    return;

  struct stat st {};
  if (::fstat(fileno(file_), &st) != 0)
    throw storage_error("failed to get file info", errno_text(errno));

  if (static_cast<std::int64_t>(st.st_size) >= cfg_.max_file_size)
    rotate_locked();
}

void Storage::rotate_locked() {
  std::fclose(file_);
  file_ = nullptr;

  std::error_code ec;
  fs::create_directories(cfg_.backup_dir, ec);
  if (ec) {
    open_locked();
    throw storage_error("failed to create backup directory", ec.message());
  }

  const std::string base = fs::path(cfg_.data_file).filename().string() + "." +
                           format_backup_suffix(std::chrono::system_clock::now());
  fs::path backup = fs::path(cfg_.backup_dir) / base;
  // несколько ротаций в одну секунду
  for (int i = 1; fs::exists(backup, ec); ++i)
    backup = fs::path(cfg_.backup_dir) / (base + "-" + std::to_string(i));

  fs::rename(cfg_.data_file, backup, ec);
  if (ec) {
    open_locked();
    throw storage_error("failed to rename file for rotation", ec.message());
  }

  open_locked();
  metrics_.inc_counter(metric::kStorageRotations);
  log_info("STORAGE", "storage file rotated: " + cfg_.data_file + " -> " +
                          backup.string());
}

void Storage::close() {
  boost::lock_guard<boost::mutex> lk(m_);
  if (!file_)
    return;
  const int rc = std::fclose(file_);
  file_ = nullptr;
  metrics_.set_gauge(metric::kStorageConnection, 0);
  if (rc != 0)
    throw storage_error("failed to close storage file", errno_text(errno));
}

void Storage::clear() {
  boost::lock_guard<boost::mutex> lk(m_);
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  std::error_code ec;
  fs::resize_file(cfg_.data_file, 0, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    open_locked();
    throw storage_error("failed to truncate file", ec.message());
  }
  open_locked();
}

} // namespace tsdb
