#pragma once
#include "metrics.hpp"
#include "types.hpp"
#include <boost/thread/mutex.hpp>
#include <cstdio>
#include <string>

namespace tsdb {

// То, чем обработчик /write пишет точки. Ошибки: AppError(storage).
class PointWriter {
public:
  virtual ~PointWriter() = default;
  virtual void write_point(const Point &p) = 0;
};

// Append-only TSV файл: одна строка на поле точки
//   measurement \t tags \t field \t value \t RFC3339Nano
// Все вызовы сериализуются внутренним мьютексом; строки одного вызова не
// перемешиваются со строками другого. Файл открыт без буфера stdio: после
// write_point строки уже переданы ядру, а неудачная запись не оставляет
// недописанных байт для следующего вызова.
class Storage : public PointWriter {
public:
  Storage(const StorageConfig &cfg, MetricsRecorder &metrics);
  ~Storage() override;

  Storage(const Storage &) = delete;
  Storage &operator=(const Storage &) = delete;

  void write_point(const Point &p) override;

  // Повторный вызов: no-op.
  void close();

  // Обрезает файл до нуля и открывает заново.
  void clear();

  bool is_open() const;
  const std::string &path() const noexcept { return cfg_.data_file; }

private:
  void open_locked();
  void rotate_if_needed_locked();
  void rotate_locked();

  const StorageConfig cfg_;
  MetricsRecorder &metrics_;
  mutable boost::mutex m_;
  std::FILE *file_ = nullptr;
};

} // namespace tsdb
