#include "test_helpers.hpp"
#include <boost/thread.hpp>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <set>
#include <tsdb/errors.hpp>
#include <tsdb/format.hpp>
#include <tsdb/storage.hpp>
#include <tsdb/time_utils.hpp>
#include <sys/stat.h>
#include <unistd.h>

using tsdb::ErrorType;
using tsdb::MetricsRegistry;
using tsdb::Point;
using tsdb::Storage;
using tsdb::StorageConfig;
using tsdb::test::read_lines;
using tsdb::test::TempDir;

namespace {

StorageConfig make_config(const TempDir &dir) {
  StorageConfig c;
  c.data_file = dir.file("data.tsv");
  c.backup_dir = dir.file("backups");
  c.max_file_size = 0;
  return c;
}

Point make_point(std::string m, tsdb::Tags tags, tsdb::Fields fields,
                 std::int64_t ns) {
  Point p;
  p.measurement = std::move(m);
  p.tags = std::move(tags);
  p.fields = std::move(fields);
  p.timestamp = tsdb::from_unix_nanos(ns);
  return p;
}

std::size_t count_files(const std::filesystem::path &dir) {
  std::size_t n = 0;
  for (const auto &e : std::filesystem::directory_iterator(dir)) {
    (void)e;
    ++n;
  }
  return n;
}

} // namespace

TEST(Storage, WritesOneRowPerField) {
  TempDir dir;
  MetricsRegistry metrics;
  const auto cfg = make_config(dir);
  {
    Storage s(cfg, metrics);
    s.write_point(make_point("cpu", {{"host", "server01"}}, {{"value", 0.64}},
                             1434055562000000000LL));
    s.write_point(
        make_point("mem", {}, {{"used", 10}, {"free", 22.5}, {"total", 32.5}}, 5));
    s.close();
  }

  const auto lines = read_lines(cfg.data_file);
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "cpu\thost=server01\tvalue\t0.64\t2015-06-11T20:46:02Z");

  std::set<std::string> mem_fields;
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto cols = tsdb::decode_row(lines[i]);
    ASSERT_EQ(cols.size(), 5u) << lines[i];
    EXPECT_EQ(cols[0], "mem");
    EXPECT_EQ(cols[1], "");
    EXPECT_EQ(cols[4], "1970-01-01T00:00:00.000000005Z");
    mem_fields.insert(cols[2] + "=" + cols[3]);
  }
  EXPECT_EQ(mem_fields,
            (std::set<std::string>{"used=10", "free=22.5", "total=32.5"}));

  EXPECT_DOUBLE_EQ(metrics.value(tsdb::metric::kStorageRows), 4);
  EXPECT_DOUBLE_EQ(metrics.value(tsdb::metric::kStorageWrites), 2);
  EXPECT_EQ(metrics.histogram_count(tsdb::metric::kStorageWriteLatency), 2u);
}

TEST(Storage, AppendsAcrossReopen) {
  TempDir dir;
  MetricsRegistry metrics;
  const auto cfg = make_config(dir);
  {
    Storage s(cfg, metrics);
    s.write_point(make_point("a", {}, {{"v", 1}}, 1));
  }
  {
    Storage s(cfg, metrics);
    s.write_point(make_point("b", {}, {{"v", 2}}, 2));
  }
  const auto lines = read_lines(cfg.data_file);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].substr(0, 2), "a\t");
  EXPECT_EQ(lines[1].substr(0, 2), "b\t");
}

TEST(Storage, DataVisibleWithoutClose) {
  TempDir dir;
  MetricsRegistry metrics;
  const auto cfg = make_config(dir);
  Storage s(cfg, metrics);
  s.write_point(make_point("cpu", {}, {{"v", 1}}, 1));
  EXPECT_EQ(read_lines(cfg.data_file).size(), 1u);
}

TEST(Storage, CloseIsIdempotentAndWriteAfterCloseFails) {
  TempDir dir;
  MetricsRegistry metrics;
  Storage s(make_config(dir), metrics);
  EXPECT_TRUE(s.is_open());
  EXPECT_DOUBLE_EQ(metrics.value(tsdb::metric::kStorageConnection), 1);

  s.close();
  EXPECT_NO_THROW(s.close());
  EXPECT_FALSE(s.is_open());
  EXPECT_DOUBLE_EQ(metrics.value(tsdb::metric::kStorageConnection), 0);

  try {
    s.write_point(make_point("cpu", {}, {{"v", 1}}, 1));
    FAIL() << "expected storage error";
  } catch (const tsdb::AppError &e) {
    EXPECT_EQ(e.type(), ErrorType::storage);
    EXPECT_EQ(e.message(), "storage is closed");
  }
  EXPECT_DOUBLE_EQ(metrics.value(tsdb::metric::kStorageWriteErrors), 1);
}

TEST(Storage, OpenFailureIsStorageError) {
  TempDir dir;
  MetricsRegistry metrics;
  auto cfg = make_config(dir);
  cfg.data_file = dir.file("no/such/dir/data.tsv");
  try {
    Storage s(cfg, metrics);
    FAIL() << "expected storage error";
  } catch (const tsdb::AppError &e) {
    EXPECT_EQ(e.type(), ErrorType::storage);
    EXPECT_EQ(e.context()["path"], cfg.data_file);
  }
}

TEST(Storage, WriteFailureIsStorageError) {
  MetricsRegistry metrics;
  StorageConfig cfg;
  cfg.data_file = "/dev/full";
  cfg.max_file_size = 0;
  Storage s(cfg, metrics);
  for (int i = 0; i < 2; ++i) {
    try {
      s.write_point(make_point("cpu", {}, {{"v", 1}}, 1));
      FAIL() << "expected storage error";
    } catch (const tsdb::AppError &e) {
      EXPECT_EQ(e.type(), ErrorType::storage);
      EXPECT_EQ(e.message(), "failed to write point to storage");
      EXPECT_EQ(e.cause(), std::strerror(ENOSPC));
    }
  }
  EXPECT_DOUBLE_EQ(metrics.value(tsdb::metric::kStorageWriteErrors), 2);
  EXPECT_DOUBLE_EQ(metrics.value(tsdb::metric::kStorageRows), 0);
}

// Неудачная запись не должна всплыть в файле вместе со следующей.
TEST(Storage, FailedWriteLeavesNothingBehind) {
  std::signal(SIGPIPE, SIG_IGN);
  TempDir dir;
  MetricsRegistry metrics;
  auto cfg = make_config(dir);
  ASSERT_EQ(::mkfifo(cfg.data_file.c_str(), 0600), 0);

  int reader = ::open(cfg.data_file.c_str(), O_RDONLY | O_NONBLOCK);
  ASSERT_GE(reader, 0);
  Storage s(cfg, metrics);
  ::close(reader);

  // читателя нет: EPIPE
  EXPECT_THROW(s.write_point(make_point("lost", {}, {{"v", 1}}, 1)),
               tsdb::AppError);

  reader = ::open(cfg.data_file.c_str(), O_RDONLY | O_NONBLOCK);
  ASSERT_GE(reader, 0);
  s.write_point(make_point("cpu", {}, {{"v", 2}}, 2));

  char buf[4096];
  const ssize_t n = ::read(reader, buf, sizeof(buf));
  ::close(reader);
  ASSERT_GT(n, 0);
  EXPECT_EQ(std::string(buf, static_cast<std::size_t>(n)),
            tsdb::encode_row({"cpu", "", "v", "2",
                              tsdb::format_rfc3339_nano(
                                  tsdb::from_unix_nanos(2))}));
}

TEST(Storage, EmptyPathRejected) {
  MetricsRegistry metrics;
  StorageConfig cfg;
  cfg.data_file = "";
  EXPECT_THROW({ Storage s(cfg, metrics); }, tsdb::AppError);
}

TEST(Storage, InvalidPointRejected) {
  TempDir dir;
  MetricsRegistry metrics;
  Storage s(make_config(dir), metrics);
  EXPECT_THROW(s.write_point(make_point("", {}, {{"v", 1}}, 1)),
               tsdb::AppError);
  EXPECT_THROW(s.write_point(make_point("cpu", {}, {}, 1)), tsdb::AppError);
}

TEST(Storage, RotatesIntoBackupDir) {
  TempDir dir;
  MetricsRegistry metrics;
  auto cfg = make_config(dir);
  cfg.max_file_size = 1; // любой непустой файл ротируется перед записью

  Storage s(cfg, metrics);
  s.write_point(make_point("a", {}, {{"v", 1}}, 1));
  s.write_point(make_point("b", {}, {{"v", 2}}, 2));
  s.write_point(make_point("c", {}, {{"v", 3}}, 3));
  s.close();

  EXPECT_EQ(count_files(cfg.backup_dir), 2u);
  EXPECT_DOUBLE_EQ(metrics.value(tsdb::metric::kStorageRotations), 2);

  const auto lines = read_lines(cfg.data_file);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].substr(0, 2), "c\t");

  for (const auto &e : std::filesystem::directory_iterator(cfg.backup_dir)) {
    const auto name = e.path().filename().string();
    EXPECT_EQ(name.rfind("data.tsv.", 0), 0u) << name;
    EXPECT_EQ(read_lines(e.path().string()).size(), 1u) << name;
  }
}

TEST(Storage, ClearTruncates) {
  TempDir dir;
  MetricsRegistry metrics;
  const auto cfg = make_config(dir);
  Storage s(cfg, metrics);
  s.write_point(make_point("a", {}, {{"v", 1}}, 1));
  s.clear();
  EXPECT_TRUE(read_lines(cfg.data_file).empty());
  EXPECT_TRUE(s.is_open());
  s.write_point(make_point("b", {}, {{"v", 2}}, 2));
  ASSERT_EQ(read_lines(cfg.data_file).size(), 1u);
}

TEST(Storage, ConcurrentWritesDoNotInterleave) {
  TempDir dir;
  MetricsRegistry metrics;
  const auto cfg = make_config(dir);
  const int kThreads = 8;
  const int kPerThread = 200;

  {
    Storage s(cfg, metrics);
    boost::thread_group group;
    for (int t = 0; t < kThreads; ++t) {
      group.create_thread([&s, t] {
        for (int i = 0; i < kPerThread; ++i) {
          const double v = i;
          s.write_point(make_point("m" + std::to_string(t), {{"t", "x"}},
                                   {{"a", v}, {"b", v}, {"c", v}}, i));
        }
      });
    }
    group.join_all();
  }

  const auto lines = read_lines(cfg.data_file);
  ASSERT_EQ(lines.size(), static_cast<std::size_t>(kThreads * kPerThread * 3));

  // строки одного write_point идут подряд
  for (std::size_t i = 0; i < lines.size(); i += 3) {
    const auto first = tsdb::decode_row(lines[i]);
    ASSERT_EQ(first.size(), 5u);
    std::set<std::string> fields{first[2]};
    for (std::size_t k = 1; k < 3; ++k) {
      const auto cols = tsdb::decode_row(lines[i + k]);
      ASSERT_EQ(cols.size(), 5u);
      EXPECT_EQ(cols[0], first[0]) << "line " << i + k;
      EXPECT_EQ(cols[4], first[4]) << "line " << i + k;
      fields.insert(cols[2]);
    }
    EXPECT_EQ(fields.size(), 3u);
  }
  EXPECT_DOUBLE_EQ(metrics.value(tsdb::metric::kStorageRows),
                   kThreads * kPerThread * 3);
}
