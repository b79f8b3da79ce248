#pragma once
#include <boost/stacktrace.hpp>
#include <cstdint>
#include <exception>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace tsdb {

enum class ErrorType {
  validation,
  not_found,
  database,
  storage,
  network,
  internal,
  timeout,
};

const char *to_string(ErrorType type) noexcept;

// HTTP-код для типа ошибки: validation→400, not_found→404,
// database/storage→503, network→502, timeout→408, остальное→500.
int http_status_for(ErrorType type) noexcept;

class AppError : public std::runtime_error {
public:
  AppError(ErrorType type, std::string message, std::string cause = {});

  // Оборачивает чужое исключение; AppError сохраняет свой тип, к сообщению
  // добавляется префикс.
  static AppError wrap(const std::exception &e, ErrorType type,
                       const std::string &message);

  ErrorType type() const noexcept { return type_; }
  const std::string &message() const noexcept { return message_; }
  const std::string &cause() const noexcept { return cause_; }
  const nlohmann::json &context() const noexcept { return context_; }
  const boost::stacktrace::stacktrace &stack() const noexcept { return stack_; }
  std::int64_t timestamp_ns() const noexcept { return timestamp_ns_; }

  AppError &with_context(const std::string &key, nlohmann::json value);

  // Тело ответа: {error, type, code, message, context}
  nlohmann::json to_json() const;

private:
  ErrorType type_;
  std::string message_;
  std::string cause_;
  nlohmann::json context_ = nlohmann::json::object();
  boost::stacktrace::stacktrace stack_;
  std::int64_t timestamp_ns_;
};

bool is_type(const std::exception &e, ErrorType type) noexcept;

inline AppError validation_error(std::string msg) {
  return AppError(ErrorType::validation, std::move(msg));
}
inline AppError not_found_error(std::string msg) {
  return AppError(ErrorType::not_found, std::move(msg));
}
inline AppError storage_error(std::string msg, std::string cause = {}) {
  return AppError(ErrorType::storage, std::move(msg), std::move(cause));
}
inline AppError network_error(std::string msg, std::string cause = {}) {
  return AppError(ErrorType::network, std::move(msg), std::move(cause));
}
inline AppError internal_error(std::string msg) {
  return AppError(ErrorType::internal, std::move(msg));
}
inline AppError timeout_error(std::string msg) {
  return AppError(ErrorType::timeout, std::move(msg));
}

} // namespace tsdb
