#include "tsdb/errors.hpp"
#include <chrono>

namespace tsdb {

namespace {

std::int64_t now_ns() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string compose(const std::string &message, const std::string &cause) {
  if (cause.empty())
    return message;
  return message + ": " + cause;
}

} // namespace

const char *to_string(ErrorType type) noexcept {
  switch (type) {
  case ErrorType::validation:
    return "validation";
  case ErrorType::not_found:
    return "not_found";
  case ErrorType::database:
    return "database";
  case ErrorType::storage:
    return "storage";
  case ErrorType::network:
    return "network";
  case ErrorType::internal:
    return "internal";
  case ErrorType::timeout:
    return "timeout";
  }
  return "internal";
}

int http_status_for(ErrorType type) noexcept {
  switch (type) {
  case ErrorType::validation:
    return 400;
  case ErrorType::not_found:
    return 404;
  case ErrorType::database:
  case ErrorType::storage:
    return 503;
  case ErrorType::network:
    return 502;
  case ErrorType::timeout:
    return 408;
  case ErrorType::internal:
    return 500;
  }
  return 500;
}

AppError::AppError(ErrorType type, std::string message, std::string cause)
    : std::runtime_error(compose(message, cause)), type_(type),
      message_(std::move(message)), cause_(std::move(cause)),
      timestamp_ns_(now_ns()) {}

AppError AppError::wrap(const std::exception &e, ErrorType type,
                        const std::string &message) {
  if (auto *app = dynamic_cast<const AppError *>(&e)) {
    AppError copy(app->type_, message + ": " + app->message_, app->cause_);
    copy.context_ = app->context_;
    copy.stack_ = app->stack_;
    return copy;
  }
  return AppError(type, message, e.what());
}

AppError &AppError::with_context(const std::string &key,
                                 nlohmann::json value) {
  context_[key] = std::move(value);
  return *this;
}

nlohmann::json AppError::to_json() const {
  return nlohmann::json{{"error", to_string(type_)},
                        {"type", to_string(type_)},
                        {"code", http_status_for(type_)},
                        {"message", message_},
                        {"context", context_}};
}

bool is_type(const std::exception &e, ErrorType type) noexcept {
  auto *app = dynamic_cast<const AppError *>(&e);
  return app != nullptr && app->type() == type;
}

} // namespace tsdb
