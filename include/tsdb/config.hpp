#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace tsdb {

// Значения по умолчанию → JSON-файл (если есть) → переменные окружения.
// Битый JSON: AppError(validation). Нераспознанные значения переменных
// окружения игнорируются.
Config load_config(const std::string &path);

// Применяет ключи из JSON поверх cfg.
void apply_json(Config &cfg, const nlohmann::json &j);

// PORT, HOST, HTTP_THREADS, READ_TIMEOUT, WRITE_TIMEOUT, IDLE_TIMEOUT,
// SHUTDOWN_TIMEOUT (секунды), DATA_FILE, MAX_FILE_SIZE, BACKUP_DIR,
// COMPRESSION, LOG_LEVEL, LOG_FORMAT, LOG_OUTPUT
void apply_env(Config &cfg);

// AppError(validation) с перечнем всех проблем.
void validate_config(const Config &cfg);

std::string to_string(const Config &cfg);

} // namespace tsdb
