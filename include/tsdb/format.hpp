#pragma once
#include "types.hpp"
#include <string>
#include <vector>

namespace tsdb {

// Кратчайшее десятичное представление без экспоненты: 0.64, 42, 0.0001.
// Не-конечные значения: NaN, +Inf, -Inf.
std::string format_float(double v);

// k=v через запятую; порядок не гарантирован.
std::string format_tags(const Tags &tags);

// Строка хранилища: колонки через TAB, '\n' в конце. Колонки с TAB, '"',
// '\r', '\n' или начальным пробелом берутся в кавычки.
std::string encode_row(const std::vector<std::string> &columns);

// Обратная операция для одной строки без '\n' (используется в тестах и
// утилитах чтения).
std::vector<std::string> decode_row(const std::string &line);

} // namespace tsdb
