#pragma once
#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace tsdb {

// Разбирает текст в формате
//   measurement[,tag=value...] field=value[,field=value...] timestamp_ns
// по одной точке на непустую строку.
//
// Всё или ничего: при первой ошибке бросает AppError(validation) с номером
// строки в context и не возвращает ни одной точки, даже если предыдущие
// строки были корректны. Кому нужна построчная устойчивость, режьте вход
// на строки сами.
std::vector<Point> parse_line_protocol(std::string_view input);

// Одна строка line protocol для точки (теги и поля отсортированы по ключу).
std::string to_line_protocol(const Point &p);

} // namespace tsdb
