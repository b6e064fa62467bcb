// ==============================================================================
// warden/datetime.hpp - Время и RFC 3339
// ==============================================================================
//
// Назначение:
// - Единый тип момента времени (system_clock, UTC)
// - Разбор и форматирование RFC 3339 ("2024-01-15T10:30:00.000Z")
// - Календарные поля в UTC для time_window условий
//
// ==============================================================================

#ifndef WARDEN_DATETIME_HPP
#define WARDEN_DATETIME_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace warden::datetime {

/// Момент времени (UTC)
using TimePoint = std::chrono::system_clock::time_point;

/// Источник текущего времени (подменяется в тестах)
using Clock = std::function<TimePoint()>;

/// Текущее время
TimePoint now();

/// Системные часы по умолчанию
Clock system_clock();

/// Разобрать RFC 3339 / ISO 8601 строку.
/// Поддерживается: YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]
/// (без смещения трактуется как UTC; 'T' можно заменить пробелом).
/// @return std::nullopt если строка не распознана
std::optional<TimePoint> parse_rfc3339(std::string_view str);

/// Форматировать момент как "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string format_rfc3339(TimePoint tp);

/// Миллисекунды с эпохи Unix
std::int64_t unix_millis(TimePoint tp);

/// Момент из миллисекунд Unix
TimePoint from_unix_millis(std::int64_t millis);

/// День недели в UTC: 0 = воскресенье .. 6 = суббота
int weekday_utc(TimePoint tp);

/// Час в UTC (0..23)
int hour_utc(TimePoint tp);

/// Длительность в миллисекундах (дробная) между двумя моментами steady_clock
double elapsed_ms(std::chrono::steady_clock::time_point start);

}  // namespace warden::datetime

#endif  // WARDEN_DATETIME_HPP
