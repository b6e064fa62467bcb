// ==============================================================================
// warden/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr (библиотечные модули не пишут
//   в консоль напрямую)
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - Цветной вывод (ANSI escape codes) на TTY
// - JSON вывод через RapidJSON, таблицы для текстового режима
// - Вывод в файл (--output)
//
// ==============================================================================

#ifndef WARDEN_OUTPUT_HPP
#define WARDEN_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace warden {
class Value;
}  // namespace warden

namespace warden::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Формат вывода
// ----------------------------------------------------------------------------

enum class Format {
    Std,   // Стандартный (таблицы/текст)
    Json,  // Pretty JSON
    Jsonl  // JSON Lines (один объект на строку)
};

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;           // -q: подавить informational stderr
    int verbose = 0;              // -v: уровень подробности (0..2+)
    bool no_banner = false;       // --no-banner: скрыть баннер
    Format format = Format::Std;  // Формат вывода

    // Путь для вывода (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Зелёная строка в stdout
    void green_line(std::string_view message);

    /// Жёлтая строка в stdout
    void yellow_line(std::string_view message);

    /// Красная строка в stdout
    void red_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать JSON значение (компактно)
    void write_json(const rapidjson::Value& value);

    /// Записать JSON значение + newline (JSONL формат)
    void write_json_line(const rapidjson::Value& value);

    /// Записать pretty JSON (с отступами)
    void write_json_pretty(const rapidjson::Value& value);

    /// Записать Value в формате из конфигурации (Json - pretty, иначе строка JSONL)
    void write_value(const warden::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    /// Получить текущую конфигурацию
    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при output_path задан)
    bool open_output_file();

    /// Закрыть файл вывода
    void close_output_file();

    /// Проверить, открыт ли файл для вывода
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_impl(Stream s, std::string_view bytes);
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    void write_colored(Stream s, std::string_view message, Color color);
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    /// Задать заголовки
    void set_headers(const std::vector<std::string>& headers);

    /// Добавить строку данных
    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer
    void print(Writer& w) const;

    /// Вывести таблицу в строку
    std::string to_string() const;

    /// Количество строк (без заголовка)
    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char position, const std::vector<size_t>& widths) const;
    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;
    std::vector<size_t> calculate_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[+] <message>\n"
std::string format_info(std::string_view message);

/// "[x] <message>\n"
std::string format_error(std::string_view message);

/// "[!] <message>\n"
std::string format_warning(std::string_view message);

/// "[*] <message>\n"
std::string format_debug(std::string_view message);

/// Очистить поле для ячейки таблицы: \n \r \t и повторные пробелы
/// схлопываются; длиннее limit - обрезается с "..."
std::string format_field(std::string_view field, size_t limit);

/// ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// ANSI reset code
std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace warden::output

#endif  // WARDEN_OUTPUT_HPP
