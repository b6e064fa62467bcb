// ==============================================================================
// warden/reader.hpp - Чтение входных документов
// ==============================================================================
//
// Назначение:
// - Унифицированное чтение JSON / JSONL / YAML файлов (запросы, записи
//   аудита, трассы решений)
// - Корневой массив (JSON) или последовательность (YAML) даёт по документу
//   на элемент; JSONL - по документу на непустую строку
//
// ==============================================================================

#ifndef WARDEN_READER_HPP
#define WARDEN_READER_HPP

#include <warden/value.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace warden::io {

// ----------------------------------------------------------------------------
// DocumentKind
// ----------------------------------------------------------------------------

enum class DocumentKind {
    Json,   // .json
    Jsonl,  // .jsonl
    Yaml,   // .yml, .yaml
    Unknown
};

const char* document_kind_to_string(DocumentKind kind);

/// @param ext Расширение без точки, регистр не важен
DocumentKind document_kind_from_extension(std::string_view ext);

DocumentKind document_kind_from_path(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// Document
// ----------------------------------------------------------------------------

struct Document {
    DocumentKind kind = DocumentKind::Unknown;
    Value data;
    std::string source;  // путь (UTF-8)

    /// Индекс элемента массива или номер строки JSONL
    std::optional<std::uint64_t> record_id;
};

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class ReaderErrorKind { FileNotFound, ParseError, UnsupportedFormat };

struct ReaderError {
    ReaderErrorKind kind = ReaderErrorKind::ParseError;
    std::string message;
    std::string path;

    /// "failed to load file '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Reader
// ----------------------------------------------------------------------------

struct ReaderResult {
    bool ok = false;
    std::unique_ptr<class Reader> reader;
    ReaderError error;

    explicit operator bool() const { return ok; }
};

/// Итерация по документам файла
///
/// @code
///   auto result = Reader::open(path);
///   if (!result) {
///       writer.error(result.error.format());
///       return 1;
///   }
///   Document doc;
///   while (result.reader->next(doc)) {
///       ...
///   }
///   if (result.reader->last_error()) { ... }
/// @endcode
class Reader {
public:
    virtual ~Reader() = default;

    /// Открыть файл; формат выбирается по расширению
    static ReaderResult open(const std::filesystem::path& file);

    /// @return false если документы закончились или строка JSONL не разобрана
    /// (во втором случае заполнен last_error)
    virtual bool next(Document& out) = 0;

    virtual DocumentKind kind() const = 0;
    virtual const std::filesystem::path& path() const = 0;
    virtual const std::optional<ReaderError>& last_error() const = 0;

protected:
    Reader() = default;
};

// ----------------------------------------------------------------------------
// Поиск файлов
// ----------------------------------------------------------------------------

/// Рекурсивно собрать файлы с заданными расширениями (без точки,
/// регистр не важен). Явно указанный файл берётся независимо от расширения.
/// @return пути в отсортированном порядке
/// @throw std::runtime_error если путь не существует или не читается
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const std::unordered_set<std::string>& extensions);

/// Прочитать все документы файла
/// @throw std::runtime_error с текстом ReaderError::format()
std::vector<Document> read_documents(const std::filesystem::path& file);

}  // namespace warden::io

#endif  // WARDEN_READER_HPP
