// ==============================================================================
// reader.cpp - Чтение JSON / JSONL / YAML документов
// ==============================================================================

#include "warden/reader.hpp"

#include "warden/platform.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace warden::io {

// ============================================================================
// DocumentKind
// ============================================================================

const char* document_kind_to_string(DocumentKind kind) {
    switch (kind) {
    case DocumentKind::Json:
        return "json";
    case DocumentKind::Jsonl:
        return "jsonl";
    case DocumentKind::Yaml:
        return "yaml";
    case DocumentKind::Unknown:
        break;
    }
    return "unknown";
}

DocumentKind document_kind_from_extension(std::string_view ext) {
    std::string lower_ext(ext);
    std::transform(lower_ext.begin(), lower_ext.end(), lower_ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower_ext == "json") {
        return DocumentKind::Json;
    }
    if (lower_ext == "jsonl") {
        return DocumentKind::Jsonl;
    }
    if (lower_ext == "yml" || lower_ext == "yaml") {
        return DocumentKind::Yaml;
    }
    return DocumentKind::Unknown;
}

DocumentKind document_kind_from_path(const std::filesystem::path& path) {
    if (!path.has_extension()) {
        return DocumentKind::Unknown;
    }
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return document_kind_from_extension(ext);
}

std::string ReaderError::format() const {
    return "failed to load file '" + path + "' - " + message;
}

namespace {

// ============================================================================
// BufferedReader - документы разобраны целиком при открытии (JSON, YAML)
// ============================================================================

class BufferedReader : public Reader {
public:
    BufferedReader(std::filesystem::path path, DocumentKind kind)
        : path_(std::move(path)), kind_(kind) {}

    /// Корневой массив раскладывается на элементы
    void set_root(Value root) {
        if (const auto* arr = root.get_array()) {
            items_ = *arr;
            indexed_ = true;
        } else {
            items_.push_back(std::move(root));
        }
    }

    void set_error(ReaderError error) { error_ = std::move(error); }

    bool next(Document& out) override {
        if (error_ || index_ >= items_.size()) {
            return false;
        }
        out.kind = kind_;
        out.data = items_[index_];
        out.source = platform::path_to_utf8(path_);
        out.record_id = indexed_ ? std::optional<std::uint64_t>(index_) : std::nullopt;
        ++index_;
        return true;
    }

    DocumentKind kind() const override { return kind_; }
    const std::filesystem::path& path() const override { return path_; }
    const std::optional<ReaderError>& last_error() const override { return error_; }

private:
    std::filesystem::path path_;
    DocumentKind kind_;
    std::vector<Value> items_;
    std::size_t index_ = 0;
    bool indexed_ = false;
    std::optional<ReaderError> error_;
};

std::unique_ptr<Reader> create_json_reader(const std::filesystem::path& path) {
    auto reader = std::make_unique<BufferedReader>(path, DocumentKind::Json);
    std::string path_str = platform::path_to_utf8(path);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        reader->set_error({ReaderErrorKind::FileNotFound, "could not open file", path_str});
        return reader;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    rapidjson::Document doc;
    doc.Parse(content.c_str());
    if (doc.HasParseError()) {
        reader->set_error({ReaderErrorKind::ParseError,
                           std::string("JSON parse error: ") +
                               rapidjson::GetParseError_En(doc.GetParseError()) + " at offset " +
                               std::to_string(doc.GetErrorOffset()),
                           path_str});
        return reader;
    }

    reader->set_root(Value::from_rapidjson(doc));
    return reader;
}

std::unique_ptr<Reader> create_yaml_reader(const std::filesystem::path& path) {
    auto reader = std::make_unique<BufferedReader>(path, DocumentKind::Yaml);
    std::string path_str = platform::path_to_utf8(path);

    try {
        reader->set_root(from_yaml(YAML::LoadFile(path_str)));
    } catch (const YAML::BadFile&) {
        reader->set_error({ReaderErrorKind::FileNotFound, "could not open file", path_str});
    } catch (const YAML::Exception& e) {
        reader->set_error(
            {ReaderErrorKind::ParseError, std::string("YAML parse error: ") + e.what(), path_str});
    }
    return reader;
}

// ============================================================================
// JsonlReader - построчное чтение
// ============================================================================

class JsonlReader : public Reader {
public:
    explicit JsonlReader(std::filesystem::path path) : path_(std::move(path)) {}

    bool load() {
        file_.open(path_, std::ios::binary);
        if (!file_.is_open()) {
            error_ = ReaderError{ReaderErrorKind::FileNotFound, "could not open file",
                                 platform::path_to_utf8(path_)};
            return false;
        }
        return true;
    }

    bool next(Document& out) override {
        if (!file_.is_open() || error_) {
            return false;
        }

        std::string line;
        while (std::getline(file_, line)) {
            ++line_number_;

            // Пустые строки пропускаются
            if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
                continue;
            }

            rapidjson::Document doc;
            doc.Parse(line.c_str());
            if (doc.HasParseError()) {
                error_ = ReaderError{ReaderErrorKind::ParseError,
                                     "JSONL line " + std::to_string(line_number_) +
                                         " parse error: " +
                                         rapidjson::GetParseError_En(doc.GetParseError()),
                                     platform::path_to_utf8(path_)};
                return false;
            }

            out.kind = DocumentKind::Jsonl;
            out.data = Value::from_rapidjson(doc);
            out.source = platform::path_to_utf8(path_);
            out.record_id = line_number_;
            return true;
        }
        return false;
    }

    DocumentKind kind() const override { return DocumentKind::Jsonl; }
    const std::filesystem::path& path() const override { return path_; }
    const std::optional<ReaderError>& last_error() const override { return error_; }

private:
    std::filesystem::path path_;
    std::ifstream file_;
    std::optional<ReaderError> error_;
    std::uint64_t line_number_ = 0;
};

}  // anonymous namespace

// ============================================================================
// Reader::open
// ============================================================================

ReaderResult Reader::open(const std::filesystem::path& file) {
    ReaderResult result;
    std::string path_str = platform::path_to_utf8(file);

    std::error_code ec;
    if (!std::filesystem::exists(file, ec) || ec) {
        result.error = ReaderError{ReaderErrorKind::FileNotFound, "file not found", path_str};
        return result;
    }

    switch (document_kind_from_path(file)) {
    case DocumentKind::Json:
        result.reader = create_json_reader(file);
        break;
    case DocumentKind::Yaml:
        result.reader = create_yaml_reader(file);
        break;
    case DocumentKind::Jsonl: {
        auto reader = std::make_unique<JsonlReader>(file);
        reader->load();
        result.reader = std::move(reader);
        break;
    }
    case DocumentKind::Unknown:
        result.error = ReaderError{ReaderErrorKind::UnsupportedFormat,
                                   "file type is not currently supported", path_str};
        return result;
    }

    if (result.reader->last_error()) {
        result.error = *result.reader->last_error();
        return result;
    }
    result.ok = true;
    return result;
}

// ============================================================================
// Поиск файлов
// ============================================================================

namespace {

bool has_extension(const std::filesystem::path& path,
                   const std::unordered_set<std::string>& extensions) {
    if (!path.has_extension()) {
        return false;
    }
    std::string ext = path.extension().string().substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extensions.count(ext) > 0;
}

void collect_files(const std::filesystem::path& path,
                   const std::unordered_set<std::string>& extensions,
                   std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(path, ec);
    if (ec) {
        throw std::runtime_error("failed to read directory - " + ec.message());
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && !entry_ec && has_extension(entry.path(), extensions)) {
            result.push_back(entry.path());
        }
    }
}

}  // anonymous namespace

std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const std::unordered_set<std::string>& extensions) {
    std::vector<std::filesystem::path> result;

    for (const auto& input : inputs) {
        std::error_code ec;
        auto status = std::filesystem::status(input, ec);
        if (ec || !std::filesystem::exists(status)) {
            throw std::runtime_error("specified path does not exist - " +
                                     platform::path_to_utf8(input));
        }
        if (std::filesystem::is_directory(status)) {
            collect_files(input, extensions, result);
        } else {
            result.push_back(input);
        }
    }

    // Детерминированный порядок независимо от файловой системы
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<Document> read_documents(const std::filesystem::path& file) {
    ReaderResult result = Reader::open(file);
    if (!result) {
        throw std::runtime_error(result.error.format());
    }

    std::vector<Document> documents;
    Document doc;
    while (result.reader->next(doc)) {
        documents.push_back(doc);
    }
    if (result.reader->last_error()) {
        throw std::runtime_error(result.reader->last_error()->format());
    }
    return documents;
}

}  // namespace warden::io
