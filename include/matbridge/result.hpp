/**
 * MatBridge - Result Type
 *
 * Provides a Result<T> type for consistent error handling, plus the
 * structured Diagnostic records that non-fatal conditions are reported as.
 */

#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <optional>
#include <stdexcept>
#include <vector>

namespace matbridge {

/**
 * Error information with code and message
 */
struct Error {
    enum class Code {
        None = 0,
        FileNotFound,
        InvalidFormat,
        CompressionError,
        IoError,
        ParseError,
        Extraction,       // Archive unreadable or corrupt (fatal for a run)
        MaterialParse,    // One material record could not be decoded
        ManifestParse,    // Material list could not be read
        Mapping,          // Material has nothing to map
        InvalidArgument,
        Unknown
    };

    Code code = Code::None;
    std::string message;
    std::string context;  // Offending identifier, name or path

    Error() = default;
    Error(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(Code c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    bool ok() const { return code == Code::None; }

    std::string full_message() const {
        if (context.empty()) {
            return message;
        }
        return message + " [" + context + "]";
    }

    // Common error constructors
    static Error file_not_found(const std::string& path) {
        return Error(Code::FileNotFound, "File not found", path);
    }

    static Error invalid_format(const std::string& msg, const std::string& path = "") {
        return Error(Code::InvalidFormat, msg, path);
    }

    static Error compression_error(const std::string& msg) {
        return Error(Code::CompressionError, msg);
    }

    static Error io_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::IoError, msg, path);
    }

    static Error parse_error(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::ParseError, msg, ctx);
    }

    static Error extraction(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::Extraction, msg, ctx);
    }

    static Error material_parse(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::MaterialParse, msg, ctx);
    }

    static Error manifest_parse(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::ManifestParse, msg, ctx);
    }

    static Error mapping(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::Mapping, msg, ctx);
    }
};

/**
 * Result type that holds either a value T or an Error
 *
 * Usage:
 *   Result<AssetIndex> extract_package(const fs::path& path);
 *
 *   auto result = extract_package("Nature.unitypackage");
 *   if (result) {
 *       auto& index = result.value();
 *       // use index...
 *   } else {
 *       std::cerr << "Error: " << result.error().full_message() << "\n";
 *   }
 */
template<typename T>
class Result {
public:
    // Success construction
    Result(T value) : data_(std::move(value)) {}

    // Error construction
    Result(Error error) : data_(std::move(error)) {}

    // Check if result is successful
    bool ok() const { return std::holds_alternative<T>(data_); }
    bool has_value() const { return ok(); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    // Access value with default
    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    // Access error
    const Error& error() const {
        if (ok()) {
            static Error no_error;
            return no_error;
        }
        return std::get<Error>(data_);
    }

    // Pointer-like access
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    // Convert to optional (discards error info)
    std::optional<T> to_optional() const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return std::nullopt;
    }

private:
    std::variant<T, Error> data_;
};

/**
 * Specialization for void results (just success/failure)
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        static Error no_error;
        if (!error_) return no_error;
        return *error_;
    }

    static Result success() { return Result(); }
    static Result failure(Error err) { return Result(std::move(err)); }

private:
    std::optional<Error> error_;
};

/**
 * Kind of a non-fatal condition collected during a conversion run.
 */
enum class DiagnosticKind {
    ExtractionError,
    MaterialParseError,
    ManifestParseError,
    ClassificationFallback,
    MappingError,
    UnresolvedReference,
    Warning
};

constexpr const char* diagnostic_kind_string(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::ExtractionError:        return "ExtractionError";
        case DiagnosticKind::MaterialParseError:     return "MaterialParseError";
        case DiagnosticKind::ManifestParseError:     return "ManifestParseError";
        case DiagnosticKind::ClassificationFallback: return "ClassificationFallback";
        case DiagnosticKind::MappingError:           return "MappingError";
        case DiagnosticKind::UnresolvedReference:    return "UnresolvedReference";
        case DiagnosticKind::Warning:                return "Warning";
        default:                                     return "Unknown";
    }
}

/**
 * Structured report entry: kind + message + offending identifier or name.
 */
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::Warning;
    std::string message;
    std::string subject;

    std::string to_string() const {
        std::string out = std::string(diagnostic_kind_string(kind)) + ": " + message;
        if (!subject.empty()) {
            out += " [" + subject + "]";
        }
        return out;
    }
};

using Diagnostics = std::vector<Diagnostic>;

/**
 * Count diagnostics of one kind.
 */
inline size_t count_diagnostics(const Diagnostics& diagnostics, DiagnosticKind kind) {
    size_t count = 0;
    for (const auto& d : diagnostics) {
        if (d.kind == kind) count++;
    }
    return count;
}

// Helper macros for early return on error
#define TRY(expr) \
    do { \
        auto _result = (expr); \
        if (!_result.ok()) { \
            return _result.error(); \
        } \
    } while(0)

#define TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (!_result_##var.ok()) { \
        return _result_##var.error(); \
    } \
    auto var = std::move(_result_##var.value())

} // namespace matbridge
