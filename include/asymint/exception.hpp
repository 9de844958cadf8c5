// -*- c++ -*-
//
// Unified exception classes for asymint

#ifndef ASYMINT_EXCEPTION__H
#define ASYMINT_EXCEPTION__H

#include <stdexcept>
#include <string>

namespace AsymInt {

// Error categories carried by every exception and by failed AinResult values
enum class ErrorKind {
    None,
    Validation,
    Domain,
    ComplexResult,
    Range,
    File,
    Parse,
    Configuration,
    Runtime
};

// Base exception class for all asymint exceptions
class Exception : public std::exception {
   public:
    explicit Exception(const std::string& message, ErrorKind kind = ErrorKind::Runtime)
        : message_(message)
        , detail_(message)
        , kind_(kind) {}
    Exception(const std::string& context, const std::string& message, ErrorKind kind)
        : message_(context + ": " + message)
        , detail_(message)
        , kind_(kind) {}

    ~Exception() noexcept override = default;

    [[nodiscard]] const char* what() const noexcept override {
        return message_.c_str();
    }

    [[nodiscard]] const std::string& message() const {
        return message_;
    }
    // Message without the category prefix
    [[nodiscard]] const std::string& detail() const {
        return detail_;
    }
    [[nodiscard]] ErrorKind kind() const {
        return kind_;
    }

   protected:
    std::string message_;
    std::string detail_;
    ErrorKind kind_;
};

// Malformed interval at construction
class ValidationError : public Exception {
   public:
    explicit ValidationError(const std::string& message)
        : Exception("Validation error", message, ErrorKind::Validation) {}
};

// Operation undefined on the given interval
class DomainError : public Exception {
   public:
    explicit DomainError(const std::string& message)
        : Exception("Domain error", message, ErrorKind::Domain) {}
};

// Power whose result would not be real
class ComplexResultError : public Exception {
   public:
    explicit ComplexResultError(const std::string& message)
        : Exception("Complex result error", message, ErrorKind::ComplexResult) {}
};

// Argument outside its admissible range
class RangeError : public Exception {
   public:
    explicit RangeError(const std::string& message)
        : Exception("Range error", message, ErrorKind::Range) {}
};

class FileException : public Exception {
   public:
    FileException(const std::string& filename, const std::string& message)
        : Exception("File error", filename + ": " + message, ErrorKind::File) {}
};

class ParseException : public Exception {
   public:
    ParseException(const std::string& filename, int line, const std::string& message)
        : Exception("Parse error", filename + ":" + std::to_string(line) + ": " + message,
                    ErrorKind::Parse) {}
};

class ConfigurationException : public Exception {
   public:
    explicit ConfigurationException(const std::string& message)
        : Exception("Configuration error", message, ErrorKind::Configuration) {}
};

class RuntimeException : public Exception {
   public:
    explicit RuntimeException(const std::string& message)
        : Exception("Runtime error", message, ErrorKind::Runtime) {}
};

}  // namespace AsymInt

#endif  // ASYMINT_EXCEPTION__H
