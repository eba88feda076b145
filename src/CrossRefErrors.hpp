#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace autocref {
    enum class ErrorKind {
        Parse,
        MissingReference,
        ReferenceIdOverflow,
        Package,
        Io
    };

    [[nodiscard]] inline const char *ErrorKindName(const ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::Parse: return "ParseError";
            case ErrorKind::MissingReference: return "MissingReference";
            case ErrorKind::ReferenceIdOverflow: return "ReferenceIdOverflow";
            case ErrorKind::Package: return "PackageError";
            case ErrorKind::Io: return "IoError";
        }
        return "Error";
    }

    // ============================================================
    //  Error hierarchy
    //  Every failure of the pipeline is terminal for the run.
    // ============================================================
    class Error : public std::runtime_error {
    public:
        Error(const ErrorKind kind, const std::string &message)
            : std::runtime_error(message), kind_(kind) {
        }

        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    // A regex-captured numeric field failed integer parsing.
    class ParseError final : public Error {
    public:
        explicit ParseError(const std::string &message)
            : Error(ErrorKind::Parse, message) {
        }
    };

    // A cross-reference names a footnote that was never bookmarked.
    class MissingReference final : public Error {
    public:
        MissingReference(const std::uint32_t number, const std::string &message)
            : Error(ErrorKind::MissingReference, message), number_(number) {
        }

        [[nodiscard]] std::uint32_t number() const noexcept { return number_; }

    private:
        std::uint32_t number_;
    };

    class ReferenceIdOverflow final : public Error {
    public:
        explicit ReferenceIdOverflow(const std::string &message)
            : Error(ErrorKind::ReferenceIdOverflow, message) {
        }
    };

    class PackageError final : public Error {
    public:
        explicit PackageError(const std::string &message)
            : Error(ErrorKind::Package, message) {
        }
    };

    class IoError final : public Error {
    public:
        explicit IoError(const std::string &message)
            : Error(ErrorKind::Io, message) {
        }
    };
} // namespace autocref
