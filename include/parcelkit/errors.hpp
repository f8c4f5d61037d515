#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace parcelkit {

    inline constexpr const char *CODE_INVALID_POINT_FORMAT = "INVALID_POINT_FORMAT";
    inline constexpr const char *CODE_MISSING_PARCEL_HEADER = "MISSING_PARCEL_HEADER";

    class Error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class ParseError : public Error {
      public:
        using Error::Error;
    };

    // Malformed line inside the coordinate section. line is 1-based.
    class SyntaxError : public ParseError {
      public:
        SyntaxError(std::size_t line, std::string code, const std::string &detail);

        std::size_t line() const noexcept { return line_; }
        const std::string &code() const noexcept { return code_; }

      private:
        std::size_t line_;
        std::string code_;
    };

    class MissingParcelHeaderError : public SyntaxError {
      public:
        explicit MissingParcelHeaderError(std::size_t line);
    };

    class MissingSectionError : public ParseError {
      public:
        explicit MissingSectionError(std::string section);

        const std::string &section() const noexcept { return section_; }

      private:
        std::string section_;
    };

    class MissingAttributesError : public ParseError {
      public:
        explicit MissingAttributesError(std::vector<std::string> keys);

        const std::vector<std::string> &keys() const noexcept { return keys_; }

      private:
        std::vector<std::string> keys_;
    };

    class CrsError : public Error {
      public:
        using Error::Error;
    };

    class GeometryBuildError : public Error {
      public:
        GeometryBuildError(std::string parcel_id, const std::string &detail);

        const std::string &parcel_id() const noexcept { return parcel_id_; }

      private:
        std::string parcel_id_;
    };

    class DecodeError : public Error {
      public:
        using Error::Error;
    };

    class HistoryError : public Error {
      public:
        using Error::Error;
    };

} // namespace parcelkit
