#ifndef NONFINITE_CORE_ERRORS_HPP
#define NONFINITE_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

#include "nonfinite/core/host.hpp"

namespace nonfinite {

// Where a failure happened and what went wrong there.
struct ErrorContext {
  CodingPath Path;
  std::string DebugDescription;
};

class DecodingError : public std::runtime_error {
public:
  enum class Kind { TypeMismatch, ValueNotFound, KeyNotFound };

  DecodingError(Kind K, ErrorContext Ctx)
      : std::runtime_error(describe(K, Ctx)), ErrKind(K),
        Context(std::move(Ctx)) {}

  static DecodingError typeMismatch(CodingPath Path, std::string Desc) {
    return {Kind::TypeMismatch, {std::move(Path), std::move(Desc)}};
  }
  static DecodingError valueNotFound(CodingPath Path, std::string Desc) {
    return {Kind::ValueNotFound, {std::move(Path), std::move(Desc)}};
  }
  static DecodingError keyNotFound(CodingPath Path, std::string Desc) {
    return {Kind::KeyNotFound, {std::move(Path), std::move(Desc)}};
  }

  Kind kind() const noexcept { return ErrKind; }
  const ErrorContext &context() const noexcept { return Context; }

  static const char *kindName(Kind K) {
    switch (K) {
    case Kind::TypeMismatch:  return "type mismatch";
    case Kind::ValueNotFound: return "value not found";
    case Kind::KeyNotFound:   return "key not found";
    }
    return "???";
  }

private:
  static std::string describe(Kind K, const ErrorContext &Ctx) {
    return std::string(kindName(K)) + " at " + formatCodingPath(Ctx.Path) +
           ": " + Ctx.DebugDescription;
  }

  Kind ErrKind;
  ErrorContext Context;
};

class EncodingError : public std::runtime_error {
public:
  enum class Kind { InvalidValue };

  EncodingError(Kind K, ErrorContext Ctx)
      : std::runtime_error("invalid value at " + formatCodingPath(Ctx.Path) +
                           ": " + Ctx.DebugDescription),
        ErrKind(K), Context(std::move(Ctx)) {}

  static EncodingError invalidValue(CodingPath Path, std::string Desc) {
    return {Kind::InvalidValue, {std::move(Path), std::move(Desc)}};
  }

  Kind kind() const noexcept { return ErrKind; }
  const ErrorContext &context() const noexcept { return Context; }

private:
  Kind ErrKind;
  ErrorContext Context;
};

} // namespace nonfinite

#endif // NONFINITE_CORE_ERRORS_HPP
