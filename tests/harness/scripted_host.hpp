#ifndef NONFINITE_TESTS_HARNESS_SCRIPTED_HOST_HPP
#define NONFINITE_TESTS_HARNESS_SCRIPTED_HOST_HPP

// In-memory host cursors for behavior tests.
//
// ScriptedDecoder<W> serves one scripted token (a string, a native
// number, or a native read that fails) and counts how the codec
// touched it. ScriptedEncoder<W> records the one token written to it and
// can be told to fail every write.

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "nonfinite/nonfinite.hpp"

namespace nonfinite::testing {

// What a host throws on its own; must reach the caller untouched.
struct HostFailure : std::runtime_error {
  using std::runtime_error::runtime_error;
};

template <FloatWidth W> class ScriptedDecoder {
public:
  enum class Token { String, Native, Broken };

  static ScriptedDecoder string(std::string Text, CodingPath Path = {}) {
    return ScriptedDecoder(Token::String, std::move(Text), W{},
                           std::move(Path));
  }
  static ScriptedDecoder native(W Value, CodingPath Path = {}) {
    return ScriptedDecoder(Token::Native, {}, Value, std::move(Path));
  }
  // A numeric-looking token whose native read throws HostFailure.
  static ScriptedDecoder broken(CodingPath Path = {}) {
    return ScriptedDecoder(Token::Broken, {}, W{}, std::move(Path));
  }

  std::optional<std::string> tryDecodeString() {
    ++StringProbes;
    if (Kind != Token::String)
      return std::nullopt;
    return Text;
  }

  template <typename V> V decodeNative() {
    ++NativeReads;
    if (Kind == Token::Native)
      return static_cast<V>(Number);
    if (Kind == Token::String)
      throw HostFailure("scripted token is a string");
    throw HostFailure("scripted native read failure");
  }

  const CodingPath &codingPath() const { return Path; }

  int StringProbes = 0;
  int NativeReads = 0;

private:
  ScriptedDecoder(Token Kind, std::string Text, W Number, CodingPath Path)
      : Kind(Kind), Text(std::move(Text)), Number(Number),
        Path(std::move(Path)) {}

  Token Kind;
  std::string Text;
  W Number;
  CodingPath Path;
};

template <FloatWidth W> class ScriptedEncoder {
public:
  enum class Written { Nothing, String, Native };

  explicit ScriptedEncoder(CodingPath Path = {}) : Path(std::move(Path)) {}

  void encodeString(std::string_view S) {
    if (FailWrites)
      throw HostFailure("scripted string write failure");
    Kind = Written::String;
    Text = std::string(S);
    ++Writes;
  }

  void encodeNative(W Value) {
    if (FailWrites)
      throw HostFailure("scripted native write failure");
    Kind = Written::Native;
    Number = Value;
    ++Writes;
  }

  const CodingPath &codingPath() const { return Path; }

  // Feed what was written back in as a decoder token.
  ScriptedDecoder<W> replay() const {
    if (Kind == Written::String)
      return ScriptedDecoder<W>::string(Text, Path);
    return ScriptedDecoder<W>::native(Number, Path);
  }

  bool FailWrites = false;
  Written Kind = Written::Nothing;
  std::string Text;
  W Number{};
  int Writes = 0;

private:
  CodingPath Path;
};

} // namespace nonfinite::testing

#endif // NONFINITE_TESTS_HARNESS_SCRIPTED_HOST_HPP
