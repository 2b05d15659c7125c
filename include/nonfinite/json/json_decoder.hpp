#ifndef NONFINITE_JSON_JSON_DECODER_HPP
#define NONFINITE_JSON_JSON_DECODER_HPP

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "nonfinite/core/errors.hpp"
#include "nonfinite/core/host.hpp"
#include "nonfinite/core/width.hpp"

namespace nonfinite::json {

// HostDecoder over a parsed nlohmann::json document. A JsonDecoder is a
// view: the document must outlive it.
class JsonDecoder {
public:
  explicit JsonDecoder(const nlohmann::json &Node, CodingPath Path = {})
      : Node(&Node), Path(std::move(Path)) {}

  const CodingPath &codingPath() const { return Path; }

  bool isNull() const { return Node->is_null(); }

  std::optional<std::string> tryDecodeString() const {
    if (!Node->is_string())
      return std::nullopt;
    return Node->get<std::string>();
  }

  // Any JSON number converts, integer tokens included. The DOM holds
  // doubles; a float field rounds them to nearest, overflowing to a
  // signed infinity.
  template <FloatWidth W> W decodeNative() const {
    if (!Node->is_number())
      throw mismatch(Width<W>::name);
    double Value = Node->get<double>();
    if constexpr (std::is_same_v<W, double>) {
      return Value;
    } else {
      // Halfway between the largest float and 2^128: at or past it,
      // round to nearest even gives infinity.
      constexpr double Overflow = 0x1.ffffffp127;
      if (std::isfinite(Value) && std::fabs(Value) >= Overflow)
        return Value < 0 ? -std::numeric_limits<W>::infinity()
                         : std::numeric_limits<W>::infinity();
      return static_cast<W>(Value);
    }
  }

  std::size_t count() const { return Node->size(); }

  bool contains(std::string_view Key) const {
    return Node->is_object() && Node->contains(std::string(Key));
  }

  JsonDecoder decoderForKey(std::string_view Key) const {
    if (!Node->is_object())
      throw mismatch("Dictionary");
    auto It = Node->find(std::string(Key));
    if (It == Node->end())
      throw DecodingError::keyNotFound(
          Path, "No value associated with key \"" + std::string(Key) + "\"");
    return JsonDecoder(*It, childPath(CodingKey::member(Key)));
  }

  JsonDecoder decoderAtIndex(int Index) const {
    if (!Node->is_array())
      throw mismatch("Array");
    if (Index < 0 || static_cast<std::size_t>(Index) >= Node->size())
      throw DecodingError::valueNotFound(
          childPath(CodingKey::index(Index)),
          "Unkeyed container is at end (" + std::to_string(Node->size()) +
              " elements)");
    return JsonDecoder((*Node)[static_cast<std::size_t>(Index)],
                       childPath(CodingKey::index(Index)));
  }

private:
  CodingPath childPath(CodingKey Key) const {
    CodingPath Child = Path;
    Child.push_back(std::move(Key));
    return Child;
  }

  // Null is a missing value, anything else of the wrong shape is a type
  // mismatch.
  DecodingError mismatch(std::string_view Expected) const {
    if (Node->is_null())
      return DecodingError::valueNotFound(
          Path, "Expected " + std::string(Expected) +
                    " value but found null instead");
    return DecodingError::typeMismatch(
        Path, "Expected to decode " + std::string(Expected) + " but found " +
                  std::string(Node->type_name()) + " instead");
  }

  const nlohmann::json *Node;
  CodingPath Path;
};

} // namespace nonfinite::json

#endif // NONFINITE_JSON_JSON_DECODER_HPP
