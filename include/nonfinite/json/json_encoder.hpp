#ifndef NONFINITE_JSON_JSON_ENCODER_HPP
#define NONFINITE_JSON_JSON_ENCODER_HPP

#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "nonfinite/core/errors.hpp"
#include "nonfinite/core/host.hpp"
#include "nonfinite/core/width.hpp"

namespace nonfinite::json {

// HostEncoder writing into a nlohmann::json DOM slot.
//
// Like a stock JSON writer it refuses non-finite numbers: those must go
// through a non-conforming strategy. A child encoder remembers the keys
// leading to its slot and looks the slot up again on every write, so it
// stays usable while its parent array grows. Only the root document
// must outlive it.
class JsonEncoder {
public:
  explicit JsonEncoder(nlohmann::json &Target, CodingPath Path = {})
      : Root(&Target), Base(Path.size()), Path(std::move(Path)) {}

  const CodingPath &codingPath() const { return Path; }

  void encodeNull() { slot() = nullptr; }

  void encodeString(std::string_view Text) { slot() = std::string(Text); }

  template <FloatWidth W> void encodeNative(W Value) {
    if (!std::isfinite(Value))
      throw EncodingError::invalidValue(
          Path, "Unable to encode " + std::string(Width<W>::name) +
                    " value " + describe(Value) + " directly in JSON");
    slot() = static_cast<double>(Value);
  }

  JsonEncoder encoderForKey(std::string_view Key) {
    nlohmann::json &Node = slot();
    if (Node.is_null())
      Node = nlohmann::json::object();
    if (!Node.is_object())
      throw EncodingError::invalidValue(
          Path, "Cannot add key \"" + std::string(Key) + "\" to a " +
                    std::string(Node.type_name()));
    Node[std::string(Key)]; // the member exists from here on
    return child(CodingKey::member(Key));
  }

  // Elements before Index that do not exist yet are filled with null.
  JsonEncoder encoderAtIndex(int Index) {
    nlohmann::json &Node = slot();
    if (Node.is_null())
      Node = nlohmann::json::array();
    if (!Node.is_array() || Index < 0)
      throw EncodingError::invalidValue(
          Path, "Cannot write element " + std::to_string(Index) + " of a " +
                    std::string(Node.type_name()));
    Node[static_cast<std::size_t>(Index)];
    return child(CodingKey::index(Index));
  }

private:
  JsonEncoder(nlohmann::json *Root, std::size_t Base, CodingPath Path)
      : Root(Root), Base(Base), Path(std::move(Path)) {}

  template <FloatWidth W> static std::string describe(W Value) {
    if (std::isnan(Value))
      return "nan";
    return Value > 0 ? "inf" : "-inf";
  }

  // Walk from the root along the keys this encoder added to its
  // starting path. The parent created every step, so none is missing.
  nlohmann::json &slot() const {
    nlohmann::json *Node = Root;
    for (std::size_t I = Base; I < Path.size(); ++I) {
      const CodingKey &Key = Path[I];
      if (Key.IntValue)
        Node = &(*Node)[static_cast<std::size_t>(*Key.IntValue)];
      else
        Node = &(*Node)[Key.StringValue];
    }
    return *Node;
  }

  JsonEncoder child(CodingKey Key) const {
    CodingPath Child = Path;
    Child.push_back(std::move(Key));
    return JsonEncoder(Root, Base, std::move(Child));
  }

  nlohmann::json *Root;
  std::size_t Base;
  CodingPath Path;
};

} // namespace nonfinite::json

#endif // NONFINITE_JSON_JSON_ENCODER_HPP
