#include "internal/codec/command.hpp"

#include <type_traits>

namespace migrate::codec {

std::string Command::Name() const {
  return std::visit(
      [](const auto& body) -> std::string {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, Opaque>) {
          return body.name;
        } else {
          return std::string(T::kName);
        }
      },
      body_);
}

std::string Command::Collection() const {
  return std::visit(
      [](const auto& body) -> std::string {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, Opaque>) {
          return {};
        } else {
          return body.collection;
        }
      },
      body_);
}

bool Command::IsStructural() const {
  return std::holds_alternative<Create>(body_) || std::holds_alternative<CreateIndexes>(body_) || std::holds_alternative<Drop>(body_) ||
         std::holds_alternative<DropIndexes>(body_);
}

bsoncxx::document::view Command::Document() const {
  return std::visit([](const auto& body) { return body.raw.view(); }, body_);
}

} // namespace migrate::codec
