#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by the world accessor and the logger.

#include <cstdint>
#include <functional>

namespace interact::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps a 64-bit object GUID from being mixed up with a raw object
/// pointer or an object entry id, which share the same integral types
/// in the host client.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct ObjectGuidTag {};

/// Globally unique identifier of a world object, as issued by the host.
/// A zero GUID means "no object".
using ObjectGuid = StrongId<ObjectGuidTag>;

} // namespace interact::foundation

template <typename Tag, typename T>
struct std::hash<interact::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const interact::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
