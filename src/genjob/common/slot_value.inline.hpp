/**
 * @file slot_value.inline.hpp
 * @brief Implementations for type-parameterized member methods in the SlotValue class.
 */
#pragma once
#include "genjob/common/slot_value.hpp"

namespace genjob
{

namespace detail
{

template <typename T>
using slot_storage_t = std::decay_t<T>;

template <typename T>
inline constexpr bool is_valid_slot_type_v =
    !std::is_void_v<slot_storage_t<T>> && !std::is_array_v<slot_storage_t<T>>;

} // namespace detail

template <typename T>
SlotValue SlotValue::of(T&& value)
{
    using StorageT = detail::slot_storage_t<T>;
    static_assert(detail::is_valid_slot_type_v<T>,
        "SlotValue: T cannot be void or an array type");

    SlotValue result;
    result.m_pconst = std::make_shared<StorageT>(std::forward<T>(value));
    result.m_ti = std::type_index{typeid(StorageT)};
    return result;
}

template <typename T>
bool SlotValue::has_type() const noexcept
{
    using StorageT = detail::slot_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "SlotValue: T cannot be void");
    return m_ti == std::type_index{typeid(StorageT)};
}

template <typename T>
const T& SlotValue::as() const
{
    using StorageT = detail::slot_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "SlotValue: T cannot be void");

    if (!m_pconst)
    {
        throw SlotValueEmptyError{};
    }
    if (m_ti != std::type_index{typeid(StorageT)})
    {
        throw SlotValueTypeError(
            std::string("SlotValue holds ") + m_ti.name() +
            ", requested " + typeid(StorageT).name());
    }
    return *static_cast<const StorageT*>(m_pconst.get());
}

template <typename T>
const T* SlotValue::try_as() const noexcept
{
    using StorageT = detail::slot_storage_t<T>;
    if (!m_pconst || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return static_cast<const StorageT*>(m_pconst.get());
}

} // namespace genjob
