/**
 * @file slot_value.hpp
 * @brief Definition of SlotValue, the type-erased payload of tasks and result slots.
 * @see slot_value.inline.hpp for implementations of type-parameterized methods.
 */
#pragma once
#include "genjob/common/common.hpp"

namespace genjob
{

/**
 * @brief Exception thrown when SlotValue is accessed as the wrong type.
 */
class SlotValueTypeError : public std::runtime_error
{
public:
    explicit SlotValueTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Exception thrown when accessing an empty SlotValue.
 */
class SlotValueEmptyError : public std::runtime_error
{
public:
    SlotValueEmptyError()
        : std::runtime_error("SlotValue is empty")
    {}
};

/**
 * @brief An immutable, type-erased value shared between tasks, futures and jobs.
 *
 * @details
 * SlotValue carries task inputs, task outputs and the entries of a job's
 * results buffer. An empty SlotValue is the placeholder of a result slot that
 * has not been filled.
 *
 * @par Invariants
 * - `(m_ti == typeid(void))` if and only if `m_pconst == nullptr`
 * - The stored object is never modified after construction.
 *
 * @par Thread Safety
 * - The stored object is const, so any number of threads may read the same
 *   SlotValue or copies of it concurrently.
 * - Assigning to a SlotValue instance requires external synchronization.
 *
 * @par Ownership
 * - Copies share the same underlying object.
 */
class SlotValue
{
public:
    /**
     * @brief Default constructor creates an empty SlotValue.
     */
    SlotValue() = default;

    /**
     * @brief Create a SlotValue holding a copy (or move) of `value`.
     * @tparam T The value type (will be decayed).
     */
    template <typename T>
    [[nodiscard]] static SlotValue of(T&& value);

    /**
     * @brief Check if SlotValue contains a value.
     */
    [[nodiscard]] bool has_value() const noexcept
    {
        return m_pconst != nullptr;
    }

    explicit operator bool() const noexcept
    {
        return has_value();
    }

    /**
     * @brief Check if stored type matches T.
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    /**
     * @brief Get the type_index of stored value, or typeid(void) if empty.
     */
    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_ti;
    }

    void reset() noexcept
    {
        m_pconst.reset();
        m_ti = std::type_index{typeid(void)};
    }

    /**
     * @brief Access stored value as const reference.
     * @throws SlotValueEmptyError if empty.
     * @throws SlotValueTypeError if type mismatch.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Access stored value as const pointer.
     * @return nullptr if empty or type mismatch.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

private:
    std::shared_ptr<const void> m_pconst{};
    std::type_index m_ti{typeid(void)};
};

} // namespace genjob
