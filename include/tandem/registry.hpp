#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace tandem
{

enum class InsertResult
{
    Inserted,
    AlreadyExists,
};

enum class PublishResult
{
    Created,
    Updated,
    TypeMismatch,
};

// Result of with_read / with_mutate: the closure's value, or for void
// closures a flag telling whether the closure ran at all.
template <typename R>
using ApplyResult = std::conditional_t<std::is_void_v<R>, bool, std::optional<R>>;

/**
 * Registry: process-wide named resource store.
 *
 * Maps string keys to slots that each hold one value of a fixed type.  A slot
 * is bound to its type for its whole lifetime: reading or mutating it as any
 * other type is reported as an empty result, never a reinterpretation.
 *
 * Locking is per slot.  The key table is only locked while a slot is looked
 * up, inserted or erased, so closures running on different keys never block
 * each other.  A closure must not re-enter the registry on the key it is
 * operating on (the slot mutex is not recursive).
 *
 * Values may be move-only.  Slots are reference counted: removing a key while
 * another thread is inside a closure on it is safe, the closure finishes on
 * the detached slot.
 */
class Registry
{
   public:
    Registry()  = default;
    ~Registry() = default;

    Registry(const Registry&)            = delete;
    Registry& operator=(const Registry&) = delete;

    // The instance shared by the runtime, the logger and application code.
    static Registry& instance();

    // Create a slot.  Never replaces an existing one.
    template <typename T>
    [[nodiscard]] InsertResult register_resource(std::string_view key, T value);

    // Create the slot, or overwrite its value when it already holds a T.
    // Refuses to change the stored type of an existing slot.
    template <typename T>
    PublishResult publish(std::string_view key, T value);

    // Run fn(const T&) under the slot lock.  Empty result when the key is
    // absent or holds another type.
    template <typename T, typename Fn>
    auto with_read(std::string_view key, Fn&& fn) const
        -> ApplyResult<std::invoke_result_t<Fn&, const T&>>;

    // Run fn(T&) under the slot lock.
    template <typename T, typename Fn>
    auto with_mutate(std::string_view key, Fn&& fn)
        -> ApplyResult<std::invoke_result_t<Fn&, T&>>;

    // Copy the value out.
    template <typename T>
    std::optional<T> get(std::string_view key) const;

    bool exists(std::string_view key) const;

    // Typed existence: the key is present and holds a T.
    template <typename T>
    bool holds(std::string_view key) const;

    // Drop a slot.  Returns false if the key was not registered.
    bool remove(std::string_view key);

    size_t                   size() const;
    std::vector<std::string> keys() const;

   private:
    struct Slot
    {
        explicit Slot(std::type_index t) : type(t) {}
        virtual ~Slot() = default;

        const std::type_index type;
        std::mutex            mutex;
    };

    template <typename T>
    struct TypedSlot final : Slot
    {
        explicit TypedSlot(T v) : Slot(typeid(T)), value(std::move(v)) {}
        T value;
    };

    std::shared_ptr<Slot> find(std::string_view key) const;
    InsertResult          insert_slot(std::string_view key, std::shared_ptr<Slot> slot);

    template <typename T>
    std::shared_ptr<TypedSlot<T>> find_typed(std::string_view key) const
    {
        auto slot = find(key);
        if (!slot || slot->type != std::type_index(typeid(T)))
        {
            return nullptr;
        }
        return std::static_pointer_cast<TypedSlot<T>>(slot);
    }

    mutable std::shared_mutex                               map_mutex_;
    std::map<std::string, std::shared_ptr<Slot>, std::less<>> slots_;
};

// ─── Template definitions ────────────────────────────────────────────────────

template <typename T>
InsertResult Registry::register_resource(std::string_view key, T value)
{
    return insert_slot(key, std::make_shared<TypedSlot<T>>(std::move(value)));
}

template <typename T>
PublishResult Registry::publish(std::string_view key, T value)
{
    // A concurrent publisher may create the slot between the lookup and the
    // insert, and a concurrent remove may drop it again after the insert
    // failed; retry until one of the two steps lands.
    for (;;)
    {
        if (auto slot = find(key))
        {
            if (slot->type != std::type_index(typeid(T)))
            {
                return PublishResult::TypeMismatch;
            }
            auto                        typed = std::static_pointer_cast<TypedSlot<T>>(slot);
            std::lock_guard<std::mutex> lock(typed->mutex);
            typed->value = std::move(value);
            return PublishResult::Updated;
        }

        auto fresh = std::make_shared<TypedSlot<T>>(std::move(value));
        if (insert_slot(key, fresh) == InsertResult::Inserted)
        {
            return PublishResult::Created;
        }
        value = std::move(fresh->value);
    }
}

template <typename T, typename Fn>
auto Registry::with_read(std::string_view key, Fn&& fn) const
    -> ApplyResult<std::invoke_result_t<Fn&, const T&>>
{
    using R   = std::invoke_result_t<Fn&, const T&>;
    auto slot = find_typed<T>(key);
    if (!slot)
    {
        return ApplyResult<R>{};
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    const T&                    value = slot->value;
    if constexpr (std::is_void_v<R>)
    {
        fn(value);
        return true;
    }
    else
    {
        return std::optional<R>(fn(value));
    }
}

template <typename T, typename Fn>
auto Registry::with_mutate(std::string_view key, Fn&& fn)
    -> ApplyResult<std::invoke_result_t<Fn&, T&>>
{
    using R   = std::invoke_result_t<Fn&, T&>;
    auto slot = find_typed<T>(key);
    if (!slot)
    {
        return ApplyResult<R>{};
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if constexpr (std::is_void_v<R>)
    {
        fn(slot->value);
        return true;
    }
    else
    {
        return std::optional<R>(fn(slot->value));
    }
}

template <typename T>
std::optional<T> Registry::get(std::string_view key) const
{
    return with_read<T>(key, [](const T& value) { return value; });
}

template <typename T>
bool Registry::holds(std::string_view key) const
{
    return find_typed<T>(key) != nullptr;
}

}   // namespace tandem
