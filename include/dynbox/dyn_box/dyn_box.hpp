// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

/**
 * @file dyn_box.hpp
 * @brief A fixed-capacity, heap-free slot holding at most one value of any type that implements a given interface.
 *
 * This header provides the `dynbox::dyn_box<Capability, N, Align>` class template. It behaves like an optional
 * value whose static type is the interface `Capability`: the concrete type of the occupant is erased when it is
 * stored and only its `Capability` surface remains reachable through `get()` and `get_mut()`.
 * - The occupant always lives in the `N`-byte inline buffer; there is no heap fallback.
 * - Storing a type that is larger than `N` bytes (or more aligned than `Align`) is refused before anything is touched.
 * - The container is move-only. The occupant is destroyed exactly once: on `clear()`, on the next `set()`/`emplace()`,
 *   when the container is moved from, or when the container itself is destroyed.
 * - Type-safe access to the concrete occupant is available via `dynbox::dyn_cast<T>`.
 *
 * @section Usage
 * @code
 * struct Shape { virtual ~Shape() = default; virtual double area() const = 0; };
 * struct Square final : Shape { double side; explicit Square(double s) : side(s) {} double area() const override { return side * side; } };
 *
 * dynbox::dyn_box<Shape, 32> box;        // empty, 32 bytes of inline storage
 * box.set(Square{2.0});                  // moves the Square into the buffer
 * double a = box.get()->area();          // dispatches to Square::area, a == 4.0
 * box.emplace<Square>(3.0);              // destroys the first Square, constructs a new one in place
 * auto* sq = dynbox::dyn_cast<Square>(&box); // non-null since the occupant is a Square
 * box.clear();                           // destroys the Square, box.empty() == true
 * @endcode
 *
 * @section License
 * Licensed under the Apache License, Version 2.0 with LLVM Exceptions.
 * See the LICENSE file in the root of this repository for complete details.
 */

#pragma once

#if __has_include(<dynbox/dyn_box/config.hpp>)
#include <dynbox/dyn_box/config.hpp>
#endif

#include <algorithm>   // for max
#include <array>
#include <concepts>    // for derived_from, constructible_from
#include <cstddef>     // for size_t, max_align_t
#include <new>         // for placement new, launder
#include <stdexcept>   // for length_error
#include <type_traits> // for true_type, false_type, and various meta-functions
#include <typeinfo>    // for type_info, bad_cast
#include <utility>     // for in_place_type_t, forward, move, exchange, swap

#ifndef DYNBOX_THROW_OR_ABORT

#ifndef DYNBOX_NO_EXCEPTIONS
#define DYNBOX_NO_EXCEPTIONS() 0
#endif

#if DYNBOX_NO_EXCEPTIONS()
#include <cstdlib> // for abort
#define DYNBOX_THROW_OR_ABORT(exception) std::abort()
#else
#define DYNBOX_THROW_OR_ABORT(exception) throw exception
#endif

#endif

#ifndef DYNBOX_NO_VIRTUAL
#define DYNBOX_NO_VIRTUAL() 0
#endif

#ifndef DYNBOX_DEFAULT_ALIGNMENT
#define DYNBOX_DEFAULT_ALIGNMENT alignof(std::max_align_t)
#endif

// Forward declaration of dynbox::dyn_box
namespace dynbox
{
    template<class Capability, std::size_t N, std::size_t Align = DYNBOX_DEFAULT_ALIGNMENT> class dyn_box;
}

// Private utilities for dynbox::dyn_box
namespace dynbox::details::dyn_box
{
    // Used to exclude `ValueType` versions of `dynbox::dyn_box` members from overload resolution
    // when the `ValueType` argument is itself a specialization of `dynbox::dyn_box`.
    template<class T> struct is_dyn_box : std::false_type {};
    template<class Capability, std::size_t N, std::size_t Align>
    struct is_dyn_box<::dynbox::dyn_box<Capability, N, Align>> : std::true_type {};

    // Dispatch table that `dynbox::dyn_box` specializations keep a pointer to while they are occupied.
    // It knows how to view the raw buffer as a `Capability` and how to destroy or relocate the occupant.
    template<class Capability> struct ITypeInfo;
    // Implementation of `ITypeInfo<Capability>` for a given occupant type `T`.
    template<class Capability, class T> struct TypeInfo;
    template<class Capability, class T> inline constexpr TypeInfo<Capability, T> info{};

    // Smallest `dynbox::dyn_box` able to hold a `T`.
    template<class Capability, class T>
    using fitted = ::dynbox::dyn_box<Capability, sizeof(std::decay_t<T>), std::max(alignof(std::decay_t<T>), std::size_t{DYNBOX_DEFAULT_ALIGNMENT})>;
}

namespace dynbox
{
    /**
     * @brief Thrown when a value cannot be placed in a `dynbox::dyn_box` because it is larger than the
     *        buffer or requires a stricter alignment than the buffer provides.
     * @details Calls `std::abort()` instead when `DYNBOX_NO_EXCEPTIONS()` is `1`.
     */
    class bad_dyn_box_capacity : public std::length_error
    {
    public:
        bad_dyn_box_capacity() : std::length_error("dynbox::dyn_box: value does not fit in the inline buffer") {}
    };

    /**
     * @brief Thrown by the value and reference forms of `dynbox::dyn_cast` when the requested type is not the occupant's type.
     */
    class bad_dyn_cast : public std::bad_cast
    {
    public:
        const char* what() const noexcept override { return "dynbox::bad_dyn_cast"; }
    };

    /**
     * @brief Satisfied if `std::decay_t<T>` can be held by a `dynbox::dyn_box<Capability, N, Align>` as far as its type is concerned.
     *
     * `std::decay_t<T>` must derive publicly and unambiguously from `Capability`, and must be noexcept move-constructible
     * so that relocating the occupant between containers cannot fail halfway.
     * Whether it fits in the buffer is checked separately, see `dynbox::dyn_box_fits`.
     */
    template<class T, class Capability>
    concept dyn_box_storable = std::derived_from<std::decay_t<T>, Capability> && std::is_nothrow_move_constructible_v<std::decay_t<T>>;

    /**
     * @brief Satisfied if an object of type `std::decay_t<T>` fits in `N` bytes aligned to `Align`.
     */
    template<class T, std::size_t N, std::size_t Align = DYNBOX_DEFAULT_ALIGNMENT>
    concept dyn_box_fits = sizeof(std::decay_t<T>) <= N && alignof(std::decay_t<T>) <= Align;

    /**
     * @brief A slot holding zero or one object of any type implementing `Capability`, stored in-place in `N` bytes.
     *
     * - No heap allocation ever takes place. Storing a value that does not fit is a contract violation reported
     *   through `dynbox::bad_dyn_box_capacity` (or `std::abort()` without exceptions), and leaves the container untouched.
     * - `get()`/`get_mut()` return a pointer to the occupant viewed as `Capability`, or a null pointer when empty.
     *   The pointer is a borrowed view; it is invalidated by any later `set`, `emplace`, `clear`, move, swap or destruction.
     * - Copying is not supported: the occupant's concrete type is erased, so it cannot be duplicated generically.
     * - Not thread-safe. Guard the whole container externally if it is shared between threads.
     *
     * @tparam Capability The interface occupants implement (a class they publicly derive from).
     * @tparam N The size of the buffer used for in-place storage, in bytes.
     * @tparam Align The alignment of the buffer. Defaults to `alignof(std::max_align_t)`.
     */
    template<class Capability, std::size_t N, std::size_t Align>
    class dyn_box
    {
        static_assert(std::is_class_v<Capability>, "dynbox::dyn_box requires Capability to be a class type");
        static_assert(Align != 0 && (Align & (Align - 1)) == 0, "dynbox::dyn_box requires Align to be a power of two");
    public:
        /**
         * @brief `true` if and only if an object of type `std::decay_t<T>` fits in this container's buffer.
         * @details Lets callers turn the runtime capacity check of `set`/`emplace` into a compile-time one, e.g.
         * `static_assert(dynbox::dyn_box<Shape, 32>::fits<Square>);`
         */
        template<class T>
        static constexpr bool fits = dyn_box_fits<T, N, Align>;

        /**
         * @brief Constructs an empty object.
         */
        constexpr dyn_box() noexcept;
        dyn_box(const dyn_box&) = delete;
        /**
         * @brief Moves the content of `other` into a new instance.
         * @param other The `dynbox::dyn_box` to move from. It is left empty.
         */
        dyn_box(dyn_box&& other) noexcept;
        /**
         * @brief Moves the content of a container with a different buffer into a new instance.
         * @tparam M The size of the buffer used by `other`.
         * @tparam A The alignment of the buffer used by `other`.
         * @param other The `dynbox::dyn_box` to move from. It is left empty on success and untouched on failure.
         * @exception `dynbox::bad_dyn_box_capacity` if the content of `other` does not fit in `N` bytes aligned to `Align`.
         * This can only happen when `M > N` or `A > Align`; otherwise the constructor is noexcept.
         */
        template<std::size_t M, std::size_t A>
        dyn_box(dyn_box<Capability, M, A>&& other) noexcept(M <= N && A <= Align);
        /**
         * @brief Constructs an object holding a `std::decay_t<ValueType>` direct-non-list-initialized from `std::forward<Args>(args)...`.
         * @exception `dynbox::bad_dyn_box_capacity` if `std::decay_t<ValueType>` does not fit. Any exception thrown by the constructor of
         * `std::decay_t<ValueType>` propagates.
         */
        template<class ValueType, class... Args>
        requires(dyn_box_storable<ValueType, Capability> && std::constructible_from<std::decay_t<ValueType>, Args...>)
        explicit dyn_box(std::in_place_type_t<ValueType>, Args&&... args) noexcept(std::is_nothrow_constructible_v<std::decay_t<ValueType>, Args...> && dyn_box_fits<ValueType, N, Align>);

        /**
         * @brief Destroys the contained object, if any, as if by a call to `clear()`.
         */
        ~dyn_box();

        dyn_box& operator=(const dyn_box&) = delete;
        /**
         * @brief Destroys the current content, if any, then takes over the content of `rhs`, leaving `rhs` empty.
         * @param rhs The `dynbox::dyn_box` to move from.
         * @return A reference to `*this`.
         */
        dyn_box& operator=(dyn_box&& rhs) noexcept;
        /**
         * @brief Destroys the current content, if any, then takes over the content of `rhs`, leaving `rhs` empty.
         * @tparam M The size of the buffer used by `rhs`.
         * @tparam A The alignment of the buffer used by `rhs`.
         * @param rhs The `dynbox::dyn_box` to move from.
         * @return A reference to `*this`.
         * @exception `dynbox::bad_dyn_box_capacity` if the content of `rhs` does not fit. The check happens first, so on failure
         * neither `*this` nor `rhs` is modified.
         */
        template<std::size_t M, std::size_t A>
        dyn_box& operator=(dyn_box<Capability, M, A>&& rhs) noexcept(M <= N && A <= Align);

        /**
         * @brief Takes ownership of `value` by moving it into the buffer.
         * @tparam ValueType The type of the value to be stored. Lvalues and const rvalues are rejected; ownership must be handed over
         * with a non-const rvalue so that the value is moved, never copied.
         * @param value The value to be stored. Left in its moved-from state.
         * @return A reference to the newly stored `std::decay_t<ValueType>`.
         * @exception `dynbox::bad_dyn_box_capacity` if `std::decay_t<ValueType>` does not fit. In that case the current content, if any,
         * is left as it was.
         * @details The previous content, if any, is destroyed before the new value is moved in, so `value` must not refer to
         * the current occupant.
         */
        template<class ValueType>
        requires(!details::dyn_box::is_dyn_box<std::decay_t<ValueType>>::value && !std::is_lvalue_reference_v<ValueType> && !std::is_const_v<ValueType> && dyn_box_storable<ValueType, Capability>)
        std::decay_t<ValueType>& set(ValueType&& value) noexcept(dyn_box_fits<ValueType, N, Align>);
        /**
         * @brief Changes the contained object to one of type `std::decay_t<ValueType>` constructed from the arguments.
         * @tparam ValueType The type of the value to be stored.
         * @tparam Args The types of the arguments to be forwarded to the constructor of `std::decay_t<ValueType>`.
         * @param args The arguments to be forwarded to the constructor of `std::decay_t<ValueType>`.
         * @return A reference to the newly constructed object of type `std::decay_t<ValueType>`.
         * @exception `dynbox::bad_dyn_box_capacity` if `std::decay_t<ValueType>` does not fit, in which case nothing is modified.
         * @details First destroys the contained object, if any, then constructs the new one in the buffer. None of `args`
         * may refer to the current occupant.
         * If that constructor throws, the exception propagates and `*this` is left empty.
         */
        template<class ValueType, class... Args>
        requires(dyn_box_storable<ValueType, Capability> && std::constructible_from<std::decay_t<ValueType>, Args...>)
        std::decay_t<ValueType>& emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<std::decay_t<ValueType>, Args...> && dyn_box_fits<ValueType, N, Align>);

        /**
         * @brief If `*this` contains a value, destroys the contained value.
         * @details `*this` does not contain a value after this call. Calling it on an empty object does nothing.
         */
        void clear() noexcept;
        /**
         * @brief Swaps the content of two `dynbox::dyn_box` objects of the same type.
         */
        void swap(dyn_box& other) noexcept;

        [[nodiscard]] static constexpr std::size_t capacity() noexcept { return N; }
        [[nodiscard]] static constexpr std::size_t alignment() noexcept { return Align; }
        /**
         * @brief Checks whether the object is empty.
         */
        [[nodiscard]] bool empty() const noexcept;
        [[nodiscard]] bool has_value() const noexcept { return !empty(); }
        /**
         * @brief Queries the contained type.
         * @returns The `type_info` of the contained value if instance is non-empty, otherwise `typeid(void)`.
         */
        [[nodiscard]] const std::type_info& type() const noexcept;

        /**
         * @brief Gets a read-only view of the occupant through its `Capability` interface.
         * @return A pointer to the occupant, or a null pointer if `*this` is empty.
         */
        [[nodiscard]] const Capability* get() const noexcept;
        /**
         * @brief Gets a mutable view of the occupant through its `Capability` interface.
         * @return A pointer to the occupant, or a null pointer if `*this` is empty.
         */
        [[nodiscard]] Capability* get() noexcept;
        [[nodiscard]] Capability* get_mut() noexcept { return get(); }

    private:
    // Friend Declarations
        template<class C, std::size_t M, std::size_t A> friend class dyn_box;
        template<class T, class C, std::size_t M, std::size_t A>
        friend const T* dyn_cast(const dyn_box<C, M, A>* operand) noexcept;
        template<class T, class C, std::size_t M, std::size_t A>
        friend T* dyn_cast(dyn_box<C, M, A>* operand) noexcept;

        template<std::size_t M, std::size_t A>
        bool can_take(const dyn_box<Capability, M, A>& other) const noexcept;
        template<std::size_t M, std::size_t A>
        void take(dyn_box<Capability, M, A>& other) noexcept;

    // Member variables
        const details::dyn_box::ITypeInfo<Capability>* info;
        alignas(Align) std::array<char, N> buff;
    };

    /**
     * @brief Performs type-safe access to the contained object.
     * @tparam T The type to which the contained object should be cast.
     * @return `static_cast<T>(*dyn_cast<std::remove_cvref_t<T>>(&operand))`.
     * @exception `dynbox::bad_dyn_cast` if the occupant of `operand` is not exactly a `std::remove_cvref_t<T>`, including when it is empty.
     */
    template<class T, class Capability, std::size_t N, std::size_t Align>
    T dyn_cast(const dyn_box<Capability, N, Align>& operand);
    /**
     * @brief Performs type-safe access to the contained object.
     * @tparam T The type to which the contained object should be cast.
     * @return `static_cast<T>(*dyn_cast<std::remove_cvref_t<T>>(&operand))`.
     * @exception `dynbox::bad_dyn_cast` if the occupant of `operand` is not exactly a `std::remove_cvref_t<T>`, including when it is empty.
     */
    template<class T, class Capability, std::size_t N, std::size_t Align>
    T dyn_cast(dyn_box<Capability, N, Align>& operand);
    /**
     * @brief Performs type-safe access to the contained object, moving out of it.
     * @return `static_cast<T>(std::move(*dyn_cast<std::remove_cvref_t<T>>(&operand)))`.
     * @exception `dynbox::bad_dyn_cast` if the occupant of `operand` is not exactly a `std::remove_cvref_t<T>`, including when it is empty.
     */
    template<class T, class Capability, std::size_t N, std::size_t Align>
    T dyn_cast(dyn_box<Capability, N, Align>&& operand);
    /**
     * @brief Performs type-safe access to the contained object.
     * @return A pointer to the occupant if `operand` is not null and holds exactly a `T`; otherwise a null pointer.
     */
    template<class T, class Capability, std::size_t N, std::size_t Align>
    const T* dyn_cast(const dyn_box<Capability, N, Align>* operand) noexcept;
    template<class T, class Capability, std::size_t N, std::size_t Align>
    T* dyn_cast(dyn_box<Capability, N, Align>* operand) noexcept;

    /**
     * @brief Constructs a `dynbox::dyn_box<Capability, N>` holding a `T` constructed from the provided arguments.
     * @details Equivalent to `return dynbox::dyn_box<Capability, N>(std::in_place_type<T>, std::forward<Args>(args)...);`
     */
    template<class Capability, std::size_t N, class T, class... Args>
    dyn_box<Capability, N> make_dyn_box(Args&&... args) noexcept(noexcept(dyn_box<Capability, N>{std::in_place_type<T>, std::forward<Args>(args)...}));
    /**
     * @brief Constructs the smallest `dynbox::dyn_box` able to hold a `T`, holding a `T` constructed from the provided arguments.
     * @details The capacity is `sizeof(std::decay_t<T>)` and the alignment the larger of `alignof(std::decay_t<T>)` and the default alignment.
     */
    template<class Capability, class T, class... Args>
    details::dyn_box::fitted<Capability, T> make_dyn_box(Args&&... args) noexcept(std::is_nothrow_constructible_v<std::decay_t<T>, Args...>);
}



// ----------------------------------------------------------------------------
// Implementation details below this point.
// ----------------------------------------------------------------------------

#if DYNBOX_NO_VIRTUAL()
template<class Capability>
struct dynbox::details::dyn_box::ITypeInfo
{
    const std::type_info& (* const type) () noexcept;
    std::size_t (* const size) () noexcept;
    std::size_t (* const align) () noexcept;
    Capability* (* const upcast) (void* buff) noexcept;
    const Capability* (* const upcastConst) (const void* buff) noexcept;
    void (* const relocate) (void* from, void* to) noexcept;
    void (* const destroy) (void* buff) noexcept;
};
#else
template<class Capability>
struct dynbox::details::dyn_box::ITypeInfo
{
    virtual const std::type_info& type() const noexcept = 0;
    virtual constexpr std::size_t size() const noexcept = 0;
    virtual constexpr std::size_t align() const noexcept = 0;
    virtual Capability* upcast(void* buff) const noexcept = 0;
    virtual const Capability* upcastConst(const void* buff) const noexcept = 0;
    virtual void relocate(void* from, void* to) const noexcept = 0;
    virtual void destroy(void* buff) const noexcept = 0;
};
#endif

template<class Capability, class T>
struct dynbox::details::dyn_box::TypeInfo final : dynbox::details::dyn_box::ITypeInfo<Capability>
{
    static const std::type_info& Type() noexcept;
    static constexpr std::size_t Size() noexcept;
    static constexpr std::size_t Align() noexcept;
    static Capability* Upcast(void* buff) noexcept;
    static const Capability* UpcastConst(const void* buff) noexcept;
    static void Relocate(void* from, void* to) noexcept;
    static void Destroy(void* buff) noexcept;
#if DYNBOX_NO_VIRTUAL()
    constexpr TypeInfo() noexcept
        : ITypeInfo<Capability>{.type=&Type,
                                .size=&Size,
                                .align=&Align,
                                .upcast=&Upcast,
                                .upcastConst=&UpcastConst,
                                .relocate=&Relocate,
                                .destroy=&Destroy}
    {}
#else
    const std::type_info& type() const noexcept override { return Type(); }
    constexpr std::size_t size() const noexcept override { return Size(); }
    constexpr std::size_t align() const noexcept override { return Align(); }
    Capability* upcast(void* buff) const noexcept override { return Upcast(buff); }
    const Capability* upcastConst(const void* buff) const noexcept override { return UpcastConst(buff); }
    void relocate(void* from, void* to) const noexcept override { return Relocate(from, to); }
    void destroy(void* buff) const noexcept override { return Destroy(buff); }
#endif
};

template<class Capability, class T>
inline const std::type_info& dynbox::details::dyn_box::TypeInfo<Capability, T>::Type() noexcept
{
    return typeid(T);
}
template<class Capability, class T>
inline constexpr std::size_t dynbox::details::dyn_box::TypeInfo<Capability, T>::Size() noexcept
{
    return sizeof(T);
}
template<class Capability, class T>
inline constexpr std::size_t dynbox::details::dyn_box::TypeInfo<Capability, T>::Align() noexcept
{
    return alignof(T);
}
// The only place the raw buffer is turned back into a typed object. Valid because `info` points at this
// table only while the buffer holds a live `T`.
template<class Capability, class T>
inline Capability* dynbox::details::dyn_box::TypeInfo<Capability, T>::Upcast(void* buff) noexcept
{
    return static_cast<Capability*>(std::launder(reinterpret_cast<T*>(buff)));
}
template<class Capability, class T>
inline const Capability* dynbox::details::dyn_box::TypeInfo<Capability, T>::UpcastConst(const void* buff) noexcept
{
    return static_cast<const Capability*>(std::launder(reinterpret_cast<const T*>(buff)));
}
template<class Capability, class T>
inline void dynbox::details::dyn_box::TypeInfo<Capability, T>::Relocate(void* from, void* to) noexcept
{
    T* source = std::launder(reinterpret_cast<T*>(from));
    new (to) T(std::move(*source));
    source->~T();
}
template<class Capability, class T>
inline void dynbox::details::dyn_box::TypeInfo<Capability, T>::Destroy(void* buff) noexcept
{
    std::launder(reinterpret_cast<T*>(buff))->~T();
}

namespace dynbox
{
    template<class Capability, std::size_t N, std::size_t Align>
    inline constexpr dyn_box<Capability, N, Align>::dyn_box() noexcept
        : info(nullptr)
    {}
    template<class Capability, std::size_t N, std::size_t Align>
    inline dyn_box<Capability, N, Align>::dyn_box(dyn_box&& other) noexcept
        : info(nullptr)
    {
        take(other);
    }
    template<class Capability, std::size_t N, std::size_t Align>
    template<std::size_t M, std::size_t A>
    inline dyn_box<Capability, N, Align>::dyn_box(dyn_box<Capability, M, A>&& other) noexcept(M <= N && A <= Align)
        : info(nullptr)
    {
        if constexpr (M > N || A > Align)
        {
            if (!can_take(other)) DYNBOX_THROW_OR_ABORT(bad_dyn_box_capacity{});
        }
        take(other);
    }
    template<class Capability, std::size_t N, std::size_t Align>
    template<class ValueType, class... Args>
    requires(dyn_box_storable<ValueType, Capability> && std::constructible_from<std::decay_t<ValueType>, Args...>)
    inline dyn_box<Capability, N, Align>::dyn_box(std::in_place_type_t<ValueType>, Args&&... args) noexcept(std::is_nothrow_constructible_v<std::decay_t<ValueType>, Args...> && dyn_box_fits<ValueType, N, Align>)
        : info(nullptr)
    {
        emplace<ValueType>(std::forward<Args>(args)...);
    }

    template<class Capability, std::size_t N, std::size_t Align>
    inline dyn_box<Capability, N, Align>::~dyn_box()
    {
        clear();
    }

    template<class Capability, std::size_t N, std::size_t Align>
    inline dyn_box<Capability, N, Align>& dyn_box<Capability, N, Align>::operator=(dyn_box&& rhs) noexcept
    {
        if (&rhs == this) return *this;
        clear();
        take(rhs);
        return *this;
    }
    template<class Capability, std::size_t N, std::size_t Align>
    template<std::size_t M, std::size_t A>
    inline dyn_box<Capability, N, Align>& dyn_box<Capability, N, Align>::operator=(dyn_box<Capability, M, A>&& rhs) noexcept(M <= N && A <= Align)
    {
        if constexpr (M > N || A > Align)
        {
            // Checked before anything is destroyed so that a refused move leaves both sides as they were.
            if (!can_take(rhs)) DYNBOX_THROW_OR_ABORT(bad_dyn_box_capacity{});
        }
        clear();
        take(rhs);
        return *this;
    }

    template<class Capability, std::size_t N, std::size_t Align>
    template<class ValueType>
    requires(!details::dyn_box::is_dyn_box<std::decay_t<ValueType>>::value && !std::is_lvalue_reference_v<ValueType> && !std::is_const_v<ValueType> && dyn_box_storable<ValueType, Capability>)
    inline std::decay_t<ValueType>& dyn_box<Capability, N, Align>::set(ValueType&& value) noexcept(dyn_box_fits<ValueType, N, Align>)
    {
        return emplace<ValueType>(std::move(value));
    }

    template<class Capability, std::size_t N, std::size_t Align>
    template<class ValueType, class... Args>
    requires(dyn_box_storable<ValueType, Capability> && std::constructible_from<std::decay_t<ValueType>, Args...>)
    inline std::decay_t<ValueType>& dyn_box<Capability, N, Align>::emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<std::decay_t<ValueType>, Args...> && dyn_box_fits<ValueType, N, Align>)
    {
        using T = std::decay_t<ValueType>;
        if constexpr (!fits<T>)
        {
            // Refused before the current occupant is touched.
            DYNBOX_THROW_OR_ABORT(bad_dyn_box_capacity{});
        }
        else
        {
            // `info` stays null while the new object is being constructed, so a throwing constructor leaves `*this` empty.
            clear();
            T* value = new (buff.data()) T(std::forward<Args>(args)...);
            info = &(details::dyn_box::info<Capability, T>);
            return *value;
        }
    }

    template<class Capability, std::size_t N, std::size_t Align>
    inline void dyn_box<Capability, N, Align>::clear() noexcept
    {
        if (!info) return;
        info->destroy(buff.data());
        info = nullptr;
    }
    template<class Capability, std::size_t N, std::size_t Align>
    inline void dyn_box<Capability, N, Align>::swap(dyn_box& other) noexcept
    {
        if (&other == this) return;
        alignas(Align) std::array<char, N> tmp;
        if (other.info) other.info->relocate(other.buff.data(), tmp.data());
        if (info) info->relocate(buff.data(), other.buff.data());
        if (other.info) other.info->relocate(tmp.data(), buff.data());
        std::swap(info, other.info);
    }

    template<class Capability, std::size_t N, std::size_t Align>
    template<std::size_t M, std::size_t A>
    inline bool dyn_box<Capability, N, Align>::can_take(const dyn_box<Capability, M, A>& other) const noexcept
    {
        return !other.info || (other.info->size() <= N && other.info->align() <= Align);
    }
    // Requires `*this` to be empty and `can_take(other)` to hold.
    template<class Capability, std::size_t N, std::size_t Align>
    template<std::size_t M, std::size_t A>
    inline void dyn_box<Capability, N, Align>::take(dyn_box<Capability, M, A>& other) noexcept
    {
        if (!other.info) return;
        other.info->relocate(other.buff.data(), buff.data());
        info = std::exchange(other.info, nullptr);
    }

    template<class Capability, std::size_t N, std::size_t Align>
    inline bool dyn_box<Capability, N, Align>::empty() const noexcept
    {
        return info == nullptr;
    }
    template<class Capability, std::size_t N, std::size_t Align>
    inline const std::type_info& dyn_box<Capability, N, Align>::type() const noexcept
    {
        return info ? info->type() : typeid(void);
    }

    template<class Capability, std::size_t N, std::size_t Align>
    inline const Capability* dyn_box<Capability, N, Align>::get() const noexcept
    {
        if (!info) return nullptr;
        return info->upcastConst(buff.data());
    }
    template<class Capability, std::size_t N, std::size_t Align>
    inline Capability* dyn_box<Capability, N, Align>::get() noexcept
    {
        if (!info) return nullptr;
        return info->upcast(buff.data());
    }

    template<class T, class Capability, std::size_t N, std::size_t Align>
    inline T dyn_cast(const dyn_box<Capability, N, Align>& operand)
    {
        if (auto* casted = dyn_cast<std::remove_cvref_t<T>>(&operand)) return static_cast<T>(*casted);
        DYNBOX_THROW_OR_ABORT(bad_dyn_cast{});
    }
    template<class T, class Capability, std::size_t N, std::size_t Align>
    inline T dyn_cast(dyn_box<Capability, N, Align>& operand)
    {
        if (auto* casted = dyn_cast<std::remove_cvref_t<T>>(&operand)) return static_cast<T>(*casted);
        DYNBOX_THROW_OR_ABORT(bad_dyn_cast{});
    }
    template<class T, class Capability, std::size_t N, std::size_t Align>
    inline T dyn_cast(dyn_box<Capability, N, Align>&& operand)
    {
        if (auto* casted = dyn_cast<std::remove_cvref_t<T>>(&operand)) return static_cast<T>(std::move(*casted));
        DYNBOX_THROW_OR_ABORT(bad_dyn_cast{});
    }
    template<class T, class Capability, std::size_t N, std::size_t Align>
    inline const T* dyn_cast(const dyn_box<Capability, N, Align>* operand) noexcept
    {
        if (!operand || operand->info != &(details::dyn_box::info<Capability, std::remove_cv_t<T>>)) return nullptr;
        return std::launder(reinterpret_cast<const T*>(operand->buff.data()));
    }
    template<class T, class Capability, std::size_t N, std::size_t Align>
    inline T* dyn_cast(dyn_box<Capability, N, Align>* operand) noexcept
    {
        if (!operand || operand->info != &(details::dyn_box::info<Capability, std::remove_cv_t<T>>)) return nullptr;
        return std::launder(reinterpret_cast<T*>(operand->buff.data()));
    }

    template<class Capability, std::size_t N, class T, class... Args>
    inline dyn_box<Capability, N> make_dyn_box(Args&&... args) noexcept(noexcept(dyn_box<Capability, N>{std::in_place_type<T>, std::forward<Args>(args)...}))
    {
        return dyn_box<Capability, N>{std::in_place_type<T>, std::forward<Args>(args)...};
    }
    template<class Capability, class T, class... Args>
    inline details::dyn_box::fitted<Capability, T> make_dyn_box(Args&&... args) noexcept(std::is_nothrow_constructible_v<std::decay_t<T>, Args...>)
    {
        return details::dyn_box::fitted<Capability, T>{std::in_place_type<T>, std::forward<Args>(args)...};
    }
}
