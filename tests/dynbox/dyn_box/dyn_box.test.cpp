// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <dynbox/dyn_box/dyn_box.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

using dynbox::dyn_box;
using dynbox::dyn_cast;

namespace
{
    struct MyTrait
    {
        virtual ~MyTrait() = default;
        virtual std::uint32_t foo() const = 0;
    };

    // No per-instance data besides the vptr.
    struct A final : MyTrait
    {
        std::uint32_t foo() const override { return 1; }
    };

    struct B final : MyTrait
    {
        explicit B(std::uint64_t v) : value(v) {}
        std::uint32_t foo() const override { return static_cast<std::uint32_t>(value); }
        std::uint64_t value;
    };

    struct Big final : MyTrait
    {
        std::uint32_t foo() const override { return 7; }
        std::uint64_t data[8] = {};
    };

    struct alignas(64) Wide final : MyTrait
    {
        std::uint32_t foo() const override { return 64; }
    };

    // Counts how many times an owning instance is destroyed. A moved-from instance no longer owns the
    // counter, so it does not count.
    struct Droppable final : MyTrait
    {
        explicit Droppable(int* counter) : drops(counter) {}
        Droppable(Droppable&& other) noexcept : drops(std::exchange(other.drops, nullptr)) {}
        Droppable& operator=(Droppable&&) = delete;
        ~Droppable() override { if (drops) ++*drops; }
        std::uint32_t foo() const override { return 2; }
        int* drops;
    };

    struct Throwing final : MyTrait
    {
        explicit Throwing(bool doThrow) { if (doThrow) throw std::runtime_error("Throwing"); }
        std::uint32_t foo() const override { return 3; }
    };

    struct NotATrait
    {
        std::uint32_t foo() const { return 0; }
    };

    struct MayThrowOnMove final : MyTrait
    {
        MayThrowOnMove() = default;
        MayThrowOnMove(MayThrowOnMove&&) {}
        std::uint32_t foo() const override { return 4; }
    };

    // An interface with a mutating operation and no virtual destructor.
    struct Accumulator
    {
        virtual void add(int amount) = 0;
        virtual int total() const = 0;
    protected:
        ~Accumulator() = default;
    };

    struct Sum final : Accumulator
    {
        explicit Sum(int* counter = nullptr) : drops(counter) {}
        Sum(Sum&& other) noexcept : sum(other.sum), drops(std::exchange(other.drops, nullptr)) {}
        ~Sum() { if (drops) ++*drops; }
        void add(int amount) override { sum += amount; }
        int total() const override { return sum; }
        int sum = 0;
        int* drops;
    };

    struct Named final : MyTrait
    {
        explicit Named(std::string n) : name(std::move(n)) {}
        std::uint32_t foo() const override { return static_cast<std::uint32_t>(name.size()); }
        std::string name;
    };

    template<class Box, class T>
    concept can_set = requires(Box& box, T&& value) { box.set(std::forward<T>(value)); };

    using Box64 = dyn_box<MyTrait, 64>;
    using Box16 = dyn_box<MyTrait, 16>;
    using Box4 = dyn_box<MyTrait, 4>;
}

static_assert(!std::is_copy_constructible_v<Box64>);
static_assert(!std::is_copy_assignable_v<Box64>);
static_assert(std::is_nothrow_move_constructible_v<Box64>);
static_assert(std::is_nothrow_move_assignable_v<Box64>);
static_assert(can_set<Box64, B>);
static_assert(!can_set<Box64, B&>);
static_assert(!can_set<Box64, const B>);
static_assert(!can_set<Box64, const Named>);
static_assert(!can_set<Box64, NotATrait>);
static_assert(!can_set<Box64, MayThrowOnMove>);
static_assert(Box64::fits<B>);
static_assert(!Box4::fits<B>);
static_assert(!Box64::fits<Big>);
static_assert(dyn_box<MyTrait, 128>::fits<Big>);
static_assert(!Box64::fits<Wide>);
static_assert(dyn_box<MyTrait, 64, 64>::fits<Wide>);
static_assert(alignof(Box64) >= alignof(std::max_align_t));

TEST(DynBoxTest, NewIsEmpty)
{
    Box64 box;
    EXPECT_TRUE(box.empty());
    EXPECT_FALSE(box.has_value());
    EXPECT_EQ(box.get(), nullptr);
    EXPECT_EQ(box.get_mut(), nullptr);
    EXPECT_EQ(std::as_const(box).get(), nullptr);
    EXPECT_EQ(box.type(), typeid(void));
    EXPECT_EQ(box.capacity(), 64);
}

TEST(DynBoxTest, SetThenClear)
{
    Box64 box;
    box.set(A{});
    EXPECT_FALSE(box.empty());
    EXPECT_EQ(box.type(), typeid(A));

    box.clear();
    EXPECT_TRUE(box.empty());
    EXPECT_EQ(box.get(), nullptr);
    EXPECT_EQ(box.get_mut(), nullptr);
}

TEST(DynBoxTest, NoPerInstanceData)
{
    dyn_box<MyTrait, sizeof(A)> box;
    box.set(A{});
    ASSERT_NE(std::as_const(box).get(), nullptr);
    EXPECT_EQ(std::as_const(box).get()->foo(), 1);
    EXPECT_EQ(box.get_mut()->foo(), 1);
}

TEST(DynBoxTest, SetSmaller)
{
    B b{42};
    Box64 box;
    box.set(std::move(b));
    EXPECT_EQ(std::as_const(box).get()->foo(), 42);
    EXPECT_EQ(box.get_mut()->foo(), 42);
    EXPECT_EQ(box.get_mut()->foo(), b.foo());

    box.clear();
    EXPECT_TRUE(box.empty());
}

TEST(DynBoxTest, SetSameSize)
{
    dyn_box<MyTrait, sizeof(B)> box;
    auto& stored = box.set(B{42});
    EXPECT_EQ(stored.value, 42);
    EXPECT_EQ(std::as_const(box).get()->foo(), 42);
    EXPECT_EQ(box.get_mut()->foo(), 42);
}

TEST(DynBoxTest, SetTooLargeThrows)
{
    Box4 box;
    EXPECT_THROW(box.set(B{42}), dynbox::bad_dyn_box_capacity);
    EXPECT_TRUE(box.empty());

    // The container stays usable after the failure has been caught.
    box.clear();
    EXPECT_TRUE(box.empty());
}

TEST(DynBoxTest, SetTooLargeKeepsOccupant)
{
    int drops = 0;
    Box16 box;
    box.set(Droppable{&drops});
    EXPECT_THROW(box.set(Big{}), dynbox::bad_dyn_box_capacity);
    EXPECT_EQ(drops, 0);
    ASSERT_FALSE(box.empty());
    EXPECT_EQ(box.get()->foo(), 2);
}

TEST(DynBoxTest, OverAlignedThrows)
{
    Box64 box;
    EXPECT_THROW(box.set(Wide{}), dynbox::bad_dyn_box_capacity);
    EXPECT_TRUE(box.empty());

    dyn_box<MyTrait, 64, 64> wide;
    wide.set(Wide{});
    EXPECT_EQ(wide.get()->foo(), 64);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(wide.get()) % 64, 0u);
}

TEST(DynBoxTest, DropIsCalledOnClear)
{
    int drops = 0;
    Box64 box;
    box.set(Droppable{&drops});
    EXPECT_EQ(drops, 0);

    box.clear();
    EXPECT_EQ(drops, 1);

    box.clear();
    EXPECT_EQ(drops, 1);
}

TEST(DynBoxTest, ClearOnEmptyIsNoop)
{
    Box64 box;
    box.clear();
    box.clear();
    EXPECT_TRUE(box.empty());
}

TEST(DynBoxTest, DropIsCalledOnSet)
{
    int drops = 0;
    Box64 box;
    box.set(Droppable{&drops});
    EXPECT_EQ(drops, 0);

    box.set(A{});
    EXPECT_EQ(drops, 1);
    EXPECT_EQ(box.get()->foo(), 1);
}

TEST(DynBoxTest, DropIsCalledOnDestruction)
{
    int drops = 0;
    {
        Box64 box;
        box.set(Droppable{&drops});
        EXPECT_EQ(drops, 0);
    }
    EXPECT_EQ(drops, 1);
}

TEST(DynBoxTest, MutationThroughInterface)
{
    int drops = 0;
    {
        dyn_box<Accumulator, 32> box;
        box.set(Sum{&drops});
        box.get_mut()->add(40);
        box.get()->add(2);
        EXPECT_EQ(std::as_const(box).get()->total(), 42);
    }
    // The destructor runs even though Accumulator's destructor is not virtual.
    EXPECT_EQ(drops, 1);
}

TEST(DynBoxTest, Emplace)
{
    Box64 box;
    auto& b = box.emplace<B>(7u);
    EXPECT_EQ(b.value, 7u);
    EXPECT_EQ(box.get()->foo(), 7);
    EXPECT_EQ(static_cast<MyTrait*>(&b), box.get());
}

TEST(DynBoxTest, ReplaceWithValueTakenFromOccupant)
{
    int drops = 0;
    Box64 box;
    box.set(Droppable{&drops});

    // Take the value out before storing it again: `set` destroys the occupant before it moves in the new value.
    Droppable taken = std::move(dyn_cast<Droppable&>(box));
    box.set(std::move(taken));
    EXPECT_EQ(drops, 0);
    EXPECT_EQ(box.get()->foo(), 2);

    box.clear();
    EXPECT_EQ(drops, 1);
}

TEST(DynBoxTest, EmplaceThrowingConstructorLeavesEmpty)
{
    int drops = 0;
    Box64 box;
    box.set(Droppable{&drops});
    EXPECT_THROW(box.emplace<Throwing>(true), std::runtime_error);
    EXPECT_EQ(drops, 1);
    EXPECT_TRUE(box.empty());

    box.emplace<Throwing>(false);
    EXPECT_EQ(box.get()->foo(), 3);
}

TEST(DynBoxTest, NonTrivialOccupant)
{
    const std::string name = "a name that does not fit in the small string buffer";
    Box64 box;
    box.set(Named{name});
    EXPECT_EQ(box.get()->foo(), name.size());
    EXPECT_EQ(dyn_cast<const Named&>(box).name, name);
}

TEST(DynBoxTest, Move)
{
    int drops = 0;
    {
        Box64 a;
        a.set(Droppable{&drops});
        Box64 b = std::move(a);
        EXPECT_TRUE(a.empty());
        ASSERT_FALSE(b.empty());
        EXPECT_EQ(b.get()->foo(), 2);
        EXPECT_EQ(drops, 0);
    }
    EXPECT_EQ(drops, 1);
}

TEST(DynBoxTest, MoveAssign)
{
    int drops = 0;
    Box64 a;
    a.set(Droppable{&drops});
    Box64 b;
    b.set(Droppable{&drops});

    b = std::move(a);
    EXPECT_EQ(drops, 1);
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(b.get()->foo(), 2);

    b.clear();
    EXPECT_EQ(drops, 2);
}

TEST(DynBoxTest, MoveToLargerCapacity)
{
    Box16 small;
    small.set(B{5});
    Box64 large = std::move(small);
    EXPECT_TRUE(small.empty());
    EXPECT_EQ(large.get()->foo(), 5);
}

TEST(DynBoxTest, MoveToSmallerCapacity)
{
    Box64 large;
    large.set(B{9});
    Box16 small = std::move(large);
    EXPECT_TRUE(large.empty());
    EXPECT_EQ(small.get()->foo(), 9);
}

TEST(DynBoxTest, MoveToSmallerCapacityThatDoesNotFit)
{
    dyn_box<MyTrait, 128> large;
    large.set(Big{});
    Box16 small;
    small.set(A{});
    EXPECT_THROW(small = std::move(large), dynbox::bad_dyn_box_capacity);
    EXPECT_EQ(large.get()->foo(), 7);
    EXPECT_EQ(small.get()->foo(), 1);

    EXPECT_THROW(Box16{std::move(large)}, dynbox::bad_dyn_box_capacity);
    EXPECT_EQ(large.get()->foo(), 7);
}

TEST(DynBoxTest, Swap)
{
    Box64 a;
    a.set(B{1});
    Box64 b;
    b.set(B{2});
    a.swap(b);
    EXPECT_EQ(a.get()->foo(), 2);
    EXPECT_EQ(b.get()->foo(), 1);

    Box64 empty;
    a.swap(empty);
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(empty.get()->foo(), 2);
}

TEST(DynBoxTest, DynCast)
{
    Box64 box;
    EXPECT_EQ(dyn_cast<B>(&box), nullptr);
    EXPECT_THROW(dyn_cast<B>(box), dynbox::bad_dyn_cast);

    box.set(B{42});
    ASSERT_NE(dyn_cast<B>(&box), nullptr);
    EXPECT_EQ(dyn_cast<B>(&box)->value, 42);
    EXPECT_EQ(dyn_cast<A>(&box), nullptr);
    EXPECT_EQ(dyn_cast<B>(&std::as_const(box))->value, 42);

    dyn_cast<B&>(box).value = 43;
    EXPECT_EQ(box.get()->foo(), 43);
    EXPECT_EQ(dyn_cast<B>(std::as_const(box)).value, 43);
    EXPECT_THROW(dyn_cast<A>(box), dynbox::bad_dyn_cast);
}

TEST(DynBoxTest, MakeDynBox)
{
    auto a = dynbox::make_dyn_box<MyTrait, 64, B>(11u);
    EXPECT_EQ(a.capacity(), 64);
    EXPECT_EQ(a.type(), typeid(B));
    EXPECT_EQ(a.get()->foo(), 11);

    auto b = dynbox::make_dyn_box<MyTrait, B>(12u);
    EXPECT_EQ(b.capacity(), sizeof(B));
    EXPECT_EQ(b.get()->foo(), 12);

    auto c = dynbox::make_dyn_box<MyTrait, Wide>();
    EXPECT_EQ(c.alignment(), 64);
    EXPECT_EQ(c.get()->foo(), 64);
}

TEST(DynBoxTest, InPlaceTooLargeThrows)
{
    EXPECT_THROW((Box4{std::in_place_type<B>, 1u}), dynbox::bad_dyn_box_capacity);
}
