//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#include <queryable/queryable_impl.hpp>
//
#include <queryable/queryable_impl.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <functional>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;

using qry::usize;

int square(int i)
{
    return i * i;
}

// A minimal user-defined sequence; counts how many items have been pulled.
//
struct CountingSeq {
    using Item = int;

    int limit;
    std::shared_ptr<int> pulled;

    qry::Optional<int> next()
    {
        if (*pulled >= limit) {
            return qry::None;
        }
        return (*pulled)++;
    }
};

struct Point {
    int x;
    int y;

    int manhattan() const
    {
        return (x < 0 ? -x : x) + (y < 0 ? -y : y);
    }
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Pull primitive and iteration.

TEST(QueryableTest, NextLatchesExhaustion)
{
    auto q = qry::of(1, 2);

    EXPECT_EQ(q.next(), 1);
    EXPECT_EQ(q.next(), 2);
    EXPECT_EQ(q.next(), qry::None);
    EXPECT_EQ(q.next(), qry::None);
}

TEST(QueryableTest, IteratorSharesCursorWithNext)
{
    auto q = qry::range(1, 6);

    EXPECT_EQ(q.next(), 1);

    std::vector<int> seen;
    for (int i : q) {
        seen.push_back(i);
        if (i == 3) {
            break;
        }
    }
    EXPECT_THAT(seen, ElementsAre(2, 3));

    // Starting a new loop pulls the next item; there is no rewind.
    //
    seen.clear();
    for (int i : q) {
        seen.push_back(i);
    }
    EXPECT_THAT(seen, ElementsAre(4, 5));
    EXPECT_EQ(q.next(), qry::None);
}

TEST(QueryableTest, UserDefinedSeq)
{
    auto pulled = std::make_shared<int>(0);

    auto q = qry::from(CountingSeq{4, pulled}).map(&square);

    EXPECT_EQ(*pulled, 0);
    EXPECT_THAT(q.collect_vec(), ElementsAre(0, 1, 4, 9));
    EXPECT_EQ(*pulled, 4);
}

TEST(QueryableTest, MoveOnlyItems)
{
    std::vector<std::unique_ptr<int>> v;
    v.emplace_back(std::make_unique<int>(7));
    v.emplace_back(std::make_unique<int>(8));

    auto values = qry::from(std::move(v))
                      .map([](std::unique_ptr<int>& p) {
                          return *p;
                      })
                      .collect_vec();

    EXPECT_THAT(values, ElementsAre(7, 8));
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Transformation stages.

TEST(QueryableTest, MapIsLazy)
{
    int calls = 0;
    auto q = qry::range(10).map([&calls](int i) {
        ++calls;
        return i * 2;
    });

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(q.next(), 0);
    EXPECT_EQ(q.next(), 2);
    EXPECT_EQ(calls, 2);
}

TEST(QueryableTest, MapCallbackArity)
{
    EXPECT_THAT(qry::of(10, 20, 30)
                    .map([](int item, usize index) {
                        return item + static_cast<int>(index);
                    })
                    .collect_vec(),
                ElementsAre(10, 21, 32));

    // The third argument is the upstream Queryable; pulling from it skips ahead.
    //
    EXPECT_THAT(qry::range(6)
                    .map([](int item, usize, qry::Queryable<int>& upstream) {
                        return item + upstream.next().value_or(-100);
                    })
                    .collect_vec(),
                ElementsAre(1, 5, 9));
}

TEST(QueryableTest, MapChangesItemType)
{
    auto q = qry::of(1, 2, 3).map([](int i) {
        return std::to_string(i);
    });

    static_assert(std::is_same_v<decltype(q), qry::Queryable<std::string>>, "");

    EXPECT_EQ(q.join(""), "123");
}

TEST(QueryableTest, FilterIndexCountsEveryItem)
{
    std::vector<usize> indices;

    auto evens = qry::of(5, 6, 7, 8)
                     .filter([&indices](int i, usize index) {
                         indices.push_back(index);
                         return i % 2 == 0;
                     })
                     .collect_vec();

    EXPECT_THAT(evens, ElementsAre(6, 8));
    EXPECT_THAT(indices, ElementsAre(0u, 1u, 2u, 3u));
}

TEST(QueryableTest, ConcatFlattensOneLevel)
{
    EXPECT_THAT(qry::of(1, 2).concat(std::vector<int>{3, 4}, 5).collect_vec(), ElementsAre(1, 2, 3, 4, 5));

    EXPECT_THAT(qry::of(1).concat(qry::range(2, 4), qry::of(4)).collect_vec(), ElementsAre(1, 2, 3, 4));

    EXPECT_THAT(qry::of(1).concat().collect_vec(), ElementsAre(1));
}

TEST(QueryableTest, ConcatStringsAreItems)
{
    const std::vector<std::string> more{"c", "d"};

    EXPECT_THAT(qry::of(std::string{"a"}).concat("b", more).collect_vec(), ElementsAre("a", "b", "c", "d"));
}

TEST(QueryableTest, PushAndUnshift)
{
    EXPECT_THAT(qry::of(2, 3).push(4, 5).unshift(0, 1).collect_vec(), ElementsAre(0, 1, 2, 3, 4, 5));

    EXPECT_THAT(qry::from<int>().push().unshift().collect_vec(), IsEmpty());
}

TEST(QueryableTest, Flat)
{
    std::vector<std::vector<int>> nested{{1, 2}, {}, {3}};

    auto flat = qry::from(std::move(nested)).flat();

    static_assert(std::is_same_v<decltype(flat), qry::Queryable<int>>, "");

    EXPECT_THAT(flat.collect_vec(), ElementsAre(1, 2, 3));
}

TEST(QueryableTest, FlatIsOneLevelOnly)
{
    std::vector<std::vector<std::vector<int>>> nested{{{1}, {2, 3}}, {{4}}};

    auto once = qry::from(std::move(nested)).flat();

    static_assert(std::is_same_v<decltype(once), qry::Queryable<std::vector<int>>>, "");

    EXPECT_THAT(std::move(once).flat().collect_vec(), ElementsAre(1, 2, 3, 4));
}

TEST(QueryableTest, FlatOfScalarsIsIdentity)
{
    auto ints = qry::of(1, 2).flat();
    auto strings = qry::of(std::string{"ab"}, std::string{"cd"}).flat();

    static_assert(std::is_same_v<decltype(ints), qry::Queryable<int>>, "");
    static_assert(std::is_same_v<decltype(strings), qry::Queryable<std::string>>, "");

    EXPECT_THAT(ints.collect_vec(), ElementsAre(1, 2));
    EXPECT_THAT(strings.collect_vec(), ElementsAre("ab", "cd"));
}

TEST(QueryableTest, FlatMap)
{
    EXPECT_THAT(qry::range(1, 4)
                    .flat_map([](int n) {
                        return qry::range(n);
                    })
                    .collect_vec(),
                ElementsAre(0, 0, 1, 0, 1, 2));
}

TEST(QueryableTest, KeysValuesEntries)
{
    EXPECT_THAT(qry::of('a', 'b', 'c').keys().collect_vec(), ElementsAre(0u, 1u, 2u));
    EXPECT_THAT(qry::of('a', 'b', 'c').values().collect_vec(), ElementsAre('a', 'b', 'c'));
    EXPECT_THAT(qry::of('a', 'b').entries().collect_vec(), ElementsAre(Pair(0u, 'a'), Pair(1u, 'b')));
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Windowed consumption stages.

TEST(QueryableTest, Shift)
{
    EXPECT_THAT(qry::range(5).shift().collect_vec(), ElementsAre(1, 2, 3, 4));
    EXPECT_THAT(qry::range(5).shift(3).collect_vec(), ElementsAre(3, 4));
    EXPECT_THAT(qry::range(5).shift(9).collect_vec(), IsEmpty());
}

TEST(QueryableTest, Pop)
{
    EXPECT_THAT(qry::range(1, 6).pop(2).collect_vec(), ElementsAre(1, 2, 3));
    EXPECT_THAT(qry::range(1, 6).pop().collect_vec(), ElementsAre(1, 2, 3, 4));
    EXPECT_THAT(qry::range(1, 6).pop(0).collect_vec(), ElementsAre(1, 2, 3, 4, 5));
    EXPECT_THAT(qry::of(1, 2).pop(5).collect_vec(), IsEmpty());
}

TEST(QueryableTest, SliceNonNegative)
{
    EXPECT_THAT(qry::range(1, 6).slice().collect_vec(), ElementsAre(1, 2, 3, 4, 5));
    EXPECT_THAT(qry::range(1, 6).slice(2).collect_vec(), ElementsAre(3, 4, 5));
    EXPECT_THAT(qry::range(1, 6).slice(1, 3).collect_vec(), ElementsAre(2, 3));
    EXPECT_THAT(qry::range(1, 6).slice(3, 1).collect_vec(), IsEmpty());
    EXPECT_THAT(qry::range(1, 6).slice(1, 100).collect_vec(), ElementsAre(2, 3, 4, 5));
}

TEST(QueryableTest, SliceNegativeEnd)
{
    EXPECT_THAT(qry::range(1, 6).slice(1, -1).collect_vec(), ElementsAre(2, 3, 4));
    EXPECT_THAT(qry::range(1, 6).slice(0, -5).collect_vec(), IsEmpty());
}

TEST(QueryableTest, SliceNegativeBegin)
{
    EXPECT_THAT(qry::range(1, 6).slice(-2).collect_vec(), ElementsAre(4, 5));
    EXPECT_THAT(qry::range(1, 6).slice(-9).collect_vec(), ElementsAre(1, 2, 3, 4, 5));
    EXPECT_THAT(qry::range(1, 6).slice(-3, -1).collect_vec(), ElementsAre(3, 4));
    EXPECT_THAT(qry::range(1, 6).slice(-3, 4).collect_vec(), ElementsAre(3, 4));
    EXPECT_THAT(qry::range(1, 6).slice(-3, 2).collect_vec(), IsEmpty());
}

TEST(QueryableTest, Splice)
{
    EXPECT_THAT(qry::range(1, 6).splice(1, 2, 9).collect_vec(), ElementsAre(1, 9, 4, 5));
    EXPECT_THAT(qry::range(1, 6).splice(2).collect_vec(), ElementsAre(1, 2));
    EXPECT_THAT(qry::range(1, 6).splice(0, 0, -1, 0).collect_vec(), ElementsAre(-1, 0, 1, 2, 3, 4, 5));
    EXPECT_THAT(qry::range(1, 6).splice(10, 1, 7).collect_vec(), ElementsAre(1, 2, 3, 4, 5, 7));
}

TEST(QueryableTest, SpliceNegativeStart)
{
    EXPECT_THAT(qry::range(1, 6).splice(-2, 1).collect_vec(), ElementsAre(1, 2, 3, 5));
    EXPECT_THAT(qry::range(1, 6).splice(-2, 0, 8).collect_vec(), ElementsAre(1, 2, 3, 8, 4, 5));
    EXPECT_THAT(qry::range(1, 6).splice(-9, 2).collect_vec(), ElementsAre(3, 4, 5));
}

TEST(QueryableTest, Reverse)
{
    EXPECT_THAT(qry::range(4).reverse().collect_vec(), ElementsAre(3, 2, 1, 0));
    EXPECT_THAT(qry::range(4).reverse().reverse().collect_vec(), ElementsAre(0, 1, 2, 3));
    EXPECT_THAT(qry::from<int>().reverse().collect_vec(), IsEmpty());
}

TEST(QueryableTest, ReverseLongSequence)
{
    auto q = qry::range(100000).reverse();

    EXPECT_EQ(q.next(), 99999);
    EXPECT_EQ(q.reduce([](int acc, int i) {
                  return acc > i ? acc : i;
              }),
              99998);
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Terminal operations.

TEST(QueryableTest, FindIndexIsZeroBased)
{
    EXPECT_EQ(qry::of(4, 5, 6).find_index([](int i) { return i == 4; }), 0);
    EXPECT_EQ(qry::of(4, 5, 6).find_index([](int i) { return i == 6; }), 2);
    EXPECT_EQ(qry::of(4, 5, 6).find_index([](int i) { return i == 7; }), -1);
}

TEST(QueryableTest, FindConsumesUpToMatch)
{
    auto q = qry::range(10);

    EXPECT_EQ(q.find([](int i) { return i > 3; }), 4);
    EXPECT_EQ(q.next(), 5);
    EXPECT_EQ(q.find([](int i) { return i > 100; }), qry::None);
    EXPECT_EQ(q.next(), qry::None);
}

TEST(QueryableTest, SomeEvery)
{
    EXPECT_TRUE(qry::of(1, 2, 3).some([](int i) { return i == 2; }));
    EXPECT_FALSE(qry::of(1, 2, 3).some([](int i) { return i > 3; }));
    EXPECT_FALSE(qry::from<int>().some([](int) { return true; }));

    EXPECT_TRUE(qry::of(1, 2, 3).every([](int i) { return i > 0; }));
    EXPECT_FALSE(qry::of(1, 2, 3).every([](int i, usize index) { return index < 2 && i > 0; }));
    EXPECT_TRUE(qry::from<int>().every([](int) { return false; }));
}

TEST(QueryableTest, IndexOf)
{
    EXPECT_EQ(qry::of(1, 2, 3, 2).index_of(2), 1);
    EXPECT_EQ(qry::of(1, 2, 3, 2).index_of(2, 2), 3);
    EXPECT_EQ(qry::of(1, 2, 3, 2).index_of(9), -1);
    EXPECT_EQ(qry::of(1, 2).index_of(1, 5), -1);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(qry::of(1.0, nan).index_of(nan), -1);
    EXPECT_EQ(qry::of(0.0, 1.0).index_of(-0.0), 0);
}

TEST(QueryableTest, LastIndexOf)
{
    EXPECT_EQ(qry::of(1, 2, 3, 2, 1).last_index_of(2), 3);
    EXPECT_EQ(qry::of(1, 2, 3, 2, 1).last_index_of(2, 2), 1);
    EXPECT_EQ(qry::of(1, 2, 3, 2, 1).last_index_of(2, 4), -1);
    EXPECT_EQ(qry::of(1, 2, 3, 2, 1).last_index_of(7), -1);
}

TEST(QueryableTest, IncludesUsesSameValueEquality)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_TRUE(qry::of(1.0, nan).includes(nan));
    EXPECT_TRUE(qry::of(1, 2, 3).includes(3));
    EXPECT_FALSE(qry::of(1, 2, 3).includes(1, 1));
    EXPECT_FALSE(qry::of(0.0, 1.0).includes(-0.0));
    EXPECT_TRUE(qry::of(std::string{"a"}, std::string{"b"}).includes("b"));
}

TEST(QueryableTest, ForEach)
{
    std::vector<std::pair<int, usize>> seen;

    qry::of(7, 8).for_each([&seen](int i, usize index) {
        seen.emplace_back(i, index);
    });

    EXPECT_THAT(seen, ElementsAre(Pair(7, 0u), Pair(8, 1u)));
}

TEST(QueryableTest, ReduceWithSeed)
{
    EXPECT_EQ(qry::range(1, 5).reduce(
                  [](int acc, int i) {
                      return acc + i;
                  },
                  100),
              110);

    EXPECT_EQ(qry::of('a', 'b').reduce(
                  [](std::string acc, char c, usize index) {
                      return acc + c + std::to_string(index);
                  },
                  std::string{">"}),
              ">a0b1");

    EXPECT_EQ(qry::from<int>().reduce(
                  [](int acc, int i) {
                      return acc + i;
                  },
                  -1),
              -1);
}

TEST(QueryableTest, ReduceWithoutSeed)
{
    std::vector<usize> indices;

    auto sum = qry::of(10, 20, 30).reduce([&indices](int acc, int i, usize index) {
        indices.push_back(index);
        return acc + i;
    });

    EXPECT_EQ(sum, 60);
    EXPECT_THAT(indices, ElementsAre(0u, 1u));

    bool called = false;
    auto empty = qry::from<int>().reduce([&called](int acc, int) {
        called = true;
        return acc;
    });

    EXPECT_EQ(empty, qry::None);
    EXPECT_FALSE(called);
}

TEST(QueryableTest, ReduceRight)
{
    auto concat = [](std::string acc, const std::string& s) {
        return acc + s;
    };

    EXPECT_EQ(qry::of(std::string{"a"}, std::string{"b"}, std::string{"c"}).reduce_right(concat),
              std::string{"cba"});
    EXPECT_EQ(qry::of(std::string{"a"}, std::string{"b"}).reduce_right(concat, std::string{"!"}),
              "!ba");
}

TEST(QueryableTest, Join)
{
    EXPECT_EQ(qry::of(1, 2, 3).join(), "1,2,3");
    EXPECT_EQ(qry::of(1, 2, 3).join(" - "), "1 - 2 - 3");
    EXPECT_EQ(qry::of(true, false).join(), "true,false");
    EXPECT_EQ(qry::of(std::string{"solo"}).join(";"), "solo");
    EXPECT_EQ(qry::from<int>().join(), "");
}

TEST(QueryableTest, JoinKeepsFloatingPointDigits)
{
    EXPECT_EQ(qry::of(1234567.0, 0.1 + 0.2).join("|"), "1234567|0.30000000000000004");
    EXPECT_EQ(qry::of(0.5, 0.1, -2.0).join(), "0.5,0.1,-2");
    EXPECT_EQ(qry::of(1.0f / 3.0f).join(), "0.333333343");
}

TEST(QueryableTest, TerminalsResumeFromCursor)
{
    auto q = qry::range(6);

    EXPECT_EQ(q.next(), 0);
    EXPECT_EQ(q.index_of(3), 2);
    EXPECT_THAT(q.collect_vec(), ElementsAre(4, 5));
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Capability propagation.

TEST(QueryableTest, ArbitraryChaining)
{
    std::string s = qry::range(10)
                        .filter([](int i) {
                            return i % 2 == 0;
                        })
                        .map([](int i) {
                            return i * i;
                        })
                        .slice(1, -1)
                        .join("-");

    EXPECT_EQ(s, "4-16-36");

    EXPECT_EQ(qry::of(3, 1, 2)
                  .reverse()
                  .push(9)
                  .shift()
                  .concat(std::vector<int>{5})
                  .splice(1, 1)
                  .entries()
                  .map([](const std::pair<usize, int>& e) {
                      return static_cast<int>(e.first) * 100 + e.second;
                  })
                  .join(),
              "1,109,205");
}

TEST(QueryableTest, ChainingDoesNotPull)
{
    auto pulled = std::make_shared<int>(0);

    auto q = qry::from(CountingSeq{100, pulled})
                 .map(&square)
                 .filter([](int i) {
                     return i % 2 == 0;
                 })
                 .shift(2)
                 .pop(1)
                 .slice(0, 3)
                 .concat(1, 2)
                 .flat();

    EXPECT_EQ(*pulled, 0);
    EXPECT_EQ(q.next(), 16);
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Invalid callbacks.

TEST(QueryableTest, NullFunctionPointerThrowsOnFirstUse)
{
    int (*fn)(int) = nullptr;

    auto q = qry::of(1, 2).map(fn);

    EXPECT_THROW(q.next(), std::invalid_argument);
}

TEST(QueryableTest, MemberPointerCallbacks)
{
    EXPECT_THAT(qry::of(Point{1, -2}, Point{3, 4}).map(&Point::manhattan).collect_vec(), ElementsAre(3, 7));
    EXPECT_THAT(qry::of(Point{1, -2}, Point{3, 4}).map(&Point::y).collect_vec(), ElementsAre(-2, 4));

    int (Point::*null_fn)() const = nullptr;

    EXPECT_THROW(qry::of(Point{0, 0}).map(null_fn).collect_vec(), std::invalid_argument);
}

TEST(QueryableTest, EmptyStdFunctionThrows)
{
    std::function<bool(int)> empty;

    EXPECT_THROW(qry::of(1, 2).filter(empty).collect_vec(), std::invalid_argument);
    EXPECT_THROW(qry::of(1, 2).some(empty), std::invalid_argument);
    EXPECT_THROW(qry::of(1, 2).every(empty), std::invalid_argument);

    std::function<int(int, int)> empty_reducer;

    EXPECT_THROW(qry::of(1, 2).reduce(empty_reducer), std::invalid_argument);
}

TEST(QueryableTest, EmptyCallbackNotCheckedOnEmptySequence)
{
    std::function<void(int)> empty;

    EXPECT_NO_THROW(qry::from<int>().for_each(empty));
}

TEST(QueryableTest, CallbackExceptionsPropagate)
{
    auto q = qry::of(1, 2, 3).map([](int i) {
        if (i == 2) {
            throw std::runtime_error{"two"};
        }
        return i;
    });

    EXPECT_EQ(q.next(), 1);
    EXPECT_THROW(q.next(), std::runtime_error);
}

}  // namespace
