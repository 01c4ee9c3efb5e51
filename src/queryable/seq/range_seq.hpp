//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_RANGE_SEQ_HPP
#define QUERYABLE_SEQ_RANGE_SEQ_HPP

#include <queryable/config.hpp>
//
#include <queryable/optional.hpp>
#include <queryable/utility.hpp>

#include <boost/range/iterator_range.hpp>

#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// SubRangeSeq - a sequence over a borrowed iterator range; items are copied out as they are
// pulled.  The underlying container must outlive the sequence.
//
template <typename Iter>
class SubRangeSeq
{
   public:
    using Item = typename std::iterator_traits<Iter>::value_type;

    explicit SubRangeSeq(boost::iterator_range<Iter>&& sub_range) noexcept : sub_range_{std::move(sub_range)}
    {
    }

    Optional<Item> next()
    {
        if (sub_range_.empty()) {
            return None;
        }
        Optional<Item> item{Item(sub_range_.front())};
        sub_range_.drop_front();
        return item;
    }

   private:
    boost::iterator_range<Iter> sub_range_;
};

template <typename Range>
auto borrow_range(Range& range)
{
    using Iter = decltype(std::begin(range));

    return SubRangeSeq<Iter>{boost::make_iterator_range(std::begin(range), std::end(range))};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// OwnedRangeSeq - takes ownership of a container and moves its elements out one at a time.
//
//  The container lives on the heap so that the iteration state survives moves of the sequence
//  object itself.
//
template <typename Container>
class OwnedRangeSeq
{
   public:
    using Iter = decltype(std::begin(std::declval<Container&>()));
    using Item = typename std::iterator_traits<Iter>::value_type;

    explicit OwnedRangeSeq(Container&& container)
        : container_{std::make_unique<Container>(std::move(container))}
        , sub_range_{boost::make_iterator_range(std::begin(*container_), std::end(*container_))}
    {
    }

    Optional<Item> next()
    {
        if (sub_range_.empty()) {
            return None;
        }
        Optional<Item> item{Item(std::move(sub_range_.front()))};
        sub_range_.drop_front();
        return item;
    }

   private:
    std::unique_ptr<Container> container_;
    boost::iterator_range<Iter> sub_range_;
};

template <typename Container>
auto own_range(Container&& container)
{
    static_assert(std::is_same_v<Container, std::decay_t<Container>>,
                  "(seq::own_range) Containers may not be captured implicitly by reference.");

    return OwnedRangeSeq<Container>{QRY_FORWARD(container)};
}

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_RANGE_SEQ_HPP
