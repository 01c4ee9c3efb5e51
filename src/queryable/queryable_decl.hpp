//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_QUERYABLE_DECL_HPP
#define QUERYABLE_QUERYABLE_DECL_HPP

#include <queryable/config.hpp>
//
#include <queryable/int_types.hpp>
#include <queryable/optional.hpp>
#include <queryable/seq/invoke.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/type_traits.hpp>
#include <queryable/utility.hpp>

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace qry {

template <typename T>
class Queryable;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// IsQueryable<T>
//
//  Derives std::true_type iff `T` is a Queryable (not merely a sequence or a range).
//
template <typename T>
struct IsQueryable : std::false_type {
};

template <typename T>
struct IsQueryable<Queryable<T>> : std::true_type {
};

template <typename T>
inline constexpr bool is_queryable(const T&)
{
    return IsQueryable<T>{};
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Queryable<T>
//
//  A single-pass, pull-based cursor over a sequence of `T`.  Every combinator returns another
//  Queryable, so pipelines can be chained in any order:
//
//  ```
//  std::string s = qry::range(10)
//                      .filter([](int i) { return i % 2 == 0; })
//                      .map([](int i) { return i * i; })
//                      .slice(1, -1)
//                      .join("-");  // "4-16-36"
//  ```
//
//  Stage combinators (map, filter, slice, ...) consume the Queryable they are called on; use
//  `std::move` or `qry::from(lvalue)` (which borrows the lvalue's cursor) for named values.
//  Terminal operations (reduce, find, join, ...) pull from the current cursor position in place.
//
//  Pulling with `next()` and iterating with `begin()`/`end()` advance the same cursor; there is no
//  way to restart a traversal.  Once `next()` returns None it always returns None, and the
//  upstream stages are released.
//
template <typename T>
class Queryable
{
   public:
    using Item = T;

    static_assert(std::is_same_v<T, std::decay_t<T>>, "Queryable<T&> is not supported");

    class AbstractSeq
    {
       public:
        AbstractSeq() = default;

        AbstractSeq(const AbstractSeq&) = delete;
        AbstractSeq& operator=(const AbstractSeq&) = delete;

        virtual ~AbstractSeq() = default;

        virtual Optional<T> next() = 0;
    };

    template <typename Seq>
    class SeqImpl : public AbstractSeq
    {
       public:
        static_assert(std::is_same_v<std::decay_t<Seq>, Seq>, "SeqImpl<T&> is not supported");

        explicit SeqImpl(Seq&& seq) noexcept : seq_(std::move(seq))
        {
        }

        Optional<T> next() override
        {
            auto item = seq_.next();
            if (!item) {
                return None;
            }
            return T(std::move(*item));
        }

       private:
        Seq seq_;
    };

    //+++++++++++-+-+--+----- --- -- -  -  -   -
    // Single-pass input iterator; incrementing calls `next()` on the owning Queryable.
    //
    class iterator
    {
       public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T*;
        using reference = T&;

        iterator() = default;

        explicit iterator(Queryable* queryable) : queryable_{queryable}
        {
            this->advance();
        }

        reference operator*()
        {
            return *this->item_;
        }

        pointer operator->()
        {
            return &*this->item_;
        }

        iterator& operator++()
        {
            this->advance();
            return *this;
        }

        void operator++(int)
        {
            this->advance();
        }

        friend bool operator==(const iterator& l, const iterator& r)
        {
            return l.at_end() == r.at_end() && (l.at_end() || l.queryable_ == r.queryable_);
        }

        friend bool operator!=(const iterator& l, const iterator& r)
        {
            return !(l == r);
        }

       private:
        bool at_end() const
        {
            return !this->item_;
        }

        void advance()
        {
            this->item_ = this->queryable_->next();
        }

        Queryable* queryable_ = nullptr;
        Optional<T> item_;
    };

    //+++++++++++-+-+--+----- --- -- -  -  -   -

    /// The empty sequence.
    ///
    Queryable() = default;

    template <typename Seq,                                   //
              typename = EnableIfNoShadow<Queryable, Seq&&>,  //
              typename = EnableIfSeq<Seq>>
    explicit Queryable(Seq&& seq) : impl_{std::make_unique<SeqImpl<std::decay_t<Seq>>>(QRY_FORWARD(seq))}
    {
        static_assert(std::is_same_v<Seq, std::decay_t<Seq>>,
                      "Queryable may not be used to capture a reference; use qry::from to borrow a sequence");
    }

    // Move-only; a cursor can not be shared between two owners.
    //
    Queryable(const Queryable&) = delete;
    Queryable& operator=(const Queryable&) = delete;

    Queryable(Queryable&&) = default;
    Queryable& operator=(Queryable&&) = default;

    ~Queryable() = default;

    //+++++++++++-+-+--+----- --- -- -  -  -   -
    // Pull primitive.

    Optional<T> next()
    {
        if (!this->impl_) {
            return None;
        }
        Optional<T> item = this->impl_->next();
        if (!item) {
            this->impl_ = nullptr;
        }
        return item;
    }

    iterator begin()
    {
        return iterator{this};
    }

    iterator end()
    {
        return iterator{};
    }

    //+++++++++++-+-+--+----- --- -- -  -  -   -
    // Transformation stages.

    /// Emits `fn(item, index, upstream)` for each item; the result item type is the decayed return
    /// type of `fn`.
    ///
    template <typename Fn>
    auto map(Fn&& fn) &&;

    template <typename Fn>
    Queryable filter(Fn&& fn) &&;

    /// Appends each of `items`: an item convertible to `T` is appended whole; any other item must be
    /// a range or sequence, whose members are appended (one level of flattening).
    ///
    template <typename... Items>
    Queryable concat(Items&&... items) &&;

    template <typename... Items>
    Queryable push(Items&&... items) &&;

    template <typename... Items>
    Queryable unshift(Items&&... items) &&;

    /// One level of flattening if `T` is a range (other than a string), a sequence or a Queryable;
    /// otherwise the identity.
    ///
    auto flat() &&;

    template <typename Fn>
    auto flat_map(Fn&& fn) &&;

    Queryable<usize> keys() &&;

    Queryable values() &&;

    Queryable<std::pair<usize, T>> entries() &&;

    //+++++++++++-+-+--+----- --- -- -  -  -   -
    // Windowed consumption stages.

    Queryable shift(usize length = 1) &&;

    Queryable pop(usize length = 1) &&;

    Queryable slice(isize begin = 0) &&;

    Queryable slice(isize begin, isize end) &&;

    Queryable splice(isize start) &&;

    template <typename... Items>
    Queryable splice(isize start, usize delete_count, Items&&... new_items) &&;

    Queryable reverse() &&;

    //+++++++++++-+-+--+----- --- -- -  -  -   -
    // Terminal operations; these advance this Queryable's cursor in place.

    template <typename Fn>
    isize find_index(Fn&& fn);

    template <typename Fn>
    Optional<T> find(Fn&& fn);

    template <typename Fn>
    bool some(Fn&& fn);

    template <typename Fn>
    bool every(Fn&& fn);

    template <typename U>
    isize index_of(const U& item, usize start_index = 0);

    template <typename U>
    isize last_index_of(const U& item, usize skip_from_end = 0);

    template <typename U>
    bool includes(const U& item, usize start_index = 0);

    template <typename Fn>
    void for_each(Fn&& fn);

    /// Uses the first item as the initial value; returns None (without invoking `fn`) if the
    /// sequence is empty.
    ///
    template <typename Fn>
    Optional<T> reduce(Fn&& fn);

    template <typename Fn, typename State>
    std::decay_t<State> reduce(Fn&& fn, State&& initial_value);

    template <typename Fn>
    Optional<T> reduce_right(Fn&& fn);

    template <typename Fn, typename State>
    std::decay_t<State> reduce_right(Fn&& fn, State&& initial_value);

    std::string join(std::string_view separator = ",");

    std::vector<T> collect_vec();

   private:
    std::unique_ptr<AbstractSeq> impl_;
};

}  // namespace qry

#endif  // QUERYABLE_QUERYABLE_DECL_HPP
