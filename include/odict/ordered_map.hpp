////////////////////////////////////////////////////////////////////////////////
///
/// odict::ordered_map
///
/// An associative container which additionally maintains a total order over
/// its entries (insertion order unless explicitly rearranged).
///
/// Two structures cooperate:
///  - the backing store: a key -> slot associative container (injected, an
///    std::unordered_map by default) which is the single source of truth for
///    key existence and owns the values
///  - a doubly-linked list threaded through the slots by *key values* (each
///    slot holds the keys of its neighbours, NIL at the boundaries) plus the
///    head and tail links held by the map itself.
/// Lookups cost one store lookup, neighbour access costs one store lookup, so
/// every reordering operation (move, swap, insert relative to a key, rename)
/// is O(1) and touches only the affected entries and their neighbours.
///
/// Overwriting the value of an existing key never changes its position.
///
/// Links are plain key values so a copy of the store (i.e. a copy of the map)
/// is immediately consistent, as is anything rebuilt from a serialized form.
///
/// Iterators, key/value views and their reversed counterparts walk the list
/// (restarting from the current head/tail on every call). Any structural
/// mutation during traversal invalidates the traversal.
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <odict/abi.hpp>
#include <odict/clone.hpp>
#include <odict/concepts.hpp>
#include <odict/error.hpp>
#include <odict/nil.hpp>
#include <odict/options.hpp>
#include <odict/slot.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/move/algo/adaptive_sort.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ranges>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace odict
{
//------------------------------------------------------------------------------

// sort() projections (applied to a (key, value) pair)
struct by_value { template <typename Pair> constexpr decltype( auto ) operator()( Pair const & item ) const noexcept { return ( item.second ); } };
struct by_key   { template <typename Pair> constexpr decltype( auto ) operator()( Pair const & item ) const noexcept { return ( item.first  ); } };

template <typename Key, typename T>
using default_store = std::unordered_map<Key, slot<Key, T>, boost::hash<Key>>;


////////////////////////////////////////////////////////////////////////////////
// \class ordered_map
////////////////////////////////////////////////////////////////////////////////

template
<
    typename Key,
    typename T,
    typename Store = default_store<Key, T>,
    ordered_map_options options = {}
>
class ordered_map
{
public:
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<Key, T>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference       = std::pair<Key const &, T       &>;
    using const_reference = std::pair<Key const &, T const &>;
    using store_type      = Store;
    using slot_type       = typename Store::mapped_type;
    using link_type       = key_link<Key>;

    using key_const_arg = const_arg_t<Key>;

    static constexpr ordered_map_options configuration{ options };

    static_assert( SlotStore<Store> );
    static_assert( SlotLike<slot_type, Key, T> );
    static_assert( std::is_same_v<typename Store::key_type, Key> );

private:
    using element_type = typename Store::value_type;

    template <typename Impl, typename Value, typename Reference = Value &>
    using iter_impl = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        Impl,
#   endif
        std::bidirectional_iterator_tag,
        Value,
        Reference
    >;

    template <typename Impl, typename Reference>
    using proxy_iter_impl = boost::stl_interfaces::proxy_iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        Impl,
#   endif
        std::bidirectional_iterator_tag,
        value_type,
        Reference
    >;

    // position in the list: the store element of the current entry (nullptr
    // for the past-the-end position, which decrements to the tail)
    template <bool IsConst>
    class cursor
    {
    protected:
        using map_ptr     = std::conditional_t<IsConst, ordered_map const *, ordered_map *>;
        using element_ptr = std::conditional_t<IsConst, element_type const *, element_type *>;

        constexpr cursor() noexcept = default;
        constexpr cursor( map_ptr const map, element_ptr const element ) noexcept : map_{ map }, element_{ element } {}

        void increment()
        {
            BOOST_ASSERT_MSG( element_, "Incrementing past the end" );
            element_ = map_->successor( *element_ );
        }

        void decrement()
        {
            auto const & prev{ element_ ? element_->second.prev : map_->tail_ };
            BOOST_ASSERT_MSG( prev, "Decrementing past the beginning" );
            element_ = map_->element_at( *prev );
        }

        map_ptr     map_    { nullptr };
        element_ptr element_{ nullptr };
    }; // class cursor

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
private:
    template <bool IsConst>
    class iterator_impl
        :
        public cursor<IsConst>,
        public proxy_iter_impl<iterator_impl<IsConst>, std::conditional_t<IsConst, const_reference, reference>>
    {
    private:
        using base = cursor<IsConst>;
        using impl = proxy_iter_impl<iterator_impl<IsConst>, std::conditional_t<IsConst, const_reference, reference>>;

        friend ordered_map;
        friend iterator_impl<!IsConst>;

        constexpr iterator_impl( typename base::map_ptr const map, typename base::element_ptr const element ) noexcept : base{ map, element } {}

        using pair_reference = std::conditional_t<IsConst, const_reference, reference>;

    public:
        constexpr iterator_impl() noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : base{ other.map_, other.element_ } {}

        pair_reference operator*() const noexcept
        {
            BOOST_ASSERT_MSG( this->element_, "Dereferencing the end iterator" );
            return { this->element_->first, this->element_->second.value };
        }

        iterator_impl & operator++() { this->increment(); return *this; }
        iterator_impl & operator--() { this->decrement(); return *this; }
        using impl::operator++;
        using impl::operator--;

        friend bool operator==( iterator_impl const & left, iterator_impl const & right ) noexcept { return left.element_ == right.element_; }
    }; // class iterator_impl

public:
    class key_iterator
        :
        public cursor<true>,
        public iter_impl<key_iterator, Key const>
    {
    private:
        using base = cursor<true>;
        using impl = iter_impl<key_iterator, Key const>;

        friend ordered_map;

        constexpr key_iterator( ordered_map const * const map, element_type const * const element ) noexcept : base{ map, element } {}

    public:
        constexpr key_iterator() noexcept = default;

        Key const & operator*() const noexcept { BOOST_ASSERT( this->element_ ); return this->element_->first; }

        key_iterator & operator++() { this->increment(); return *this; }
        key_iterator & operator--() { this->decrement(); return *this; }
        using impl::operator++;
        using impl::operator--;

        friend bool operator==( key_iterator const & left, key_iterator const & right ) noexcept { return left.element_ == right.element_; }
    }; // class key_iterator

    template <bool IsConst>
    class value_iterator
        :
        public cursor<IsConst>,
        public iter_impl<value_iterator<IsConst>, std::conditional_t<IsConst, T const, T>>
    {
    private:
        using base  = cursor<IsConst>;
        using impl  = iter_impl<value_iterator<IsConst>, std::conditional_t<IsConst, T const, T>>;
        using value = std::conditional_t<IsConst, T const, T>;

        friend ordered_map;

        constexpr value_iterator( typename base::map_ptr const map, typename base::element_ptr const element ) noexcept : base{ map, element } {}

    public:
        constexpr value_iterator() noexcept = default;

        value & operator*() const noexcept { BOOST_ASSERT( this->element_ ); return this->element_->second.value; }

        value_iterator & operator++() { this->increment(); return *this; }
        value_iterator & operator--() { this->decrement(); return *this; }
        using impl::operator++;
        using impl::operator--;

        friend bool operator==( value_iterator const & left, value_iterator const & right ) noexcept { return left.element_ == right.element_; }
    }; // class value_iterator

    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator_impl<true >;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
public:
    ordered_map() = default;

    ordered_map( ordered_map const & ) = default;

    ordered_map( ordered_map && other ) noexcept( std::is_nothrow_move_constructible_v<Store> )
        : store_{ std::move( other.store_ ) }, head_{ std::move( other.head_ ) }, tail_{ std::move( other.tail_ ) }
    {
        other.clear();
    }

    // (key, value) pairs in iteration order, which becomes the insertion order
    template <std::input_or_output_iterator It, std::sentinel_for<It> Sentinel>
    ordered_map( It first, Sentinel const last )
    {
        for ( ; first != last; ++first )
        {
            auto && [ key, value ]{ *first };
            set( key, value );
        }
    }

    template <std::ranges::range Items>
    requires( !std::is_same_v<std::remove_cvref_t<Items>, ordered_map> )
    explicit ordered_map( Items && items ) { update( items ); }

    template <std::ranges::range Items, typename Value>
    ordered_map( Items && items, keyword_args<Value> const & named )
    {
        if ( !named.empty() )
            detail::throw_invalid_configuration( "odict::ordered_map::ordered_map" );
        update( items );
    }

    ordered_map( std::initializer_list<value_type> const items ) { update( items ); }

    template <std::ranges::range Keys>
    [[ nodiscard ]] static ordered_map from_keys( Keys const & keys, T const & value = T{} )
    {
        ordered_map result;
        for ( auto const & key : keys )
            result.set( key, value );
        return result;
    }

    ordered_map & operator=( ordered_map const & ) = default;

    ordered_map & operator=( ordered_map && other ) noexcept( std::is_nothrow_move_assignable_v<Store> )
    {
        if ( this != &other )
        {
            store_ = std::move( other.store_ );
            head_  = std::move( other.head_  );
            tail_  = std::move( other.tail_  );
            other.clear();
        }
        return *this;
    }

    ~ordered_map() noexcept = default;

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
public:
    [[ nodiscard ]] T       & at( key_const_arg key )       { return existing( key, "odict::ordered_map::at" ).second.value; }
    [[ nodiscard ]] T const & at( key_const_arg key ) const { return existing( key, "odict::ordered_map::at" ).second.value; }

    [[ nodiscard ]] T get( key_const_arg key, T fallback = T{} ) const
    {
        if ( auto const element{ find_element( key ) } )
            return element->second.value;
        return fallback;
    }

    [[ nodiscard ]] bool contains( key_const_arg key ) const { return find_element( key ) != nullptr; }

    [[ nodiscard ]] iterator       find( key_const_arg key )       { return { this, find_element( key ) }; }
    [[ nodiscard ]] const_iterator find( key_const_arg key ) const { return { this, find_element( key ) }; }

    // a single store query, never a traversal
    [[ nodiscard ]] size_type size() const noexcept { return static_cast<size_type>( store_.size() ); }
    [[ nodiscard ]] bool     empty() const noexcept { return size() == 0; }

    [[ nodiscard ]] link_type const & head() const noexcept { return head_; }
    [[ nodiscard ]] link_type const & tail() const noexcept { return tail_; }

    [[ nodiscard ]] Key const & first_key() const
    {
        if ( empty() )
            detail::throw_empty_structure( "odict::ordered_map::first_key" );
        return *head_;
    }
    [[ nodiscard ]] Key const & last_key() const
    {
        if ( empty() )
            detail::throw_empty_structure( "odict::ordered_map::last_key" );
        return *tail_;
    }

    // the neighbours of an entry (key_not_found also when there is none)
    [[ nodiscard ]] Key const & next_key( key_const_arg key ) const
    {
        auto const & next{ existing( key, "odict::ordered_map::next_key" ).second.next };
        if ( !next )
            detail::throw_key_not_found( "odict::ordered_map::next_key" );
        return *next;
    }
    [[ nodiscard ]] Key const & prev_key( key_const_arg key ) const
    {
        auto const & prev{ existing( key, "odict::ordered_map::prev_key" ).second.prev };
        if ( !prev )
            detail::throw_key_not_found( "odict::ordered_map::prev_key" );
        return *prev;
    }

    [[ nodiscard ]] Store const & store() const noexcept { return store_; }

    //--------------------------------------------------------------------------
    // Traversal
    //--------------------------------------------------------------------------
public:
    [[ nodiscard ]] iterator        begin()       { return { this, head_element() }; }
    [[ nodiscard ]] const_iterator  begin() const { return { this, head_element() }; }
    [[ nodiscard ]] const_iterator cbegin() const { return begin(); }
    [[ nodiscard ]] iterator        end()       noexcept { return { this, nullptr }; }
    [[ nodiscard ]] const_iterator  end() const noexcept { return { this, nullptr }; }
    [[ nodiscard ]] const_iterator cend() const noexcept { return end(); }

    [[ nodiscard ]] reverse_iterator        rbegin()       noexcept { return reverse_iterator      { end() }; }
    [[ nodiscard ]] const_reverse_iterator  rbegin() const noexcept { return const_reverse_iterator{ end() }; }
    [[ nodiscard ]] reverse_iterator        rend  ()                { return reverse_iterator      { begin() }; }
    [[ nodiscard ]] const_reverse_iterator  rend  () const          { return const_reverse_iterator{ begin() }; }

    [[ nodiscard ]] auto keys() const { return std::ranges::subrange{ key_iterator{ this, head_element() }, key_iterator{ this, nullptr } }; }
    [[ nodiscard ]] auto rkeys() const { return keys() | std::views::reverse; }

    [[ nodiscard ]] auto values()       { return std::ranges::subrange{ value_iterator<false>{ this, head_element() }, value_iterator<false>{ this, nullptr } }; }
    [[ nodiscard ]] auto values() const { return std::ranges::subrange{ value_iterator<true >{ this, head_element() }, value_iterator<true >{ this, nullptr } }; }
    [[ nodiscard ]] auto rvalues()       { return values() | std::views::reverse; }
    [[ nodiscard ]] auto rvalues() const { return values() | std::views::reverse; }

    [[ nodiscard ]] std::ranges::subrange<iterator>       items()       { return { begin(), end() }; }
    [[ nodiscard ]] std::ranges::subrange<const_iterator> items() const { return { begin(), end() }; }
    [[ nodiscard ]] std::ranges::subrange<reverse_iterator>       ritems()       { return { rbegin(), rend() }; }
    [[ nodiscard ]] std::ranges::subrange<const_reverse_iterator> ritems() const { return { rbegin(), rend() }; }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------
public:
    // assigns the value of an existing key in place or appends a new entry
    template <typename Value = T>
    std::pair<iterator, bool> set( key_const_arg key, Value && value )
    {
        if ( auto const element{ find_element( key ) } )
        {
            element->second.value = std::forward<Value>( value );
            return { iterator{ this, element }, false };
        }
        return { iterator{ this, &link_new( key, std::forward<Value>( value ), tail_, nil ) }, true };
    }

    T & operator[]( key_const_arg key )
    {
        if ( auto const element{ find_element( key ) } )
            return element->second.value;
        return link_new( key, T{}, tail_, nil ).second.value;
    }

    void remove( key_const_arg key )
    {
        auto const pos{ store_.find( key ) };
        if ( pos == store_.end() )
            detail::throw_key_not_found( "odict::ordered_map::remove" );
        unlink( pos->second );
        store_.erase( pos );
        validate();
    }

    iterator erase( const_iterator const position )
    {
        BOOST_ASSERT_MSG( position.element_, "Erasing the end iterator" );
        auto const pos{ store_.find( position.element_->first ) };
        BOOST_ASSERT( pos != store_.end() );
        auto const following{ successor( *pos ) };
        unlink( pos->second );
        store_.erase( pos );
        validate();
        return { this, following };
    }

    template <typename Value = T>
    T & set_default( key_const_arg key, Value && value )
    {
        if ( auto const element{ find_element( key ) } )
            return element->second.value;
        return link_new( key, std::forward<Value>( value ), tail_, nil ).second.value;
    }

    T pop( key_const_arg key )
    {
        auto const pos{ store_.find( key ) };
        if ( pos == store_.end() )
            detail::throw_key_not_found( "odict::ordered_map::pop" );
        return take( pos );
    }

    T pop( key_const_arg key, T fallback )
    {
        auto const pos{ store_.find( key ) };
        if ( pos == store_.end() )
            return fallback;
        return take( pos );
    }

    // removes and returns the last entry
    value_type pop_back()
    {
        if ( empty() )
            detail::throw_empty_structure( "odict::ordered_map::pop_back" );
        auto const pos{ store_.find( *tail_ ) };
        BOOST_ASSERT( pos != store_.end() );
        value_type last{ pos->first, std::move( pos->second.value ) };
        unlink( pos->second );
        store_.erase( pos );
        validate();
        return last;
    }

    template <std::ranges::range Items>
    void update( Items && items )
    {
        for ( auto && item : items )
        {
            auto && [ key, value ]{ item };
            set( key, value );
        }
    }

    template <std::ranges::range Items, typename Value>
    void update( Items && items, keyword_args<Value> const & named )
    {
        if ( !named.empty() )
            detail::throw_invalid_configuration( "odict::ordered_map::update" );
        update( std::forward<Items>( items ) );
    }

    void clear() noexcept
    {
        store_.clear();
        head_ = nil;
        tail_ = nil;
    }

    void swap( ordered_map & other ) noexcept
    {
        std::ranges::swap( store_, other.store_ );
        std::ranges::swap( head_ , other.head_  );
        std::ranges::swap( tail_ , other.tail_  );
    }
    friend void swap( ordered_map & left, ordered_map & right ) noexcept { left.swap( right ); }

    //--------------------------------------------------------------------------
    // Reordering
    //--------------------------------------------------------------------------
public:
    // gives the entry of old_key a new key, keeping its value and position
    void rename( key_const_arg old_key, Key new_key )
    {
        static constexpr char const where[]{ "odict::ordered_map::rename" };
        if ( old_key == new_key )
            detail::throw_key_collision( where );
        auto const pos{ store_.find( old_key ) };
        if ( pos == store_.end() )
            detail::throw_key_not_found( where );
        if ( auto const displaced{ store_.find( new_key ) }; displaced != store_.end() )
        {
            if constexpr ( options.rename == rename_policy::reject_existing )
            {
                detail::throw_key_exists( where );
            }
            else
            {
                unlink( displaced->second );
                store_.erase( displaced );
            }
        }

        element_type * renamed;
        if constexpr ( NodeHandleStore<Store> )
        {
            auto node{ store_.extract( pos ) };
            node.key() = std::move( new_key );
            auto const result{ store_.insert( std::move( node ) ) };
            BOOST_ASSERT( result.inserted );
            renamed = std::addressof( *result.position );
        }
        else
        {
            // insert first: a failed insertion leaves the old entry in place
            // (pos may be invalidated by a rehash, so the old key is looked up again)
            [[ maybe_unused ]] auto const [ position, inserted ]{ store_.try_emplace( std::move( new_key ), std::move( pos->second ) ) };
            BOOST_ASSERT( inserted );
            renamed = std::addressof( *position );
            store_.erase( store_.find( old_key ) );
        }
        hook( renamed->first, renamed->second );
        validate();
    }

    // exchanges the positions of two entries (the values stay with their keys)
    void swap( key_const_arg a, key_const_arg b )
    {
        if ( a == b )
            detail::throw_key_collision( "odict::ordered_map::swap" );
        auto & first { existing( a, "odict::ordered_map::swap" ) };
        auto & second{ existing( b, "odict::ordered_map::swap" ) };

        if      ( first .second.next == second.first ) swap_adjacent( first , second );
        else if ( second.second.next == first .first ) swap_adjacent( second, first  );
        else
        {
            std::ranges::swap( first.second.prev, second.second.prev );
            std::ranges::swap( first.second.next, second.second.next );
            hook( first .first, first .second );
            hook( second.first, second.second );
        }
        validate();
    }

    template <typename Value = T>
    iterator insert_relative( key_const_arg ref, key_const_arg key, Value && value, relative_position const position )
    {
        static constexpr char const where[]{ "odict::ordered_map::insert_relative" };
        if ( ref == key )
            detail::throw_key_collision( where );
        auto const & anchor{ existing( ref, where ) };
        if ( contains( key ) )
            detail::throw_key_exists( where );

        link_type prev;
        link_type next;
        if ( position == relative_position::before ) { prev = anchor.second.prev; next = anchor.first;       }
        else                                         { prev = anchor.first;       next = anchor.second.next; }
        return { this, &link_new( key, std::forward<Value>( value ), std::move( prev ), std::move( next ) ) };
    }
    template <typename Value = T> iterator insert_before( key_const_arg ref, key_const_arg key, Value && value ) { return insert_relative( ref, key, std::forward<Value>( value ), relative_position::before ); }
    template <typename Value = T> iterator insert_after ( key_const_arg ref, key_const_arg key, Value && value ) { return insert_relative( ref, key, std::forward<Value>( value ), relative_position::after  ); }

    template <typename Value = T>
    iterator insert_at_head( key_const_arg key, Value && value )
    {
        if ( empty() )
            return set( key, std::forward<Value>( value ) ).first;
        if ( contains( key ) )
            detail::throw_key_exists( "odict::ordered_map::insert_at_head" );
        return { this, &link_new( key, std::forward<Value>( value ), nil, head_ ) };
    }

    template <typename Value = T>
    iterator insert_at_tail( key_const_arg key, Value && value )
    {
        if ( empty() )
            return set( key, std::forward<Value>( value ) ).first;
        if ( contains( key ) )
            detail::throw_key_exists( "odict::ordered_map::insert_at_tail" );
        return { this, &link_new( key, std::forward<Value>( value ), tail_, nil ) };
    }

    // relinks an existing entry right before/after ref (a no-op if it is already there)
    void move_relative( key_const_arg ref, key_const_arg key, relative_position const position )
    {
        static constexpr char const where[]{ "odict::ordered_map::move_relative" };
        if ( ref == key )
            detail::throw_key_collision( where );
        auto const & anchor{ existing( ref, where ) };
        auto       & moved { existing( key, where ) };

        bool const in_place
        {
            ( position == relative_position::before )
                ? ( anchor.second.prev == moved.first )
                : ( anchor.second.next == moved.first )
        };
        if ( in_place )
            return;

        auto & slot{ moved.second };
        unlink( slot );
        if ( position == relative_position::before ) { slot.prev = anchor.second.prev; slot.next = anchor.first;       }
        else                                         { slot.prev = anchor.first;       slot.next = anchor.second.next; }
        hook( moved.first, slot );
        validate();
    }
    void move_before( key_const_arg ref, key_const_arg key ) { move_relative( ref, key, relative_position::before ); }
    void move_after ( key_const_arg ref, key_const_arg key ) { move_relative( ref, key, relative_position::after  ); }

    void move_to_head( key_const_arg key )
    {
        auto & moved{ existing( key, "odict::ordered_map::move_to_head" ) };
        if ( head_ == moved.first )
            return;
        unlink( moved.second );
        moved.second.prev = nil;
        moved.second.next = head_;
        hook( moved.first, moved.second );
        validate();
    }

    void move_to_tail( key_const_arg key )
    {
        auto & moved{ existing( key, "odict::ordered_map::move_to_tail" ) };
        if ( tail_ == moved.first )
            return;
        unlink( moved.second );
        moved.second.prev = tail_;
        moved.second.next = nil;
        hook( moved.first, moved.second );
        validate();
    }

    // Stable sort of the entries by proj( (key, value) ), then (optionally)
    // reversal of the resulting sequence. The order is rebuilt in place by
    // relinking the existing slots: the store is not touched and no entry is
    // removed or reinserted. The map is left untouched if the comparator or
    // the projection throws.
    template <typename Compare = std::ranges::less, typename Projection = by_value>
    void sort( Compare comp = {}, Projection proj = {}, bool const reverse = false )
    {
        std::vector<element_type *> order;
        order.reserve( size() );
        for ( auto element{ head_element() }; element; element = successor( *element ) )
            order.push_back( element );

        auto const less
        {
            [ &comp, &proj ]( element_type const * const left, element_type const * const right )
            {
                return std::invoke
                (
                    comp,
                    std::invoke( proj, const_reference{ left ->first, left ->second.value } ),
                    std::invoke( proj, const_reference{ right->first, right->second.value } )
                );
            }
        };
        boost::movelib::adaptive_sort( order.begin(), order.end(), make_trivially_copyable_predicate( less ) );
        if ( reverse )
            std::ranges::reverse( order );

        element_type * previous{ nullptr };
        for ( auto const element : order )
        {
            if ( previous )
            {
                previous->second.next = element ->first;
                element ->second.prev = previous->first;
            }
            else
            {
                head_ = element->first;
                element->second.prev = nil;
            }
            previous = element;
        }
        if ( previous )
        {
            previous->second.next = nil;
            tail_ = previous->first;
        }
        validate();
    }

    //--------------------------------------------------------------------------
    // Copies and projections
    //--------------------------------------------------------------------------
public:
    // clones every value through odict::clone (a plain copy shares what the values point to)
    [[ nodiscard ]] ordered_map deep_copy() const
    {
        ordered_map result;
        for ( auto const & [ key, value ] : *this )
            result.set( key, clone( value ) );
        return result;
    }

    template <typename Map = std::unordered_map<Key, T, boost::hash<Key>>>
    [[ nodiscard ]] Map to_plain_map() const
    {
        Map result;
        for ( auto const & [ key, value ] : *this )
            result.emplace( key, value );
        return result;
    }

    // the entries in order: feeding the result back to the range constructor rebuilds an equal map
    [[ nodiscard ]] std::vector<value_type> reduce() const
    {
        std::vector<value_type> items;
        items.reserve( size() );
        for ( auto const & [ key, value ] : *this )
            items.emplace_back( key, value );
        return items;
    }

    // order sensitive
    friend bool operator==( ordered_map const & left, ordered_map const & right )
    {
        return ( left.size() == right.size() ) && std::equal( left.begin(), left.end(), right.begin() );
    }

    //--------------------------------------------------------------------------
    // Diagnostics
    //--------------------------------------------------------------------------
public:
    // O(n) consistency check of the links (head/tail, back links, reachability of every entry)
    [[ nodiscard ]] bool verify() const
    {
        if ( empty() )
            return head_.is_nil() && tail_.is_nil();
        if ( head_.is_nil() || tail_.is_nil() )
            return false;

        size_type            count   { 0 };
        element_type const * previous{ nullptr };
        for ( auto element{ find_element( *head_ ) }; element; )
        {
            if ( ++count > size() ) // cycle
                return false;
            auto const & slot{ element->second };
            if ( !( previous ? ( slot.prev == previous->first ) : slot.prev.is_nil() ) )
                return false;
            previous = element;
            if ( slot.next.is_nil() )
                break;
            element = find_element( *slot.next );
            if ( !element ) // dangling link
                return false;
        }
        return ( count == size() ) && previous && ( tail_ == previous->first );
    }

private:
    element_type * find_element( key_const_arg key )
    {
        auto const pos{ store_.find( key ) };
        return ( pos != store_.end() ) ? std::addressof( *pos ) : nullptr;
    }
    element_type const * find_element( key_const_arg key ) const
    {
        auto const pos{ store_.find( key ) };
        return ( pos != store_.end() ) ? std::addressof( *pos ) : nullptr;
    }

    element_type & existing( key_const_arg key, char const * const where )
    {
        if ( auto const element{ find_element( key ) } )
            return *element;
        detail::throw_key_not_found( where );
    }
    element_type const & existing( key_const_arg key, char const * const where ) const
    {
        if ( auto const element{ find_element( key ) } )
            return *element;
        detail::throw_key_not_found( where );
    }

    // resolves a link which has to be valid
    element_type * element_at( Key const & key )
    {
        auto const element{ find_element( key ) };
        BOOST_ASSERT_MSG( element, "Dangling odict link" );
        return element;
    }
    element_type const * element_at( Key const & key ) const
    {
        auto const element{ find_element( key ) };
        BOOST_ASSERT_MSG( element, "Dangling odict link" );
        return element;
    }

    slot_type & slot_at( Key const & key ) { return element_at( key )->second; }

    element_type       * head_element()       { return head_ ? element_at( *head_ ) : nullptr; }
    element_type const * head_element() const { return head_ ? element_at( *head_ ) : nullptr; }

    element_type       * successor( element_type       & element )       { return element.second.next ? element_at( *element.second.next ) : nullptr; }
    element_type const * successor( element_type const & element ) const { return element.second.next ? element_at( *element.second.next ) : nullptr; }

    // points the neighbours named by the slot's own links (or head/tail) at key
    void hook( Key const & key, slot_type const & slot )
    {
        if ( slot.prev ) slot_at( *slot.prev ).next = key; else head_ = key;
        if ( slot.next ) slot_at( *slot.next ).prev = key; else tail_ = key;
    }

    // connects the neighbours of the slot to each other (the slot's own links go stale)
    void unlink( slot_type const & slot )
    {
        if ( slot.prev ) slot_at( *slot.prev ).next = slot.next; else head_ = slot.next;
        if ( slot.next ) slot_at( *slot.next ).prev = slot.prev; else tail_ = slot.prev;
    }

    template <typename Value>
    element_type & link_new( key_const_arg key, Value && value, link_type prev, link_type next )
    {
        [[ maybe_unused ]] auto const [ pos, inserted ]
        {
            store_.try_emplace( key, slot_type{ std::move( prev ), T( std::forward<Value>( value ) ), std::move( next ) } )
        };
        BOOST_ASSERT( inserted );
        auto & element{ *pos };
        hook( element.first, element.second );
        validate();
        return element;
    }

    // left immediately precedes right
    void swap_adjacent( element_type & left, element_type & right )
    {
        unlink( right.second );
        right.second.prev = left.second.prev;
        right.second.next = left.first;
        hook( right.first, right.second );
    }

    T take( typename Store::iterator const pos )
    {
        unlink( pos->second );
        T value( std::move( pos->second.value ) );
        store_.erase( pos );
        validate();
        return value;
    }

    void validate() const
    {
        if constexpr ( options.validate_links )
            BOOST_ASSERT_MSG( verify(), "Broken odict links" );
    }

private:
    Store     store_;
    link_type head_;
    link_type tail_;
}; // class ordered_map


template <typename Key, typename T, typename Store, ordered_map_options options>
struct cloner<ordered_map<Key, T, Store, options>>
{
    ordered_map<Key, T, Store, options> operator()( ordered_map<Key, T, Store, options> const & value ) const { return value.deep_copy(); }
}; // struct cloner<ordered_map>

//------------------------------------------------------------------------------
} // namespace odict
//------------------------------------------------------------------------------
