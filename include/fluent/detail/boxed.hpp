////////////////////////////////////////////////////////////////////////////////
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

#include <boost/assert.hpp>

#include <memory>
#include <utility>
//------------------------------------------------------------------------------
namespace fluent::detail
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// boxed<T>
// Heap allocated, deep copied value holder for recursive members (T may be
// incomplete at the point of declaration). A moved-from box is empty and may
// only be destroyed or assigned to.
////////////////////////////////////////////////////////////////////////////////

template <typename T>
class boxed
{
public:
    boxed( T const & v ) : p_{ std::make_unique<T>( v ) } {}
    boxed( T &&      v ) : p_{ std::make_unique<T>( std::move( v ) ) } {}

    boxed( boxed const & other ) : p_{ std::make_unique<T>( *other ) } {}
    boxed( boxed && ) noexcept = default;

    boxed & operator=( boxed const & other ) { p_ = std::make_unique<T>( *other ); return *this; }
    boxed & operator=( boxed && ) noexcept = default;

    ~boxed() = default;

    T       & operator* ()       noexcept { BOOST_ASSERT( p_ ); return *p_; }
    T const & operator* () const noexcept { BOOST_ASSERT( p_ ); return *p_; }
    T       * operator->()       noexcept { BOOST_ASSERT( p_ ); return  p_.get(); }
    T const * operator->() const noexcept { BOOST_ASSERT( p_ ); return  p_.get(); }

private:
    std::unique_ptr<T> p_;
}; // class boxed

//------------------------------------------------------------------------------
} // namespace fluent::detail
//------------------------------------------------------------------------------
