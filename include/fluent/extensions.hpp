////////////////////////////////////////////////////////////////////////////////
///
/// \file extensions.hpp
/// --------------------
///
/// Named operations added to collections at run time.
///
/// An extension is a closure taking the receiving collection (nullptr for
/// static calls) and the call arguments. Registration is expected to happen
/// during start-up; the registry is not synchronized. Registering an existing
/// name replaces the previous closure, there is no removal.
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

#include <fluent/value/value.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

using extension = std::function<value( collection * self, std::vector<value> const & arguments )>;

class extension_registry
{
public:
    void add( std::string name, extension );

    [[ nodiscard ]] bool contains( std::string_view name ) const;

    // throws unknown_operation for unregistered names
    [[ nodiscard ]] extension const & get( std::string_view name ) const;

    [[ nodiscard ]] std::size_t size() const noexcept { return extensions_.size(); }

    // the registry shared by all collections
    [[ nodiscard ]] static extension_registry & global() noexcept;

private:
    std::map<std::string, extension, std::less<>> extensions_;
}; // class extension_registry

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
