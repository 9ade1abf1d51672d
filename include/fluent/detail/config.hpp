////////////////////////////////////////////////////////////////////////////////
/// Compile-time configuration for the fluent collection library.
///
/// All macros may be predefined (e.g. on the compiler command line) to
/// override the defaults below.
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

#include <boost/config.hpp>
//------------------------------------------------------------------------------

// Indentation (in spaces) used by to_json() when pretty printing is requested
// without an explicit indent.
#ifndef FLUENT_DEFAULT_JSON_INDENT
#   define FLUENT_DEFAULT_JSON_INDENT 4
#endif

// Class version written into the serialize() envelope. deserialize() rejects
// envelopes written by a newer version.
#ifndef FLUENT_SERIALIZATION_VERSION
#   define FLUENT_SERIALIZATION_VERSION 1
#endif

//------------------------------------------------------------------------------
