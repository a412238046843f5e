/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <fc/container/flat.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/static_variant.hpp>
#include <fc/string.hpp>

#include <multitoken/protocol/config.hpp>

#define MULTITOKEN_EXTERNAL_SERIALIZATION(ext, type) \
namespace fc { \
   ext template void from_variant( const variant& v, type& vo, uint32_t max_depth ); \
   ext template void to_variant( const type& v, variant& vo, uint32_t max_depth ); \
}
#define MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION(type) MULTITOKEN_EXTERNAL_SERIALIZATION(extern, type)
#define MULTITOKEN_IMPLEMENT_EXTERNAL_SERIALIZATION(type) MULTITOKEN_EXTERNAL_SERIALIZATION(/*not extern*/, type)

namespace multitoken { namespace protocol {

using std::map;
using std::vector;
using std::string;
using std::shared_ptr;
using std::unique_ptr;
using std::pair;

using fc::variant;
using fc::optional;
using fc::static_variant;
using fc::flat_set;

/**
 * 256 bit unsigned integer. Arithmetic that leaves the representable range throws
 * std::overflow_error or std::range_error instead of wrapping around.
 */
using uint256_t = boost::multiprecision::checked_uint256_t;

/// Quantity of a token class held by, moved between, minted to or burned from a holder
using share_type = uint256_t;
/// Identifier of a token class
using token_id_type = uint256_t;

/// Opaque payload forwarded to receipt hooks
using bytes = vector<char>;

} } // multitoken::protocol

namespace fc {
   /// Written as a decimal string. Read from a decimal or 0x-prefixed hex string, or a non-negative JSON integer.
   void to_variant( const multitoken::protocol::uint256_t& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, multitoken::protocol::uint256_t& vo, uint32_t max_depth = 1 );
}

FC_REFLECT_TYPENAME( multitoken::protocol::uint256_t )
