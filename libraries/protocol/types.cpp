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
#include <multitoken/protocol/types.hpp>

#include <algorithm>
#include <cctype>

namespace multitoken { namespace protocol {

   static bool is_integer_literal( const string& s )
   {
      if( s.size() > 2 && s[0] == '0' && ( s[1] == 'x' || s[1] == 'X' ) )
         return std::all_of( s.begin() + 2, s.end(), []( char c ){ return std::isxdigit( (unsigned char)c ) != 0; } );
      return !s.empty()
             && std::all_of( s.begin(), s.end(), []( char c ){ return std::isdigit( (unsigned char)c ) != 0; } );
   }

} } // multitoken::protocol

namespace fc
{
   void to_variant( const multitoken::protocol::uint256_t& var, fc::variant& vo, uint32_t max_depth )
   {
      vo = var.str();
   }

   void from_variant( const fc::variant& var, multitoken::protocol::uint256_t& vo, uint32_t max_depth )
   { try {
      if( var.is_string() )
      {
         const auto& s = var.get_string();
         FC_ASSERT( multitoken::protocol::is_integer_literal( s ), "Not an unsigned integer literal: ${s}", ("s",s) );
         // a leading zero would make the decimal literal octal
         auto literal = s;
         if( literal.size() > 1 && ( literal[1] != 'x' && literal[1] != 'X' ) )
         {
            const auto first_digit = std::min( literal.find_first_not_of( '0' ), literal.size() - 1 );
            literal.erase( 0, first_digit );
         }
         try
         {
            vo = multitoken::protocol::uint256_t( literal );
         }
         catch( const std::exception& e )
         {
            FC_THROW_EXCEPTION( fc::out_of_range_exception, "Value does not fit in 256 bits: ${s}", ("s",s)("e",e.what()) );
         }
         return;
      }
      if( var.is_uint64() )
      {
         vo = var.as_uint64();
         return;
      }
      FC_ASSERT( var.is_int64() && var.as_int64() >= 0, "Expected a non-negative integer" );
      vo = static_cast<uint64_t>( var.as_int64() );
   } FC_CAPTURE_AND_RETHROW( (var) ) }
}
