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

#include <multitoken/protocol/types.hpp>

#include <fc/crypto/ripemd160.hpp>

namespace multitoken { namespace protocol {

   /**
    *  @brief a 160 bit account identifier
    *
    *  Holders, operators, creators and receipt-hook targets are all addresses.
    *  The all-zero address is the null sentinel: it never holds a balance, and is
    *  the implied counterparty of mints (as source) and burns (as recipient).
    *
    *  The string form is MULTITOKEN_ADDRESS_PREFIX followed by 40 lowercase hex digits.
    */
   class address
   {
      public:
       address(){} ///< constructs the null address
       explicit address( const std::string& hex_str ); ///< parses the 0x-prefixed hex form
       explicit address( const fc::ripemd160& a ):addr(a){}

       /// derives a deterministic address from an arbitrary seed string
       static address from_seed( const std::string& seed );

       static bool is_valid( const std::string& hex_str );

       bool is_null()const { return addr == fc::ripemd160(); }

       explicit operator std::string()const;

       fc::ripemd160 addr;
   };
   inline bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
   inline bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
   inline bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

} } // namespace multitoken::protocol

namespace fc
{
   void to_variant( const multitoken::protocol::address& var,  fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var,  multitoken::protocol::address& vo, uint32_t max_depth = 1 );
}

FC_REFLECT_TYPENAME( multitoken::protocol::address )
