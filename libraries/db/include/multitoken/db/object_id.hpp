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
#include <fc/exception/exception.hpp>
#include <fc/string.hpp>
#include <fc/variant.hpp>

#include <functional>
#include <string>

namespace multitoken { namespace db {

   /**
    * Packs a space id, a type id and a 48 bit instance number into one 64 bit value.
    * Every object in the database is addressed by one of these; the string form is
    * "space.type.instance".
    */
   struct object_id_type
   {
      static constexpr uint8_t  instance_bits = 48;
      static constexpr uint8_t  space_shift   = 56;
      static constexpr uint64_t max_instance  = 0x0000ffffffffffff;

      object_id_type() = default;
      object_id_type( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i <= max_instance, "instance overflow", ("instance",i) );
         number = (uint64_t(s) << space_shift) | (uint64_t(t) << instance_bits) | i;
      }

      uint8_t  space()const      { return uint8_t( number >> space_shift ); }
      uint8_t  type()const       { return uint8_t( number >> instance_bits ); }
      uint64_t instance()const   { return number & max_instance; }

      /// the id of the first object of the same space and type
      object_id_type first_of_type()const { return object_id_type( space(), type(), 0 ); }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }

      explicit operator std::string()const
      {
         return fc::to_string(space()) + "." + fc::to_string(type()) + "." + fc::to_string(instance());
      }

      uint64_t number = 0;
   };

   class object;

   /// Maps a typed id to the object class stored under it, see MULTITOKEN_MAP_OBJECT_ID_TO_TYPE
   template<typename ObjectID>
   struct object_downcast { using type = object; };

#define MULTITOKEN_MAP_OBJECT_ID_TO_TYPE(OBJECT) \
   namespace multitoken { namespace db { \
   template<> \
   struct object_downcast<multitoken::db::object_id<OBJECT::space_id, OBJECT::type_id>> { using type = OBJECT; }; \
   } }

   template<typename ObjectID>
   using object_downcast_t = typename object_downcast<ObjectID>::type;

   /// An object id whose space and type are known at compile time
   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t space_id = SpaceID;
      static constexpr uint8_t type_id  = TypeID;

      object_id() = default;

      explicit operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance ); }

      uint64_t instance = 0;
   };

} } // multitoken::db

namespace fc {

 inline void to_variant( const multitoken::db::object_id_type& var, fc::variant& vo, uint32_t max_depth = 1 )
 {
    vo = std::string( var );
 }

 inline void from_variant( const fc::variant& var, multitoken::db::object_id_type& vo, uint32_t max_depth = 1 )
 { try {
    const auto s = var.get_string();
    const auto first_dot = s.find( '.' );
    FC_ASSERT( first_dot != std::string::npos, "Malformed object id" );
    const auto second_dot = s.find( '.', first_dot + 1 );
    FC_ASSERT( second_dot != std::string::npos, "Malformed object id" );
    const auto space = fc::to_uint64( s.substr( 0, first_dot ) );
    const auto type = fc::to_uint64( s.substr( first_dot + 1, second_dot - first_dot - 1 ) );
    FC_ASSERT( space <= 0xff && type <= 0xff, "Object space or type out of range" );
    vo = multitoken::db::object_id_type( uint8_t(space), uint8_t(type),
                                         fc::to_uint64( s.substr( second_dot + 1 ) ) );
 } FC_CAPTURE_AND_RETHROW( (var) ) }

} // namespace fc

namespace std {
   template <> struct hash<multitoken::db::object_id_type>
   {
      size_t operator()( const multitoken::db::object_id_type& x )const
      {
         return std::hash<uint64_t>()( x.number );
      }
   };
}
