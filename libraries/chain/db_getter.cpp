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

#include <multitoken/chain/database.hpp>
#include <multitoken/chain/exceptions.hpp>

namespace multitoken { namespace chain {

const ledger_property_object& database::get_ledger_properties()const
{
   const auto* props = find( ledger_property_id_type() );
   MULTITOKEN_ASSERT( props != nullptr, ledger_not_initialized, "LedgerNotInitialized" );
   return *props;
}

const address& database::get_ledger_owner()const
{
   return get_ledger_properties().ledger_owner;
}

token_id_type database::get_next_token_id()const
{
   return get_ledger_properties().next_token_id;
}

const token_class_object* database::find_token_class( const token_id_type& token_id )const
{
   const auto& idx = get_index_type<token_class_index>().indices().get<by_token_id>();
   auto itr = idx.find( token_id );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const token_class_object& database::get_token_class( const token_id_type& token_id )const
{
   const auto* token_class = find_token_class( token_id );
   MULTITOKEN_ASSERT( token_class != nullptr, nonexistent_token, "NonexistentAsset", ("token_id",token_id) );
   return *token_class;
}

bool database::token_exists( const token_id_type& token_id )const
{
   return find_token_class( token_id ) != nullptr;
}

address database::creator_of( const token_id_type& token_id )const
{
   const auto* token_class = find_token_class( token_id );
   return token_class ? token_class->creator : address();
}

share_type database::initial_supply_of( const token_id_type& token_id )const
{
   const auto* token_class = find_token_class( token_id );
   return token_class ? token_class->initial_supply : share_type(0);
}

bool database::is_approved_for_all( const address& owner, const address& operator_account )const
{
   const auto& idx = get_index_type<operator_approval_index>().indices().get<by_owner_operator>();
   auto itr = idx.find( boost::make_tuple( owner, operator_account ) );
   return itr != idx.end() && itr->approved;
}

bool database::is_owner_or_approved( const address& owner, const address& account )const
{
   return account == owner || is_approved_for_all( owner, account );
}

} } // multitoken::chain
