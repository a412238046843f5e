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

#include <limits>

namespace multitoken { namespace chain {

share_type database::balance_of( const token_id_type& token_id, const address& holder )const
{
   MULTITOKEN_ASSERT( !holder.is_null(), zero_source, "ZeroSource", ("token_id",token_id) );

   const auto& idx = get_index_type<token_balance_index>().indices().get<by_token_owner>();
   auto itr = idx.find( boost::make_tuple( token_id, holder ) );
   if( itr == idx.end() )
      return share_type(0);
   return itr->amount;
}

vector<share_type> database::balance_of_batch( const vector<address>& holders,
                                               const vector<token_id_type>& token_ids )const
{
   MULTITOKEN_ASSERT( holders.size() == token_ids.size(), length_mismatch, "LengthMismatch",
                      ("holders",holders.size())("token_ids",token_ids.size()) );

   vector<share_type> result;
   result.reserve( holders.size() );
   for( size_t i = 0; i < holders.size(); ++i )
      result.push_back( balance_of( token_ids[i], holders[i] ) );
   return result;
}

vector<token_balance_object> database::get_holdings( const address& holder )const
{
   const auto& idx = get_index_type<token_balance_index>().indices().get<by_owner>();
   auto range = idx.equal_range( boost::make_tuple( holder ) );

   vector<token_balance_object> result;
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( *itr );
   return result;
}

void database::add_balance( const token_id_type& token_id, const address& holder, const share_type& amount )
{ try {
   FC_ASSERT( !holder.is_null(), "The null address cannot hold a balance" );

   const auto& idx = get_index_type<token_balance_index>().indices().get<by_token_owner>();
   auto itr = idx.find( boost::make_tuple( token_id, holder ) );
   if( itr == idx.end() )
   {
      create<token_balance_object>( [&]( token_balance_object& b ) {
         b.token_id = token_id;
         b.owner = holder;
         b.amount = amount;
      });
      return;
   }

   FC_ASSERT( itr->amount <= std::numeric_limits<share_type>::max() - amount,
              "Balance overflow", ("balance",itr->amount)("amount",amount) );
   modify( *itr, [&amount]( token_balance_object& b ) {
      b.amount += amount;
   });
} FC_CAPTURE_AND_RETHROW( (token_id)(holder)(amount) ) }

void database::reduce_balance( const token_id_type& token_id, const address& holder, const share_type& amount )
{ try {
   const auto& idx = get_index_type<token_balance_index>().indices().get<by_token_owner>();
   auto itr = idx.find( boost::make_tuple( token_id, holder ) );
   const share_type available = ( itr == idx.end() ) ? share_type(0) : itr->amount;
   MULTITOKEN_ASSERT( available >= amount, insufficient_balance, "InsufficientBalance",
                      ("available",available)("amount",amount) );

   if( itr == idx.end() )
      return; // zero debited from a holder that never had an entry

   modify( *itr, [&amount]( token_balance_object& b ) {
      b.amount -= amount;
   });
} FC_CAPTURE_AND_RETHROW( (token_id)(holder)(amount) ) }

} } // multitoken::chain
