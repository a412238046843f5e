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
#include <multitoken/app/ledger_api.hpp>

#include <fc/log/logger.hpp>

namespace multitoken { namespace app {

ledger_api::ledger_api( chain::database& db ):_db(db){}

share_type ledger_api::balance_of( const token_id_type& token_id, const address& holder )const
{
   return _db.balance_of( token_id, holder );
}

vector<share_type> ledger_api::balance_of_batch( const vector<address>& holders,
                                                 const vector<token_id_type>& token_ids )const
{
   return _db.balance_of_batch( holders, token_ids );
}

bool ledger_api::is_approved_for_all( const address& owner, const address& operator_account )const
{
   return _db.is_approved_for_all( owner, operator_account );
}

bool ledger_api::exists( const token_id_type& token_id )const
{
   return _db.token_exists( token_id );
}

address ledger_api::creator_of( const token_id_type& token_id )const
{
   return _db.creator_of( token_id );
}

share_type ledger_api::initial_supply_of( const token_id_type& token_id )const
{
   return _db.initial_supply_of( token_id );
}

token_id_type ledger_api::get_next_token_id()const
{
   return _db.get_next_token_id();
}

void ledger_api::safe_transfer_from( const address& caller, const address& from, const address& to,
                                     const token_id_type& token_id, const share_type& amount,
                                     const bytes& data )
{
   transfer_operation op;
   op.from = from;
   op.to = to;
   op.token_id = token_id;
   op.amount = amount;
   op.data = data;
   _db.push_operation( op, caller );
}

void ledger_api::safe_batch_transfer_from( const address& caller, const address& from, const address& to,
                                           const vector<token_id_type>& token_ids,
                                           const vector<share_type>& amounts,
                                           const bytes& data )
{
   transfer_batch_operation op;
   op.from = from;
   op.to = to;
   op.token_ids = token_ids;
   op.amounts = amounts;
   op.data = data;
   _db.push_operation( op, caller );
}

void ledger_api::set_approval_for_all( const address& caller, const address& operator_account, bool approved )
{
   set_approval_for_all_operation op;
   op.owner = caller;
   op.operator_account = operator_account;
   op.approved = approved;
   _db.push_operation( op, caller );
}

token_id_type ledger_api::create_token_class( const address& caller, const address& creator,
                                              const share_type& initial_supply, const string& uri,
                                              const address& initial_holder, bool atomic )
{
   token_class_create_operation create_op;
   create_op.creator = creator;
   create_op.initial_supply = initial_supply;
   create_op.uri = uri;

   // the mint targets the id the create is about to be assigned
   mint_operation mint_op;
   mint_op.to = initial_holder;
   mint_op.token_id = _db.get_next_token_id();
   mint_op.amount = initial_supply;

   if( atomic )
   {
      transaction trx;
      trx.operations.push_back( create_op );
      trx.operations.push_back( mint_op );
      auto processed = _db.push_transaction( trx, caller );
      return processed.operation_results.front().get<token_id_type>();
   }

   auto result = _db.push_operation( create_op, caller ).get<token_id_type>();
   try
   {
      _db.push_operation( mint_op, caller );
   }
   catch( fc::exception& e )
   {
      wlog( "Token class ${token_id} was created but its initial mint failed", ("token_id",result) );
      FC_RETHROW_EXCEPTION( e, warn, "Token class ${token_id} was created but its initial mint failed",
                            ("token_id",result) );
   }
   return result;
}

void ledger_api::mint( const address& caller, const address& to, const token_id_type& token_id,
                       const share_type& amount, const bytes& data )
{
   mint_operation op;
   op.to = to;
   op.token_id = token_id;
   op.amount = amount;
   op.data = data;
   _db.push_operation( op, caller );
}

void ledger_api::mint_batch( const address& caller, const address& to, const vector<token_id_type>& token_ids,
                             const vector<share_type>& amounts, const bytes& data )
{
   mint_batch_operation op;
   op.to = to;
   op.token_ids = token_ids;
   op.amounts = amounts;
   op.data = data;
   _db.push_operation( op, caller );
}

void ledger_api::burn( const address& caller, const address& owner, const token_id_type& token_id,
                       const share_type& amount )
{
   burn_operation op;
   op.owner = owner;
   op.token_id = token_id;
   op.amount = amount;
   _db.push_operation( op, caller );
}

void ledger_api::burn_batch( const address& caller, const address& owner, const vector<token_id_type>& token_ids,
                             const vector<share_type>& amounts )
{
   burn_batch_operation op;
   op.owner = owner;
   op.token_ids = token_ids;
   op.amounts = amounts;
   _db.push_operation( op, caller );
}

} } // multitoken::app
