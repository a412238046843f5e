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

#include <multitoken/chain/approval_object.hpp>
#include <multitoken/chain/balance_object.hpp>
#include <multitoken/chain/evaluator.hpp>
#include <multitoken/chain/ledger_property_object.hpp>
#include <multitoken/chain/receipt_hook.hpp>
#include <multitoken/chain/token_class_object.hpp>

#include <multitoken/db/object_database.hpp>
#include <multitoken/protocol/events.hpp>
#include <multitoken/protocol/transaction.hpp>

#include <fc/signals.hpp>
#include <fc/log/logger.hpp>

#include <memory>

namespace multitoken { namespace chain {

   /**
    *   @class database
    *   @brief owns the complete ledger state and applies transactions to it
    *
    *   A database is constructed empty, initialized once with the ledger owner and
    *   then changed only by push_transaction(). Every transaction runs inside an
    *   undo session: it either commits as a whole, after which its events are
    *   published on applied_event, or leaves no trace at all.
    *
    *   The database is not synchronized. Hosts that push from several threads
    *   must serialize the calls.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * Creates the ledger-wide record. Must be called exactly once, before the
          * first transaction is pushed.
          * @param ledger_owner the only caller allowed to create token classes and mint
          */
         void initialize( const address& ledger_owner );
         bool is_initialized()const;

         /**
          * Installs the gateway used to consult programmatic recipients. Without
          * one every recipient is treated as a plain address.
          */
         void set_receipt_hook( std::shared_ptr<receipt_hook> hook );
         receipt_hook* get_receipt_hook()const { return _receipt_hook.get(); }

         //////////////////// db_getter.cpp ////////////////////

         const ledger_property_object& get_ledger_properties()const;
         const address&                get_ledger_owner()const;
         /// the id the next token_class_create_operation will be assigned
         token_id_type                 get_next_token_id()const;

         const token_class_object*     find_token_class( const token_id_type& token_id )const;
         /// throws nonexistent_token for ids that were never created
         const token_class_object&     get_token_class( const token_id_type& token_id )const;
         bool                          token_exists( const token_id_type& token_id )const;
         /// null address for ids that were never created
         address                       creator_of( const token_id_type& token_id )const;
         /// zero for ids that were never created
         share_type                    initial_supply_of( const token_id_type& token_id )const;

         bool is_approved_for_all( const address& owner, const address& operator_account )const;
         /// true when @p account is @p owner itself or one of its approved operators
         bool is_owner_or_approved( const address& owner, const address& account )const;

         //////////////////// db_init.cpp ////////////////////

         /// Reset the object graph in-memory
         void initialize_indexes();
      private:
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

         //////////////////// db_balance.cpp ////////////////////

      public:
         /**
          * @brief Retrieve the balance of a holder in a given token class
          * @param token_id token class to look up
          * @param holder address whose balance should be retrieved, must not be null
          * @return the balance, zero when the holder was never credited
          */
         share_type balance_of( const token_id_type& token_id, const address& holder )const;

         /**
          * @brief Retrieve several balances at once, pairing holders and token ids by position
          *
          * Fails as a whole with length_mismatch when the lists differ in length, or with
          * zero_source when any holder is null.
          */
         vector<share_type> balance_of_batch( const vector<address>& holders,
                                              const vector<token_id_type>& token_ids )const;

         /// Every balance entry of @p holder, ordered by token id
         vector<token_balance_object> get_holdings( const address& holder )const;

         /**
          * @brief Credit @p amount of a token class to @p holder, creating the entry on first use
          */
         void add_balance( const token_id_type& token_id, const address& holder, const share_type& amount );

         /**
          * @brief Debit @p amount of a token class from @p holder
          *
          * Callers check sufficiency first and report the failure kind that fits the
          * operation. A debit beyond the balance still fails here with
          * insufficient_balance and never underflows.
          */
         void reduce_balance( const token_id_type& token_id, const address& holder, const share_type& amount );

         //////////////////// db_apply.cpp ////////////////////

         /**
          * Validates and applies every operation of @p trx on behalf of @p caller.
          * Either all operations take effect and their events are published, or
          * the ledger is left exactly as it was and the failure is rethrown.
          *
          * Transactions do not nest. Calling this from a receipt hook while another
          * transaction is being applied fails, and the receipt hook reports it as a
          * panic of the recipient. applied_event listeners run after the
          * transaction is done and may push new ones.
          */
         processed_transaction push_transaction( const transaction& trx, const address& caller );

         /// push_transaction() for a transaction holding just @p op
         operation_result push_operation( const operation& op, const address& caller );

         /**
          * This method is used to track applied events during the evaluation of a
          * transaction. They are published once the transaction commits.
          */
         void push_event( const ledger_event& e );

         /**
          *  Emitted once per event of every committed transaction, in the order the
          *  events were raised.
          */
         fc::signal<void(const ledger_event&)> applied_event;

      protected:
         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

      private:
         processed_transaction _apply_transaction( const transaction& trx, const address& caller );

         //////////////////// db_notify.cpp ////////////////////

         void notify_applied_events();

         vector< unique_ptr<op_evaluator> >  _operation_evaluators;
         vector< ledger_event >              _pending_events;
         std::shared_ptr<receipt_hook>       _receipt_hook;
         bool                                _applying_transaction = false;
   };

} }
