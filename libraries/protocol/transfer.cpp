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
#include <multitoken/protocol/transfer.hpp>

namespace multitoken { namespace protocol {

void transfer_operation::validate()const
{
   MULTITOKEN_ASSERT( !to.is_null(), zero_recipient, "ZeroRecipient", ("to",to) );
   MULTITOKEN_ASSERT( !from.is_null(), zero_source, "ZeroSource", ("from",from) );
}

void transfer_batch_operation::validate()const
{
   MULTITOKEN_ASSERT( !to.is_null(), zero_recipient, "ZeroRecipient", ("to",to) );
   MULTITOKEN_ASSERT( !from.is_null(), zero_source, "ZeroSource", ("from",from) );
   MULTITOKEN_ASSERT( token_ids.size() == amounts.size(), length_mismatch, "LengthMismatch",
                      ("token_ids",token_ids.size())("amounts",amounts.size()) );
}

} } // multitoken::protocol

MULTITOKEN_IMPLEMENT_EXTERNAL_SERIALIZATION( multitoken::protocol::transfer_operation )
MULTITOKEN_IMPLEMENT_EXTERNAL_SERIALIZATION( multitoken::protocol::transfer_batch_operation )
