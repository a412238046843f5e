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
#include <multitoken/protocol/exceptions.hpp>

namespace multitoken { namespace protocol {

FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

FC_IMPLEMENT_DERIVED_EXCEPTION( operation_validate_exception, protocol_exception, 4010000,
                                "operation validation exception" )
FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_exception,        protocol_exception, 4020000,
                                "transaction validation exception" )

FC_IMPLEMENT_DERIVED_EXCEPTION( zero_recipient,  operation_validate_exception, 4010001,
                                "recipient is the null address" )
FC_IMPLEMENT_DERIVED_EXCEPTION( zero_source,     operation_validate_exception, 4010002,
                                "source is the null address" )
FC_IMPLEMENT_DERIVED_EXCEPTION( self_approval,   operation_validate_exception, 4010003,
                                "owner cannot approve itself as operator" )
FC_IMPLEMENT_DERIVED_EXCEPTION( length_mismatch, operation_validate_exception, 4010004,
                                "token id and amount lists differ in length" )

FC_IMPLEMENT_DERIVED_EXCEPTION( empty_transaction, transaction_exception, 4020001,
                                "transaction contains no operations" )

} } // multitoken::protocol
