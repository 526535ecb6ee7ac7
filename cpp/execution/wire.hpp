#ifndef EXECUTION_WIRE_HPP
#define EXECUTION_WIRE_HPP

#include "capnp/execution.capnp.h"
#include "execution/request.hpp"
#include "execution/result.hpp"

namespace execution {

// Conversions between the in-memory types and their Cap'n Proto messages.

RawRequest RequestFromCapnp(capnproto::ExecutionRequest::Reader reader);
void RequestToCapnp(const RawRequest& request,
                    capnproto::ExecutionRequest::Builder builder);

ValidationError ErrorFromCapnp(capnproto::ValidationError::Reader reader);
void ErrorToCapnp(const ValidationError& error,
                  capnproto::ValidationError::Builder builder);

ExecutionResult ResultFromCapnp(capnproto::ExecutionResult::Reader reader);
void ResultToCapnp(const ExecutionResult& result,
                   capnproto::ExecutionResult::Builder builder);

}  // namespace execution

#endif
