#pragma once

#include <lockbox/schema/primitives.hpp>
#include <functional>

namespace lockbox::execution {

/// Currency rail used to pay out a withdrawal. Returns false when the
/// transfer did not happen; the caller then rolls the withdrawal back.
using funds_transfer_t =
    std::function<bool(const lockbox::schema::account_id_t& recipient,
                       const lockbox::schema::amount_t& amount)>;

}  // namespace lockbox::execution
