/**
 * @file flarb_errors.hpp
 * @brief Failure conditions raised by the executor and its host.
 *
 * Every one of these is a local, synchronous failure: the operation that
 * raised it is abandoned and its ledger transaction rolled back.
 * Nothing is retried.
 */

#pragma once

#include "flarb_types.hpp"
#include <stdexcept>

namespace flarb {
namespace model {

/**
 * @brief base for the conditions reported by the executor entry points
 */
struct ExecutorError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// non-owner calling a privileged entry point
struct Unauthorized: ExecutorError
{
    using ExecutorError::ExecutorError;
};

/// ownership can not be handed to the zero address
struct InvalidOwner: ExecutorError
{
    using ExecutorError::ExecutorError;
};

/// loan callback invoked by anyone other than the resolved lending pool
struct UntrustedCaller: ExecutorError
{
    using ExecutorError::ExecutorError;
};

/// decoded path does not start with the borrowed asset
struct PathMismatch: ExecutorError
{
    using ExecutorError::ExecutorError;
};

/// callback delivered something other than one asset/amount/premium
struct MalformedLoan: ExecutorError
{
    using ExecutorError::ExecutorError;
};

/// a second invocation attempted while one is in flight
struct ReentrancyError: ExecutorError
{
    using ExecutorError::ExecutorError;
};

/// withdrawal of an asset this executor does not hold
struct NothingToWithdraw: ExecutorError
{
    using ExecutorError::ExecutorError;
};

/// the two legs did not yield a strictly positive profit
struct UnprofitableArbitrage: ExecutorError
{
    UnprofitableArbitrage(const std::string &msg, const balance_t &profit_)
        : ExecutorError(msg)
        , profit(profit_)
    {}

    const balance_t profit;
};


/// insufficient balance or allowance on the ledger
struct TransferError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// transaction misuse (out of order commit, commit after rollback...)
struct TransactionError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// the lending authority refused or could not complete a loan
struct LendingError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// configuration values do not make sense together
struct ConfigConsistencyError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};


} // namespace model
} // namespace flarb
