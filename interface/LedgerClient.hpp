#pragma once

#include "../ledger/Block.h"
#include "../lib/ResultOrError.hpp"

namespace lw {
namespace iii {

/**
 * Interface for a ledger client as consumed by the block watcher.
 * Implementations talk to a ledger node (or fake one in tests).
 */
class LedgerClient {
public:
    struct Error : RoeErrorBase {
        using RoeErrorBase::RoeErrorBase;
    };

    template <typename T> using Roe = ResultOrError<T, Error>;

    virtual ~LedgerClient() = default;

    // Current head of the chain; error when the ledger is unavailable
    virtual Roe<Block> fetchLatestBlock() = 0;

    // Locally cached chain parameters, never fails
    virtual ChainConfig getConfig() const = 0;
};

} // namespace iii
} // namespace lw
