/**
 * Ducat: Double-Entry Ledger Engine - Cryptographic Module Header
 * Purpose: SHA-256 fingerprint chain over a ledger's transaction log.
 */

#ifndef DUCAT_CRYPTO_HPP
#define DUCAT_CRYPTO_HPP

#include <string>
#include "ledger.hpp"
#include "transaction.hpp"

namespace ducat {

class DucatCrypto {
public:
    static std::string generate_sha256(const std::string& str);

    /**
     * calculate_transaction_hash
     * Bonds one transaction (date, description and every leg with its side,
     * account, type and amount) to the hash of everything before it.
     */
    static std::string calculate_transaction_hash(const std::string& prev_hash, const Transaction& transaction);

    /**
     * fingerprint
     * Folds calculate_transaction_hash over the log, oldest first, starting from
     * the hash of the empty string. Ledgers with the same postings in the same
     * order share a fingerprint, whatever their names or account order.
     */
    static std::string fingerprint(const Ledger& ledger);
};

} // namespace ducat

#endif
