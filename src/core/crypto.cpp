#include "crypto.hpp"
#include "errors.hpp"
#include <openssl/evp.h> // Modern OpenSSL API
#include <iomanip>
#include <sstream>

namespace ducat {

namespace {

void append_entries(std::stringstream& data, char side, const std::vector<TransactionEntry>& entries) {
    for (const auto& entry : entries) {
        data << '|' << side
             << '|' << entry.account->name()
             << '|' << to_string(entry.account->type())
             << '|' << entry.amount.cents();
    }
}

} // namespace

std::string DucatCrypto::generate_sha256(const std::string& str) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    EVP_MD_CTX* context = EVP_MD_CTX_new();
    if (context == nullptr) {
        throw Error("OpenSSL could not allocate a digest context.");
    }

    bool ok = EVP_DigestInit_ex(context, EVP_sha256(), NULL) == 1
              && EVP_DigestUpdate(context, str.c_str(), str.size()) == 1
              && EVP_DigestFinal_ex(context, hash, &length) == 1;
    EVP_MD_CTX_free(context);

    if (!ok) {
        throw Error("OpenSSL SHA-256 digest failed.");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

std::string DucatCrypto::calculate_transaction_hash(const std::string& prev_hash, const Transaction& transaction) {
    std::stringstream data;
    data << prev_hash
         << '|' << transaction.date().to_string()
         << '|' << transaction.description();
    append_entries(data, 'D', transaction.debits());
    append_entries(data, 'C', transaction.credits());

    return generate_sha256(data.str());
}

std::string DucatCrypto::fingerprint(const Ledger& ledger) {
    std::string current_link = generate_sha256("");

    for (const auto& transaction : ledger.transactions()) {
        current_link = calculate_transaction_hash(current_link, transaction);
    }

    return current_link;
}

} // namespace ducat
