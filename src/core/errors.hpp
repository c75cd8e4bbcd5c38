/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Exception taxonomy for the engine. Everything thrown on purpose derives
 * from ducat::Error so callers can catch the engine's failures in one place.
 * ============================================================================
 */

#ifndef DUCAT_ERRORS_HPP
#define DUCAT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ducat {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Debits and credits do not net to zero, or one side of the entry is empty.
class UnbalancedTransactionError : public Error {
public:
    using Error::Error;
};

// An imported record is missing a field or carries an unparseable value.
class MalformedRecordError : public Error {
public:
    using Error::Error;
};

// account_type in a JSON record is not one of the five categories.
class UnknownAccountTypeError : public Error {
public:
    using Error::Error;
};

// A sum or balance would leave the range of money_cents.
class AmountOverflowError : public Error {
public:
    using Error::Error;
};

class DuplicateAccountError : public Error {
public:
    using Error::Error;
};

// A transaction line references an account this ledger does not own.
class UnknownAccountError : public Error {
public:
    using Error::Error;
};

// Fatal for a whole import call: missing file, bad container, bad header.
class ImportError : public Error {
public:
    using Error::Error;
};

class ExportError : public Error {
public:
    using Error::Error;
};

} // namespace ducat

#endif // DUCAT_ERRORS_HPP
