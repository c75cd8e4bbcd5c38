/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: csv_tokenizer.cpp
 * ============================================================================
 */

#include "csv_tokenizer.hpp"

#include <istream>
#include <sstream>

#include <boost/tokenizer.hpp>

namespace ducat {
namespace codec {

namespace {

// Boost TokenizerFunction for RFC 4180 fields: a quoted field may hold
// separators and line breaks, and "" inside quotes stands for one quote.
// Backslashes carry no meaning. Shaped like boost::escaped_list_separator,
// including the empty token after a trailing separator.
class CsvFieldSeparator {
public:
    explicit CsvFieldSeparator(const std::string& separators = ",")
        : sep_str(separators), last_(false) {}

    void reset() { last_ = false; }

    template <typename InputIterator, typename Token>
    bool operator()(InputIterator& next, InputIterator end, Token& tok)
    {
        bool in_quote = false;
        tok = Token();

        if (next == end)
        {
            if (last_)
            {
                last_ = false;
                return true;
            }
            return false;
        }
        last_ = false;

        for (; next != end; ++next)
        {
            if (*next == '"')
            {
                InputIterator peek = next;
                ++peek;
                if (in_quote && peek != end && *peek == '"')
                {
                    tok += '"';
                    next = peek;
                }
                else
                    in_quote = !in_quote;
            }
            else if (!in_quote && sep_str.find(*next) != std::string::npos)
            {
                ++next;
                last_ = true;
                return true;
            }
            else
                tok += *next;
        }
        return true;
    }

private:
    std::string sep_str;
    bool last_;
};

} // namespace

void CsvTokenizer::set_separators(const std::string& separators) {
    sep_str = separators;
}

std::vector<CsvRecord> CsvTokenizer::tokenize(const std::string& contents) const {
    std::istringstream in_stream(contents);
    return tokenize(in_stream);
}

std::vector<CsvRecord> CsvTokenizer::tokenize(std::istream& in_stream) const {
    typedef boost::tokenizer<CsvFieldSeparator> Tokenizer;

    CsvFieldSeparator sep(sep_str);

    std::vector<CsvRecord> records;
    std::string line;
    std::string buffer;
    std::size_t line_no = 0;
    std::size_t record_start = 0;

    bool inside_quotes(false);

    while (std::getline(in_stream, buffer))
    {
        ++line_no;
        if (!buffer.empty() && buffer.back() == '\r')
            buffer.pop_back();

        if (line.empty() && !inside_quotes)
            record_start = line_no;

        // --- deal with line breaks in quoted strings
        // A doubled quote toggles twice, so counting every quote is enough.
        for (char c : buffer)
        {
            if (c == '"')
                inside_quotes = !inside_quotes;
        }

        line.append(buffer);
        if (inside_quotes)
        {
            line.append("\n");
            continue;
        }
        // ---

        if (line.empty())
            continue;

        CsvRecord record;
        record.line = record_start;
        Tokenizer tok(line, sep);
        record.fields.assign(tok.begin(), tok.end());

        line.clear(); // clear here, next record starts fresh
        records.push_back(record);
    }

    // Unterminated quote at end of input.
    if (!line.empty())
    {
        CsvRecord record;
        record.line = record_start;
        record.error = "unterminated quoted field";
        records.push_back(record);
    }

    return records;
}

std::string CsvTokenizer::escape(const std::string& field) const {
    if (field.find_first_of(sep_str + "\"\r\n") == std::string::npos) {
        return field;
    }

    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string CsvTokenizer::join(const str_vec& fields) const {
    std::string out;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += sep_str.empty() ? ',' : sep_str[0];
        out += escape(fields[i]);
    }
    return out;
}

} // namespace codec
} // namespace ducat
