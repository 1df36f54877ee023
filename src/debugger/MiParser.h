/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>
#include <vector>

/**
 * @file MiParser.h
 * @brief Parser for GDB machine interface (MI) output lines
 *
 * Only the subset of the MI grammar that GDB emits is accepted:
 * @code
 * output-line  := [token] record | "(gdb)"
 * record       := ("^" | "*" | "+" | "=") class ("," result)*
 *               | ("~" | "@" | "&") c-string
 * result       := variable "=" value
 * value        := c-string | "{" [result ("," result)*] "}"
 *               | "[" [(value | result) ("," ...)*] "]"
 * @endcode
 */

/**
 * @brief MI value: a constant string, a tuple or a list
 *
 * Tuples and lists share one representation: keys[i] names values[i], and
 * list elements that are plain values carry an empty key.
 */
struct MiValue {
    enum class Kind { Const, Tuple, List };

    Kind kind = Kind::Const;
    std::string text;  ///< Decoded string for Const values
    std::vector<std::string> keys;
    std::vector<MiValue> values;

    /**
     * @brief Child value by key, or nullptr if absent
     */
    const MiValue* find(const std::string& key) const;

    /**
     * @brief Text of a constant child, or an empty string if absent
     */
    std::string get(const std::string& key) const;
};

/**
 * @brief One parsed MI output line
 */
struct MiRecord {
    enum class Type {
        Result,   ///< ^done, ^error, ^running, ^connected, ^exit
        Exec,     ///< *stopped, *running
        Status,   ///< +download
        Notify,   ///< =thread-group-added, ...
        Console,  ///< ~"text"
        Target,   ///< @"text"
        Log,      ///< &"text"
        Prompt,   ///< (gdb)
        Unknown   ///< anything else (program output, blank lines)
    };

    Type type = Type::Unknown;
    std::string token;         ///< Numeric command token echoed by GDB, if any
    std::string result_class;  ///< "done", "error", ... for async and result records
    std::string stream_text;   ///< Decoded payload of stream records
    MiValue results;           ///< Tuple of the record's results
};

/**
 * @class MiParser
 * @brief Stateless MI line parser and command quoting helpers
 */
class MiParser {
public:
    /**
     * @brief Parse one line of MI output (without the trailing newline)
     *
     * Malformed records yield Type::Unknown rather than an exception because
     * GDB interleaves MI with unstructured program output.
     */
    static MiRecord parseLine(const std::string& line);

    /**
     * @brief Quote a string as an MI c-string argument
     * @return e.g. info "x" becomes "info \"x\""
     */
    static std::string quote(const std::string& text);
};
