/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "MiParser.h"
#include <cctype>

namespace {

/**
 * @brief Cursor over one MI line
 *
 * Every parse method returns false on malformed input and leaves the
 * position undefined; callers abandon the line in that case.
 */
class MiCursor {
public:
    explicit MiCursor(const std::string& line) : line_(line), pos_(0) {}

    bool atEnd() const { return pos_ >= line_.size(); }
    char peek() const { return atEnd() ? '\0' : line_[pos_]; }

    bool consume(char c) {
        if (peek() != c) {
            return false;
        }
        ++pos_;
        return true;
    }

    std::string parseToken() {
        size_t start = pos_;
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(line_[pos_]))) {
            ++pos_;
        }
        return line_.substr(start, pos_ - start);
    }

    std::string parseIdentifier() {
        size_t start = pos_;
        while (!atEnd()) {
            char c = line_[pos_];
            if (c == '=' || c == ',' || c == '{' || c == '}' || c == '[' || c == ']' ||
                c == '"') {
                break;
            }
            ++pos_;
        }
        return line_.substr(start, pos_ - start);
    }

    bool parseCString(std::string& out) {
        if (!consume('"')) {
            return false;
        }
        out.clear();
        while (!atEnd()) {
            char c = line_[pos_++];
            if (c == '"') {
                return true;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (atEnd()) {
                return false;
            }
            char e = line_[pos_++];
            switch (e) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                case 'e': out += '\x1b'; break;
                case 'a': out += '\a'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'v': out += '\v'; break;
                default:
                    if (e >= '0' && e <= '7') {
                        // Up to three octal digits
                        int value = e - '0';
                        for (int i = 0; i < 2 && peek() >= '0' && peek() <= '7'; ++i) {
                            value = value * 8 + (line_[pos_++] - '0');
                        }
                        out += static_cast<char>(value);
                    } else {
                        out += e;
                    }
                    break;
            }
        }
        return false;
    }

    bool parseValue(MiValue& value) {
        char c = peek();
        if (c == '"') {
            value.kind = MiValue::Kind::Const;
            return parseCString(value.text);
        }
        if (c == '{') {
            ++pos_;
            value.kind = MiValue::Kind::Tuple;
            return parseItems(value, '}');
        }
        if (c == '[') {
            ++pos_;
            value.kind = MiValue::Kind::List;
            return parseItems(value, ']');
        }
        return false;
    }

    // Comma separated results (or bare values inside lists) up to the closing bracket
    bool parseItems(MiValue& container, char closing) {
        if (consume(closing)) {
            return true;
        }
        while (true) {
            std::string key;
            if (peek() != '"' && peek() != '{' && peek() != '[') {
                key = parseIdentifier();
                if (!consume('=')) {
                    return false;
                }
            }
            MiValue child;
            if (!parseValue(child)) {
                return false;
            }
            container.keys.push_back(key);
            container.values.push_back(std::move(child));

            if (consume(closing)) {
                return true;
            }
            if (!consume(',')) {
                return false;
            }
        }
    }

    bool parseResults(MiValue& tuple) {
        tuple.kind = MiValue::Kind::Tuple;
        while (consume(',')) {
            std::string key = parseIdentifier();
            if (!consume('=')) {
                return false;
            }
            MiValue child;
            if (!parseValue(child)) {
                return false;
            }
            tuple.keys.push_back(key);
            tuple.values.push_back(std::move(child));
        }
        return atEnd();
    }

private:
    const std::string& line_;
    size_t pos_;
};

}  // namespace

const MiValue* MiValue::find(const std::string& key) const {
    for (size_t i = 0; i < keys.size(); ++i) {
        if (keys[i] == key) {
            return &values[i];
        }
    }
    return nullptr;
}

std::string MiValue::get(const std::string& key) const {
    const MiValue* child = find(key);
    if (!child || child->kind != Kind::Const) {
        return "";
    }
    return child->text;
}

MiRecord MiParser::parseLine(const std::string& rawLine) {
    MiRecord record;

    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    if (line == "(gdb)") {
        record.type = MiRecord::Type::Prompt;
        return record;
    }

    MiCursor cursor(line);
    std::string token = cursor.parseToken();

    char prefix = cursor.peek();
    switch (prefix) {
        case '~':
        case '@':
        case '&': {
            cursor.consume(prefix);
            std::string text;
            if (!cursor.parseCString(text) || !cursor.atEnd()) {
                return record;
            }
            record.type = prefix == '~'   ? MiRecord::Type::Console
                          : prefix == '@' ? MiRecord::Type::Target
                                          : MiRecord::Type::Log;
            record.stream_text = std::move(text);
            return record;
        }
        case '^':
        case '*':
        case '+':
        case '=': {
            cursor.consume(prefix);
            std::string resultClass = cursor.parseIdentifier();
            MiValue results;
            if (resultClass.empty() || !cursor.parseResults(results)) {
                return record;
            }
            record.type = prefix == '^'   ? MiRecord::Type::Result
                          : prefix == '*' ? MiRecord::Type::Exec
                          : prefix == '+' ? MiRecord::Type::Status
                                          : MiRecord::Type::Notify;
            record.token = std::move(token);
            record.result_class = std::move(resultClass);
            record.results = std::move(results);
            return record;
        }
        default:
            return record;
    }
}

std::string MiParser::quote(const std::string& text) {
    std::string quoted = "\"";
    for (char c : text) {
        switch (c) {
            case '"': quoted += "\\\""; break;
            case '\\': quoted += "\\\\"; break;
            case '\n': quoted += "\\n"; break;
            case '\t': quoted += "\\t"; break;
            default: quoted += c; break;
        }
    }
    quoted += '"';
    return quoted;
}
