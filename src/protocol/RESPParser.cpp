#include "RESPParser.hpp"

namespace {

// Length headers ("*3", "$12") never get anywhere near this.
constexpr std::size_t MAX_HEADER_LINE = 64;

// Simple strings and errors in replies.
constexpr std::size_t MAX_REPLY_LINE = 64 * 1024;

constexpr int MAX_REPLY_DEPTH = 32;

std::string describeByte(char c) {
    if (c >= 32 && c < 127)
        return std::string("'") + c + "'";
    return "byte " + std::to_string(static_cast<unsigned char>(c));
}

} // namespace

bool RESPParser::parseInteger(std::string_view s, long long& out) {
    if (s.empty())
        return false;

    std::size_t i = 0;
    bool negative = false;
    if (s[0] == '-') {
        negative = true;
        i = 1;
        if (s.size() == 1)
            return false;
    }

    unsigned long long value = 0;
    for (; i < s.size(); i++) {
        if (s[i] < '0' || s[i] > '9')
            return false;
        value = value * 10 + static_cast<unsigned long long>(s[i] - '0');
        if (value > 9223372036854775807ULL)
            return false;
    }

    out = negative ? -static_cast<long long>(value) : static_cast<long long>(value);
    return true;
}

ParseStatus RESPParser::readLine(std::string_view data, std::size_t& pos,
                                 std::string_view& line, std::size_t max_len,
                                 std::string& err) {
    std::size_t end = data.find("\r\n", pos);
    if (end == std::string_view::npos) {
        if (data.size() - pos > max_len) {
            err = "line too long";
            return ParseStatus::ERROR;
        }
        return ParseStatus::INCOMPLETE;
    }

    if (end - pos > max_len) {
        err = "line too long";
        return ParseStatus::ERROR;
    }

    line = data.substr(pos, end - pos);
    pos = end + 2;
    return ParseStatus::OK;
}

ParseStatus RESPParser::parseCommand(std::string_view data,
                                     std::vector<std::string>& args,
                                     std::size_t& consumed,
                                     std::string& err) {
    args.clear();
    consumed = 0;

    if (data.empty())
        return ParseStatus::INCOMPLETE;

    if (data[0] != '*') {
        err = "expected '*', got " + describeByte(data[0]);
        return ParseStatus::ERROR;
    }

    std::size_t pos = 1;
    std::string_view line;
    ParseStatus st = readLine(data, pos, line, MAX_HEADER_LINE, err);
    if (st != ParseStatus::OK)
        return st;

    long long count = 0;
    if (!parseInteger(line, count) || count < -1 || count > MAX_ARRAY_LENGTH) {
        err = "invalid multibulk length";
        return ParseStatus::ERROR;
    }

    // "*0" and "*-1" carry no command; report them as an empty request.
    if (count <= 0) {
        consumed = pos;
        return ParseStatus::OK;
    }

    std::vector<std::string> parsed;
    parsed.reserve(static_cast<std::size_t>(count));

    for (long long i = 0; i < count; i++) {
        if (pos >= data.size())
            return ParseStatus::INCOMPLETE;

        if (data[pos] != '$') {
            err = "expected '$', got " + describeByte(data[pos]);
            return ParseStatus::ERROR;
        }
        pos++;

        st = readLine(data, pos, line, MAX_HEADER_LINE, err);
        if (st != ParseStatus::OK)
            return st;

        long long len = 0;
        if (!parseInteger(line, len) || len < 0 || len > MAX_BULK_LENGTH) {
            err = "invalid bulk length";
            return ParseStatus::ERROR;
        }

        std::size_t ulen = static_cast<std::size_t>(len);
        if (data.size() - pos < ulen + 2)
            return ParseStatus::INCOMPLETE;

        if (data[pos + ulen] != '\r' || data[pos + ulen + 1] != '\n') {
            err = "bulk string not terminated by CRLF";
            return ParseStatus::ERROR;
        }

        parsed.emplace_back(data.substr(pos, ulen));
        pos += ulen + 2;
    }

    args = std::move(parsed);
    consumed = pos;
    return ParseStatus::OK;
}

ParseStatus RESPParser::parseReplyAt(std::string_view data, std::size_t& pos,
                                     RespValue& out, std::string& err, int depth) {
    if (depth > MAX_REPLY_DEPTH) {
        err = "reply nested too deeply";
        return ParseStatus::ERROR;
    }

    if (pos >= data.size())
        return ParseStatus::INCOMPLETE;

    char type = data[pos++];
    std::string_view line;
    ParseStatus st;

    switch (type) {
        case '+':
        case '-':
            st = readLine(data, pos, line, MAX_REPLY_LINE, err);
            if (st != ParseStatus::OK)
                return st;
            out.type = (type == '+') ? RespValue::Type::SIMPLE_STRING
                                     : RespValue::Type::ERROR;
            out.str.assign(line);
            return ParseStatus::OK;

        case ':':
            st = readLine(data, pos, line, MAX_HEADER_LINE, err);
            if (st != ParseStatus::OK)
                return st;
            if (!parseInteger(line, out.integer)) {
                err = "invalid integer reply";
                return ParseStatus::ERROR;
            }
            out.type = RespValue::Type::INTEGER;
            return ParseStatus::OK;

        case '$': {
            st = readLine(data, pos, line, MAX_HEADER_LINE, err);
            if (st != ParseStatus::OK)
                return st;
            long long len = 0;
            if (!parseInteger(line, len) || len < -1 || len > MAX_BULK_LENGTH) {
                err = "invalid bulk length";
                return ParseStatus::ERROR;
            }
            if (len == -1) {
                out.type = RespValue::Type::NULL_BULK;
                return ParseStatus::OK;
            }
            std::size_t ulen = static_cast<std::size_t>(len);
            if (data.size() - pos < ulen + 2)
                return ParseStatus::INCOMPLETE;
            if (data[pos + ulen] != '\r' || data[pos + ulen + 1] != '\n') {
                err = "bulk string not terminated by CRLF";
                return ParseStatus::ERROR;
            }
            out.type = RespValue::Type::BULK_STRING;
            out.str.assign(data.substr(pos, ulen));
            pos += ulen + 2;
            return ParseStatus::OK;
        }

        case '*': {
            st = readLine(data, pos, line, MAX_HEADER_LINE, err);
            if (st != ParseStatus::OK)
                return st;
            long long count = 0;
            if (!parseInteger(line, count) || count < -1 || count > MAX_ARRAY_LENGTH) {
                err = "invalid multibulk length";
                return ParseStatus::ERROR;
            }
            if (count == -1) {
                out.type = RespValue::Type::NULL_ARRAY;
                return ParseStatus::OK;
            }
            out.type = RespValue::Type::ARRAY;
            out.elements.clear();
            out.elements.resize(static_cast<std::size_t>(count));
            for (auto& element : out.elements) {
                st = parseReplyAt(data, pos, element, err, depth + 1);
                if (st != ParseStatus::OK)
                    return st;
            }
            return ParseStatus::OK;
        }

        default:
            err = "unknown reply type " + describeByte(type);
            return ParseStatus::ERROR;
    }
}

ParseStatus RESPParser::parseReply(std::string_view data,
                                   RespValue& out,
                                   std::size_t& consumed,
                                   std::string& err) {
    consumed = 0;
    std::size_t pos = 0;
    RespValue value;

    ParseStatus st = parseReplyAt(data, pos, value, err, 0);
    if (st != ParseStatus::OK)
        return st;

    out = std::move(value);
    consumed = pos;
    return ParseStatus::OK;
}

ParseStatus RESPParser::parseBulkPayload(std::string_view data,
                                         std::string& out,
                                         std::size_t& consumed,
                                         std::string& err) {
    consumed = 0;

    if (data.empty())
        return ParseStatus::INCOMPLETE;

    if (data[0] != '$') {
        err = "expected '$' before snapshot payload, got " + describeByte(data[0]);
        return ParseStatus::ERROR;
    }

    std::size_t pos = 1;
    std::string_view line;
    ParseStatus st = readLine(data, pos, line, MAX_HEADER_LINE, err);
    if (st != ParseStatus::OK)
        return st;

    long long len = 0;
    if (!parseInteger(line, len) || len < 0 || len > MAX_BULK_LENGTH) {
        err = "invalid snapshot length";
        return ParseStatus::ERROR;
    }

    std::size_t ulen = static_cast<std::size_t>(len);
    if (data.size() - pos < ulen)
        return ParseStatus::INCOMPLETE;

    out.assign(data.substr(pos, ulen));
    consumed = pos + ulen;
    return ParseStatus::OK;
}
