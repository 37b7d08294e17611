#include "RESPWriter.hpp"

std::string RESPWriter::simpleString(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 3);
    out += '+';
    out += s;
    out += "\r\n";
    return out;
}

std::string RESPWriter::error(std::string_view message) {
    std::string out;
    out.reserve(message.size() + 3);
    out += '-';
    out += message;
    out += "\r\n";
    return out;
}

std::string RESPWriter::integer(long long n) {
    return ":" + std::to_string(n) + "\r\n";
}

std::string RESPWriter::bulk(std::string_view value) {
    std::string len = std::to_string(value.size());

    std::string reply;
    reply.reserve(1 + len.size() + 2 + value.size() + 2);

    reply += '$';
    reply += len;
    reply += "\r\n";
    reply += value;
    reply += "\r\n";

    return reply;
}

std::string RESPWriter::nullBulk() {
    return "$-1\r\n";
}

std::string RESPWriter::nullArray() {
    return "*-1\r\n";
}

std::string RESPWriter::arrayHeader(std::size_t n) {
    return "*" + std::to_string(n) + "\r\n";
}

std::string RESPWriter::array(const std::vector<std::string>& encoded) {
    std::string out = arrayHeader(encoded.size());
    for (const auto& e : encoded) {
        out += e;
    }
    return out;
}

std::string RESPWriter::bulkArray(const std::vector<std::string>& values) {
    std::string out = arrayHeader(values.size());
    for (const auto& v : values) {
        out += bulk(v);
    }
    return out;
}
