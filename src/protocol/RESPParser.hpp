#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

enum class ParseStatus { OK, INCOMPLETE, ERROR };

/**
 * RespValue
 * ---------
 * Decoded RESP2 reply. Only the field matching `type` is meaningful:
 *   SIMPLE_STRING, ERROR, BULK_STRING → str
 *   INTEGER                          → integer
 *   ARRAY                            → elements
 *   NULL_BULK, NULL_ARRAY            → nothing
 */
struct RespValue {
    enum class Type { SIMPLE_STRING, ERROR, INTEGER, BULK_STRING, ARRAY, NULL_BULK, NULL_ARRAY };

    Type type = Type::NULL_BULK;
    std::string str;
    long long integer = 0;
    std::vector<RespValue> elements;
};

/**
 * RESPParser
 * ----------
 * Incremental RESP2 decoder. Every entry point looks at the front of a
 * byte buffer and reports:
 *   OK          → one frame decoded, `consumed` bytes may be dropped
 *   INCOMPLETE  → the frame is not fully buffered yet, nothing consumed
 *   ERROR       → the bytes can never form a valid frame, `err` is set
 *
 * The caller owns the buffer, so several pipelined frames are handled by
 * calling again on the remaining bytes.
 */
class RESPParser {
public:
    static constexpr long long MAX_BULK_LENGTH  = 512LL * 1024 * 1024;
    static constexpr long long MAX_ARRAY_LENGTH = 1024 * 1024;

    // Request framing: *<n>\r\n followed by n bulk strings.
    static ParseStatus parseCommand(std::string_view data,
                                    std::vector<std::string>& args,
                                    std::size_t& consumed,
                                    std::string& err);

    // Any reply type, nested arrays included.
    static ParseStatus parseReply(std::string_view data,
                                  RespValue& out,
                                  std::size_t& consumed,
                                  std::string& err);

    // "$<len>\r\n<payload>" with no trailing CRLF (full resync snapshot).
    static ParseStatus parseBulkPayload(std::string_view data,
                                        std::string& out,
                                        std::size_t& consumed,
                                        std::string& err);

private:
    static ParseStatus readLine(std::string_view data, std::size_t& pos,
                                std::string_view& line, std::size_t max_len,
                                std::string& err);
    static bool parseInteger(std::string_view s, long long& out);
    static ParseStatus parseReplyAt(std::string_view data, std::size_t& pos,
                                    RespValue& out, std::string& err, int depth);
};
