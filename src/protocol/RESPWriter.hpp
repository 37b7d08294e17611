#pragma once
#include <string>
#include <string_view>
#include <vector>

/**
 * RESPWriter
 * ----------
 * RESP2 encoders. Every function returns the exact bytes that go on
 * the wire, so replies can be concatenated (EXEC, XREAD) or forwarded
 * to replicas as-is.
 */
class RESPWriter {
public:
    /** +OK\r\n */
    static std::string simpleString(std::string_view s);

    /** -<message>\r\n, message carries its own prefix ("ERR ...", "WRONGTYPE ...") */
    static std::string error(std::string_view message);

    /** :123\r\n */
    static std::string integer(long long n);

    /** $<len>\r\n<value>\r\n */
    static std::string bulk(std::string_view value);

    /** $-1\r\n */
    static std::string nullBulk();

    /** *-1\r\n */
    static std::string nullArray();

    /** *<n>\r\n, elements are appended by the caller */
    static std::string arrayHeader(std::size_t n);

    /** Array of already-encoded elements. */
    static std::string array(const std::vector<std::string>& encoded);

    /** Array of bulk strings; this is also the request/propagation format. */
    static std::string bulkArray(const std::vector<std::string>& values);
};
