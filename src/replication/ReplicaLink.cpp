#include "ReplicaLink.hpp"

#include "../protocol/RESPParser.hpp"
#include "../protocol/RESPWriter.hpp"
#include "../utils/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

namespace {
constexpr int HANDSHAKE_TIMEOUT_SEC = 5;
}

ReplicaLink::ReplicaLink(std::string h, int p, int listen_port)
    : host(std::move(h)),
      port(p),
      listening_port(listen_port)
{
}

ReplicaLink::~ReplicaLink() {
    closeSocket();
}

void ReplicaLink::closeSocket() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int ReplicaLink::releaseFd() {
    int out = fd;
    fd = -1;

    if (out >= 0) {
        // Handshake timeouts no longer apply once the loop owns the socket.
        timeval tv{};
        setsockopt(out, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(out, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
    return out;
}

bool ReplicaLink::openSocket(std::string& err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        err = "cannot resolve " + host + ": " + gai_strerror(rc);
        return false;
    }

    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        int s = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s < 0)
            continue;
        if (connect(s, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd = s;
            break;
        }
        ::close(s);
    }
    freeaddrinfo(res);

    if (fd < 0) {
        err = "cannot connect to " + host + ":" + service + ": " + std::strerror(errno);
        return false;
    }

    timeval tv{};
    tv.tv_sec = HANDSHAKE_TIMEOUT_SEC;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    return true;
}

bool ReplicaLink::sendCommand(const std::vector<std::string>& args, std::string& err) {
    const std::string payload = RESPWriter::bulkArray(args);
    std::size_t sent = 0;

    while (sent < payload.size()) {
        ssize_t n = ::send(fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            err = std::string("send failed: ") + std::strerror(errno);
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

bool ReplicaLink::readMore(std::string& err) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n > 0) {
            pending.append(buffer, static_cast<std::size_t>(n));
            return true;
        }
        if (n == 0) {
            err = "master closed the connection";
            return false;
        }
        if (errno == EINTR)
            continue;
        err = std::string("recv failed: ") + std::strerror(errno);
        return false;
    }
}

// Reads one reply and requires it to be the simple string `expected`.
bool ReplicaLink::expectSimple(const std::string& expected, std::string& err) {
    while (true) {
        RespValue reply;
        std::size_t consumed = 0;
        ParseStatus st = RESPParser::parseReply(pending, reply, consumed, err);

        if (st == ParseStatus::ERROR)
            return false;

        if (st == ParseStatus::OK) {
            pending.erase(0, consumed);
            if (reply.type != RespValue::Type::SIMPLE_STRING || reply.str != expected) {
                err = "unexpected reply from master, wanted +" + expected +
                      (reply.type == RespValue::Type::ERROR ? " got -" + reply.str : "");
                return false;
            }
            return true;
        }

        if (!readMore(err))
            return false;
    }
}

bool ReplicaLink::readFullResync(std::string& err) {
    // +FULLRESYNC <replid> <offset>
    while (true) {
        RespValue reply;
        std::size_t consumed = 0;
        ParseStatus st = RESPParser::parseReply(pending, reply, consumed, err);
        if (st == ParseStatus::ERROR)
            return false;

        if (st == ParseStatus::OK) {
            pending.erase(0, consumed);
            if (reply.type != RespValue::Type::SIMPLE_STRING) {
                err = "PSYNC refused by master";
                return false;
            }

            std::istringstream in(reply.str);
            std::string word;
            in >> word >> replid >> offset;
            if (word != "FULLRESYNC" || replid.size() != 40 || in.fail()) {
                err = "malformed PSYNC reply: " + reply.str;
                return false;
            }
            break;
        }

        if (!readMore(err))
            return false;
    }

    // $<len>\r\n<rdb bytes>
    while (true) {
        std::size_t consumed = 0;
        ParseStatus st = RESPParser::parseBulkPayload(pending, rdb, consumed, err);
        if (st == ParseStatus::ERROR)
            return false;

        if (st == ParseStatus::OK) {
            pending.erase(0, consumed);
            return true;
        }

        if (!readMore(err))
            return false;
    }
}

bool ReplicaLink::connectAndSync(std::string& err) {
    closeSocket();
    pending.clear();
    rdb.clear();

    if (!openSocket(err))
        return false;
    Logger::info("connected to master " + host + ":" + std::to_string(port));

    if (!sendCommand({"PING"}, err) || !expectSimple("PONG", err))
        return false;
    Logger::info("handshake: PING ok");

    if (!sendCommand({"REPLCONF", "listening-port", std::to_string(listening_port)}, err) ||
        !expectSimple("OK", err))
        return false;

    if (!sendCommand({"REPLCONF", "capa", "psync2"}, err) || !expectSimple("OK", err))
        return false;
    Logger::info("handshake: REPLCONF ok");

    if (!sendCommand({"PSYNC", "?", "-1"}, err) || !readFullResync(err))
        return false;

    Logger::info("handshake: FULLRESYNC " + replid + " " + std::to_string(offset) +
                 ", snapshot " + std::to_string(rdb.size()) + " bytes");
    return true;
}
