#include "EventLoop.hpp"

#include "../protocol/RESPParser.hpp"
#include "../protocol/RESPWriter.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Time.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr long SELECT_TIMEOUT_US = 50000;
constexpr std::size_t READ_CHUNK = 16 * 1024;

std::vector<std::string_view> toViews(const std::vector<std::string>& args) {
    return std::vector<std::string_view>(args.begin(), args.end());
}

} // namespace

EventLoop::EventLoop(int serverFd, CommandHandler& h,
                     ReplicationManager& repl, const ServerConfig& cfg)
    : server_fd(serverFd),
      max_fd(serverFd),
      handler(h),
      replication(repl),
      config(cfg)
{
    FD_ZERO(&current_fds);
    FD_SET(server_fd, &current_fds);
}

void EventLoop::attachMaster(int fd, std::string buffered) {
    master_fd = fd;
    master_buffer = std::move(buffered);
    last_ack_ms = current_time_ms();

    FD_SET(master_fd, &current_fds);
    if (master_fd > max_fd) max_fd = master_fd;

    replication.setLinkUp(true);

    // The snapshot may have been followed by commands in the same read.
    processMaster();
}

void EventLoop::run() {
    while (tick()) {
    }
}

bool EventLoop::tick() {
    fd_set ready_fds = current_fds;

    // select() may modify the timeout, so it is rebuilt every tick.
    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = SELECT_TIMEOUT_US;

    int activity = select(max_fd + 1, &ready_fds, nullptr, nullptr, &tv);
    if (activity < 0) {
        if (errno == EINTR)
            return true;
        Logger::error(std::string("select error: ") + std::strerror(errno));
        return false;
    }

    if (activity > 0) {
        if (FD_ISSET(server_fd, &ready_fds))
            acceptClient();

        if (master_fd >= 0 && FD_ISSET(master_fd, &ready_fds))
            readMaster();

        for (int fd = 0; fd <= max_fd; ++fd) {
            if (fd == server_fd || fd == master_fd) continue;
            if (!FD_ISSET(fd, &ready_fds)) continue;
            if (connections.count(fd) == 0) continue;

            readClient(fd);
        }
    }

    handler.checkTimeouts();
    flushPending();

    while (!resumable.empty()) {
        std::vector<int> batch;
        batch.swap(resumable);
        for (int fd : batch)
            processClient(fd);
    }

    sendPeriodicAck();
    return true;
}

// ----------------------------------------------------
// Clients
// ----------------------------------------------------
void EventLoop::acceptClient() {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    int fd = accept(server_fd, reinterpret_cast<sockaddr*>(&client_addr), &len);
    if (fd < 0) {
        Logger::warn(std::string("accept error: ") + std::strerror(errno));
        return;
    }

    if (fd >= FD_SETSIZE) {
        Logger::warn("too many connections, refusing fd " + std::to_string(fd));
        ::close(fd);
        return;
    }

    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
    Logger::debug("accepted " + std::string(ip) + ":" +
                  std::to_string(ntohs(client_addr.sin_port)) + " on fd " + std::to_string(fd));

    connections[fd] = Connection{};
    handler.onConnect(fd);

    FD_SET(fd, &current_fds);
    if (fd > max_fd) max_fd = fd;
}

void EventLoop::readClient(int fd) {
    char buffer[READ_CHUNK];

    ssize_t bytes = ::read(fd, buffer, sizeof(buffer));
    if (bytes < 0 && errno == EINTR)
        return;
    if (bytes <= 0) {
        closeClient(fd);
        return;
    }

    connections[fd].in.append(buffer, static_cast<std::size_t>(bytes));
    processClient(fd);
}

// Executes every complete frame in the client's buffer, in order.
void EventLoop::processClient(int fd) {
    while (true) {
        auto it = connections.find(fd);
        if (it == connections.end() || it->second.blocked)
            return;

        std::string& in = it->second.in;
        std::vector<std::string> args;
        std::size_t consumed = 0;
        std::string err;

        ParseStatus st = RESPParser::parseCommand(in, args, consumed, err);

        if (st == ParseStatus::INCOMPLETE)
            return;

        if (st == ParseStatus::ERROR) {
            Logger::warn("protocol error on fd " + std::to_string(fd) + ": " + err);
            writeAll(fd, RESPWriter::error("ERR Protocol error: " + err));
            closeClient(fd);
            return;
        }

        in.erase(0, consumed);
        if (args.empty())
            continue;

        ExecResult result = handler.execute(toViews(args), fd);

        if (result.blocked)
            connections[fd].blocked = true;

        if (!result.reply.empty() && !writeAll(fd, result.reply)) {
            closeClient(fd);
            flushPending();
            return;
        }

        flushPending();
    }
}

void EventLoop::closeClient(int fd) {
    if (connections.erase(fd) == 0)
        return;

    Logger::debug("closing fd " + std::to_string(fd));
    handler.onDisconnect(fd);

    ::close(fd);
    FD_CLR(fd, &current_fds);

    while (max_fd > server_fd && !FD_ISSET(max_fd, &current_fds))
        --max_fd;
}

void EventLoop::flushPending() {
    std::vector<ExecResult> writes = handler.takePendingWrites();

    for (auto& w : writes) {
        auto it = connections.find(w.target_fd);
        if (it == connections.end())
            continue;

        if (it->second.blocked) {
            it->second.blocked = false;
            if (!it->second.in.empty())
                resumable.push_back(w.target_fd);
        }

        if (!writeAll(w.target_fd, w.reply))
            closeClient(w.target_fd);
    }
}

bool EventLoop::writeAll(int fd, const std::string& payload) {
    std::size_t sent = 0;

    while (sent < payload.size()) {
        ssize_t n = ::send(fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            Logger::debug("write to fd " + std::to_string(fd) + " failed: " + std::strerror(errno));
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

// ----------------------------------------------------
// Master link (replica role)
// ----------------------------------------------------
void EventLoop::readMaster() {
    char buffer[READ_CHUNK];

    ssize_t bytes = ::read(master_fd, buffer, sizeof(buffer));
    if (bytes < 0 && errno == EINTR)
        return;
    if (bytes <= 0) {
        closeMaster(bytes == 0 ? "master closed the connection"
                               : std::string("read failed: ") + std::strerror(errno));
        return;
    }

    master_buffer.append(buffer, static_cast<std::size_t>(bytes));
    processMaster();
}

void EventLoop::processMaster() {
    while (master_fd >= 0) {
        std::vector<std::string> args;
        std::size_t consumed = 0;
        std::string err;

        ParseStatus st = RESPParser::parseCommand(master_buffer, args, consumed, err);

        if (st == ParseStatus::INCOMPLETE)
            return;

        if (st == ParseStatus::ERROR) {
            closeMaster("protocol error in replication stream: " + err);
            return;
        }

        master_buffer.erase(0, consumed);

        std::string ack = handler.applyFromMaster(toViews(args), consumed);
        if (!ack.empty() && !writeAll(master_fd, ack)) {
            closeMaster("cannot send ACK to master");
            return;
        }

        flushPending();
    }
}

void EventLoop::closeMaster(const std::string& reason) {
    if (master_fd < 0)
        return;

    Logger::error("replication link lost: " + reason);
    ::close(master_fd);
    FD_CLR(master_fd, &current_fds);
    master_fd = -1;
    master_buffer.clear();
    replication.setLinkUp(false);
}

void EventLoop::sendPeriodicAck() {
    if (master_fd < 0 || config.repl_ack_interval_ms == 0)
        return;

    const uint64_t now = current_time_ms();
    if (now - last_ack_ms < config.repl_ack_interval_ms)
        return;

    last_ack_ms = now;
    if (!writeAll(master_fd, replication.ackCommand()))
        closeMaster("cannot send ACK to master");
}
