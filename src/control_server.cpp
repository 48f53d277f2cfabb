#include "kmswitch/control_server.hpp"

#include "kmswitch/errors.hpp"

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace kmswitch {

namespace {

constexpr size_t MAX_LINE = 0x2000;
constexpr int CLIENT_TIMEOUT_SEC = 2;
constexpr int ACCEPT_POLL_MS = 200;
// pointer positions beyond any screen are rejected
constexpr int MAX_POSITION = 1 << 16;

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

class LineReader {
public:
    explicit LineReader(int fd) : fd_(fd) {}

    bool next(std::string& line) {
        line.clear();
        while (true) {
            size_t nl = buf_.find('\n');
            if (nl != std::string::npos) {
                line = buf_.substr(0, nl);
                buf_.erase(0, nl + 1);
                return true;
            }
            if (buf_.size() >= MAX_LINE) return false;
            char chunk[512];
            ssize_t n = read(fd_, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                // peer closed after an unterminated last line
                if (buf_.empty()) return false;
                line.swap(buf_);
                return true;
            }
            buf_.append(chunk, static_cast<size_t>(n));
        }
    }

private:
    int fd_;
    std::string buf_;
};

}  // namespace

ControlServer::ControlServer(Router& router, Options options)
    : router_(router), options_(std::move(options)) {}

ControlServer::~ControlServer() { stop(); }

std::string ControlServer::read_auth_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigError("cannot read auth file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string token = trim(ss.str());
    if (token.empty()) {
        throw ConfigError("auth file is empty: " + path);
    }
    return token;
}

std::vector<int> ControlServer::split_motion(long long delta, int max_step) {
    std::vector<int> steps;
    if (max_step < 1) max_step = 1;
    const int direction = delta < 0 ? -1 : 1;
    unsigned long long left = delta < 0 ? 0ULL - static_cast<unsigned long long>(delta)
                                        : static_cast<unsigned long long>(delta);
    while (left > 0) {
        int part = left > static_cast<unsigned long long>(max_step) ? max_step : static_cast<int>(left);
        steps.push_back(part * direction);
        left -= static_cast<unsigned long long>(part);
    }
    return steps;
}

bool ControlServer::handle_request(const std::string& auth_line, const std::string& command_line) {
    if (options_.auth_token.empty() || trim(auth_line) != options_.auth_token) {
        return false;
    }

    std::istringstream in(command_line);
    std::string name;
    if (!(in >> name)) return false;

    try {
        router_.set_active(name);
    } catch (const ConfigError& e) {
        std::cerr << "[control] " << e.what() << std::endl;
        return false;
    }

    // move the pointer away from the edge it left through
    auto nudge = options_.nudges.find(name);
    if (nudge != options_.nudges.end() && nudge->second != 0) {
        router_.inject_motion(REL_X, nudge->second);
    }

    std::string y_text;
    if (!(in >> y_text)) return true;
    int y = 0;
    try {
        size_t pos = 0;
        y = std::stoi(y_text, &pos);
        if (pos != y_text.size()) throw std::invalid_argument(y_text);
    } catch (const std::exception&) {
        std::cerr << "[control] ignoring bad y position '" << y_text << "'" << std::endl;
        return true;
    }
    if (y < -MAX_POSITION || y > MAX_POSITION) {
        std::cerr << "[control] ignoring out of range y position " << y << std::endl;
        return true;
    }

    std::lock_guard<std::mutex> guard(lock_);
    if (have_last_y_) {
        for (int step : split_motion(static_cast<long long>(y) - last_y_, options_.max_step)) {
            router_.inject_motion(REL_Y, step);
        }
    }
    last_y_ = y;
    have_last_y_ = true;
    return true;
}

void ControlServer::start() {
    listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    int one = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(options_.port));
    if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || listen(listen_fd_, 8) < 0) {
        int err = errno;
        close(listen_fd_);
        listen_fd_ = -1;
        throw std::system_error(err, std::generic_category(), "bind port " + std::to_string(options_.port));
    }

    running_ = true;
    thread_ = std::thread(&ControlServer::serve, this);
    std::cout << "[control] listening on port " << options_.port << std::endl;
}

void ControlServer::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }
}

void ControlServer::serve() {
    while (running_) {
        pollfd p{};
        p.fd = listen_fd_;
        p.events = POLLIN;
        int rc = poll(&p, 1, ACCEPT_POLL_MS);
        if (rc <= 0) continue;
        int client = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN) perror("accept");
            continue;
        }
        serve_client(client);
        close(client);
    }
}

void ControlServer::serve_client(int fd) {
    timeval tv{};
    tv.tv_sec = CLIENT_TIMEOUT_SEC;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    LineReader reader(fd);
    std::string auth, command;
    if (!reader.next(auth) || !reader.next(command)) return;
    try {
        handle_request(auth, command);
    } catch (const SinkWriteFailed& e) {
        std::cerr << "[control] " << e.what() << std::endl;
        failed_ = true;
        running_ = false;
        router_.stop();
    }
}

}  // namespace kmswitch
