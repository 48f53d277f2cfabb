#pragma once

#include "kmswitch/router.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace kmswitch {

/*
    Remote switch requests over TCP.

    A client sends two lines: the shared secret, then "<target> [<y>]".
    Nothing is ever sent back; a bad secret just closes the connection.
    <y> is the pointer's last vertical position on the requesting side; the
    difference to the previous request is replayed as REL_Y steps of at most
    `max_step` units so the pointer arrives at the same height.
*/
class ControlServer {
public:
    struct Options {
        int port = 9898;
        std::string auth_token;
        std::map<std::string, int> nudges;
        int max_step = 100;
    };

    ControlServer(Router& router, Options options);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Throws std::system_error if the port cannot be bound.
    void start();
    void stop();
    // A sink write failed while serving a request.
    bool failed() const { return failed_; }

    // Returns false if the request was rejected.
    bool handle_request(const std::string& auth_line, const std::string& command_line);

    static std::vector<int> split_motion(long long delta, int max_step);
    // Throws ConfigError.
    static std::string read_auth_file(const std::string& path);

private:
    void serve();
    void serve_client(int fd);

    Router& router_;
    Options options_;
    int listen_fd_ = -1;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};

    std::mutex lock_;
    bool have_last_y_ = false;
    int last_y_ = 0;
};

}  // namespace kmswitch
