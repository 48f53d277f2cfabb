#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace kmswitch {

class KmSwitchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A source path could not be opened or initialized.
class DeviceUnavailable : public KmSwitchError {
public:
    DeviceUnavailable(const std::string& path, int err)
        : KmSwitchError("device unavailable: " + path + ": " + std::generic_category().message(err)),
          path_(path),
          err_(err) {}

    const std::string& path() const { return path_; }
    int error() const { return err_; }

private:
    std::string path_;
    int err_;
};

// A source vanished while being read. Recovered by the supervisor.
class SourceDisconnected : public KmSwitchError {
public:
    explicit SourceDisconnected(const std::string& path)
        : KmSwitchError("source disconnected: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Exclusive grab refused. Logged by the source, never propagated.
class GrabDenied : public KmSwitchError {
public:
    GrabDenied(const std::string& path, int err)
        : KmSwitchError("grab denied: " + path + ": " + std::generic_category().message(err)) {}
};

class SinkWriteFailed : public KmSwitchError {
public:
    SinkWriteFailed(const std::string& device, int err)
        : KmSwitchError("write to " + device + " failed: " + std::generic_category().message(err)),
          code_(err, std::generic_category()) {}

    const std::error_code& code() const { return code_; }

private:
    std::error_code code_;
};

class ConfigError : public KmSwitchError {
public:
    using KmSwitchError::KmSwitchError;
};

}  // namespace kmswitch
