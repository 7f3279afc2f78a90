/**
 * @file fake_container_runtime.hpp
 * @brief In-process ContainerRuntime + ImageStore for unit tests
 *
 * Containers are entries in a map. Starting one "runs" a scripted behaviour
 * chosen per container from its configuration: exit code, output streams,
 * files written into the bound workspace, or a hang that only ends with a
 * kill. Bind mounts are honoured, so files staged on the host are visible at
 * their container paths.
 *
 * @date 2025
 */

#pragma once

#include "codecell/utils/container_utils.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace codecell {
namespace testing {

/// What a fake container does when started
struct FakeBehaviour {
    int exit_code{0};
    std::string stdout_output;
    std::string stderr_output;
    bool hang{false};                                 ///< Never exits on its own
    std::map<std::string, std::string> writes;        ///< container path -> bytes
};

class FakeContainerRuntime : public utils::ContainerRuntime, public utils::ImageStore {
public:
    using BehaviourFn = std::function<FakeBehaviour(const utils::ContainerConfig&)>;

    // Knobs
    bool image_present{true};
    bool fail_build{false};
    bool fail_create{false};
    bool create_times_out{false};                     ///< Container exists, but no id is returned
    bool fail_start{false};
    bool fail_wait{false};
    bool fail_copy_to{false};
    bool fail_remove{false};
    bool logs_unavailable{false};
    BehaviourFn behaviour = [](const utils::ContainerConfig&) { return FakeBehaviour{}; };

    // Observations
    std::atomic<int> build_count{0};
    std::atomic<int> start_count{0};
    std::atomic<int> kill_count{0};
    std::string last_dockerfile;
    std::filesystem::path last_build_context;
    std::optional<utils::ContainerConfig> last_config;

    // ImageStore
    bool ImageExists(const std::string& /*image*/) override {
        return image_present;
    }

    bool BuildImage(const std::string& /*tag*/, const std::filesystem::path& context_dir) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++build_count;
        last_build_context = context_dir;
        last_dockerfile = ReadFile(context_dir / "Dockerfile");
        if (fail_build) {
            return false;
        }
        image_present = true;
        return true;
    }

    // ContainerRuntime
    std::string CreateContainer(const utils::ContainerConfig& config) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_create) {
            return "";
        }

        std::string id = "fake" + std::to_string(++next_id_) + std::string(60, '0');
        containers_[id] = Container{config, {}, State::CREATED, {}};
        last_config = config;
        configs_.push_back(config);
        return create_times_out ? "" : id;
    }

    bool StartContainer(const std::string& container_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++start_count;
        auto it = containers_.find(container_id);
        if (fail_start || it == containers_.end() || it->second.state != State::CREATED) {
            return false;
        }

        Container& container = it->second;
        container.behaviour = behaviour(container.config);
        container.state = container.behaviour.hang ? State::RUNNING : State::EXITED;

        for (const auto& [path, bytes] : container.behaviour.writes) {
            auto host = HostPathFor(container, path);
            if (host) {
                std::filesystem::create_directories(host->parent_path());
                std::ofstream out(*host, std::ios::binary);
                out << bytes;
            } else {
                container.files[path] = bytes;
            }
        }
        return true;
    }

    utils::ContainerWaitResult WaitForContainer(const std::string& container_id,
                                                std::chrono::milliseconds timeout) override {
        utils::ContainerWaitResult result;
        bool hang = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = containers_.find(container_id);
            if (fail_wait || it == containers_.end()) {
                result.error = "wait failed";
                return result;
            }
            hang = it->second.state == State::RUNNING;
            result.exit_code = it->second.behaviour.exit_code;
        }

        if (hang) {
            std::this_thread::sleep_for(timeout);
            result.timed_out = true;
            result.exit_code = -1;
            return result;
        }

        result.completed = true;
        return result;
    }

    bool KillContainer(const std::string& container_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++kill_count;
        auto it = containers_.find(container_id);
        if (it != containers_.end()) {
            it->second.state = State::EXITED;
            it->second.killed = true;
        }
        return true;
    }

    bool RemoveContainer(const std::string& container_id, bool /*force*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_remove) {
            return false;
        }
        for (auto it = containers_.begin(); it != containers_.end(); ++it) {
            if (it->first == container_id || it->second.config.name == container_id) {
                removed_.insert(it->first);
                containers_.erase(it);
                return true;
            }
        }
        return false;
    }

    utils::ContainerExecResult CopyToContainer(const std::string& container_id,
                                               const std::filesystem::path& source,
                                               const std::filesystem::path& dest) override {
        std::lock_guard<std::mutex> lock(mutex_);
        utils::ContainerExecResult result;
        auto it = containers_.find(container_id);
        if (fail_copy_to || it == containers_.end()) {
            result.exit_code = 1;
            result.stderr_output = "copy rejected";
            return result;
        }

        it->second.files[dest.string()] = ReadFile(source);
        result.success = true;
        return result;
    }

    utils::ContainerExecResult CopyFromContainer(const std::string& container_id,
                                                 const std::filesystem::path& source,
                                                 const std::filesystem::path& dest) override {
        std::lock_guard<std::mutex> lock(mutex_);
        utils::ContainerExecResult result;
        result.exit_code = 1;

        auto it = containers_.find(container_id);
        if (it == containers_.end()) {
            result.stderr_output = "No such container: " + container_id;
            return result;
        }

        auto host = HostPathFor(it->second, source.string());
        std::error_code ec;
        if (host && std::filesystem::exists(*host, ec)) {
            std::filesystem::copy(*host, dest, std::filesystem::copy_options::recursive, ec);
            if (ec) {
                result.stderr_output = ec.message();
                return result;
            }
        } else if (it->second.files.count(source.string())) {
            std::ofstream out(dest, std::ios::binary);
            out << it->second.files[source.string()];
        } else {
            result.stderr_output = "Could not find the file " + source.string() + " in container";
            return result;
        }

        result.exit_code = 0;
        result.success = true;
        return result;
    }

    std::optional<utils::ContainerLogs> GetContainerLogs(const std::string& container_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = containers_.find(container_id);
        if (logs_unavailable || it == containers_.end()) {
            return std::nullopt;
        }
        return utils::ContainerLogs{it->second.behaviour.stdout_output,
                                    it->second.behaviour.stderr_output};
    }

    std::vector<utils::ContainerInfo> ListContainers(
        const std::map<std::string, std::string>& labels) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<utils::ContainerInfo> list;
        for (const auto& [id, container] : containers_) {
            bool match = true;
            for (const auto& [key, value] : labels) {
                auto label = container.config.labels.find(key);
                if (label == container.config.labels.end() || label->second != value) {
                    match = false;
                }
            }
            if (match) {
                list.push_back(utils::ContainerInfo{id, container.config.name, container.config.image,
                                                    utils::ContainerState::EXITED});
            }
        }
        return list;
    }

    // Inspection helpers
    std::vector<utils::ContainerConfig> CreatedConfigs() {
        std::lock_guard<std::mutex> lock(mutex_);
        return configs_;
    }

    std::size_t LiveContainers() {
        std::lock_guard<std::mutex> lock(mutex_);
        return containers_.size();
    }

    bool WasRemoved(const std::string& container_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed_.count(container_id) > 0;
    }

    bool WasKilled(const std::string& container_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = containers_.find(container_id);
        return it != containers_.end() && it->second.killed;
    }

    std::optional<std::string> FileInContainer(const std::string& container_id,
                                               const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = containers_.find(container_id);
        if (it == containers_.end() || !it->second.files.count(path)) {
            return std::nullopt;
        }
        return it->second.files[path];
    }

    static std::string ReadFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    /// Host directory bound at `container_dir` in a config, if any
    static std::optional<std::filesystem::path> MountSource(const utils::ContainerConfig& config,
                                                            const std::filesystem::path& container_dir) {
        for (const auto& [host, target] : config.mounts) {
            if (target == container_dir) {
                return host;
            }
        }
        return std::nullopt;
    }

private:
    enum class State { CREATED, RUNNING, EXITED };

    struct Container {
        utils::ContainerConfig config;
        FakeBehaviour behaviour;
        State state{State::CREATED};
        std::map<std::string, std::string> files;   ///< Paths outside any mount
        bool killed{false};
    };

    std::mutex mutex_;
    std::map<std::string, Container> containers_;
    std::set<std::string> removed_;
    std::vector<utils::ContainerConfig> configs_;
    int next_id_{0};

    static std::optional<std::filesystem::path> HostPathFor(const Container& container,
                                                            const std::string& container_path) {
        std::filesystem::path path(container_path);
        for (const auto& [host, target] : container.config.mounts) {
            auto relative = path.lexically_relative(target);
            if (!relative.empty() && *relative.begin() != "..") {
                return relative == "." ? host : host / relative;
            }
        }
        return std::nullopt;
    }
};

} // namespace testing
} // namespace codecell
