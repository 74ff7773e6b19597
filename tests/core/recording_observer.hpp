#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "core/transfer/transfer_types.hpp"

namespace dbxfer::testing {

class RecordingObserver final : public core::TransferObserver {
public:
    void on_progress(core::TransferGeneration generation, int percentage) override {
        std::lock_guard lock(mutex_);
        generations_.push_back(generation);
        progress_.push_back(percentage);
    }

    void on_status(core::TransferGeneration, const std::string& message) override {
        std::function<void(const std::string&)> hook;
        {
            std::lock_guard lock(mutex_);
            statuses_.push_back(message);
            hook = status_hook_;
        }
        if (hook) hook(message);
    }

    void on_files(core::TransferGeneration, std::uint64_t done, std::uint64_t total) override {
        std::lock_guard lock(mutex_);
        files_.emplace_back(done, total);
    }

    void set_status_hook(std::function<void(const std::string&)> hook) {
        std::lock_guard lock(mutex_);
        status_hook_ = std::move(hook);
    }

    auto progress() const -> std::vector<int> {
        std::lock_guard lock(mutex_);
        return progress_;
    }

    auto statuses() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return statuses_;
    }

    auto files() const -> std::vector<std::pair<std::uint64_t, std::uint64_t>> {
        std::lock_guard lock(mutex_);
        return files_;
    }

    auto generations() const -> std::vector<core::TransferGeneration> {
        std::lock_guard lock(mutex_);
        return generations_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<int> progress_;
    std::vector<std::string> statuses_;
    std::vector<std::pair<std::uint64_t, std::uint64_t>> files_;
    std::vector<core::TransferGeneration> generations_;
    std::function<void(const std::string&)> status_hook_;
};

} // namespace dbxfer::testing
