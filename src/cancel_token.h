#pragma once

#include <atomic>
#include <memory>

// Observer side of a cancellation flag. A default-constructed token is
// already cancelled.
class CancelToken {
public:
    CancelToken() = default;
    explicit CancelToken(std::shared_ptr<const std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    bool cancelled() const { return !flag_ || flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<const std::atomic<bool>> flag_;
};

// Strong holder. Its tokens report cancelled once it is cancelled, destroyed,
// or replaced by assignment.
class CancelSource {
public:
    CancelSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    ~CancelSource() { cancel(); }

    CancelSource(const CancelSource&) = delete;
    CancelSource& operator=(const CancelSource&) = delete;

    CancelSource(CancelSource&& other) noexcept : flag_(std::move(other.flag_)) {}
    CancelSource& operator=(CancelSource&& other) noexcept {
        if (this != &other) {
            cancel();
            flag_ = std::move(other.flag_);
        }
        return *this;
    }

    void cancel() {
        if (flag_) flag_->store(true, std::memory_order_release);
    }

    CancelToken token() const { return CancelToken(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
