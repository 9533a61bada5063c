/**
 * @file cancellation.h
 * @brief Cooperative cancellation shared between a caller and its workers
 */

#ifndef FILESHARE_CORE_CANCELLATION_H
#define FILESHARE_CORE_CANCELLATION_H

#include <atomic>
#include <memory>

namespace fileshare {

/**
 * @brief Cancellation token
 *
 * Copies share one flag: cancelling any copy is observed by all of them.
 * Transfers poll the token between steps; a network call that is already in
 * flight is not interrupted, but its body is discarded.
 *
 * @code
 * cancellation_token token;
 * auto summary_future = std::async([&] {
 *     return client.download_directory("photos", token);
 * });
 * token.cancel();
 * @endcode
 */
class cancellation_token {
public:
    cancellation_token() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * @brief Request cancellation
     */
    void cancel() noexcept { cancelled_->store(true, std::memory_order_release); }

    /**
     * @brief Check whether cancellation was requested
     */
    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace fileshare

#endif  // FILESHARE_CORE_CANCELLATION_H
